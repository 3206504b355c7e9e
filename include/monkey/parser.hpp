#ifndef MONKEY_PARSER_HPP
#define MONKEY_PARSER_HPP

/*!\file monkey/parser.hpp
 * \brief Syntax analysis: recursive descent for statements, operator
 * precedence (Pratt) parsing for expressions.
 */

#include "monkey/global.hpp"
#include "monkey/lexer.hpp"
#include "monkey/syntax.hpp"

/*!\brief Binding power of operators, weakest first.
 * \see getTokenPrecedence
 */
enum Precedence : int {
  prec_lowest = 0,
  prec_equals,      //!< ==, !=
  prec_lessgreater, //!< \<, \>
  prec_sum,         //!< +, -
  prec_product,     //!< *, /
  prec_prefix,      //!< !x, -x
  prec_call,        //!< Reserved for function calls
};

/*!\return Returns precedence of token type as infix operator, prec_lowest
 * if the token type isn't an infix operator.
 */
int getTokenPrecedence(TokenType type) noexcept;

/*!\return Returns the operator a token type stands for. tok_minus maps to
 * op_sub both as prefix and as infix operator.
 */
Operator getTokenOperator(TokenType type) noexcept;

/*!\brief A diagnostic message and the token it was reported at.
 */
class ParseDiagnostic {
  std::string msg;
  LocalizedToken pos;
public:
  ParseDiagnostic(const std::string &msg, const LocalizedToken &pos)
    : msg(msg), pos(pos) {}

  const std::string &getMessage() const noexcept { return msg; }
  const LocalizedToken &getTokenPos() const noexcept { return pos; }
};

/*!\brief Single-use parser for the tokens of one lexer.
 *
 * Syntax errors don't stop parsing: they are collected and the parser
 * continues with the next statement. A parse with errors is a failed parse.
 */
class Parser {
  typedef ExprPtr (Parser::*PrefixParseFn)();
  typedef ExprPtr (Parser::*InfixParseFn)(ExprPtr lhs);

  Lexer &lexer;

  LocalizedToken curtok;
  LocalizedToken peektok;

  std::map<TokenType, PrefixParseFn> prefixParseFns;
  std::map<TokenType, InfixParseFn> infixParseFns;

  std::vector<std::string> errorMessages;
  std::vector<ParseDiagnostic> diags;

  //!\brief Advances current and peek token.
  void nextToken();

  const Token &currentToken() const noexcept { return curtok.getToken(); }
  const Token &peekToken() const noexcept { return peektok.getToken(); }

  /*!\brief Advances if peek token is of type type, reports error otherwise.
   * \return Returns true if advanced.
   */
  bool expectPeek(TokenType type);

  void peekError(TokenType type);

  //!\brief Records a diagnostic.
  void reportSyntaxError(const std::string &msg, const LocalizedToken &pos);

  int currentPrecedence() const noexcept
    { return getTokenPrecedence(currentToken().getType()); }
  int peekPrecedence() const noexcept
    { return getTokenPrecedence(peekToken().getType()); }

  StmtPtr parseStatement();
  StmtPtr parseLetStatement();
  StmtPtr parseReturnStatement();
  StmtPtr parseExpressionStatement();

  /*!\brief Parses statements until '}'. Current token must be '{'.
   * \return Returns nullptr if end of input was reached before '}'.
   */
  std::unique_ptr<BlockStmt> parseBlockStatement();

  /*!\brief Parses expression starting at the current token.
   * \param prec Only infix operators binding stronger than prec are
   * consumed.
   * \return Returns nullptr on error.
   */
  ExprPtr parseExpression(int prec);

  // Prefix parse functions (src/primary_syntax.cpp)
  ExprPtr parseIdentifier();
  ExprPtr parseIntegerLiteral();
  ExprPtr parseBoolean();
  ExprPtr parsePrefixExpression();
  ExprPtr parseGroupedExpression();
  ExprPtr parseIfExpression();
  ExprPtr parseFunctionLiteral();
  bool parseFunctionParameters(std::vector<std::unique_ptr<IdExpr>> &params);

  // Infix parse functions
  ExprPtr parseInfixExpression(ExprPtr lhs);
public:
  Parser(Lexer &lexer);
  virtual ~Parser() {}

  /*!\return Returns all statements that parsed. Check errors() afterwards.
   */
  std::unique_ptr<Program> parseProgram();

  //!\return Returns diagnostic messages in the order they occured.
  const std::vector<std::string> &errors() const noexcept
    { return errorMessages; }

  //!\return Returns diagnostics with the position they refer to.
  const std::vector<ParseDiagnostic> &diagnostics() const noexcept
    { return diags; }

  bool hasErrors() const noexcept { return !errorMessages.empty(); }
};

/*!\brief Parses source.
 * \param source
 * \param errors Receives the diagnostics, empty on success.
 * \return Returns the parsed program (also on error).
 */
std::unique_ptr<Program> parse(const std::string &source,
    std::vector<std::string> &errors);

#endif /* MONKEY_PARSER_HPP */
