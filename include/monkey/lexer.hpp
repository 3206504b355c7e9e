#ifndef MONKEY_LEXER_HPP
#define MONKEY_LEXER_HPP

/*!\file monkey/lexer.hpp
 * \brief Lexical Analysis/Tokenizer.
 */

#include "monkey/global.hpp"

/*!\brief Token types for Tokenizer/Lexical Analysis.
 * \see Lexer::nextToken, Token
 */
enum TokenType : int {
  tok_eof,     //!< End of input
  tok_illegal, //!< Unknown character

  tok_id,  //!< Identifier
  tok_int, //!< Integer number

  tok_assign,   //!< =
  tok_plus,     //!< +
  tok_minus,    //!< -
  tok_bang,     //!< !
  tok_asterisk, //!< *
  tok_slash,    //!< /

  tok_eq,  //!< ==
  tok_neq, //!< !=
  tok_lt,  //!< \<
  tok_gt,  //!< \>

  tok_comma,     //!< ,
  tok_semicolon, //!< ;

  tok_lparen, //!< (
  tok_rparen, //!< )
  tok_lbrace, //!< {
  tok_rbrace, //!< }

  tok_fn,     //!< 'fn'
  tok_let,    //!< 'let'
  tok_true,   //!< 'true'
  tok_false,  //!< 'false'
  tok_if,     //!< 'if'
  tok_else,   //!< 'else'
  tok_return, //!< 'return'
};

namespace std {
  std::string to_string(TokenType type) noexcept;
};

/*!\return Returns the source spelling of a token type with a fixed literal
 * (e.g. "==" for tok_eq, "let" for tok_let). Empty for tok_eof, tok_id,
 * tok_int and tok_illegal.
 */
std::string getTokenLiteral(TokenType type) noexcept;

/*!\brief A token: type and the text it was scanned from.
 */
class Token {
  TokenType type;
  std::string literal;
public:
  //!\brief Token with the canonical literal of type.
  Token(TokenType type = tok_eof)
    : type{type}, literal(getTokenLiteral(type)) {}
  Token(TokenType type, const std::string &literal)
    : type{type}, literal(literal) {}

  TokenType getType() const noexcept { return type; }
  const std::string &getLiteral() const noexcept { return literal; }

  bool is(TokenType type) const noexcept { return this->type == type; }
};

/*!\brief Token with its position in the source. Only used for diagnostics.
 */
class LocalizedToken {
  Token token;
  std::size_t line, column;
  std::string lineText;
public:
  LocalizedToken(const Token &token = Token(), std::size_t line = 0,
      std::size_t column = 0, const std::string &lineText = "")
    : token(token), line{line}, column{column}, lineText(lineText) {}

  const Token &getToken() const noexcept { return token; }

  //!\return Returns 0-based line of the first character of the token.
  std::size_t getLine() const noexcept { return line; }

  //!\return Returns 0-based column of the first character of the token.
  std::size_t getColumn() const noexcept { return column; }

  //!\return Returns the whole source line the token starts in.
  const std::string &getLineText() const noexcept { return lineText; }
};

class Lexer {
  std::string input;
  std::vector<std::string> lines;

  std::size_t pos;
  std::size_t line;
  std::size_t column;

  /*!\return Returns char at the cursor, '\0' at the end of input.
   */
  char currentChar() const noexcept;

  /*!\brief Moves cursor by one character. Does nothing at end of input.
   */
  void nextChar() noexcept;

  void skipWhitespace() noexcept;
public:
  Lexer(const std::string &input);
  virtual ~Lexer() {}

  /*!\return Returns next token. Returns tok_eof for every call after the
   * end of input was reached.
   * \see Token
   */
  Token nextToken();

  /*!\return Returns next token together with line, column and line text.
   * \see nextToken
   */
  LocalizedToken nextLocalized();
};

/*!\brief Prints error to out: the line of pos, a marker under the token
 * and "line:column: msg" (both 1-based).
 */
void reportError(std::ostream &out, const std::string &msg,
    const LocalizedToken &pos) noexcept;

#endif /* MONKEY_LEXER_HPP */
