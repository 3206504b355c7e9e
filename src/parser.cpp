#include "monkey/parser.hpp"

int getTokenPrecedence(TokenType type) noexcept {
  switch (type) {
  case tok_eq:
  case tok_neq:
    return prec_equals;
  case tok_lt:
  case tok_gt:
    return prec_lessgreater;
  case tok_plus:
  case tok_minus:
    return prec_sum;
  case tok_asterisk:
  case tok_slash:
    return prec_product;
  default:
    return prec_lowest;
  }
}

Parser::Parser(Lexer &lexer) : lexer(lexer) {
  prefixParseFns[tok_id] = &Parser::parseIdentifier;
  prefixParseFns[tok_int] = &Parser::parseIntegerLiteral;
  prefixParseFns[tok_true] = &Parser::parseBoolean;
  prefixParseFns[tok_false] = &Parser::parseBoolean;
  prefixParseFns[tok_bang] = &Parser::parsePrefixExpression;
  prefixParseFns[tok_minus] = &Parser::parsePrefixExpression;
  prefixParseFns[tok_lparen] = &Parser::parseGroupedExpression;
  prefixParseFns[tok_if] = &Parser::parseIfExpression;
  prefixParseFns[tok_fn] = &Parser::parseFunctionLiteral;

  infixParseFns[tok_plus] = &Parser::parseInfixExpression;
  infixParseFns[tok_minus] = &Parser::parseInfixExpression;
  infixParseFns[tok_asterisk] = &Parser::parseInfixExpression;
  infixParseFns[tok_slash] = &Parser::parseInfixExpression;
  infixParseFns[tok_eq] = &Parser::parseInfixExpression;
  infixParseFns[tok_neq] = &Parser::parseInfixExpression;
  infixParseFns[tok_lt] = &Parser::parseInfixExpression;
  infixParseFns[tok_gt] = &Parser::parseInfixExpression;

  // Read two tokens, so current and peek token are both set
  nextToken();
  nextToken();
}

void Parser::nextToken() {
  curtok = peektok;
  peektok = lexer.nextLocalized();
}

bool Parser::expectPeek(TokenType type) {
  if (peekToken().is(type)) {
    nextToken();
    return true;
  }

  peekError(type);
  return false;
}

void Parser::peekError(TokenType type) {
  reportSyntaxError("expected next token to be " + std::to_string(type)
      + ", got " + std::to_string(peekToken().getType()) + " instead",
      peektok);
}

void Parser::reportSyntaxError(const std::string &msg,
    const LocalizedToken &pos) {
  errorMessages.push_back(msg);
  diags.push_back(ParseDiagnostic(msg, pos));
}

std::unique_ptr<Program> Parser::parseProgram() {
  std::vector<StmtPtr> statements;
  while (!currentToken().is(tok_eof)) {
    StmtPtr stmt = parseStatement();
    if (stmt)
      statements.push_back(std::move(stmt));

    nextToken(); // eat last token of statement
  }

  return std::unique_ptr<Program>(new Program(std::move(statements)));
}

StmtPtr Parser::parseStatement() {
  switch (currentToken().getType()) {
  case tok_let:
    return parseLetStatement();
  case tok_return:
    return parseReturnStatement();
  default:
    return parseExpressionStatement();
  }
}

StmtPtr Parser::parseLetStatement() {
  Token lettok = currentToken();

  if (!expectPeek(tok_id))
    return nullptr;

  std::unique_ptr<IdExpr> name(
      new IdExpr(currentToken(), currentToken().getLiteral()));

  if (!expectPeek(tok_assign))
    return nullptr;

  nextToken(); // eat =

  ExprPtr value = parseExpression(prec_lowest);
  if (!value)
    return nullptr; // error forwarding

  if (peekToken().is(tok_semicolon))
    nextToken();

  return StmtPtr(new LetStmt(lettok, std::move(name), std::move(value)));
}

StmtPtr Parser::parseReturnStatement() {
  Token rettok = currentToken();
  nextToken(); // eat return

  ExprPtr value = parseExpression(prec_lowest);
  if (!value)
    return nullptr; // error forwarding

  if (peekToken().is(tok_semicolon))
    nextToken();

  return StmtPtr(new ReturnStmt(rettok, std::move(value)));
}

StmtPtr Parser::parseExpressionStatement() {
  Token exprtok = currentToken();

  ExprPtr value = parseExpression(prec_lowest);
  if (!value)
    return nullptr; // error forwarding

  // Semicolon is optional (REPL input like "5 + 5")
  if (peekToken().is(tok_semicolon))
    nextToken();

  return StmtPtr(new ExprStmt(exprtok, std::move(value)));
}

std::unique_ptr<BlockStmt> Parser::parseBlockStatement() {
  Token blocktok = currentToken();
  nextToken(); // eat {

  std::vector<StmtPtr> statements;
  while (!currentToken().is(tok_rbrace)) {
    if (currentToken().is(tok_eof)) {
      reportSyntaxError("expected next token to be "
          + std::to_string(tok_rbrace) + ", got "
          + std::to_string(tok_eof) + " instead", curtok);
      return nullptr;
    }

    StmtPtr stmt = parseStatement();
    if (stmt)
      statements.push_back(std::move(stmt));

    nextToken(); // eat last token of statement
  }

  return std::unique_ptr<BlockStmt>(
      new BlockStmt(blocktok, std::move(statements)));
}

ExprPtr Parser::parseExpression(int prec) {
  auto prefix = prefixParseFns.find(currentToken().getType());
  if (prefix == prefixParseFns.end()) {
    reportSyntaxError("no prefix parse function for "
        + std::to_string(currentToken().getType()) + " found", curtok);
    return nullptr;
  }

  ExprPtr lhs = (this->*(prefix->second))();
  if (!lhs)
    return nullptr; // error forwarding

  // Operators of the same precedence stop the loop, so they fold left
  while (!peekToken().is(tok_semicolon) && prec < peekPrecedence()) {
    auto infix = infixParseFns.find(peekToken().getType());
    if (infix == infixParseFns.end())
      return lhs;

    nextToken(); // advance to operator

    lhs = (this->*(infix->second))(std::move(lhs));
    if (!lhs)
      return nullptr; // error forwarding
  }

  return lhs;
}

Operator getTokenOperator(TokenType type) noexcept {
  switch (type) {
  case tok_eq:
    return op_eq;
  case tok_neq:
    return op_neq;
  case tok_lt:
    return op_lt;
  case tok_gt:
    return op_gt;
  case tok_plus:
    return op_add;
  case tok_asterisk:
    return op_mul;
  case tok_slash:
    return op_div;
  case tok_bang:
    return op_not;
  default:
    return op_sub;
  }
}

ExprPtr Parser::parseInfixExpression(ExprPtr lhs) {
  Token optok = currentToken();
  int prec = currentPrecedence();
  nextToken(); // eat operator

  ExprPtr rhs = parseExpression(prec);
  if (!rhs)
    return nullptr; // error forwarding

  return ExprPtr(new BiOpExpr(optok, getTokenOperator(optok.getType()),
        std::move(lhs), std::move(rhs)));
}

std::unique_ptr<Program> parse(const std::string &source,
    std::vector<std::string> &errors) {
  Lexer lexer(source);
  Parser parser(lexer);

  std::unique_ptr<Program> program = parser.parseProgram();
  errors = parser.errors();

  return program;
}
