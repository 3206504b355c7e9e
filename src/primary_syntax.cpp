#include "monkey/parser.hpp"

/* only for parsing expressions starting with a prefix token */

ExprPtr Parser::parseIdentifier() {
  return ExprPtr(new IdExpr(currentToken(), currentToken().getLiteral()));
}

ExprPtr Parser::parseIntegerLiteral() {
  const std::string &literal = currentToken().getLiteral();

  std::int64_t num = 0;
  for (char c : literal) {
    std::int64_t digit = c - '0';
    if (num > (INT64_MAX - digit) / 10) {
      reportSyntaxError("could not parse " + literal + " as integer", curtok);
      return nullptr;
    }

    num = num * 10 + digit;
  }

  return ExprPtr(new IntExpr(currentToken(), num));
}

ExprPtr Parser::parseBoolean() {
  return ExprPtr(new BoolExpr(currentToken(), currentToken().is(tok_true)));
}

ExprPtr Parser::parsePrefixExpression() {
  Token optok = currentToken();
  nextToken(); // eat ! or -

  ExprPtr expr = parseExpression(prec_prefix);
  if (!expr)
    return nullptr; // error forwarding

  return ExprPtr(new UnOpExpr(optok, getTokenOperator(optok.getType()),
        std::move(expr)));
}

ExprPtr Parser::parseGroupedExpression() {
  nextToken(); // eat (

  ExprPtr expr = parseExpression(prec_lowest);
  if (!expr)
    return nullptr; // error forwarding

  if (!expectPeek(tok_rparen))
    return nullptr;

  return expr;
}

ExprPtr Parser::parseIfExpression() {
  Token iftok = currentToken();

  if (!expectPeek(tok_lparen))
    return nullptr;

  nextToken(); // eat (

  ExprPtr condition = parseExpression(prec_lowest);
  if (!condition)
    return nullptr; // error forwarding

  if (!expectPeek(tok_rparen) || !expectPeek(tok_lbrace))
    return nullptr;

  std::unique_ptr<BlockStmt> consequence = parseBlockStatement();
  if (!consequence)
    return nullptr; // error forwarding

  std::unique_ptr<BlockStmt> alternative;
  if (peekToken().is(tok_else)) {
    nextToken(); // advance to else

    if (!expectPeek(tok_lbrace))
      return nullptr;

    alternative = parseBlockStatement();
    if (!alternative)
      return nullptr; // error forwarding
  }

  return ExprPtr(new IfExpr(iftok, std::move(condition),
        std::move(consequence), std::move(alternative)));
}

ExprPtr Parser::parseFunctionLiteral() {
  Token fntok = currentToken();

  if (!expectPeek(tok_lparen))
    return nullptr;

  std::vector<std::unique_ptr<IdExpr>> params;
  if (!parseFunctionParameters(params))
    return nullptr; // error forwarding

  if (!expectPeek(tok_lbrace))
    return nullptr;

  std::unique_ptr<BlockStmt> body = parseBlockStatement();
  if (!body)
    return nullptr; // error forwarding

  return ExprPtr(new FnExpr(fntok, std::move(params), std::move(body)));
}

bool Parser::parseFunctionParameters(
    std::vector<std::unique_ptr<IdExpr>> &params) {
  if (peekToken().is(tok_rparen)) {
    nextToken(); // advance to )
    return true;
  }

  if (!expectPeek(tok_id))
    return false;

  params.push_back(std::unique_ptr<IdExpr>(
        new IdExpr(currentToken(), currentToken().getLiteral())));

  while (peekToken().is(tok_comma)) {
    nextToken(); // advance to ,

    if (!expectPeek(tok_id))
      return false;

    params.push_back(std::unique_ptr<IdExpr>(
          new IdExpr(currentToken(), currentToken().getLiteral())));
  }

  return expectPeek(tok_rparen);
}
