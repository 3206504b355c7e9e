#include "monkey/syntax.hpp"

static std::string joinStatements(const std::vector<StmtPtr> &statements) {
  std::string result;
  for (auto it = statements.begin(); it != statements.end(); ++it) {
    if (it != statements.begin())
      result += "\n";

    result += (*it)->toString();
  }

  return result;
}

std::string BlockStmt::toString() const noexcept {
  return joinStatements(statements);
}

std::string Program::toString() const noexcept {
  return joinStatements(statements);
}

std::string IfExpr::toString() const noexcept {
  // Prefix and infix expressions already render their own parentheses
  std::string cond = condition->toString();
  if (condition->getExpressionType() != expr_unop
      && condition->getExpressionType() != expr_biop)
    cond = "(" + cond + ")";

  std::string result = tokenLiteral() + " " + cond
    + " {\n" + consequence->toString() + "\n}";
  if (alternative)
    result += " else {\n" + alternative->toString() + "\n}";

  return result;
}

std::string FnExpr::toString() const noexcept {
  std::string result = tokenLiteral() + "(";
  for (auto it = parameters.begin(); it != parameters.end(); ++it) {
    if (it != parameters.begin())
      result += ", ";

    result += (*it)->toString();
  }

  return result + ") {\n" + body->toString() + "\n}";
}

std::string std::to_string(Operator op) noexcept {
  switch (op) {
  case op_eq:
    return "==";
  case op_neq:
    return "!=";
  case op_lt:
    return "<";
  case op_gt:
    return ">";
  case op_add:
    return "+";
  case op_sub:
    return "-";
  case op_mul:
    return "*";
  case op_div:
    return "/";
  case op_not:
    return "!";
  }

  return ""; // invalid
}
