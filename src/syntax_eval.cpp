#include "monkey/eval.hpp"

// interpreter stuff

static ObjectPtr newError(const std::string &msg) {
  return std::make_shared<ErrorObj>(msg);
}

//!\return Returns true for errors and return signals, which stop evaluation.
static bool isSignal(const ObjectPtr &obj) noexcept {
  return obj->getObjectType() == obj_error
    || obj->getObjectType() == obj_return;
}

static std::int64_t asInteger(const ObjectPtr &obj) noexcept {
  return static_cast<const IntObj&>(*obj).getNumber();
}

// Integer arithmetic wraps around instead of overflowing
static std::int64_t wrapAdd(std::int64_t num0, std::int64_t num1) {
  return static_cast<std::int64_t>(
      static_cast<std::uint64_t>(num0) + static_cast<std::uint64_t>(num1));
}

static std::int64_t wrapSub(std::int64_t num0, std::int64_t num1) {
  return static_cast<std::int64_t>(
      static_cast<std::uint64_t>(num0) - static_cast<std::uint64_t>(num1));
}

static std::int64_t wrapMul(std::int64_t num0, std::int64_t num1) {
  return static_cast<std::int64_t>(
      static_cast<std::uint64_t>(num0) * static_cast<std::uint64_t>(num1));
}

static ObjectPtr unopeval(Operator op, const ObjectPtr &rhs) {
  switch (op) {
  case op_not:
    return nativeBoolToObj(!isTruthy(rhs));
  case op_sub:
    if (rhs->getObjectType() != obj_integer)
      break;

    return std::make_shared<IntObj>(wrapSub(0, asInteger(rhs)));
  default:
    break;
  }

  return newError("unknown operator: " + std::to_string(op)
      + std::to_string(rhs->getObjectType()));
}

static ObjectPtr biopeval(Operator op, std::int64_t num0, std::int64_t num1) {
  switch (op) {
  case op_add: return std::make_shared<IntObj>(wrapAdd(num0, num1));
  case op_sub: return std::make_shared<IntObj>(wrapSub(num0, num1));
  case op_mul: return std::make_shared<IntObj>(wrapMul(num0, num1));
  case op_div:
    if (num1 == 0)
      return newError("division by zero");
    if (num1 == -1)
      return std::make_shared<IntObj>(wrapSub(0, num0));

    return std::make_shared<IntObj>(num0 / num1);
  case op_lt: return nativeBoolToObj(num0 < num1);
  case op_gt: return nativeBoolToObj(num0 > num1);
  case op_eq: return nativeBoolToObj(num0 == num1);
  case op_neq: return nativeBoolToObj(num0 != num1);
  case op_not:
    break;
  }

  return newError("unknown operator: INTEGER " + std::to_string(op)
      + " INTEGER");
}

static ObjectPtr biopeval(Operator op, const ObjectPtr &lhs,
    const ObjectPtr &rhs) {
  if (lhs->getObjectType() == obj_integer
      && rhs->getObjectType() == obj_integer)
    return biopeval(op, asInteger(lhs), asInteger(rhs));

  // Only one instance of true, false and null exists
  if (op == op_eq)
    return nativeBoolToObj(lhs == rhs);
  if (op == op_neq)
    return nativeBoolToObj(lhs != rhs);

  std::string msg = std::to_string(lhs->getObjectType()) + " "
    + std::to_string(op) + " " + std::to_string(rhs->getObjectType());
  if (lhs->getObjectType() != rhs->getObjectType())
    return newError("type mismatch: " + msg);

  return newError("unknown operator: " + msg);
}

static ObjectPtr evalBlock(const BlockStmt &block) {
  ObjectPtr result = NULL_OBJ;
  for (const StmtPtr &stmt : block.getStatements()) {
    result = eval(*stmt);

    // Return signal and errors are passed on unchanged
    switch (result->getObjectType()) {
    case obj_return:
    case obj_error:
      return result;
    default:
      break;
    }
  }

  return result;
}

static ObjectPtr evalIf(const IfExpr &expr) {
  ObjectPtr condition = eval(expr.getCondition());
  if (isSignal(condition))
    return condition; // signal forwarding

  if (isTruthy(condition))
    return evalBlock(expr.getConsequence());

  if (expr.getAlternative())
    return evalBlock(*expr.getAlternative());

  return NULL_OBJ;
}

ObjectPtr eval(const Program &program) noexcept {
  ObjectPtr result = NULL_OBJ;
  for (const StmtPtr &stmt : program.getStatements()) {
    result = eval(*stmt);

    switch (result->getObjectType()) {
    case obj_return:
      return static_cast<const ReturnObj&>(*result).getValue();
    case obj_error:
      return result;
    default:
      break;
    }
  }

  return result;
}

ObjectPtr eval(const Statement &stmt) noexcept {
  switch (stmt.getStatementType()) {
  case stmt_let: {
      // No environment to bind to: only the value is checked
      ObjectPtr value = eval(static_cast<const LetStmt&>(stmt).getValue());
      if (isSignal(value))
        return value; // signal forwarding

      return NULL_OBJ;
    }
  case stmt_return: {
      ObjectPtr value = eval(static_cast<const ReturnStmt&>(stmt).getValue());
      if (isSignal(value))
        return value; // signal forwarding

      return std::make_shared<ReturnObj>(value);
    }
  case stmt_expr:
    return eval(static_cast<const ExprStmt&>(stmt).getExpression());
  case stmt_block:
    return evalBlock(static_cast<const BlockStmt&>(stmt));
  }

  return newError("unknown statement: " + stmt.toString());
}

ObjectPtr eval(const Expr &expr) noexcept {
  switch (expr.getExpressionType()) {
  case expr_id:
    return newError("identifier not found: "
        + static_cast<const IdExpr&>(expr).getName());
  case expr_int:
    return std::make_shared<IntObj>(
        static_cast<const IntExpr&>(expr).getNumber());
  case expr_bool:
    return nativeBoolToObj(static_cast<const BoolExpr&>(expr).getValue());
  case expr_unop: {
      const UnOpExpr &unop = static_cast<const UnOpExpr&>(expr);

      ObjectPtr rhs = eval(unop.getExpression());
      if (isSignal(rhs))
        return rhs; // signal forwarding

      return unopeval(unop.getOperator(), rhs);
    }
  case expr_biop: {
      const BiOpExpr &biop = static_cast<const BiOpExpr&>(expr);

      // Left to right
      ObjectPtr lhs = eval(biop.getLHS());
      if (isSignal(lhs))
        return lhs; // signal forwarding

      ObjectPtr rhs = eval(biop.getRHS());
      if (isSignal(rhs))
        return rhs; // signal forwarding

      return biopeval(biop.getOperator(), lhs, rhs);
    }
  case expr_if:
    return evalIf(static_cast<const IfExpr&>(expr));
  case expr_fn:
    return std::make_shared<FnObj>(static_cast<const FnExpr*>(&expr));
  }

  return newError("unknown expression: " + expr.toString());
}
