#ifndef MONKEY_SYNTAX_HPP
#define MONKEY_SYNTAX_HPP

/*!\file monkey/syntax.hpp
 * \brief Abstract syntax tree.
 */

#include "monkey/global.hpp"
#include "monkey/lexer.hpp"

class Expr;
class IdExpr;
class IntExpr;
class BoolExpr;
class UnOpExpr;
class BiOpExpr;
class IfExpr;
class FnExpr;

class Statement;
class LetStmt;
class ReturnStmt;
class ExprStmt;
class BlockStmt;

class Program;

typedef std::unique_ptr<Expr> ExprPtr;
typedef std::unique_ptr<Statement> StmtPtr;

/*!\brief Operator type.
 * \see UnOpExpr::getOperator, BiOpExpr::getOperator
 */
enum Operator {
  op_eq,  //!< ==
  op_neq, //!< !=
  op_lt,  //!< \<
  op_gt,  //!< \>

  op_add, //!< +
  op_sub, //!< - (binary and unary)
  op_mul, //!< *
  op_div, //!< /

  op_not, //!< !
};

namespace std {
  std::string to_string(Operator op) noexcept;
};

/*!\brief Types of expressions.
 * \see Expr, Expr::getExpressionType
 */
enum ExprType : int {
  expr_id,   //!< Identifier
  expr_int,  //!< Integer literal
  expr_bool, //!< Boolean literal
  expr_unop, //!< Unary prefix operator
  expr_biop, //!< Binary operator
  expr_if,   //!< If-else
  expr_fn,   //!< Function literal
};

/*!\brief Types of statements.
 * \see Statement, Statement::getStatementType
 */
enum StmtType : int {
  stmt_let,    //!< let \<id\> = \<expr\>;
  stmt_return, //!< return \<expr\>;
  stmt_expr,   //!< \<expr\>;
  stmt_block,  //!< { \<statement\>* }
};

/*!\brief Common base of statements, expressions and programs.
 */
class Node {
  Token token;
public:
  Node(const Token &token) : token(token) {}
  virtual ~Node() {}

  //!\return Returns the token the node was parsed from.
  const Token &getToken() const noexcept { return token; }

  //!\return Returns the literal of the leading token.
  virtual std::string tokenLiteral() const noexcept {
    return token.getLiteral();
  }

  /*!\return Returns canonical rendering in monkey (the programming
   * language to parse).
   */
  virtual std::string toString() const noexcept = 0;
};

/*!\brief Main expression handle (should only be used as parent class).
 */
class Expr : public Node {
  ExprType type;
public:
  Expr(ExprType type, const Token &token) : Node(token), type{type} {}
  virtual ~Expr() {}

  /*!\return Returns the type of expression.
   * \see ExprType
   */
  ExprType getExpressionType() const noexcept { return type; }
};

/*!\brief Identifier expression.
 */
class IdExpr : public Expr {
  std::string id;
public:
  IdExpr(const Token &token, const std::string &id)
    : Expr(expr_id, token), id(id) {}

  virtual ~IdExpr() {}

  const std::string &getName() const noexcept { return id; }

  virtual std::string toString() const noexcept override {
    return id;
  }
};

/*!\brief Integer number expression.
 */
class IntExpr : public Expr {
  std::int64_t num;
public:
  IntExpr(const Token &token, std::int64_t num)
    : Expr(expr_int, token), num{num} {}

  virtual ~IntExpr() {}

  std::int64_t getNumber() const noexcept { return num; }

  virtual std::string toString() const noexcept override {
    return getToken().getLiteral();
  }
};

/*!\brief Boolean literal ('true' or 'false').
 */
class BoolExpr : public Expr {
  bool value;
public:
  BoolExpr(const Token &token, bool value)
    : Expr(expr_bool, token), value{value} {}

  virtual ~BoolExpr() {}

  bool getValue() const noexcept { return value; }

  virtual std::string toString() const noexcept override {
    return getToken().getLiteral();
  }
};

/*!\brief Unary prefix operator expression.
 *
 *     '!' \<expr\> | '-' \<expr\>
 */
class UnOpExpr : public Expr {
  Operator op;
  ExprPtr expr;
public:
  UnOpExpr(const Token &token, Operator op, ExprPtr expr)
    : Expr(expr_unop, token), op{op}, expr(std::move(expr)) {}

  virtual ~UnOpExpr() {}

  Operator getOperator() const noexcept { return op; }
  const Expr &getExpression() const noexcept { return *expr; }

  virtual std::string toString() const noexcept override {
    return "(" + std::to_string(op) + expr->toString() + ")";
  }
};

/*!\brief Binary operator expression.
 */
class BiOpExpr : public Expr {
  Operator op;
  ExprPtr lhs, rhs;
public:
  BiOpExpr(const Token &token, Operator op, ExprPtr lhs, ExprPtr rhs)
    : Expr(expr_biop, token), op{op}, lhs(std::move(lhs)),
      rhs(std::move(rhs)) {}

  virtual ~BiOpExpr() {}

  //!\return Returns operator.
  Operator getOperator() const noexcept { return op; }

  //!\return Returns left-hand-side
  const Expr &getLHS() const noexcept { return *lhs; }

  //!\return Returns right-hand-side
  const Expr &getRHS() const noexcept { return *rhs; }

  virtual std::string toString() const noexcept override {
    return "(" + lhs->toString()
      + " " + std::to_string(op) + " " + rhs->toString() + ")";
  }
};

/*!\brief Base of all statements.
 */
class Statement : public Node {
  StmtType type;
public:
  Statement(StmtType type, const Token &token) : Node(token), type{type} {}
  virtual ~Statement() {}

  /*!\return Returns the type of statement.
   * \see StmtType
   */
  StmtType getStatementType() const noexcept { return type; }
};

/*!\brief Statements between '{' and '}'.
 */
class BlockStmt : public Statement {
  std::vector<StmtPtr> statements;
public:
  BlockStmt(const Token &token, std::vector<StmtPtr> statements)
    : Statement(stmt_block, token), statements(std::move(statements)) {}

  virtual ~BlockStmt() {}

  const std::vector<StmtPtr> &getStatements() const noexcept
    { return statements; }

  //!\return Returns the statements, one per line.
  virtual std::string toString() const noexcept override;
};

/*!\brief If-else expression.
 *
 *     if '(' \<condition\> ')' \<block\> [ else \<block\> ]
 */
class IfExpr : public Expr {
  ExprPtr condition;
  std::unique_ptr<BlockStmt> consequence, alternative;
public:
  IfExpr(const Token &token, ExprPtr condition,
      std::unique_ptr<BlockStmt> consequence,
      std::unique_ptr<BlockStmt> alternative = nullptr)
    : Expr(expr_if, token), condition(std::move(condition)),
      consequence(std::move(consequence)),
      alternative(std::move(alternative)) {}

  virtual ~IfExpr() {}

  const Expr &getCondition() const noexcept { return *condition; }

  //! Evaluated if condition is truthy.
  const BlockStmt &getConsequence() const noexcept { return *consequence; }

  //! nullptr if there was no else clause.
  const BlockStmt *getAlternative() const noexcept { return alternative.get(); }

  virtual std::string toString() const noexcept override;
};

/*!\brief Function literal.
 *
 *     fn '(' [ \<id\> { ',' \<id\> } ] ')' \<block\>
 */
class FnExpr : public Expr {
  std::vector<std::unique_ptr<IdExpr>> parameters;
  std::unique_ptr<BlockStmt> body;
public:
  FnExpr(const Token &token, std::vector<std::unique_ptr<IdExpr>> parameters,
      std::unique_ptr<BlockStmt> body)
    : Expr(expr_fn, token), parameters(std::move(parameters)),
      body(std::move(body)) {}

  virtual ~FnExpr() {}

  //!\return Returns parameters in declaration order (duplicates kept).
  const std::vector<std::unique_ptr<IdExpr>> &getParameters() const noexcept
    { return parameters; }

  const BlockStmt &getBody() const noexcept { return *body; }

  virtual std::string toString() const noexcept override;
};

/*!\brief Let statement.
 */
class LetStmt : public Statement {
  std::unique_ptr<IdExpr> name;
  ExprPtr value;
public:
  LetStmt(const Token &token, std::unique_ptr<IdExpr> name, ExprPtr value)
    : Statement(stmt_let, token), name(std::move(name)),
      value(std::move(value)) {}

  virtual ~LetStmt() {}

  const IdExpr &getName() const noexcept { return *name; }
  const Expr &getValue() const noexcept { return *value; }

  virtual std::string toString() const noexcept override {
    return tokenLiteral() + " " + name->toString() + " = "
      + value->toString() + ";";
  }
};

/*!\brief Return statement.
 */
class ReturnStmt : public Statement {
  ExprPtr value;
public:
  ReturnStmt(const Token &token, ExprPtr value)
    : Statement(stmt_return, token), value(std::move(value)) {}

  virtual ~ReturnStmt() {}

  const Expr &getValue() const noexcept { return *value; }

  virtual std::string toString() const noexcept override {
    return tokenLiteral() + " " + value->toString() + ";";
  }
};

/*!\brief Expression used as statement.
 */
class ExprStmt : public Statement {
  ExprPtr value;
public:
  ExprStmt(const Token &token, ExprPtr value)
    : Statement(stmt_expr, token), value(std::move(value)) {}

  virtual ~ExprStmt() {}

  const Expr &getExpression() const noexcept { return *value; }

  virtual std::string toString() const noexcept override {
    return value->toString();
  }
};

/*!\brief Parse root: all top-level statements.
 */
class Program : public Node {
  std::vector<StmtPtr> statements;
public:
  Program(std::vector<StmtPtr> statements = std::vector<StmtPtr>())
    : Node(Token(tok_eof)), statements(std::move(statements)) {}

  virtual ~Program() {}

  const std::vector<StmtPtr> &getStatements() const noexcept
    { return statements; }

  //!\return Returns literal of the first statement, empty if none.
  virtual std::string tokenLiteral() const noexcept override {
    return statements.empty() ? std::string()
      : statements.front()->tokenLiteral();
  }

  //!\return Returns the statements, one per line.
  virtual std::string toString() const noexcept override;
};

#endif /* MONKEY_SYNTAX_HPP */
