#define BOOST_TEST_MODULE Parser Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "monkey/parser.hpp"

static std::unique_ptr<Program> buildProgram(const std::string &input) {
  std::vector<std::string> errors;
  std::unique_ptr<Program> program = parse(input, errors);

  for (const std::string &error : errors)
    BOOST_ERROR("parser error: " << error);

  return program;
}

static const Expr &singleExpression(const Program &program) {
  BOOST_REQUIRE(program.getStatements().size() == 1u);
  const Statement &stmt = *program.getStatements().front();
  BOOST_REQUIRE(stmt.getStatementType() == stmt_expr);

  return static_cast<const ExprStmt&>(stmt).getExpression();
}

static void test_integer(const Expr &expr, std::int64_t value) {
  BOOST_REQUIRE(expr.getExpressionType() == expr_int);
  BOOST_TEST(static_cast<const IntExpr&>(expr).getNumber() == value);
  BOOST_TEST(expr.tokenLiteral() == std::to_string(value));
}

static void test_identifier(const Expr &expr, const std::string &name) {
  BOOST_REQUIRE(expr.getExpressionType() == expr_id);
  BOOST_TEST(static_cast<const IdExpr&>(expr).getName() == name);
  BOOST_TEST(expr.tokenLiteral() == name);
}

static void test_boolean(const Expr &expr, bool value) {
  BOOST_REQUIRE(expr.getExpressionType() == expr_bool);
  BOOST_TEST(static_cast<const BoolExpr&>(expr).getValue() == value);
  BOOST_TEST(expr.tokenLiteral() == (value ? "true" : "false"));
}

static void test_infix(const Expr &expr, const std::string &lhs,
    const std::string &op, const std::string &rhs) {
  BOOST_REQUIRE(expr.getExpressionType() == expr_biop);
  const BiOpExpr &biop = static_cast<const BiOpExpr&>(expr);
  BOOST_TEST(biop.getLHS().toString() == lhs);
  BOOST_TEST(std::to_string(biop.getOperator()) == op);
  BOOST_TEST(biop.getRHS().toString() == rhs);
}

BOOST_AUTO_TEST_CASE( let_statements_test ) {
  auto program = buildProgram("let x = 5;\n"
      "let y = 10;\n"
      "let foobar = 838383;");

  BOOST_REQUIRE(program->getStatements().size() == 3u);

  const char *names[] = { "x", "y", "foobar" };
  const std::int64_t values[] = { 5, 10, 838383 };
  for (std::size_t i = 0; i < 3; ++i) {
    const Statement &stmt = *program->getStatements()[i];
    BOOST_TEST(stmt.tokenLiteral() == "let");
    BOOST_REQUIRE(stmt.getStatementType() == stmt_let);

    const LetStmt &let = static_cast<const LetStmt&>(stmt);
    BOOST_TEST(let.getName().getName() == names[i]);
    BOOST_TEST(let.getName().tokenLiteral() == names[i]);
    test_integer(let.getValue(), values[i]);
  }
}

BOOST_AUTO_TEST_CASE( return_statements_test ) {
  auto program = buildProgram("return 5;\n"
      "return 10;\n"
      "return 993322;");

  BOOST_REQUIRE(program->getStatements().size() == 3u);
  for (const StmtPtr &stmt : program->getStatements()) {
    BOOST_TEST(stmt->getStatementType() == stmt_return);
    BOOST_TEST(stmt->tokenLiteral() == "return");
  }

  BOOST_TEST(program->toString() == "return 5;\nreturn 10;\nreturn 993322;");
}

BOOST_AUTO_TEST_CASE( program_to_string_test ) {
  std::vector<StmtPtr> statements;
  statements.push_back(StmtPtr(new LetStmt(Token(tok_let),
          std::unique_ptr<IdExpr>(new IdExpr(Token(tok_id, "myVar"), "myVar")),
          ExprPtr(new IdExpr(Token(tok_id, "anotherVar"), "anotherVar")))));
  Program program(std::move(statements));

  BOOST_TEST(program.toString() == "let myVar = anotherVar;");
  BOOST_TEST(program.tokenLiteral() == "let");
  BOOST_TEST(Program().tokenLiteral() == "");
}

BOOST_AUTO_TEST_CASE( literal_expressions_test ) {
  auto program = buildProgram("foobar;");
  test_identifier(singleExpression(*program), "foobar");

  program = buildProgram("5;");
  test_integer(singleExpression(*program), 5);

  program = buildProgram("9223372036854775807");
  test_integer(singleExpression(*program), INT64_MAX);

  program = buildProgram("true; false;");
  BOOST_REQUIRE(program->getStatements().size() == 2u);
  test_boolean(static_cast<const ExprStmt&>(
        *program->getStatements()[0]).getExpression(), true);
  test_boolean(static_cast<const ExprStmt&>(
        *program->getStatements()[1]).getExpression(), false);
}

BOOST_AUTO_TEST_CASE( prefix_expressions_test ) {
  struct { const char *input; const char *op; const char *rhs; } tests[] = {
    { "!5", "!", "5" },
    { "- 15;", "-", "15" },
    { "!true", "!", "true" },
    { "!false", "!", "false" },
  };

  for (auto &test : tests) {
    auto program = buildProgram(test.input);
    const Expr &expr = singleExpression(*program);

    BOOST_REQUIRE(expr.getExpressionType() == expr_unop);
    const UnOpExpr &unop = static_cast<const UnOpExpr&>(expr);
    BOOST_TEST(std::to_string(unop.getOperator()) == test.op);
    BOOST_TEST(unop.getExpression().toString() == test.rhs);
  }

  auto program = buildProgram("!5");
  const UnOpExpr &unop =
    static_cast<const UnOpExpr&>(singleExpression(*program));
  test_integer(unop.getExpression(), 5);
}

BOOST_AUTO_TEST_CASE( infix_expressions_test ) {
  struct {
    const char *input, *lhs, *op, *rhs;
  } tests[] = {
    { "5 + 5;", "5", "+", "5" },
    { "3 + 10", "3", "+", "10" },
    { "5 - 5;", "5", "-", "5" },
    { "5 * 5;", "5", "*", "5" },
    { "5 / 5;", "5", "/", "5" },
    { "5 > 5;", "5", ">", "5" },
    { "5 < 5;", "5", "<", "5" },
    { "0 < 83", "0", "<", "83" },
    { "5 == 5;", "5", "==", "5" },
    { "5 != 5;", "5", "!=", "5" },
    { "true == true", "true", "==", "true" },
    { "true != false;", "true", "!=", "false" },
    { "false == false", "false", "==", "false" },
  };

  for (auto &test : tests) {
    auto program = buildProgram(test.input);
    test_infix(singleExpression(*program), test.lhs, test.op, test.rhs);
  }

  auto program = buildProgram("5 + 5;");
  const BiOpExpr &biop =
    static_cast<const BiOpExpr&>(singleExpression(*program));
  test_integer(biop.getLHS(), 5);
  BOOST_TEST(biop.getOperator() == op_add);
  test_integer(biop.getRHS(), 5);
}

BOOST_AUTO_TEST_CASE( operator_precedence_test ) {
  struct { const char *input, *expected; } tests[] = {
    { "-a * b", "((-a) * b)" },
    { "!-a", "(!(-a))" },
    { "a + b + c", "((a + b) + c)" },
    { "a + b - c", "((a + b) - c)" },
    { "a * b * c", "((a * b) * c)" },
    { "a * b / c", "((a * b) / c)" },
    { "a + b / c", "(a + (b / c))" },
    { "a + b * c + d / e - f", "(((a + (b * c)) + (d / e)) - f)" },
    { "3 + 4; -5 * 5", "(3 + 4)\n((-5) * 5)" },
    { "5 > 4 == 3 < 4", "((5 > 4) == (3 < 4))" },
    { "5 < 4 != 3 > 4", "((5 < 4) != (3 > 4))" },
    { "3 + 4 * 5 == 3 * 1 + 4 * 5", "((3 + (4 * 5)) == ((3 * 1) + (4 * 5)))" },
    { "true", "true" },
    { "false", "false" },
    { "3 > 5 == false", "((3 > 5) == false)" },
    { "3 < 5 == true", "((3 < 5) == true)" },
    { "1 + (2 + 3) + 4", "((1 + (2 + 3)) + 4)" },
    { "(5 + 5) * 2", "((5 + 5) * 2)" },
    { "2 / (5 + 5)", "(2 / (5 + 5))" },
    { "-(5 + 5)", "(-(5 + 5))" },
    { "!(true == true)", "(!(true == true))" },
    { "--a", "(-(-a))" },
    { "a == b != c", "((a == b) != c)" },
  };

  for (auto &test : tests) {
    auto program = buildProgram(test.input);
    BOOST_TEST(program->toString() == test.expected);
  }
}

BOOST_AUTO_TEST_CASE( if_expression_test ) {
  auto program = buildProgram("if (x < y) { x }");
  const Expr &expr = singleExpression(*program);

  BOOST_REQUIRE(expr.getExpressionType() == expr_if);
  const IfExpr &ifexpr = static_cast<const IfExpr&>(expr);
  test_infix(ifexpr.getCondition(), "x", "<", "y");

  BOOST_REQUIRE(ifexpr.getConsequence().getStatements().size() == 1u);
  const Statement &consequence = *ifexpr.getConsequence().getStatements()[0];
  BOOST_REQUIRE(consequence.getStatementType() == stmt_expr);
  test_identifier(static_cast<const ExprStmt&>(consequence).getExpression(),
      "x");

  BOOST_TEST(!ifexpr.getAlternative());
  BOOST_TEST(ifexpr.toString() == "if (x < y) {\nx\n}");
}

BOOST_AUTO_TEST_CASE( if_else_expression_test ) {
  auto program = buildProgram("if (y > x) { x } else { y }");
  const Expr &expr = singleExpression(*program);

  BOOST_REQUIRE(expr.getExpressionType() == expr_if);
  const IfExpr &ifexpr = static_cast<const IfExpr&>(expr);
  test_infix(ifexpr.getCondition(), "y", ">", "x");

  BOOST_REQUIRE(ifexpr.getConsequence().getStatements().size() == 1u);
  BOOST_REQUIRE(ifexpr.getAlternative());
  BOOST_REQUIRE(ifexpr.getAlternative()->getStatements().size() == 1u);
  const Statement &alternative = *ifexpr.getAlternative()->getStatements()[0];
  BOOST_REQUIRE(alternative.getStatementType() == stmt_expr);
  test_identifier(static_cast<const ExprStmt&>(alternative).getExpression(),
      "y");

  BOOST_TEST(ifexpr.toString() == "if (y > x) {\nx\n} else {\ny\n}");

  // Conditions without own parentheses get them from the if
  program = buildProgram("if (true) { 1; 2 }");
  BOOST_TEST(program->toString() == "if (true) {\n1\n2\n}");
}

BOOST_AUTO_TEST_CASE( function_literal_test ) {
  auto program = buildProgram("fn(x, y) { x + y; }");
  const Expr &expr = singleExpression(*program);

  BOOST_REQUIRE(expr.getExpressionType() == expr_fn);
  const FnExpr &fn = static_cast<const FnExpr&>(expr);

  BOOST_REQUIRE(fn.getParameters().size() == 2u);
  test_identifier(*fn.getParameters()[0], "x");
  test_identifier(*fn.getParameters()[1], "y");

  BOOST_REQUIRE(fn.getBody().getStatements().size() == 1u);
  const Statement &body = *fn.getBody().getStatements()[0];
  BOOST_REQUIRE(body.getStatementType() == stmt_expr);
  test_infix(static_cast<const ExprStmt&>(body).getExpression(),
      "x", "+", "y");

  BOOST_TEST(fn.toString() == "fn(x, y) {\n(x + y)\n}");
}

BOOST_AUTO_TEST_CASE( function_parameters_test ) {
  struct {
    const char *input;
    std::vector<std::string> params;
  } tests[] = {
    { "fn () {};", {} },
    { "fn (x) {};", { "x" } },
    { "fn (x, y, z) {};", { "x", "y", "z" } },
    { "fn (a, a) {};", { "a", "a" } },
  };

  for (auto &test : tests) {
    auto program = buildProgram(test.input);
    const Expr &expr = singleExpression(*program);
    BOOST_REQUIRE(expr.getExpressionType() == expr_fn);

    const FnExpr &fn = static_cast<const FnExpr&>(expr);
    BOOST_REQUIRE(fn.getParameters().size() == test.params.size());
    for (std::size_t i = 0; i < test.params.size(); ++i)
      test_identifier(*fn.getParameters()[i], test.params[i]);
  }
}

BOOST_AUTO_TEST_CASE( canonical_rendering_fixpoint_test ) {
  const char *inputs[] = {
    "let x = 5 * (1 + 2); return -x",
    "a + b * c + d / e - f",
    "if (x) { let y = !x; } else { return 1 }",
    "if (1 < 2) { if (true) { return 10; } return 1; }",
    "let f = fn(a, b) { a * b }; fn() {}",
    "!(-(5 + 5)) == false",
  };

  for (const char *input : inputs) {
    std::string rendered = buildProgram(input)->toString();
    std::string again = buildProgram(rendered)->toString();
    BOOST_TEST(again == rendered);
  }
}

static std::vector<std::string> parseErrors(const std::string &input) {
  std::vector<std::string> errors;
  parse(input, errors);
  return errors;
}

BOOST_AUTO_TEST_CASE( let_errors_test ) {
  auto errors = parseErrors("let = 5;");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "expected next token to be IDENT, got = instead");

  errors = parseErrors("let x 5;");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "expected next token to be =, got INT instead");
}

BOOST_AUTO_TEST_CASE( batch_errors_test ) {
  // All statements are reported, not only the first broken one
  auto errors = parseErrors("let = 1;\nlet y 2;\nlet z = 3;");
  BOOST_TEST(errors.size() >= 2u);

  Lexer lexer("let = 1;\nlet y 2;\nlet z = 3;");
  Parser parser(lexer);
  auto program = parser.parseProgram();
  BOOST_TEST(parser.hasErrors());
  BOOST_TEST(parser.diagnostics().size() == parser.errors().size());
  BOOST_TEST(parser.diagnostics()[0].getTokenPos().getLine() == 0u);

  // The last, correct statement is kept
  BOOST_REQUIRE(!program->getStatements().empty());
  BOOST_TEST(program->getStatements().back()->toString() == "let z = 3;");
}

BOOST_AUTO_TEST_CASE( prefix_errors_test ) {
  auto errors = parseErrors("+ 5");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "no prefix parse function for + found");

  errors = parseErrors("1 + ;");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "no prefix parse function for ; found");

  errors = parseErrors("a @ b");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "no prefix parse function for ILLEGAL found");
}

BOOST_AUTO_TEST_CASE( structural_errors_test ) {
  auto errors = parseErrors("(1 + 2");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "expected next token to be ), got EOF instead");

  errors = parseErrors("if x { 1 }");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "expected next token to be (, got IDENT instead");

  errors = parseErrors("if (x) { 1 ");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "expected next token to be }, got EOF instead");

  errors = parseErrors("fn (x, 1) {}");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "expected next token to be IDENT, got INT instead");

  errors = parseErrors("99999999999999999999");
  BOOST_REQUIRE(!errors.empty());
  BOOST_TEST(errors[0] == "could not parse 99999999999999999999 as integer");
}
