#include "monkey/monkey.hpp"

static bool printTokens(const std::string &source) {
  bool error = false;

  Lexer lexer(source);
  LocalizedToken tok = lexer.nextLocalized();
  while (!tok.getToken().is(tok_eof)) {
    if (tok.getToken().is(tok_illegal)) {
      reportError(std::cerr, "Illegal token: "
          + tok.getToken().getLiteral(), tok);
      error = true;
    } else
      std::cout << std::to_string(tok.getToken().getType())
        << " '" << tok.getToken().getLiteral() << "'" << std::endl;

    tok = lexer.nextLocalized();
  }

  return !error;
}

static bool run(const std::string &source, Mode mode) {
  if (mode == mode_tokens)
    return printTokens(source);

  Lexer lexer(source);
  Parser parser(lexer);
  std::unique_ptr<Program> program = parser.parseProgram();

  // Print either the diagnostics or the result, never both
  if (parser.hasErrors()) {
    for (const ParseDiagnostic &diag : parser.diagnostics())
      reportError(std::cerr, diag.getMessage(), diag.getTokenPos());

    return false;
  }

  if (mode == mode_parse) {
    std::cout << program->toString() << std::endl;
    return true;
  }

  // Nothing to print for empty input
  if (program->getStatements().empty())
    return true;

  ObjectPtr result = eval(*program);
  if (result->getObjectType() == obj_error) {
    std::cerr << result->inspect() << std::endl;
    return false;
  }

  std::cout << "=> " << result->inspect() << std::endl;
  return true;
}

bool interpret(std::istream &input, Mode mode, bool interpret_mode) noexcept {
  if (!interpret_mode) {
    std::stringstream buffer;
    buffer << input.rdbuf();

    return run(buffer.str(), mode);
  }

  bool error = false;

  std::string line;
  while (true) {
    std::cout << ">> "; // print prefix
    if (!std::getline(input, line))
      break;

    if (!run(line, mode))
      error = true;
  }

  std::cout << std::endl;

  return !error;
}
