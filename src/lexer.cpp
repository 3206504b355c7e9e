#include "monkey/lexer.hpp"

static std::vector<std::string> splitLines(const std::string &input) {
  std::vector<std::string> result;
  std::string lineStr;
  for (char c : input) {
    if (c == '\n') {
      result.push_back(lineStr);
      lineStr = "";
    } else
      lineStr += c;
  }
  result.push_back(lineStr);

  return result;
}

Lexer::Lexer(const std::string &input)
  : input(input), lines(splitLines(input)), pos{0}, line{0}, column{0} {
}

static Token identifierToken(const std::string &id) {
  if (id == "fn")
    return Token(tok_fn);
  if (id == "let")
    return Token(tok_let);
  if (id == "true")
    return Token(tok_true);
  if (id == "false")
    return Token(tok_false);
  if (id == "if")
    return Token(tok_if);
  if (id == "else")
    return Token(tok_else);
  if (id == "return")
    return Token(tok_return);

  return Token(tok_id, id);
}

static bool isLetter(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c));
}

char Lexer::currentChar() const noexcept {
  return pos < input.size() ? input[pos] : '\0';
}

void Lexer::nextChar() noexcept {
  if (pos >= input.size())
    return;

  ++pos;
  ++column;
}

void Lexer::skipWhitespace() noexcept {
  while (pos < input.size()
      && std::isspace(static_cast<unsigned char>(currentChar()))) {
    if (currentChar() == '\n') {
      nextChar(); // eat new line
      ++line;
      column = 0;
    } else
      nextChar();
  }
}

LocalizedToken Lexer::nextLocalized() {
  skipWhitespace();

  std::size_t tokenLine = line;
  std::size_t tokenColumn = column;
  std::string lineStr = tokenLine < lines.size() ? lines[tokenLine] : "";

  return LocalizedToken(nextToken(), tokenLine, tokenColumn, lineStr);
}

Token Lexer::nextToken() {
  skipWhitespace();

  char c = currentChar();
  switch (c) {
  case '\0':
    return Token(tok_eof);
  case '{':
    nextChar(); // eat {
    return Token(tok_lbrace);
  case '}':
    nextChar(); // eat }
    return Token(tok_rbrace);
  case '(':
    nextChar(); // eat (
    return Token(tok_lparen);
  case ')':
    nextChar(); // eat )
    return Token(tok_rparen);
  case ',':
    nextChar(); // eat ,
    return Token(tok_comma);
  case ';':
    nextChar(); // eat ;
    return Token(tok_semicolon);
  case '+':
    nextChar(); // eat +
    return Token(tok_plus);
  case '-':
    nextChar(); // eat -
    return Token(tok_minus);
  case '*':
    nextChar(); // eat *
    return Token(tok_asterisk);
  case '/':
    nextChar(); // eat /
    return Token(tok_slash);
  case '<':
    nextChar(); // eat <
    return Token(tok_lt);
  case '>':
    nextChar(); // eat >
    return Token(tok_gt);
  case '=':
    nextChar(); // eat =
    if (currentChar() == '=') {
      nextChar(); // eat =
      return Token(tok_eq);
    }

    return Token(tok_assign);
  case '!':
    nextChar(); // eat !
    if (currentChar() == '=') {
      nextChar(); // eat =
      return Token(tok_neq);
    }

    return Token(tok_bang);
  }

  if (isLetter(c)) {
    // Identifier or keyword
    std::size_t start = pos;
    while (isLetter(currentChar()))
      nextChar(); // eat letter

    return identifierToken(input.substr(start, pos - start));
  }

  if (isDigit(c)) {
    // Integer, kept as written. Sign is a prefix operator.
    std::size_t start = pos;
    while (isDigit(currentChar()))
      nextChar(); // eat digit

    return Token(tok_int, input.substr(start, pos - start));
  }

  nextChar(); // eat unknown character
  return Token(tok_illegal, std::string(1, c));
}

void reportError(std::ostream &out, const std::string &msg,
    const LocalizedToken &pos) noexcept {
  // Print line
  out << pos.getLineText() << std::endl;

  // Mark position
  std::size_t width = pos.getToken().getLiteral().size();
  for (std::size_t i = 0; i < pos.getColumn(); ++i)
    out << ' ';
  for (std::size_t i = 1; i < width; ++i)
    out << '~';
  out << '^' << std::endl;

  // Print error message
  if (!msg.empty())
    out << pos.getLine() + 1 << ':' << pos.getColumn() + 1 << ": " << msg
        << std::endl;
}

std::string getTokenLiteral(TokenType type) noexcept {
  switch (type) {
  case tok_eof:
  case tok_illegal:
  case tok_id:
  case tok_int:
    return "";
  case tok_assign:
    return "=";
  case tok_plus:
    return "+";
  case tok_minus:
    return "-";
  case tok_bang:
    return "!";
  case tok_asterisk:
    return "*";
  case tok_slash:
    return "/";
  case tok_eq:
    return "==";
  case tok_neq:
    return "!=";
  case tok_lt:
    return "<";
  case tok_gt:
    return ">";
  case tok_comma:
    return ",";
  case tok_semicolon:
    return ";";
  case tok_lparen:
    return "(";
  case tok_rparen:
    return ")";
  case tok_lbrace:
    return "{";
  case tok_rbrace:
    return "}";
  case tok_fn:
    return "fn";
  case tok_let:
    return "let";
  case tok_true:
    return "true";
  case tok_false:
    return "false";
  case tok_if:
    return "if";
  case tok_else:
    return "else";
  case tok_return:
    return "return";
  }

  return ""; // invalid
}

std::string std::to_string(TokenType type) noexcept {
  switch (type) {
  case tok_eof:
    return "EOF";
  case tok_illegal:
    return "ILLEGAL";
  case tok_id:
    return "IDENT";
  case tok_int:
    return "INT";
  case tok_fn:
    return "FUNCTION";
  case tok_let:
    return "LET";
  case tok_true:
    return "TRUE";
  case tok_false:
    return "FALSE";
  case tok_if:
    return "IF";
  case tok_else:
    return "ELSE";
  case tok_return:
    return "RETURN";
  default:
    return getTokenLiteral(type);
  }
}
