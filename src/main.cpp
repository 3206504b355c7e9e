#include "monkey/monkey.hpp"

static int usage(const char *program) {
  std::cerr << "Usage: " << program << " [--parse|--tokens] [file]"
    << std::endl;
  return 1;
}

int main(int vargsc, char * vargs[]) {
  Mode mode = mode_eval;
  const char *filename = nullptr;

  for (int i = 1; i < vargsc; ++i) {
    std::string arg = vargs[i];
    if (arg == "--parse" || arg == "-p")
      mode = mode_parse;
    else if (arg == "--tokens" || arg == "-t")
      mode = mode_tokens;
    else if (arg == "--help" || arg == "-h")
      return usage(vargs[0]);
    else if (!arg.empty() && arg[0] == '-')
      return usage(vargs[0]);
    else if (!filename)
      filename = vargs[i];
    else
      return usage(vargs[0]);
  }

  if (filename) {
    std::ifstream input;
    input.open(filename);

    if (!input) {
      std::cerr << "Failed opening file \"" << filename << "\"." << std::endl;
      return 1;
    }

    return interpret(input, mode) ? 0 : 1;
  }

  return interpret(std::cin, mode, true) ? 0 : 1;
}
