#include <iostream>
#include <string>
#include <vector>

#include "LexError.hpp"
#include "cli_commands.hpp"

int main(int argc, char* argv[]) {
  std::vector < std::string > args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  try {
    pylex::cli::CommandResult result = pylex::cli::execute_command(args, std::cin, std::cout, std::cerr);
    if (!result.message.empty()) {
      std::cerr << result.message << std::endl;
    }
    return result.exit_code;
  } catch (const LexerFault &e) {
    std::cerr << "pylex: internal error at line " << e.line() << ": " << e.what() << std::endl;
    return pylex::cli::EXIT_FAULT;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return pylex::cli::EXIT_FAULT;
  }
}
