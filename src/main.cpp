#include "completion.hpp"
#include "shell.hpp"

#include <iostream>
#include <memory>

#include <unistd.h>

auto main() -> int {
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  minterm::Session session = minterm::create_session(std::cout, std::cerr);

  bool interactive = isatty(STDIN_FILENO) != 0;
  std::unique_ptr<minterm::LineReader> reader;
  if (interactive) {
    reader = std::make_unique<minterm::ReadlineLineReader>();
  } else {
    reader = std::make_unique<minterm::StreamLineReader>(std::cin);
  }

  minterm::Completer completer(session);
  reader->set_completion_source(&completer);
  minterm::load_history(session, *reader);

  if (interactive) {
    std::cout << "minterm: type 'help' for commands, 'exit' to quit"
              << std::endl;
    if (auto histfile = session.history.filepath(); histfile.has_value()) {
      std::cout << "History file: " << *histfile << std::endl;
    }
  }

  minterm::repl_loop(session, *reader);

  if (interactive) {
    std::cout << std::endl;
  }

  return 0;
}
