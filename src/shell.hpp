#pragma once

#include "commands.hpp"
#include "line_reader.hpp"
#include "session.hpp"

#include <ostream>
#include <string>

namespace minterm {

// Session rooted at the process working directory, with the history file
// from the environment loaded and the metrics provider picked for this host.
auto create_session(std::ostream &out, std::ostream &err) -> Session;

// REPL
auto load_history(const Session &session, LineReader &reader) -> void;
auto repl_loop(Session &session, LineReader &reader) -> void;

// Input handling. Returns false once the terminal should exit.
auto handle_input(Session &session, const std::string &input) -> bool;

// Execution
auto execute_builtin(Session &session, const std::string &command,
                     const Arguments &args) -> int;
auto execute_external(Session &session, const Arguments &argv) -> int;

} // namespace minterm
