#include "shell.hpp"
#include "constants.hpp"
#include "executor.hpp"
#include "parser.hpp"

#include <iostream>
#include <utility>

namespace minterm {

auto create_session(std::ostream &out, std::ostream &err) -> Session {
  auto histfile = get_histfile();
  HistoryStore history =
      histfile.has_value() ? HistoryStore(*histfile) : HistoryStore();
  history.load();

  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec) {
    err << "minterm: cannot determine working directory: " << ec.message()
        << std::endl;
    cwd = "/";
  }

  return Session(cwd, out, err, std::move(history),
                 make_metrics_provider(capture_command_output));
}

auto load_history(const Session &session, LineReader &reader) -> void {
  for (const auto &entry : session.history.entries()) {
    reader.add_history(entry);
  }
}

auto repl_loop(Session &session, LineReader &reader) -> void {
  while (true) {
    auto input = reader.read_line(build_prompt(session));
    if (!input.has_value()) {
      break;
    }

    if (!trim_whitespace(input.value()).empty()) {
      reader.add_history(input.value());
    }

    if (!handle_input(session, input.value())) {
      break;
    }
  }
}

auto handle_input(Session &session, const std::string &input) -> bool {
  if (trim_whitespace(input).empty()) {
    return true;
  }

  session.history.append(input, session.err);

  Arguments tokens = parse_arguments(input);
  if (tokens.empty()) {
    return true;
  }

  const std::string &command = tokens[0];
  if (command == "exit" || command == "quit") {
    return false;
  }

  if (is_builtin(command)) {
    Arguments args(tokens.begin() + 1, tokens.end());
    session.last_status = execute_builtin(session, command, args);
  } else {
    session.last_status = execute_external(session, tokens);
  }

  return true;
}

auto execute_builtin(Session &session, const std::string &command,
                     const Arguments &args) -> int {
  if (command == "ls") {
    return ls_command(session, args);
  } else if (command == "cd") {
    return cd_command(session, args);
  } else if (command == "pwd") {
    return pwd_command(session, args);
  } else if (command == "mkdir") {
    return mkdir_command(session, args);
  } else if (command == "rm") {
    return rm_command(session, args);
  } else if (command == "rmdir") {
    return rmdir_command(session, args);
  } else if (command == "cat") {
    return cat_command(session, args);
  } else if (command == "touch") {
    return touch_command(session, args);
  } else if (command == "mv") {
    return mv_command(session, args);
  } else if (command == "cp") {
    return cp_command(session, args);
  } else if (command == "clear") {
    return clear_command(session, args);
  } else if (command == "help") {
    return help_command(session, args);
  } else if (command == "sysinfo") {
    return sysinfo_command(session, args);
  } else if (command == "ps") {
    return ps_command(session, args);
  } else if (command == "top") {
    return top_command(session, args);
  } else if (command == "history") {
    return history_command(session, args);
  }

  return status::SUCCESS;
}

auto execute_external(Session &session, const Arguments &argv) -> int {
  const std::string &command = argv[0];

  std::string executable_path =
      resolve_executable(command, session.cwd.string());
  if (executable_path.empty()) {
    session.err << command << ": command not found" << std::endl;
    return status::NOT_FOUND;
  }

  auto exit_code = spawn_process(executable_path, argv, session.cwd.string(),
                                 session.out, session.err);
  if (!exit_code.has_value()) {
    return status::FAILURE;
  }

  if (*exit_code != status::SUCCESS) {
    session.err << command << ": exited with status " << *exit_code
                << std::endl;
  }

  return *exit_code;
}

} // namespace minterm
