#include "line_reader.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <readline/history.h>
#include <readline/readline.h>

namespace minterm {

namespace {

CompletionSource *active_completion_source = nullptr;
std::vector<std::string> completion_matches;

auto command_generator(const char *text, int state) -> char * {
  static size_t match_index;

  if (state == 0) {
    match_index = 0;
  }

  if (match_index < completion_matches.size()) {
    return strdup(completion_matches[match_index++].c_str());
  }

  return nullptr;
}

auto command_completion(const char *text, int start, int end) -> char ** {
  // Never fall back to readline's own filename completion, it would complete
  // against the process working directory instead of the session's.
  rl_attempted_completion_over = 1;

  if (active_completion_source == nullptr) {
    return nullptr;
  }

  bool command_position = true;
  for (int i = 0; i < start; i++) {
    if (rl_line_buffer[i] != ' ' && rl_line_buffer[i] != '\t') {
      command_position = false;
      break;
    }
  }

  completion_matches =
      active_completion_source->complete(text, command_position);

  // Keep typing into a completed directory
  if (completion_matches.size() == 1 && !completion_matches[0].empty() &&
      completion_matches[0].back() == '/') {
    rl_completion_append_character = '\0';
  }

  return rl_completion_matches(text, command_generator);
}

} // namespace

ReadlineLineReader::ReadlineLineReader() {
  rl_readline_name = "minterm";
  rl_attempted_completion_function = command_completion;
}

ReadlineLineReader::~ReadlineLineReader() {
  rl_attempted_completion_function = nullptr;
  active_completion_source = nullptr;
}

auto ReadlineLineReader::read_line(const std::string &prompt)
    -> std::optional<std::string> {
  char *input_cstr = readline(prompt.c_str());
  if (input_cstr == nullptr) {
    return std::nullopt;
  }

  std::string input(input_cstr);
  free(input_cstr);

  return input;
}

auto ReadlineLineReader::add_history(const std::string &line) -> void {
  ::add_history(line.c_str());
}

auto ReadlineLineReader::set_completion_source(CompletionSource *source)
    -> void {
  active_completion_source = source;
}

StreamLineReader::StreamLineReader(std::istream &in) : in_(in) {}

auto StreamLineReader::read_line(const std::string &)
    -> std::optional<std::string> {
  std::string line;
  if (!std::getline(in_, line)) {
    return std::nullopt;
  }

  return line;
}

} // namespace minterm
