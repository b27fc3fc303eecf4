#include "completion.hpp"
#include "commands.hpp"
#include "executor.hpp"

#include <algorithm>

namespace minterm {

Completer::Completer(const Session &session) : session_(session) {}

auto Completer::complete(const std::string &text, bool command_position)
    -> std::vector<std::string> {
  if (!command_position || text.find('/') != std::string::npos) {
    return get_matching_paths(session_.cwd, text);
  }

  std::vector<std::string> matches = get_matching_builtins(text);
  std::vector<std::string> executables =
      get_matching_executables_in_path(text);
  matches.insert(matches.end(), executables.begin(), executables.end());

  std::sort(matches.begin(), matches.end());
  matches.erase(std::unique(matches.begin(), matches.end()), matches.end());
  return matches;
}

auto get_matching_builtins(const std::string &prefix)
    -> std::vector<std::string> {
  std::vector<std::string> matches;
  for (const auto &builtin : SHELL_BUILTINS) {
    if (builtin.compare(0, prefix.size(), prefix) == 0) {
      matches.push_back(builtin);
    }
  }

  std::sort(matches.begin(), matches.end());
  return matches;
}

auto get_matching_paths(const fs::path &cwd, const std::string &text)
    -> std::vector<std::string> {
  std::string directory_part;
  std::string prefix = text;

  size_t last_slash = text.rfind('/');
  if (last_slash != std::string::npos) {
    directory_part = text.substr(0, last_slash + 1);
    prefix = text.substr(last_slash + 1);
  }

  fs::path directory = cwd;
  if (!directory_part.empty()) {
    fs::path typed(expand_home(directory_part));
    directory = typed.is_absolute() ? typed : cwd / typed;
  } else if (text == "~") {
    // Bare ~ completes to the home directory itself
    return {"~/"};
  }

  std::vector<std::string> matches;
  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (name.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }

    // Hidden entries only when asked for
    if (name[0] == '.' && (prefix.empty() || prefix[0] != '.')) {
      continue;
    }

    std::error_code entry_ec;
    bool is_directory = it->is_directory(entry_ec);
    matches.push_back(directory_part + name + (is_directory ? "/" : ""));
  }

  std::sort(matches.begin(), matches.end());
  return matches;
}

} // namespace minterm
