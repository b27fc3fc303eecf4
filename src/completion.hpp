#pragma once

#include "line_reader.hpp"
#include "session.hpp"

#include <string>
#include <vector>

namespace minterm {

// Completes builtins and PATH executables for the first word, filesystem
// entries relative to the session cwd everywhere else.
class Completer : public CompletionSource {
public:
  explicit Completer(const Session &session);

  auto complete(const std::string &text, bool command_position)
      -> std::vector<std::string> override;

private:
  const Session &session_;
};

auto get_matching_builtins(const std::string &prefix)
    -> std::vector<std::string>;

// Entries matching `text`, keeping its directory part as typed and marking
// directories with a trailing '/'.
auto get_matching_paths(const fs::path &cwd, const std::string &text)
    -> std::vector<std::string>;

} // namespace minterm
