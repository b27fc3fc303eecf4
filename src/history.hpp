#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace minterm {

// Append-only command log backed by a plain text file, one entry per line.
// A store constructed without a path keeps the history in memory only.
class HistoryStore {
public:
  HistoryStore() = default;
  explicit HistoryStore(std::string filepath);

  // Missing file is an empty history, not an error.
  auto load() -> bool;
  auto append(const std::string &line, std::ostream &err) -> void;

  auto entries() const -> const std::vector<std::string> & { return entries_; }
  auto filepath() const -> const std::optional<std::string> & {
    return filepath_;
  }

private:
  std::optional<std::string> filepath_;
  std::vector<std::string> entries_;
  bool write_failure_reported_ = false;
};

// HISTFILE if set, otherwise the history file in $HOME.
auto get_histfile() -> std::optional<std::string>;

} // namespace minterm
