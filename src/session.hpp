#pragma once

#include "history.hpp"
#include "metrics.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace minterm {

namespace fs = std::filesystem;

// All mutable state of one terminal. Nothing here touches the process
// working directory.
struct Session {
  Session(fs::path cwd, std::ostream &out, std::ostream &err,
          HistoryStore history, std::unique_ptr<MetricsProvider> metrics);

  fs::path cwd;
  fs::path previous_directory;
  int last_status = 0;
  HistoryStore history;
  std::unique_ptr<MetricsProvider> metrics;
  std::ostream &out;
  std::ostream &err;
};

// Expands a leading ~ and anchors relative paths at the session cwd.
auto resolve_path(const Session &session, const std::string &path) -> fs::path;
auto expand_home(const std::string &path) -> std::string;
auto get_home_directory() -> std::optional<std::string>;

// minterm:~/src$
auto build_prompt(const Session &session) -> std::string;

} // namespace minterm
