#include "history.hpp"
#include "constants.hpp"

#include <cstdlib>
#include <fstream>
#include <utility>

namespace minterm {

HistoryStore::HistoryStore(std::string filepath)
    : filepath_(std::move(filepath)) {}

auto HistoryStore::load() -> bool {
  if (!filepath_.has_value()) {
    return false;
  }

  std::ifstream file(*filepath_);
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty()) {
      continue;
    }

    entries_.push_back(line);
  }

  return true;
}

auto HistoryStore::append(const std::string &line, std::ostream &err)
    -> void {
  entries_.push_back(line);

  if (!filepath_.has_value()) {
    return;
  }

  std::ofstream file(*filepath_, std::ios::app);
  if (file.is_open()) {
    file << line << '\n';
  }

  if (!file.is_open() || !file.good()) {
    if (!write_failure_reported_) {
      err << "history: cannot write " << *filepath_ << std::endl;
      write_failure_reported_ = true;
    }
  }
}

auto get_histfile() -> std::optional<std::string> {
  const char *histfile = std::getenv("HISTFILE");
  if (histfile != nullptr && *histfile != '\0') {
    return std::string(histfile);
  }

  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::nullopt;
  }

  return std::string(home) + "/" + config::HISTORY_FILENAME;
}

} // namespace minterm
