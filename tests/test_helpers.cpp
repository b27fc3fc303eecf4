#include "test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace minterm::test {

namespace {

auto make_fake_metrics(FakeMetricsProvider *&raw)
    -> std::unique_ptr<MetricsProvider> {
  auto metrics = std::make_unique<FakeMetricsProvider>();
  raw = metrics.get();
  return metrics;
}

} // namespace

TempDirectory::TempDirectory() {
  std::string pattern =
      (fs::temp_directory_path() / "minterm_test_XXXXXX").string();
  if (mkdtemp(pattern.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed for " + pattern);
  }

  // Tests compare against resolved paths, /tmp may itself be a symlink
  path_ = fs::canonical(pattern);
}

TempDirectory::~TempDirectory() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

ScopedEnvironment::ScopedEnvironment(std::string name,
                                     const std::optional<std::string> &value)
    : name_(std::move(name)) {
  if (const char *previous = std::getenv(name_.c_str()); previous != nullptr) {
    previous_ = previous;
  }

  if (value.has_value()) {
    setenv(name_.c_str(), value->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

ScopedEnvironment::~ScopedEnvironment() {
  if (previous_.has_value()) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

TestSession::TestSession(const fs::path &cwd, HistoryStore history)
    : fake_metrics(nullptr),
      session(cwd, out, err, std::move(history),
              make_fake_metrics(fake_metrics)) {}

auto TestSession::take_out() -> std::string {
  std::string text = out.str();
  out.str("");
  out.clear();
  return text;
}

auto TestSession::take_err() -> std::string {
  std::string text = err.str();
  err.str("");
  err.clear();
  return text;
}

auto split_lines(const std::string &text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }

  return lines;
}

auto write_file(const fs::path &path, const std::string &content) -> void {
  std::ofstream file(path, std::ios::binary);
  file << content;
}

auto read_file(const fs::path &path) -> std::string {
  std::ifstream file(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(file),
                     std::istreambuf_iterator<char>());
}

} // namespace minterm::test
