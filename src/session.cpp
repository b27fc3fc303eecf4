#include "session.hpp"
#include "constants.hpp"

#include <cstdlib>
#include <utility>

namespace minterm {

Session::Session(fs::path cwd, std::ostream &out, std::ostream &err,
                 HistoryStore history,
                 std::unique_ptr<MetricsProvider> metrics)
    : cwd(std::move(cwd)), history(std::move(history)),
      metrics(std::move(metrics)), out(out), err(err) {}

auto get_home_directory() -> std::optional<std::string> {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::nullopt;
  }

  return std::string(home);
}

auto expand_home(const std::string &path) -> std::string {
  if (path.empty() || path[0] != '~') {
    return path;
  }

  // ~user is left alone
  if (path.size() > 1 && path[1] != '/') {
    return path;
  }

  auto home = get_home_directory();
  if (!home.has_value()) {
    return path;
  }

  return *home + path.substr(1);
}

auto resolve_path(const Session &session, const std::string &path)
    -> fs::path {
  fs::path expanded(expand_home(path));
  if (expanded.is_absolute()) {
    return expanded.lexically_normal();
  }

  return (session.cwd / expanded).lexically_normal();
}

auto build_prompt(const Session &session) -> std::string {
  std::string cwd = session.cwd.string();

  auto home = get_home_directory();
  if (home.has_value() && *home != "/" &&
      cwd.compare(0, home->size(), *home) == 0 &&
      (cwd.size() == home->size() || cwd[home->size()] == '/')) {
    cwd = "~" + cwd.substr(home->size());
  }

  return std::string(config::PROMPT_PREFIX) + cwd + config::PROMPT_SUFFIX;
}

} // namespace minterm
