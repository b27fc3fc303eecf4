#include "commands.hpp"
#include "constants.hpp"
#include "parser.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace minterm {

const std::unordered_set<std::string> SHELL_BUILTINS = {
    "ls",    "cd",   "pwd",     "mkdir", "rm", "rmdir",   "cat",
    "touch", "mv",   "cp",      "clear", "help", "sysinfo", "ps",
    "top",   "history", "exit", "quit"};

namespace {

auto errno_code() -> std::error_code {
  return std::error_code(errno, std::generic_category());
}

// Last component of a path, ignoring a trailing separator ("dir/" -> "dir").
auto entry_name(const fs::path &path) -> fs::path {
  if (path.has_filename()) {
    return path.filename();
  }

  return path.parent_path().filename();
}

auto move_path(const fs::path &source, const fs::path &target,
               std::error_code &ec) -> void {
  fs::rename(source, target, ec);
  if (ec != std::errc::cross_device_link) {
    return;
  }

  ec.clear();
  fs::copy(source, target,
           fs::copy_options::recursive | fs::copy_options::copy_symlinks,
           ec);
  if (!ec) {
    fs::remove_all(source, ec);
  }
}

auto copy_path(const fs::path &source, const fs::path &target,
               std::error_code &ec) -> void {
  auto source_status = fs::status(source, ec);
  if (ec) {
    return;
  }

  if (fs::is_directory(source_status)) {
    fs::copy(source, target,
             fs::copy_options::recursive |
                 fs::copy_options::overwrite_existing,
             ec);
    return;
  }

  fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
}

// Whether `path` is `base` or lies somewhere beneath it.
auto is_within(const fs::path &path, const fs::path &base) -> bool {
  std::error_code ec;
  fs::path resolved_path = fs::weakly_canonical(path, ec);
  if (ec) {
    return false;
  }
  fs::path resolved_base = fs::weakly_canonical(base, ec);
  if (ec) {
    return false;
  }

  if (!resolved_path.has_filename()) {
    resolved_path = resolved_path.parent_path();
  }
  if (!resolved_base.has_filename()) {
    resolved_base = resolved_base.parent_path();
  }

  auto mismatch = std::mismatch(resolved_base.begin(), resolved_base.end(),
                                resolved_path.begin(), resolved_path.end());
  return mismatch.first == resolved_base.end();
}

} // namespace

auto is_builtin(const std::string &command) -> bool {
  return SHELL_BUILTINS.find(command) != SHELL_BUILTINS.end();
}

auto list_directory(const fs::path &path, std::error_code &ec)
    -> std::vector<std::string> {
  auto path_status = fs::status(path, ec);
  if (ec) {
    return {};
  }

  if (!fs::is_directory(path_status)) {
    return {entry_name(path).string()};
  }

  std::vector<fs::directory_entry> entries;
  for (fs::directory_iterator it(path, ec), end; !ec && it != end;
       it.increment(ec)) {
    entries.push_back(*it);
  }

  if (ec) {
    return {};
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename() < b.path().filename();
            });

  std::vector<std::string> names;
  for (const auto &entry : entries) {
    std::string name = entry.path().filename().string();

    // Broken symlinks and races are listed without a suffix
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec)) {
      name += "/";
    } else if (entry.is_symlink(entry_ec)) {
      name += "@";
    }

    names.push_back(name);
  }

  return names;
}

auto ls_command(Session &session, const Arguments &args) -> int {
  std::string target = args.empty() ? "." : args[0];

  std::error_code ec;
  auto names = list_directory(resolve_path(session, target), ec);
  if (ec) {
    session.err << "ls: cannot access '" << target << "': " << ec.message()
                << std::endl;
    return status::FAILURE;
  }

  for (const auto &name : names) {
    session.out << name << std::endl;
  }

  return status::SUCCESS;
}

auto cd_command(Session &session, const Arguments &args) -> int {
  std::string path = args.empty() ? "" : args[0];
  fs::path target_path;

  // Home directory
  if (path.empty() || path == "~") {
    auto home = get_home_directory();
    if (!home.has_value()) {
      session.err << "cd: HOME not set" << std::endl;
      return status::FAILURE;
    }
    target_path = *home;
  }
  // Previous directory
  else if (path == "-") {
    if (session.previous_directory.empty()) {
      return pwd_command(session, {});
    }

    target_path = session.previous_directory;
    session.out << target_path.string() << std::endl;
  }
  // Absolute/relative path
  else {
    target_path = resolve_path(session, path);
  }

  std::error_code ec;
  auto target_status = fs::status(target_path, ec);
  if (target_status.type() == fs::file_type::not_found) {
    session.err << "cd: " << path << ": No such file or directory"
                << std::endl;
    return status::FAILURE;
  }

  if (ec) {
    session.err << "cd: " << path << ": " << ec.message() << std::endl;
    return status::FAILURE;
  }

  if (!fs::is_directory(target_status)) {
    session.err << "cd: " << path << ": Not a directory" << std::endl;
    return status::FAILURE;
  }

  auto resolved = fs::canonical(target_path, ec);
  if (ec) {
    session.err << "cd: " << path << ": " << ec.message() << std::endl;
    return status::FAILURE;
  }

  if (access(resolved.c_str(), X_OK) != 0) {
    session.err << "cd: " << path << ": " << std::strerror(errno) << std::endl;
    return status::FAILURE;
  }

  session.previous_directory = session.cwd;
  session.cwd = resolved;
  return status::SUCCESS;
}

auto pwd_command(Session &session, const Arguments &) -> int {
  session.out << session.cwd.string() << std::endl;
  return status::SUCCESS;
}

auto mkdir_command(Session &session, const Arguments &args) -> int {
  if (args.empty()) {
    session.err << "mkdir: missing operand" << std::endl;
    return status::FAILURE;
  }

  int result = status::SUCCESS;
  for (const auto &directory : args) {
    fs::path path = resolve_path(session, directory);

    std::error_code ec;
    if (fs::exists(fs::symlink_status(path, ec))) {
      session.err << "mkdir: cannot create directory '" << directory
                  << "': File exists" << std::endl;
      result = status::FAILURE;
      continue;
    }

    ec.clear();
    fs::create_directories(path, ec);
    if (ec) {
      session.err << "mkdir: cannot create directory '" << directory
                  << "': " << ec.message() << std::endl;
      result = status::FAILURE;
    }
  }

  return result;
}

auto rm_command(Session &session, const Arguments &args) -> int {
  if (args.empty()) {
    session.err << "rm: missing operand" << std::endl;
    return status::FAILURE;
  }

  int result = status::SUCCESS;
  for (const auto &target : args) {
    fs::path path = resolve_path(session, target);

    // Only empty directories go; remove() fails with ENOTEMPTY otherwise
    std::error_code ec;
    auto target_status = fs::symlink_status(path, ec);
    if (target_status.type() == fs::file_type::not_found) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    } else if (!ec) {
      fs::remove(path, ec);
    }

    if (ec) {
      session.err << "rm: cannot remove '" << target << "': " << ec.message()
                  << std::endl;
      result = status::FAILURE;
    }
  }

  return result;
}

auto rmdir_command(Session &session, const Arguments &args) -> int {
  if (args.empty()) {
    session.err << "rmdir: missing operand" << std::endl;
    return status::FAILURE;
  }

  int result = status::SUCCESS;
  for (const auto &directory : args) {
    fs::path path = resolve_path(session, directory);

    std::error_code ec;
    auto directory_status = fs::symlink_status(path, ec);
    if (directory_status.type() == fs::file_type::not_found) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    } else if (!ec && !fs::is_directory(directory_status)) {
      ec = std::make_error_code(std::errc::not_a_directory);
    } else if (!ec) {
      fs::remove(path, ec);
    }

    if (ec) {
      session.err << "rmdir: failed to remove '" << directory
                  << "': " << ec.message() << std::endl;
      result = status::FAILURE;
    }
  }

  return result;
}

auto touch_command(Session &session, const Arguments &args) -> int {
  if (args.empty()) {
    session.err << "touch: missing operand" << std::endl;
    return status::FAILURE;
  }

  int result = status::SUCCESS;
  for (const auto &target : args) {
    fs::path path = resolve_path(session, target);

    std::error_code ec;
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path(), ec);
    }

    bool exists = !ec && fs::exists(path, ec);
    if (!ec && !exists) {
      int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_NOCTTY,
                    permissions::DEFAULT_FILE_MODE);
      if (fd == -1) {
        ec = errno_code();
      } else {
        close(fd);
      }
    }

    // Set both timestamps to now, directories included
    if (!ec && utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0) {
      ec = errno_code();
    }

    if (ec) {
      session.err << "touch: cannot touch '" << target
                  << "': " << ec.message() << std::endl;
      result = status::FAILURE;
    }
  }

  return result;
}

auto cat_command(Session &session, const Arguments &args) -> int {
  if (args.empty()) {
    session.err << "cat: missing operand" << std::endl;
    return status::FAILURE;
  }

  int result = status::SUCCESS;
  for (const auto &filename : args) {
    fs::path path = resolve_path(session, filename);

    std::error_code ec;
    auto file_status = fs::status(path, ec);
    if (file_status.type() == fs::file_type::not_found) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    } else if (!ec && fs::is_directory(file_status)) {
      ec = std::make_error_code(std::errc::is_a_directory);
    }

    std::string content;
    if (!ec) {
      std::ifstream file(path, std::ios::binary);
      if (!file.is_open()) {
        ec = errno_code();
      } else {
        content.assign(std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>());
      }
    }

    if (ec) {
      session.err << "cat: " << filename << ": " << ec.message() << std::endl;
      result = status::FAILURE;
      continue;
    }

    session.out << content;
    if (!content.empty() && content.back() != '\n') {
      session.out << std::endl;
    }
  }

  session.out.flush();
  return result;
}

auto mv_command(Session &session, const Arguments &args) -> int {
  if (args.size() < 2) {
    session.err << "mv: missing operand" << std::endl;
    return status::FAILURE;
  }

  Arguments sources(args.begin(), args.end() - 1);
  fs::path destination = resolve_path(session, args.back());

  std::error_code ec;
  bool into_directory = sources.size() > 1;
  if (into_directory) {
    fs::create_directories(destination, ec);
    if (ec) {
      session.err << "mv: cannot create directory '" << args.back()
                  << "': " << ec.message() << std::endl;
      return status::FAILURE;
    }
  } else {
    into_directory = fs::is_directory(destination, ec);
  }

  int result = status::SUCCESS;
  for (const auto &source : sources) {
    fs::path source_path = resolve_path(session, source);
    fs::path target = into_directory ? destination / entry_name(source_path)
                                     : destination;

    ec.clear();
    move_path(source_path, target, ec);
    if (ec) {
      session.err << "mv: cannot move '" << source << "': " << ec.message()
                  << std::endl;
      result = status::FAILURE;
    }
  }

  return result;
}

auto cp_command(Session &session, const Arguments &args) -> int {
  if (args.size() < 2) {
    session.err << "cp: missing operand" << std::endl;
    return status::FAILURE;
  }

  Arguments sources(args.begin(), args.end() - 1);
  fs::path destination = resolve_path(session, args.back());

  std::error_code ec;
  bool into_directory = sources.size() > 1;
  if (into_directory) {
    fs::create_directories(destination, ec);
    if (ec) {
      session.err << "cp: cannot create directory '" << args.back()
                  << "': " << ec.message() << std::endl;
      return status::FAILURE;
    }
  } else {
    into_directory = fs::is_directory(destination, ec);
  }

  int result = status::SUCCESS;
  for (const auto &source : sources) {
    fs::path source_path = resolve_path(session, source);
    fs::path target = into_directory ? destination / entry_name(source_path)
                                     : destination;

    if (fs::is_directory(source_path, ec) && is_within(target, source_path)) {
      session.err << "cp: cannot copy a directory, '" << source
                  << "', into itself" << std::endl;
      result = status::FAILURE;
      continue;
    }

    ec.clear();
    copy_path(source_path, target, ec);
    if (ec) {
      session.err << "cp: cannot copy '" << source << "': " << ec.message()
                  << std::endl;
      result = status::FAILURE;
    }
  }

  return result;
}

auto history_command(Session &session, const Arguments &args) -> int {
  const auto &entries = session.history.entries();
  size_t num_entries = entries.size();

  if (!args.empty()) {
    if (!is_unsigned_number(args[0])) {
      session.err << "history: invalid argument" << std::endl;
      return status::FAILURE;
    }

    try {
      num_entries = std::stoul(args[0]);
    } catch (const std::out_of_range &) {
      num_entries = entries.size();
    }
  }

  size_t start_index = 0;
  if (num_entries < entries.size()) {
    start_index = entries.size() - num_entries;
  }

  for (size_t i = start_index; i < entries.size(); i++) {
    session.out << std::setw(5) << (i + 1) << "  " << entries[i] << std::endl;
  }

  return status::SUCCESS;
}

auto help_command(Session &session, const Arguments &) -> int {
  session.out << "Built-in commands:\n"
                 "  ls [path]        list directory contents\n"
                 "  cd [dir]         change directory (~ home, - previous)\n"
                 "  pwd              print current working directory\n"
                 "  mkdir NAME...    create directories\n"
                 "  rm NAME...       remove files and empty directories\n"
                 "  rmdir NAME...    remove empty directories\n"
                 "  cat FILE...      print file contents\n"
                 "  touch FILE...    create files or update timestamps\n"
                 "  mv SRC... DEST   move files or directories\n"
                 "  cp SRC... DEST   copy files or directories\n"
                 "  clear            clear the screen\n"
                 "  sysinfo          system information and resource usage\n"
                 "  ps               list processes\n"
                 "  top              processes using the most CPU\n"
                 "  history [N]      show command history\n"
                 "  help             show this help\n"
                 "  exit, quit       leave the terminal\n"
                 "\n"
                 "Anything else runs as a system command."
              << std::endl;
  return status::SUCCESS;
}

auto clear_command(Session &session, const Arguments &) -> int {
  // Erase display, cursor home
  session.out << "\033[2J\033[H" << std::flush;
  return status::SUCCESS;
}

} // namespace minterm
