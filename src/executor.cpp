#include "executor.hpp"
#include "constants.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <unordered_set>

#include <dirent.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace minterm {

namespace {

constexpr char PATH_LIST_SEPARATOR = ':';

auto decode_wait_status(int wait_status) -> int {
  if (WIFEXITED(wait_status)) {
    return WEXITSTATUS(wait_status);
  }

  if (WIFSIGNALED(wait_status)) {
    return status::SIGNAL_BASE + WTERMSIG(wait_status);
  }

  return status::FAILURE;
}

auto close_pipe(int pipe_fds[2]) -> void {
  close(pipe_fds[0]);
  close(pipe_fds[1]);
}

// Drains both pipes until the child closes them. Reading them one after the
// other could deadlock once the unread pipe fills up.
auto relay_output(int stdout_fd, int stderr_fd, std::ostream &out,
                  std::ostream &err) -> void {
  struct pollfd fds[2] = {{stdout_fd, POLLIN, 0}, {stderr_fd, POLLIN, 0}};
  std::ostream *streams[2] = {&out, &err};
  int open_fds = 2;
  char buffer[4096];

  while (open_fds > 0) {
    if (poll(fds, 2, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }

      ssize_t bytes_read = read(fds[i].fd, buffer, sizeof(buffer));
      if (bytes_read > 0) {
        streams[i]->write(buffer, bytes_read);
        streams[i]->flush();
      } else if (bytes_read == 0 || errno != EINTR) {
        close(fds[i].fd);
        fds[i].fd = -1;
        open_fds--;
      }
    }
  }

  for (auto &fd : fds) {
    if (fd.fd >= 0) {
      close(fd.fd);
    }
  }
}

} // namespace

auto split_path(const std::string &path) -> std::vector<std::string> {
  std::vector<std::string> directories;
  std::stringstream ss(path);
  std::string directory;

  while (std::getline(ss, directory, PATH_LIST_SEPARATOR)) {
    // An empty entry means the current directory
    directories.push_back(directory.empty() ? "." : directory);
  }

  return directories;
}

auto get_path_directories() -> std::vector<std::string> {
  const char *path_cstr = std::getenv("PATH");
  if (path_cstr == nullptr) {
    return {};
  }

  return split_path(path_cstr);
}

auto find_executable_in_path(const std::string &command,
                             const std::string &cwd) -> std::string {
  if (command.empty()) {
    return "";
  }

  for (const std::string &dir : get_path_directories()) {
    // Relative entries such as "." are searched from the session cwd, the
    // directory the child is started in
    std::string base = cwd.empty() || dir[0] == '/' ? dir : cwd + "/" + dir;
    std::string filepath = base + "/" + command;
    if (is_executable(filepath)) {
      return filepath;
    }
  }

  return "";
}

auto get_matching_executables_in_path(const std::string &prefix, bool sort)
    -> std::vector<std::string> {
  std::unordered_set<std::string> unique_executables;

  for (const std::string &dir : get_path_directories()) {
    DIR *dirp = opendir(dir.c_str());
    if (dirp == nullptr) {
      continue;
    }

    struct dirent *entry;
    while ((entry = readdir(dirp)) != nullptr) {
      std::string name = entry->d_name;
      if (name == "." || name == "..") {
        continue;
      }

      if (name.compare(0, prefix.size(), prefix) == 0 &&
          is_executable(dir + "/" + name)) {
        unique_executables.insert(name);
      }
    }

    closedir(dirp);
  }

  std::vector<std::string> matches(unique_executables.begin(),
                                   unique_executables.end());
  if (sort) {
    std::sort(matches.begin(), matches.end());
  }

  return matches;
}

auto is_executable(const std::string &filepath) -> bool {
  struct stat file_stat;
  if (stat(filepath.c_str(), &file_stat) != 0) {
    return false;
  }

  if (!S_ISREG(file_stat.st_mode)) {
    return false;
  }

  return access(filepath.c_str(), X_OK) == 0;
}

auto resolve_executable(const std::string &command, const std::string &cwd)
    -> std::string {
  if (command.find('/') == std::string::npos) {
    return find_executable_in_path(command, cwd);
  }

  std::string filepath = command[0] == '/' ? command : cwd + "/" + command;
  return is_executable(filepath) ? filepath : "";
}

auto spawn_process(const std::string &executable_path,
                   const std::vector<std::string> &argv,
                   const std::string &cwd, std::ostream &out,
                   std::ostream &err) -> SpawnResult {
  if (argv.empty()) {
    return std::nullopt;
  }

  int stdout_pipe[2];
  int stderr_pipe[2];
  if (pipe(stdout_pipe) == -1) {
    err << argv[0] << ": failed to create pipe: " << std::strerror(errno)
        << std::endl;
    return std::nullopt;
  }

  if (pipe(stderr_pipe) == -1) {
    err << argv[0] << ": failed to create pipe: " << std::strerror(errno)
        << std::endl;
    close_pipe(stdout_pipe);
    return std::nullopt;
  }

  // NOTE: the C-like version needs to be null-terminated.
  std::vector<char *> c_args;
  for (const auto &arg : argv) {
    c_args.push_back(const_cast<char *>(arg.c_str()));
  }
  c_args.push_back(nullptr);

  out.flush();
  err.flush();
  std::cout.flush();
  std::cerr.flush();

  // Ctrl-C while the child runs must only reach the child
  struct sigaction ignore_action = {};
  struct sigaction previous_action = {};
  ignore_action.sa_handler = SIG_IGN;
  sigemptyset(&ignore_action.sa_mask);
  sigaction(SIGINT, &ignore_action, &previous_action);

  pid_t pid = fork();
  if (pid == -1) {
    sigaction(SIGINT, &previous_action, nullptr);
    err << argv[0] << ": failed to fork process: " << std::strerror(errno)
        << std::endl;
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return std::nullopt;
  }

  // Child process
  if (pid == 0) {
    signal(SIGINT, SIG_DFL);

    dup2(stdout_pipe[1], STDOUT_FILENO);
    dup2(stderr_pipe[1], STDERR_FILENO);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    if (chdir(cwd.c_str()) != 0) {
      std::cerr << argv[0] << ": " << cwd << ": " << std::strerror(errno)
                << std::endl;
      _exit(status::NOT_EXECUTABLE);
    }

    execv(executable_path.c_str(), c_args.data());

    int exec_errno = errno;
    std::cerr << argv[0] << ": " << std::strerror(exec_errno) << std::endl;
    _exit(exec_errno == ENOENT ? status::NOT_FOUND : status::NOT_EXECUTABLE);
  }

  // Parent process
  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  relay_output(stdout_pipe[0], stderr_pipe[0], out, err);

  int wait_status = 0;
  pid_t waited;
  do {
    waited = waitpid(pid, &wait_status, 0);
  } while (waited == -1 && errno == EINTR);

  sigaction(SIGINT, &previous_action, nullptr);

  if (waited == -1) {
    err << argv[0] << ": failed to wait for process: " << std::strerror(errno)
        << std::endl;
    return std::nullopt;
  }

  return decode_wait_status(wait_status);
}

auto capture_command_output(const std::vector<std::string> &argv)
    -> std::optional<std::string> {
  if (argv.empty()) {
    return std::nullopt;
  }

  std::string executable_path = find_executable_in_path(argv[0]);
  if (executable_path.empty()) {
    return std::nullopt;
  }

  std::ostringstream out;
  std::ostringstream err;
  auto exit_code = spawn_process(executable_path, argv, ".", out, err);
  if (!exit_code.has_value() || *exit_code != status::SUCCESS) {
    return std::nullopt;
  }

  return out.str();
}

} // namespace minterm
