#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace minterm {

// Exit status of a spawned program, or nothing if it could not be started.
using SpawnResult = std::optional<int>;

// PATH lookup
auto split_path(const std::string &path) -> std::vector<std::string>;
auto get_path_directories() -> std::vector<std::string>;
// Relative PATH entries are taken against `cwd` when one is given.
auto find_executable_in_path(const std::string &command,
                             const std::string &cwd = "") -> std::string;
auto get_matching_executables_in_path(const std::string &prefix,
                                      bool sort = true)
    -> std::vector<std::string>;
auto is_executable(const std::string &filepath) -> bool;

// Resolves a command token to an executable path. Tokens containing a slash
// are taken relative to `cwd`; anything else is searched on PATH, with
// relative entries also anchored at `cwd`.
auto resolve_executable(const std::string &command, const std::string &cwd)
    -> std::string;

// Runs the program at `executable_path` with argv inside `cwd`, relays the
// child's stdout and stderr to `out` and `err` and returns its exit status
// (128 + N if killed by signal N).
auto spawn_process(const std::string &executable_path,
                   const std::vector<std::string> &argv,
                   const std::string &cwd, std::ostream &out,
                   std::ostream &err) -> SpawnResult;

// stdout of argv if it ran and exited with status 0.
auto capture_command_output(const std::vector<std::string> &argv)
    -> std::optional<std::string>;

} // namespace minterm
