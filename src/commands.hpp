#pragma once

#include "session.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace minterm {

using Arguments = std::vector<std::string>;

extern const std::unordered_set<std::string> SHELL_BUILTINS;

auto is_builtin(const std::string &command) -> bool;

// Every handler reports failures on session.err and returns the status of
// the command; none of them throws.

// Filesystem commands
auto ls_command(Session &session, const Arguments &args) -> int;
auto cd_command(Session &session, const Arguments &args) -> int;
auto pwd_command(Session &session, const Arguments &args) -> int;
auto mkdir_command(Session &session, const Arguments &args) -> int;
auto rm_command(Session &session, const Arguments &args) -> int;
auto rmdir_command(Session &session, const Arguments &args) -> int;
auto touch_command(Session &session, const Arguments &args) -> int;
auto cat_command(Session &session, const Arguments &args) -> int;
auto mv_command(Session &session, const Arguments &args) -> int;
auto cp_command(Session &session, const Arguments &args) -> int;

// System monitor commands
auto sysinfo_command(Session &session, const Arguments &args) -> int;
auto ps_command(Session &session, const Arguments &args) -> int;
auto top_command(Session &session, const Arguments &args) -> int;

// Session commands
auto history_command(Session &session, const Arguments &args) -> int;
auto help_command(Session &session, const Arguments &args) -> int;
auto clear_command(Session &session, const Arguments &args) -> int;

// Sorted names in `path`, directories suffixed with '/' and other symlinks
// with '@'. A path naming a file lists just that file.
auto list_directory(const fs::path &path, std::error_code &ec)
    -> std::vector<std::string>;

} // namespace minterm
