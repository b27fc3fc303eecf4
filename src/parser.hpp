#pragma once

#include <string>
#include <vector>

namespace minterm {

auto parse_arguments(const std::string &line) -> std::vector<std::string>;
auto trim_whitespace(const std::string &str) -> std::string;
auto is_unsigned_number(const std::string &str) -> bool;

} // namespace minterm
