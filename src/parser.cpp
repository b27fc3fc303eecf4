#include "parser.hpp"

#include <cctype>

namespace minterm {

auto parse_arguments(const std::string &line) -> std::vector<std::string> {
  std::vector<std::string> parsed_args;
  std::string current_arg;
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  // Distinguishes '' (an empty argument) from no argument at all
  bool has_arg = false;

  for (size_t i = 0; i < line.length(); i++) {
    char c = line[i];

    // Double quotes
    if (c == '\"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      has_arg = true;
    }

    // Single quotes
    else if (c == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      has_arg = true;
    }

    // Whitespace
    else if ((c == ' ' || c == '\t') && !in_double_quotes &&
             !in_single_quotes) {
      if (has_arg) {
        parsed_args.push_back(current_arg);
        current_arg.clear();
        has_arg = false;
      }
    }

    // Escaped characters
    else if (c == '\\' && !in_single_quotes && i + 1 < line.length()) {
      if (!in_double_quotes || line[i + 1] == '\"' || line[i + 1] == '\\') {
        current_arg += line[++i];
      } else {
        current_arg += '\\';
      }
      has_arg = true;
    }

    else {
      current_arg += c;
      has_arg = true;
    }
  }

  if (has_arg) {
    parsed_args.push_back(current_arg);
  }

  return parsed_args;
}

auto trim_whitespace(const std::string &str) -> std::string {
  size_t start = str.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }

  size_t end = str.find_last_not_of(" \t");
  return str.substr(start, end - start + 1);
}

auto is_unsigned_number(const std::string &str) -> bool {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  return true;
}

} // namespace minterm
