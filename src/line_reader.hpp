#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace minterm {

class CompletionSource {
public:
  virtual ~CompletionSource() = default;

  // Candidates replacing `text`. `command_position` is set when `text` is
  // the first word on the line.
  virtual auto complete(const std::string &text, bool command_position)
      -> std::vector<std::string> = 0;
};

class LineReader {
public:
  virtual ~LineReader() = default;

  // Nothing at end of input.
  virtual auto read_line(const std::string &prompt)
      -> std::optional<std::string> = 0;
  virtual auto add_history(const std::string &line) -> void = 0;
  virtual auto set_completion_source(CompletionSource *source) -> void = 0;
};

// GNU readline. Only one instance should be alive at a time, readline keeps
// its state in globals.
class ReadlineLineReader : public LineReader {
public:
  ReadlineLineReader();
  ~ReadlineLineReader() override;

  auto read_line(const std::string &prompt)
      -> std::optional<std::string> override;
  auto add_history(const std::string &line) -> void override;
  auto set_completion_source(CompletionSource *source) -> void override;
};

// Plain line input for pipes, scripts and tests. Prints no prompt.
class StreamLineReader : public LineReader {
public:
  explicit StreamLineReader(std::istream &in);

  auto read_line(const std::string &prompt)
      -> std::optional<std::string> override;
  auto add_history(const std::string &) -> void override {}
  auto set_completion_source(CompletionSource *) -> void override {}

private:
  std::istream &in_;
};

} // namespace minterm
