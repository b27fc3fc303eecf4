#pragma once

#include <stddef.h>

namespace minterm {

namespace config {
constexpr const char *PROMPT_PREFIX = "minterm:";
constexpr const char *PROMPT_SUFFIX = "$ ";
constexpr const char *HISTORY_FILENAME = ".minterm_history";
constexpr unsigned CPU_SAMPLE_INTERVAL_MS = 500;
constexpr size_t TOP_PROCESS_COUNT = 10;

} // namespace config

namespace status {
constexpr int SUCCESS = 0;
constexpr int FAILURE = 1;
constexpr int NOT_EXECUTABLE = 126;
constexpr int NOT_FOUND = 127;
constexpr int SIGNAL_BASE = 128;

} // namespace status

namespace permissions {
constexpr int DEFAULT_FILE_MODE = 0644;
} // namespace permissions

} // namespace minterm
