#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace minterm {

struct MemoryUsage {
  uint64_t total_bytes = 0;
  uint64_t used_bytes = 0;

  auto percent() const -> double {
    return total_bytes == 0 ? 0.0 : 100.0 * used_bytes / total_bytes;
  }
};

struct ProcessInfo {
  int pid = 0;
  std::string user;
  std::string name;
  std::string command_line;
  double cpu_percent = 0.0;
  double memory_percent = 0.0;
};

using LoadAverage = std::array<double, 3>;

// Source of CPU, memory and process data. Every query may come back empty
// when the underlying source cannot be read.
class MetricsProvider {
public:
  virtual ~MetricsProvider() = default;

  virtual auto name() const -> std::string = 0;
  virtual auto cpu_percent() -> std::optional<double> = 0;
  virtual auto memory_usage() -> std::optional<MemoryUsage> = 0;
  virtual auto load_average() -> std::optional<LoadAverage> = 0;
  virtual auto processes() -> std::optional<std::vector<ProcessInfo>> = 0;
};

// Reads the Linux procfs tree rooted at `root`. Used when libproc2 is not
// available.
class ProcfsMetricsProvider : public MetricsProvider {
public:
  explicit ProcfsMetricsProvider(std::string root = "/proc",
                                 unsigned sample_interval_ms = 500);

  auto name() const -> std::string override;
  auto cpu_percent() -> std::optional<double> override;
  auto memory_usage() -> std::optional<MemoryUsage> override;
  auto load_average() -> std::optional<LoadAverage> override;
  auto processes() -> std::optional<std::vector<ProcessInfo>> override;

  auto is_available() const -> bool;

private:
  struct CpuTimes {
    uint64_t busy = 0;
    uint64_t total = 0;
  };

  auto read_cpu_times() const -> std::optional<CpuTimes>;
  auto read_uptime() const -> std::optional<double>;
  auto read_process(int pid, double uptime, uint64_t total_memory) const
      -> std::optional<ProcessInfo>;

  std::string root_;
  unsigned sample_interval_ms_;
};

// Runs argv and returns its standard output, or nothing if it could not be
// spawned or exited with a nonzero status.
using CommandRunner =
    std::function<std::optional<std::string>(const std::vector<std::string> &)>;

// Parses the output of ps, free and top. Used when procfs is unreadable.
class CommandMetricsProvider : public MetricsProvider {
public:
  explicit CommandMetricsProvider(CommandRunner runner);

  auto name() const -> std::string override;
  auto cpu_percent() -> std::optional<double> override;
  auto memory_usage() -> std::optional<MemoryUsage> override;
  auto load_average() -> std::optional<LoadAverage> override;
  auto processes() -> std::optional<std::vector<ProcessInfo>> override;

private:
  CommandRunner runner_;
};

// libproc2 when it was built in and can read the system, then procfs, then
// the diagnostic commands run through `runner`.
auto make_metrics_provider(CommandRunner runner)
    -> std::unique_ptr<MetricsProvider>;

auto human_bytes(double bytes) -> std::string;

} // namespace minterm
