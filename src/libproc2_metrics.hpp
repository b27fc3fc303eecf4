#pragma once

#include "metrics.hpp"

namespace minterm {

// Queries procps-ng's libproc2 for CPU, memory, load and the task list.
class Libproc2MetricsProvider : public MetricsProvider {
public:
  explicit Libproc2MetricsProvider(unsigned sample_interval_ms = 500);

  auto name() const -> std::string override;
  auto cpu_percent() -> std::optional<double> override;
  auto memory_usage() -> std::optional<MemoryUsage> override;
  auto load_average() -> std::optional<LoadAverage> override;
  auto processes() -> std::optional<std::vector<ProcessInfo>> override;

  auto is_available() const -> bool;

private:
  unsigned sample_interval_ms_;
};

} // namespace minterm
