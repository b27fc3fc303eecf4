#include "libproc2_metrics.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <thread>

#include <unistd.h>

#include <libproc2/meminfo.h>
#include <libproc2/misc.h>
#include <libproc2/pids.h>
#include <libproc2/stat.h>

namespace minterm {

namespace {

constexpr uint64_t KIB = 1024;

struct MeminfoRelease {
  void operator()(meminfo_info *info) const { procps_meminfo_unref(&info); }
};

struct StatRelease {
  void operator()(stat_info *info) const { procps_stat_unref(&info); }
};

struct PidsRelease {
  void operator()(pids_info *info) const { procps_pids_unref(&info); }
};

using MeminfoHandle = std::unique_ptr<meminfo_info, MeminfoRelease>;
using StatHandle = std::unique_ptr<stat_info, StatRelease>;
using PidsHandle = std::unique_ptr<pids_info, PidsRelease>;

auto open_meminfo() -> MeminfoHandle {
  meminfo_info *info = nullptr;
  if (procps_meminfo_new(&info) < 0) {
    return nullptr;
  }
  return MeminfoHandle(info);
}

auto total_memory_bytes() -> uint64_t {
  MeminfoHandle info = open_meminfo();
  if (!info) {
    return 0;
  }

  meminfo_result *total = procps_meminfo_get(info.get(), MEMINFO_MEM_TOTAL);
  return total == nullptr ? 0 : total->result.ul_int * KIB;
}

auto text_or_empty(const char *str) -> std::string {
  return str == nullptr ? std::string() : std::string(str);
}

struct CpuTicks {
  unsigned long long busy = 0;
  unsigned long long total = 0;
};

// A fresh context per sample, libproc2 rereads /proc/stat at most once a
// second for a given context.
auto sample_cpu_ticks() -> std::optional<CpuTicks> {
  stat_info *raw = nullptr;
  if (procps_stat_new(&raw) < 0) {
    return std::nullopt;
  }
  StatHandle info(raw);

  stat_result *busy = procps_stat_get(info.get(), STAT_TIC_SUM_BUSY);
  stat_result *total = procps_stat_get(info.get(), STAT_TIC_SUM_TOTAL);
  if (busy == nullptr || total == nullptr) {
    return std::nullopt;
  }

  return CpuTicks{busy->result.ull_int, total->result.ull_int};
}

// Item order of the process query below
enum pids_item PROCESS_ITEMS[] = {PIDS_ID_PID,   PIDS_ID_EUSER,
                                  PIDS_CMD,      PIDS_CMDLINE,
                                  PIDS_TICS_ALL, PIDS_TIME_ELAPSED,
                                  PIDS_VM_RSS};
enum ProcessItemIndex {
  ITEM_PID,
  ITEM_USER,
  ITEM_NAME,
  ITEM_CMDLINE,
  ITEM_TICKS,
  ITEM_ELAPSED,
  ITEM_RSS,
};

} // namespace

Libproc2MetricsProvider::Libproc2MetricsProvider(unsigned sample_interval_ms)
    : sample_interval_ms_(sample_interval_ms) {}

auto Libproc2MetricsProvider::name() const -> std::string {
  return "libproc2 (procps-ng)";
}

auto Libproc2MetricsProvider::is_available() const -> bool {
  return open_meminfo() != nullptr;
}

auto Libproc2MetricsProvider::cpu_percent() -> std::optional<double> {
  auto first = sample_cpu_ticks();
  if (!first.has_value()) {
    return std::nullopt;
  }

  if (sample_interval_ms_ > 0) {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(sample_interval_ms_));
  }

  auto second = sample_cpu_ticks();
  if (!second.has_value()) {
    return std::nullopt;
  }

  if (second->total <= first->total) {
    if (second->total == 0) {
      return 0.0;
    }
    return 100.0 * second->busy / second->total;
  }

  double total = static_cast<double>(second->total - first->total);
  double busy = static_cast<double>(second->busy - first->busy);
  return std::clamp(100.0 * busy / total, 0.0, 100.0);
}

auto Libproc2MetricsProvider::memory_usage() -> std::optional<MemoryUsage> {
  MeminfoHandle info = open_meminfo();
  if (!info) {
    return std::nullopt;
  }

  // Used is total minus available, both in KiB
  meminfo_result *total = procps_meminfo_get(info.get(), MEMINFO_MEM_TOTAL);
  meminfo_result *used = procps_meminfo_get(info.get(), MEMINFO_MEM_USED);
  if (total == nullptr || used == nullptr || total->result.ul_int == 0) {
    return std::nullopt;
  }

  MemoryUsage usage;
  usage.total_bytes = total->result.ul_int * KIB;
  usage.used_bytes = used->result.ul_int * KIB;
  return usage;
}

auto Libproc2MetricsProvider::load_average() -> std::optional<LoadAverage> {
  LoadAverage loads;
  if (procps_loadavg(&loads[0], &loads[1], &loads[2]) < 0) {
    return std::nullopt;
  }

  return loads;
}

auto Libproc2MetricsProvider::processes()
    -> std::optional<std::vector<ProcessInfo>> {
  pids_info *raw = nullptr;
  if (procps_pids_new(&raw, PROCESS_ITEMS,
                      static_cast<int>(std::size(PROCESS_ITEMS))) < 0) {
    return std::nullopt;
  }
  PidsHandle info(raw);

  pids_fetch *fetch = procps_pids_reap(info.get(), PIDS_FETCH_TASKS_ONLY);
  if (fetch == nullptr) {
    return std::nullopt;
  }

  long ticks_per_second = sysconf(_SC_CLK_TCK);
  uint64_t total_memory = total_memory_bytes();

  std::vector<ProcessInfo> result;
  for (int i = 0; i < fetch->counts->total; i++) {
    pids_result *items = fetch->stacks[i]->head;

    ProcessInfo process;
    process.pid = items[ITEM_PID].result.s_int;
    process.user = text_or_empty(items[ITEM_USER].result.str);
    process.name = text_or_empty(items[ITEM_NAME].result.str);
    process.command_line = text_or_empty(items[ITEM_CMDLINE].result.str);
    // Kernel threads have no command line
    if (process.command_line.empty() || process.command_line == "-") {
      process.command_line = process.name;
    }

    double elapsed = items[ITEM_ELAPSED].result.real;
    if (ticks_per_second > 0 && elapsed > 0.0) {
      double cpu_seconds =
          static_cast<double>(items[ITEM_TICKS].result.ull_int) /
          ticks_per_second;
      process.cpu_percent = 100.0 * cpu_seconds / elapsed;
    }

    if (total_memory > 0) {
      double rss_bytes =
          static_cast<double>(items[ITEM_RSS].result.ul_int) * KIB;
      process.memory_percent = 100.0 * rss_bytes / total_memory;
    }

    result.push_back(process);
  }

  if (result.empty()) {
    return std::nullopt;
  }

  std::sort(result.begin(), result.end(),
            [](const ProcessInfo &a, const ProcessInfo &b) {
              return a.pid < b.pid;
            });
  return result;
}

} // namespace minterm
