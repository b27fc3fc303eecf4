#include "metrics.hpp"
#include "constants.hpp"
#include "parser.hpp"

#ifdef MINTERM_HAVE_LIBPROC2
#include "libproc2_metrics.hpp"
#endif

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

#include <dirent.h>
#include <pwd.h>
#include <stdlib.h>
#include <sys/sysinfo.h>
#include <unistd.h>

namespace minterm {

namespace {

auto read_file(const std::string &filepath) -> std::optional<std::string> {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

auto parse_integer(const std::string &str) -> std::optional<long long> {
  try {
    size_t consumed = 0;
    long long value = std::stoll(str, &consumed);
    if (consumed != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto parse_double(const std::string &str) -> std::optional<double> {
  try {
    return std::stod(str);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto username_for_uid(uid_t uid) -> std::string {
  struct passwd *pw = getpwuid(uid);
  if (pw == nullptr || pw->pw_name == nullptr) {
    return std::to_string(uid);
  }

  return pw->pw_name;
}

auto sysinfo_memory_usage() -> std::optional<MemoryUsage> {
  struct sysinfo info;
  if (sysinfo(&info) != 0) {
    return std::nullopt;
  }

  uint64_t unit = info.mem_unit == 0 ? 1 : info.mem_unit;
  uint64_t available =
      (static_cast<uint64_t>(info.freeram) + info.bufferram) * unit;

  MemoryUsage usage;
  usage.total_bytes = static_cast<uint64_t>(info.totalram) * unit;
  usage.used_bytes =
      usage.total_bytes > available ? usage.total_bytes - available : 0;
  return usage;
}

auto system_load_average() -> std::optional<LoadAverage> {
  double loads[3];
  if (getloadavg(loads, 3) != 3) {
    return std::nullopt;
  }

  return LoadAverage{loads[0], loads[1], loads[2]};
}

} // namespace

ProcfsMetricsProvider::ProcfsMetricsProvider(std::string root,
                                             unsigned sample_interval_ms)
    : root_(std::move(root)), sample_interval_ms_(sample_interval_ms) {}

auto ProcfsMetricsProvider::name() const -> std::string {
  return "procfs (" + root_ + ")";
}

auto ProcfsMetricsProvider::is_available() const -> bool {
  return read_cpu_times().has_value();
}

auto ProcfsMetricsProvider::read_cpu_times() const -> std::optional<CpuTimes> {
  std::ifstream file(root_ + "/stat");
  if (!file.is_open()) {
    return std::nullopt;
  }

  // cpu  user nice system idle iowait irq softirq steal ...
  std::string line;
  if (!std::getline(file, line)) {
    return std::nullopt;
  }

  std::istringstream fields(line);
  std::string label;
  fields >> label;
  if (label != "cpu") {
    return std::nullopt;
  }

  std::vector<uint64_t> values;
  uint64_t value;
  while (values.size() < 8 && fields >> value) {
    values.push_back(value);
  }

  if (values.size() < 4) {
    return std::nullopt;
  }

  CpuTimes times;
  for (size_t i = 0; i < values.size(); i++) {
    times.total += values[i];
  }

  uint64_t idle = values[3] + (values.size() > 4 ? values[4] : 0);
  times.busy = times.total - idle;
  return times;
}

auto ProcfsMetricsProvider::cpu_percent() -> std::optional<double> {
  auto first = read_cpu_times();
  if (!first.has_value()) {
    return std::nullopt;
  }

  if (sample_interval_ms_ > 0) {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(sample_interval_ms_));
  }

  auto second = read_cpu_times();
  if (!second.has_value()) {
    return std::nullopt;
  }

  // No ticks elapsed between samples, report the average since boot
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

auto ProcfsMetricsProvider::memory_usage() -> std::optional<MemoryUsage> {
  std::ifstream file(root_ + "/meminfo");
  if (!file.is_open()) {
    return sysinfo_memory_usage();
  }

  std::optional<uint64_t> total_kb;
  std::optional<uint64_t> available_kb;
  uint64_t free_kb = 0;
  uint64_t buffers_kb = 0;
  uint64_t cached_kb = 0;

  std::string key;
  uint64_t value;
  std::string line;
  while (std::getline(file, line)) {
    std::istringstream fields(line);
    if (!(fields >> key >> value)) {
      continue;
    }

    if (key == "MemTotal:") {
      total_kb = value;
    } else if (key == "MemAvailable:") {
      available_kb = value;
    } else if (key == "MemFree:") {
      free_kb = value;
    } else if (key == "Buffers:") {
      buffers_kb = value;
    } else if (key == "Cached:") {
      cached_kb = value;
    }
  }

  if (!total_kb.has_value()) {
    return std::nullopt;
  }

  uint64_t available = available_kb.value_or(free_kb + buffers_kb + cached_kb);
  available = std::min(available, *total_kb);

  MemoryUsage usage;
  usage.total_bytes = *total_kb * 1024;
  usage.used_bytes = (*total_kb - available) * 1024;
  return usage;
}

auto ProcfsMetricsProvider::load_average() -> std::optional<LoadAverage> {
  std::ifstream file(root_ + "/loadavg");
  if (!file.is_open()) {
    return system_load_average();
  }

  LoadAverage loads;
  if (!(file >> loads[0] >> loads[1] >> loads[2])) {
    return std::nullopt;
  }

  return loads;
}

auto ProcfsMetricsProvider::read_uptime() const -> std::optional<double> {
  std::ifstream file(root_ + "/uptime");
  double uptime;
  if (!file.is_open() || !(file >> uptime)) {
    return std::nullopt;
  }

  return uptime;
}

auto ProcfsMetricsProvider::processes()
    -> std::optional<std::vector<ProcessInfo>> {
  DIR *dirp = opendir(root_.c_str());
  if (dirp == nullptr) {
    return std::nullopt;
  }

  std::vector<int> pids;
  struct dirent *entry;
  while ((entry = readdir(dirp)) != nullptr) {
    std::string name = entry->d_name;
    if (!is_unsigned_number(name)) {
      continue;
    }

    if (auto pid = parse_integer(name); pid.has_value()) {
      pids.push_back(static_cast<int>(*pid));
    }
  }

  closedir(dirp);

  double uptime = read_uptime().value_or(0.0);
  uint64_t total_memory = 0;
  if (auto memory = memory_usage(); memory.has_value()) {
    total_memory = memory->total_bytes;
  }

  std::sort(pids.begin(), pids.end());

  std::vector<ProcessInfo> result;
  for (int pid : pids) {
    // Processes can exit while the table is being read
    if (auto info = read_process(pid, uptime, total_memory); info.has_value()) {
      result.push_back(*info);
    }
  }

  return result;
}

auto ProcfsMetricsProvider::read_process(int pid, double uptime,
                                         uint64_t total_memory) const
    -> std::optional<ProcessInfo> {
  std::string process_dir = root_ + "/" + std::to_string(pid);

  auto stat = read_file(process_dir + "/stat");
  if (!stat.has_value()) {
    return std::nullopt;
  }

  // pid (comm) state ppid ...; comm may itself contain spaces and parens
  size_t open_paren = stat->find('(');
  size_t close_paren = stat->rfind(')');
  if (open_paren == std::string::npos || close_paren == std::string::npos ||
      close_paren < open_paren) {
    return std::nullopt;
  }

  ProcessInfo info;
  info.pid = pid;
  info.name = stat->substr(open_paren + 1, close_paren - open_paren - 1);

  // Field 3 (state) is index 0 here
  std::istringstream rest(stat->substr(close_paren + 1));
  std::vector<std::string> fields;
  std::string field;
  while (rest >> field) {
    fields.push_back(field);
  }

  if (fields.size() < 22) {
    return std::nullopt;
  }

  auto utime = parse_integer(fields[11]);
  auto stime = parse_integer(fields[12]);
  auto start_time = parse_integer(fields[19]);
  auto rss_pages = parse_integer(fields[21]);

  long ticks_per_second = sysconf(_SC_CLK_TCK);
  long page_size = sysconf(_SC_PAGESIZE);

  if (utime && stime && start_time && ticks_per_second > 0) {
    double cpu_seconds =
        static_cast<double>(*utime + *stime) / ticks_per_second;
    double elapsed =
        uptime - static_cast<double>(*start_time) / ticks_per_second;
    if (elapsed > 0.0) {
      info.cpu_percent = 100.0 * cpu_seconds / elapsed;
    }
  }

  if (rss_pages && total_memory > 0 && page_size > 0) {
    info.memory_percent =
        100.0 * static_cast<double>(*rss_pages) * page_size / total_memory;
  }

  // Uid:	real	effective	saved	filesystem
  std::ifstream status(process_dir + "/status");
  std::string line;
  while (std::getline(status, line)) {
    if (line.rfind("Uid:", 0) == 0) {
      std::istringstream uid_fields(line.substr(4));
      uid_t uid;
      if (uid_fields >> uid) {
        info.user = username_for_uid(uid);
      }
      break;
    }
  }

  if (auto cmdline = read_file(process_dir + "/cmdline"); cmdline.has_value()) {
    std::string command_line = *cmdline;
    std::replace(command_line.begin(), command_line.end(), '\0', ' ');
    info.command_line = trim_whitespace(command_line);
  }

  if (info.command_line.empty()) {
    info.command_line = info.name;
  }

  return info;
}

CommandMetricsProvider::CommandMetricsProvider(CommandRunner runner)
    : runner_(std::move(runner)) {}

auto CommandMetricsProvider::name() const -> std::string {
  return "diagnostic commands (ps, free, top)";
}

auto CommandMetricsProvider::cpu_percent() -> std::optional<double> {
  auto output = runner_({"top", "-bn1"});
  if (!output.has_value()) {
    return std::nullopt;
  }

  // %Cpu(s):  2.3 us,  0.8 sy,  0.0 ni, 96.7 id,  0.0 wa, ...
  std::istringstream lines(*output);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.find("Cpu") == std::string::npos) {
      continue;
    }

    size_t colon = line.find(':');
    std::istringstream parts(
        colon == std::string::npos ? line : line.substr(colon + 1));
    std::string part;
    while (std::getline(parts, part, ',')) {
      std::istringstream tokens(part);
      std::string number;
      std::string label;
      if (!(tokens >> number >> label) || label != "id") {
        continue;
      }

      if (auto idle = parse_double(number); idle.has_value()) {
        return std::clamp(100.0 - *idle, 0.0, 100.0);
      }
    }
  }

  return std::nullopt;
}

auto CommandMetricsProvider::memory_usage() -> std::optional<MemoryUsage> {
  auto output = runner_({"free", "-b"});
  if (!output.has_value()) {
    return std::nullopt;
  }

  //               total        used        free ...
  // Mem:     8201367552  2390720512  ...
  std::istringstream lines(*output);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::string label;
    uint64_t total;
    uint64_t used;
    if (fields >> label && label == "Mem:" && fields >> total >> used) {
      MemoryUsage usage;
      usage.total_bytes = total;
      usage.used_bytes = std::min(used, total);
      return usage;
    }
  }

  return std::nullopt;
}

auto CommandMetricsProvider::load_average() -> std::optional<LoadAverage> {
  return system_load_average();
}

auto CommandMetricsProvider::processes()
    -> std::optional<std::vector<ProcessInfo>> {
  auto output = runner_({"ps", "-eo", "pid=,user=,pcpu=,pmem=,comm=,args="});
  if (!output.has_value()) {
    return std::nullopt;
  }

  std::vector<ProcessInfo> result;
  std::istringstream lines(*output);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    ProcessInfo info;
    if (!(fields >> info.pid >> info.user >> info.cpu_percent >>
          info.memory_percent >> info.name)) {
      continue;
    }

    std::string args;
    std::getline(fields, args);
    info.command_line = trim_whitespace(args);
    if (info.command_line.empty()) {
      info.command_line = info.name;
    }

    result.push_back(info);
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

auto make_metrics_provider(CommandRunner runner)
    -> std::unique_ptr<MetricsProvider> {
#ifdef MINTERM_HAVE_LIBPROC2
  auto native =
      std::make_unique<Libproc2MetricsProvider>(config::CPU_SAMPLE_INTERVAL_MS);
  if (native->is_available()) {
    return native;
  }
#endif

  auto procfs = std::make_unique<ProcfsMetricsProvider>(
      "/proc", config::CPU_SAMPLE_INTERVAL_MS);
  if (procfs->is_available()) {
    return procfs;
  }

  return std::make_unique<CommandMetricsProvider>(std::move(runner));
}

auto human_bytes(double bytes) -> std::string {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB", "PB"};

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1);
  for (const char *unit : units) {
    if (std::fabs(bytes) < 1024.0) {
      ss << bytes << unit;
      return ss.str();
    }
    bytes /= 1024.0;
  }

  ss << bytes << "EB";
  return ss.str();
}

} // namespace minterm
