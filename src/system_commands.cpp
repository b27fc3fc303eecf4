#include "commands.hpp"
#include "constants.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <sys/utsname.h>

namespace minterm {

namespace {

constexpr const char *UNAVAILABLE = "unavailable";

auto format_percent(double value) -> std::string {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << value << "%";
  return ss.str();
}

auto platform_description() -> std::string {
  struct utsname info;
  if (uname(&info) != 0) {
    return UNAVAILABLE;
  }

  return std::string(info.sysname) + " " + info.release + " " + info.machine +
         " (" + info.nodename + ")";
}

auto print_process_header(std::ostream &out, bool with_user) -> void {
  std::ostringstream line;
  line << std::right << std::setw(6) << "PID" << " ";
  if (with_user) {
    line << std::left << std::setw(10) << "USER" << " ";
  }
  line << std::right << std::setw(5) << "CPU%" << " " << std::setw(5) << "MEM%"
       << " CMD";
  out << line.str() << std::endl;
}

auto print_process_row(std::ostream &out, const ProcessInfo &process,
                       bool with_user) -> void {
  std::ostringstream line;
  line << std::right << std::setw(6) << process.pid << " ";
  if (with_user) {
    line << std::left << std::setw(10) << process.user.substr(0, 10) << " ";
  }
  line << std::right << std::fixed << std::setprecision(1) << std::setw(5)
       << process.cpu_percent << " " << std::setw(5) << process.memory_percent
       << " " << process.command_line;
  out << line.str() << std::endl;
}

} // namespace

auto sysinfo_command(Session &session, const Arguments &) -> int {
  auto &out = session.out;

  out << "Platform: " << platform_description() << std::endl;
  out << "CWD: " << session.cwd.string() << std::endl;

  std::error_code ec;
  auto disk = fs::space(session.cwd, ec);
  if (ec) {
    out << "Disk: " << UNAVAILABLE << std::endl;
  } else {
    out << "Disk: total=" << human_bytes(disk.capacity)
        << " used=" << human_bytes(disk.capacity - disk.free)
        << " free=" << human_bytes(disk.available) << std::endl;
  }

  out << "CPU: ";
  if (auto cpu = session.metrics->cpu_percent(); cpu.has_value()) {
    out << format_percent(*cpu) << std::endl;
  } else {
    out << UNAVAILABLE << std::endl;
  }

  out << "Memory: ";
  if (auto memory = session.metrics->memory_usage(); memory.has_value()) {
    out << format_percent(memory->percent()) << " ("
        << human_bytes(memory->used_bytes) << " / "
        << human_bytes(memory->total_bytes) << ")" << std::endl;
  } else {
    out << UNAVAILABLE << std::endl;
  }

  out << "Load Average (1m/5m/15m): ";
  if (auto load = session.metrics->load_average(); load.has_value()) {
    std::ostringstream averages;
    averages << std::fixed << std::setprecision(2) << (*load)[0] << " "
             << (*load)[1] << " " << (*load)[2];
    out << averages.str() << std::endl;
  } else {
    out << UNAVAILABLE << std::endl;
  }

  out << "Metrics: " << session.metrics->name() << std::endl;
  return status::SUCCESS;
}

auto ps_command(Session &session, const Arguments &) -> int {
  auto processes = session.metrics->processes();
  if (!processes.has_value()) {
    session.err << "ps: process information " << UNAVAILABLE << std::endl;
    return status::FAILURE;
  }

  print_process_header(session.out, true);
  for (const auto &process : *processes) {
    print_process_row(session.out, process, true);
  }

  return status::SUCCESS;
}

auto top_command(Session &session, const Arguments &) -> int {
  auto processes = session.metrics->processes();
  if (!processes.has_value()) {
    session.err << "top: process information " << UNAVAILABLE << std::endl;
    return status::FAILURE;
  }

  std::stable_sort(processes->begin(), processes->end(),
                   [](const ProcessInfo &a, const ProcessInfo &b) {
                     return a.cpu_percent > b.cpu_percent;
                   });
  if (processes->size() > config::TOP_PROCESS_COUNT) {
    processes->resize(config::TOP_PROCESS_COUNT);
  }

  print_process_header(session.out, false);
  for (const auto &process : *processes) {
    print_process_row(session.out, process, false);
  }

  return status::SUCCESS;
}

} // namespace minterm
