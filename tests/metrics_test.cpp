#include "metrics.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <map>

#include <unistd.h>

namespace minterm {
namespace {

using test::TempDirectory;
using test::write_file;

class ProcfsMetricsProviderTest : public ::testing::Test {
protected:
  ProcfsMetricsProviderTest() : provider(dir.path().string(), 0) {}

  void SetUp() override {
    write_file(dir.path() / "stat",
               "cpu  100 0 100 800 0 0 0 0 0 0\n"
               "cpu0 100 0 100 800 0 0 0 0 0 0\n");
    write_file(dir.path() / "meminfo", "MemTotal:        8000000 kB\n"
                                       "MemFree:         1000000 kB\n"
                                       "MemAvailable:    6000000 kB\n"
                                       "Buffers:          100000 kB\n");
    write_file(dir.path() / "loadavg", "0.52 0.58 0.59 1/467 12345\n");
    write_file(dir.path() / "uptime", "1000.00 3000.00\n");
  }

  // Writes /<pid>/{stat,status,cmdline} with the given accounting.
  auto add_process(int pid, const std::string &name, long utime, long stime,
                   long start_time, long rss_pages, const std::string &cmdline,
                   const std::string &uid) -> void {
    fs::path process_dir = dir.path() / std::to_string(pid);
    fs::create_directory(process_dir);

    write_file(process_dir / "stat",
               std::to_string(pid) + " (" + name + ") S 1 1 1 0 -1 4194560 "
               "10 0 0 0 " + std::to_string(utime) + " " +
                   std::to_string(stime) + " 0 0 20 0 1 0 " +
                   std::to_string(start_time) + " 1000000 " +
                   std::to_string(rss_pages) + " 18446744073709551615\n");
    write_file(process_dir / "status",
               "Name:\t" + name + "\nUid:\t" + uid + "\t" + uid + "\t" + uid +
                   "\t" + uid + "\n");
    write_file(process_dir / "cmdline", cmdline);
  }

  TempDirectory dir;
  ProcfsMetricsProvider provider;
};

TEST_F(ProcfsMetricsProviderTest, CpuPercentFromStatCounters) {
  auto cpu = provider.cpu_percent();
  ASSERT_TRUE(cpu.has_value());
  EXPECT_DOUBLE_EQ(*cpu, 20.0);
  EXPECT_TRUE(provider.is_available());
}

TEST_F(ProcfsMetricsProviderTest, MemoryUsesMemAvailable) {
  auto memory = provider.memory_usage();
  ASSERT_TRUE(memory.has_value());
  EXPECT_EQ(memory->total_bytes, 8000000ull * 1024);
  EXPECT_EQ(memory->used_bytes, 2000000ull * 1024);
  EXPECT_DOUBLE_EQ(memory->percent(), 25.0);
}

TEST_F(ProcfsMetricsProviderTest, MemoryFallsBackToFreeBuffersCached) {
  write_file(dir.path() / "meminfo", "MemTotal:        8000000 kB\n"
                                     "MemFree:         1000000 kB\n"
                                     "Buffers:          500000 kB\n"
                                     "Cached:          1500000 kB\n");

  auto memory = provider.memory_usage();
  ASSERT_TRUE(memory.has_value());
  EXPECT_EQ(memory->used_bytes, 5000000ull * 1024);
}

TEST_F(ProcfsMetricsProviderTest, MemoryWithoutTotalIsUnavailable) {
  write_file(dir.path() / "meminfo", "MemFree:         1000000 kB\n");
  EXPECT_FALSE(provider.memory_usage().has_value());
}

TEST_F(ProcfsMetricsProviderTest, LoadAverageFromLoadavg) {
  auto load = provider.load_average();
  ASSERT_TRUE(load.has_value());
  EXPECT_DOUBLE_EQ((*load)[0], 0.52);
  EXPECT_DOUBLE_EQ((*load)[1], 0.58);
  EXPECT_DOUBLE_EQ((*load)[2], 0.59);
}

TEST_F(ProcfsMetricsProviderTest, ProcessTableParsesEachProcess) {
  long ticks = sysconf(_SC_CLK_TCK);
  long page_size = sysconf(_SC_PAGESIZE);

  // 50 cpu seconds over 500 seconds of life
  add_process(42, "my (odd) proc", 30 * ticks, 20 * ticks, 500 * ticks, 2000,
              std::string("/usr/bin/my\0--flag\0", 19), "4242421");
  add_process(7, "kworker/0:1", 0, 0, 10 * ticks, 0, "", "4242421");
  fs::create_directory(dir.path() / "99");
  fs::create_directory(dir.path() / "sys");

  auto processes = provider.processes();
  ASSERT_TRUE(processes.has_value());
  ASSERT_EQ(processes->size(), 2u);

  const ProcessInfo &kworker = (*processes)[0];
  EXPECT_EQ(kworker.pid, 7);
  EXPECT_EQ(kworker.name, "kworker/0:1");
  EXPECT_EQ(kworker.command_line, "kworker/0:1");
  EXPECT_DOUBLE_EQ(kworker.cpu_percent, 0.0);

  const ProcessInfo &mine = (*processes)[1];
  EXPECT_EQ(mine.pid, 42);
  EXPECT_EQ(mine.name, "my (odd) proc");
  EXPECT_EQ(mine.command_line, "/usr/bin/my --flag");
  EXPECT_EQ(mine.user, "4242421");
  EXPECT_NEAR(mine.cpu_percent, 10.0, 1e-9);
  EXPECT_NEAR(mine.memory_percent,
              100.0 * 2000.0 * page_size / (8000000.0 * 1024), 1e-9);
}

TEST(ProcfsMetricsProviderMissingTest, MissingRootIsUnavailable) {
  TempDirectory dir;
  ProcfsMetricsProvider provider((dir.path() / "nothing").string(), 0);

  EXPECT_FALSE(provider.is_available());
  EXPECT_FALSE(provider.cpu_percent().has_value());
  EXPECT_FALSE(provider.processes().has_value());
}

class CommandMetricsProviderTest : public ::testing::Test {
protected:
  CommandMetricsProviderTest()
      : provider([this](const std::vector<std::string> &argv) {
          requested.push_back(argv);
          auto it = outputs.find(argv[0]);
          if (it == outputs.end()) {
            return std::optional<std::string>();
          }
          return std::optional<std::string>(it->second);
        }) {}

  std::map<std::string, std::string> outputs;
  std::vector<std::vector<std::string>> requested;
  CommandMetricsProvider provider;
};

TEST_F(CommandMetricsProviderTest, CpuFromTopIdleTime) {
  outputs["top"] =
      "top - 10:00:00 up 1 day,  2 users,  load average: 0.10, 0.20, 0.30\n"
      "Tasks: 200 total,   1 running, 199 sleeping\n"
      "%Cpu(s):  2.3 us,  0.8 sy,  0.0 ni, 96.7 id,  0.0 wa,  0.0 hi\n";

  auto cpu = provider.cpu_percent();
  ASSERT_TRUE(cpu.has_value());
  EXPECT_NEAR(*cpu, 3.3, 1e-9);
  EXPECT_EQ(requested.at(0), (std::vector<std::string>{"top", "-bn1"}));
}

TEST_F(CommandMetricsProviderTest, MemoryFromFree) {
  outputs["free"] = "               total        used        free      shared\n"
                    "Mem:      8201367552  2390720512  1000000000     1000\n"
                    "Swap:              0           0           0\n";

  auto memory = provider.memory_usage();
  ASSERT_TRUE(memory.has_value());
  EXPECT_EQ(memory->total_bytes, 8201367552ull);
  EXPECT_EQ(memory->used_bytes, 2390720512ull);
}

TEST_F(CommandMetricsProviderTest, ProcessesFromPsSkippingGarbage) {
  outputs["ps"] = "   42 alice     1.5  2.0 bash            -bash\n"
                  "garbage line\n"
                  "    1 root      0.0  0.1 systemd         /sbin/init splash\n"
                  "    9 root      0.0  0.0 kthreadd\n";

  auto processes = provider.processes();
  ASSERT_TRUE(processes.has_value());
  ASSERT_EQ(processes->size(), 3u);

  EXPECT_EQ((*processes)[0].pid, 1);
  EXPECT_EQ((*processes)[0].command_line, "/sbin/init splash");
  EXPECT_EQ((*processes)[1].command_line, "kthreadd");
  EXPECT_EQ((*processes)[2].user, "alice");
  EXPECT_DOUBLE_EQ((*processes)[2].cpu_percent, 1.5);
  EXPECT_DOUBLE_EQ((*processes)[2].memory_percent, 2.0);
}

TEST_F(CommandMetricsProviderTest, FailedCommandsAreUnavailable) {
  EXPECT_FALSE(provider.cpu_percent().has_value());
  EXPECT_FALSE(provider.memory_usage().has_value());
  EXPECT_FALSE(provider.processes().has_value());

  outputs["top"] = "no cpu line here\n";
  outputs["free"] = "nothing useful\n";
  outputs["ps"] = "\n";
  EXPECT_FALSE(provider.cpu_percent().has_value());
  EXPECT_FALSE(provider.memory_usage().has_value());
  EXPECT_FALSE(provider.processes().has_value());
}

TEST(MakeMetricsProviderTest, PrefersLibraryThenProcfs) {
  auto provider = make_metrics_provider(
      [](const std::vector<std::string> &) -> std::optional<std::string> {
        return std::nullopt;
      });
  ASSERT_NE(provider, nullptr);

#ifdef MINTERM_HAVE_LIBPROC2
  if (fs::exists("/proc/meminfo")) {
    EXPECT_EQ(provider->name().rfind("libproc2", 0), 0u);
    return;
  }
#endif

  if (fs::exists("/proc/stat")) {
    EXPECT_EQ(provider->name().rfind("procfs", 0), 0u);
  } else {
    EXPECT_EQ(provider->name().rfind("diagnostic", 0), 0u);
  }
}

} // namespace
} // namespace minterm
