#include "doco/core/process_metrics.h"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/vector.h>
#include <string>
#include <unistd.h>

namespace doco::core {

namespace {

kj::String read_text_file(const char* path) {
  std::ifstream file(path, std::ios::in);
  KJ_REQUIRE(file.is_open(), "failed to open", path);
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return kj::heapString(content.data(), content.size());
}

double parse_number(kj::StringPtr token) {
  char* end = nullptr;
  double value = std::strtod(token.cStr(), &end);
  KJ_REQUIRE(end != token.cStr(), "malformed number in /proc stat", token);
  return value;
}

double boot_time_seconds() {
  auto text = read_text_file("/proc/stat");
  kj::StringPtr rest = text;
  while (rest.size() > 0) {
    size_t end = rest.size();
    KJ_IF_SOME(newline, rest.findFirst('\n')) {
      end = newline;
    }
    auto line = kj::heapString(rest.slice(0, end));
    if (line.startsWith("btime ")) {
      return parse_number(line.slice(6));
    }
    rest = end < rest.size() ? rest.slice(end + 1) : ""_kj;
  }
  return 0.0;
}

} // namespace

ProcessStats parse_proc_stat(kj::StringPtr stat_line, long clock_ticks, long page_size) {
  // The command name may contain spaces and parentheses; fields resume after the last ')'.
  size_t close_paren = 0;
  KJ_IF_SOME(pos, stat_line.findLast(')')) {
    close_paren = pos;
  } else {
    KJ_FAIL_REQUIRE("malformed /proc stat line");
  }

  kj::Vector<kj::String> fields;
  kj::StringPtr rest = stat_line.slice(close_paren + 1);
  size_t start = 0;
  for (size_t i = 0; i <= rest.size(); ++i) {
    if (i == rest.size() || rest[i] == ' ' || rest[i] == '\n') {
      if (i > start) {
        fields.add(kj::heapString(rest.slice(start, i)));
      }
      start = i + 1;
    }
  }

  // fields[0] is stat field 3 (state).
  KJ_REQUIRE(fields.size() >= 22, "truncated /proc stat line", fields.size());
  auto field = [&](size_t stat_index) -> double { return parse_number(fields[stat_index - 3]); };

  double ticks = clock_ticks > 0 ? static_cast<double>(clock_ticks) : 100.0;

  ProcessStats stats;
  stats.cpu_seconds = (field(14) + field(15)) / ticks;
  stats.threads = field(20);
  stats.start_time_seconds = field(22) / ticks;
  stats.virtual_memory_bytes = field(23);
  stats.resident_memory_bytes = field(24) * static_cast<double>(page_size);
  return stats;
}

ProcessMetricsCollector::ProcessMetricsCollector(MetricsRegistry& registry)
    : cpu_seconds_(registry.register_gauge("process_cpu_seconds_total"_kj,
                                           "Total user and system CPU time spent in seconds."_kj)),
      resident_memory_(registry.register_gauge("process_resident_memory_bytes"_kj,
                                               "Resident memory size in bytes."_kj)),
      virtual_memory_(registry.register_gauge("process_virtual_memory_bytes"_kj,
                                              "Virtual memory size in bytes."_kj)),
      start_time_(registry.register_gauge(
          "process_start_time_seconds"_kj,
          "Start time of the process since unix epoch in seconds."_kj)),
      open_fds_(registry.register_gauge("process_open_fds"_kj, "Number of open file descriptors."_kj)),
      threads_(registry.register_gauge("process_threads"_kj, "Number of OS threads."_kj)) {}

bool ProcessMetricsCollector::collect() {
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto stat = read_text_file("/proc/self/stat");
               auto stats = parse_proc_stat(stat, sysconf(_SC_CLK_TCK), sysconf(_SC_PAGESIZE));

               auto fs = kj::newDiskFilesystem();
               auto fd_dir = fs->getRoot().openSubdir(kj::Path({"proc", "self", "fd"}));
               // The listing itself holds one descriptor open.
               stats.open_fds = static_cast<double>(fd_dir->listNames().size()) - 1.0;

               cpu_seconds_.set(stats.cpu_seconds);
               resident_memory_.set(stats.resident_memory_bytes);
               virtual_memory_.set(stats.virtual_memory_bytes);
               start_time_.set(boot_time_seconds() + stats.start_time_seconds);
               open_fds_.set(stats.open_fds);
               threads_.set(stats.threads);
             })) {
    KJ_LOG(WARNING, "process metrics unavailable", exception.getDescription());
    return false;
  }
  return true;
}

} // namespace doco::core
