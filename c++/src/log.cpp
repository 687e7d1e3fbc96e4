#include <atomic>
#include <cstdio>
#include <mutex>

#include "log.hpp"

static std::atomic<bool> s_verbose{false};
static std::mutex s_write_mutex;

void set_verbose(bool verbose) { s_verbose = verbose; }

bool verbose_enabled() { return s_verbose.load(); }

void write_log_line(std::string_view line)
{
    auto _lock = std::lock_guard{s_write_mutex};
    fmt::print(stderr, "{}\n", line);
}
