#pragma once

#include <string_view>
#include <utility>

#include <fmt/core.h>

void set_verbose(bool verbose);
bool verbose_enabled();

void write_log_line(std::string_view line);

// Diagnostics printed to stderr only when --verbose is given
template <typename... Args>
void log_verbose(fmt::format_string<Args...> format, Args &&...args)
{
    if (!verbose_enabled())
        return;
    write_log_line(fmt::format(format, std::forward<Args>(args)...));
}

// Always printed to stderr
template <typename... Args>
void log_error(fmt::format_string<Args...> format, Args &&...args)
{
    write_log_line(fmt::format(format, std::forward<Args>(args)...));
}
