#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <fmt/core.h>

class Timer {

  public:
    using clock = std::chrono::steady_clock;
    using duration = typename std::chrono::milliseconds::rep;

    /**
     * Returns the number of milliseconds elapsed since the creation
     * of the timer
     *
     * @return The time elapsed since the creation of the timer, in [ms]
     */
    inline duration get_millis() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   clock::now() - t0)
            .count();
    }

    float get_seconds() const { return get_millis() / 1000.f; }

    // Average transfer rate since the creation of the timer, in [KiB/s]
    float kib_per_sec(std::size_t bytes) const
    {
        auto millis = get_millis();
        return millis > 0 ? bytes / 1024.f / (millis / 1000.f) : 0.f;
    }

    std::string get_fmt() const { return format(get_millis()); }

    static std::string format(duration millis)
    {
        if (millis < 1000)
        {
            return fmt::format("{} [ms]", millis);
        }
        return fmt::format("{:.2f} [s]", millis / 1000.f);
    }

  private:
    clock::time_point t0{clock::now()};
};
