#include <algorithm>

#include <fmt/core.h>
#include <indicators/cursor_control.hpp>

#include "progress.hpp"

static std::unique_ptr<indicators::ProgressBar>
make_worker_bar(std::size_t index, std::size_t chunk_size)
{
    return std::make_unique<indicators::ProgressBar>(
        indicators::option::BarWidth{50}, indicators::option::Start{"["},
        indicators::option::Fill{"="}, indicators::option::Lead{">"},
        indicators::option::Remainder{" "}, indicators::option::End{"]"},
        indicators::option::PrefixText{fmt::format("Thread #{:2} ", index)},
        indicators::option::PostfixText{fmt::format("0/{}", chunk_size)},
        indicators::option::MaxProgress{chunk_size},
        indicators::option::ForegroundColor{indicators::Color::green});
}

Progress::Progress(std::size_t workers, std::size_t chunk_size)
    : m_chunk_size(chunk_size), m_slots(workers)
{
    m_bars.push_back(std::make_unique<indicators::ProgressBar>(
        indicators::option::BarWidth{0}, indicators::option::Start{""},
        indicators::option::End{""}, indicators::option::PrefixText{"Total "},
        indicators::option::PostfixText{"0 bytes"},
        indicators::option::ShowElapsedTime{true},
        indicators::option::ForegroundColor{indicators::Color::cyan},
        indicators::option::FontStyles{
            std::vector<indicators::FontStyle>{indicators::FontStyle::bold}}));
    for (std::size_t i = 0; i != workers; i++)
    {
        m_bars.push_back(make_worker_bar(i, chunk_size));
    }
    for (auto &bar : m_bars)
    {
        m_dynamic_progress.push_back(*bar);
    }
    m_dynamic_progress.set_option(
        indicators::option::HideBarWhenComplete{false});
    indicators::show_console_cursor(false);
}

Progress::~Progress() { indicators::show_console_cursor(true); }

void Progress::worker_started(std::size_t worker_index,
                              std::size_t expected_total)
{
    auto &slot = m_slots[worker_index % m_slots.size()];
    slot.bytes = 0;
    slot.expected = expected_total;
}

void Progress::worker_progress(std::size_t worker_index,
                               std::size_t bytes_so_far)
{
    m_slots[worker_index % m_slots.size()].bytes = bytes_so_far;
}

void Progress::update_progress_bars()
{
    auto update_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        update_time - m_last_update_time)
                        .count() /
                    1000.f;
    m_last_update_time = update_time;

    auto bytes_downloaded = m_total_bytes.load();
    auto kib_per_sec = duration > 0
                           ? (bytes_downloaded - m_last_reported_bytes) /
                                 duration / 1024
                           : 0.f;
    m_last_reported_bytes = bytes_downloaded;

    m_bars.front()->set_option(indicators::option::PostfixText{
        fmt::format("{} bytes ({:.2f} KiB/s)", bytes_downloaded,
                    kib_per_sec)});

    for (std::size_t i = 0; i != m_slots.size(); i++)
    {
        auto &bar = *m_bars[i + 1];
        auto expected = std::max<std::size_t>(m_slots[i].expected.load(), 1);
        // The response headers push the byte count past the chunk size
        auto bytes = std::min(m_slots[i].bytes.load(), expected);
        bar.set_option(indicators::option::MaxProgress{expected});
        bar.set_option(indicators::option::PostfixText{
            fmt::format("{}/{}", bytes, expected)});
        bar.set_progress(bytes);
    }
}

void Progress::mark_as_completed()
{
    update_progress_bars();
    for (auto &bar : m_bars)
    {
        if (!bar->is_completed())
            bar->mark_as_completed();
    }
}
