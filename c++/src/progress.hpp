#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include <indicators/dynamic_progress.hpp>
#include <indicators/progress_bar.hpp>

#include "progress_sink.hpp"

// Terminal rendering of download progress: one bar per worker slot plus a
// totals line. Workers only touch atomics; the bars are redrawn by
// update_progress_bars() from the monitoring loop.
class Progress : public ProgressSink {
  public:
    Progress(std::size_t workers, std::size_t chunk_size);
    ~Progress();

    void worker_started(std::size_t worker_index,
                        std::size_t expected_total) override;
    void worker_progress(std::size_t worker_index,
                         std::size_t bytes_so_far) override;
    void total_bytes(std::size_t bytes) override { m_total_bytes = bytes; }

    std::size_t bytes_downloaded() const { return m_total_bytes.load(); }

    void update_progress_bars();

    void mark_as_completed();

    void finish() { m_finished = true; }
    bool finished() const { return m_finished.load(); }

  private:
    struct WorkerSlot
    {
        std::atomic<std::size_t> bytes{0};
        std::atomic<std::size_t> expected{0};
    };

    std::size_t m_chunk_size;
    std::vector<std::unique_ptr<indicators::ProgressBar>> m_bars;
    indicators::DynamicProgress<indicators::ProgressBar> m_dynamic_progress;
    std::vector<WorkerSlot> m_slots;
    std::atomic<std::size_t> m_total_bytes{0};
    std::atomic<bool> m_finished{false};
    std::chrono::steady_clock::time_point m_last_update_time{
        std::chrono::steady_clock::now()};
    std::size_t m_last_reported_bytes{0};
};
