#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "aggregator.hpp"
#include "progress_sink.hpp"
#include "request.hpp"
#include "worker.hpp"

struct SchedulerConfig
{
    std::size_t chunk_size = 64 * 1024;
    std::size_t concurrency = 4;
    std::size_t max_batch_retries = 3;
    RetryPolicy retry;
    std::size_t io_threads = 1;
};

struct RunResult
{
    std::map<chunk_id_t, Chunk> chunks;
    std::vector<ChunkError> errors;
    bool eof = false;
    // Ids given up on when a batch was force-advanced
    std::vector<chunk_id_t> lost;
    std::size_t rounds = 0;
    std::size_t total_bytes = 0;
};

class Scheduler {
  public:
    // Called before each round with the ids handed to workers in that round
    using round_observer_t =
        std::function<void(std::size_t round, chunk_id_t cursor,
                           const std::vector<chunk_id_t> &spawned)>;

    Scheduler(boost::asio::io_context &ioc, Transport &transport,
              ProgressSink &progress, SchedulerConfig config);

    /**
     * Runs batches until a worker reports the end of the resource or the
     * scheduler is interrupted. Without an end-of-resource response from the
     * server this never returns on its own.
     */
    RunResult run();

    // Stops scheduling once the current round has been joined
    void interrupt() { m_interrupt_set = true; }
    bool interrupted() const { return m_interrupt_set.load(); }

    void set_round_observer(round_observer_t observer)
    {
        m_round_observer = std::move(observer);
    }

    chunk_id_t cursor() const { return m_cursor; }

  private:
    // Returns true when any worker of the round saw the end of the resource
    bool run_round(const std::vector<chunk_id_t> &ids);

    boost::asio::io_context &m_ioc;
    Transport &m_transport;
    ProgressSink &m_progress;
    SchedulerConfig m_config;
    Aggregator m_aggregator;
    round_observer_t m_round_observer;

    chunk_id_t m_cursor{0};
    std::size_t m_batch_retry_count{0};
    std::size_t m_rounds{0};
    std::vector<chunk_id_t> m_lost;
    bool m_global_eof{false};
    std::atomic<bool> m_interrupt_set{false};
};
