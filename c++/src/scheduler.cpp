#include <exception>
#include <numeric>
#include <stdexcept>
#include <thread>

#include <boost/asio/spawn.hpp>
#include <boost/coroutine/exceptions.hpp>
#include <fmt/format.h>

#include "log.hpp"
#include "scheduler.hpp"

namespace io = boost::asio;

Scheduler::Scheduler(io::io_context &ioc, Transport &transport,
                     ProgressSink &progress, SchedulerConfig config)
    : m_ioc(ioc), m_transport(transport), m_progress(progress),
      m_config(config)
{
    if (m_config.chunk_size == 0)
        throw std::invalid_argument("chunk size must be at least 1 byte");
    if (m_config.concurrency == 0)
        throw std::invalid_argument("concurrency must be at least 1");
    if (m_config.io_threads == 0)
        m_config.io_threads = 1;
}

bool Scheduler::run_round(const std::vector<chunk_id_t> &ids)
{
    std::atomic<bool> eof_seen{false};

    m_ioc.restart();
    for (auto id : ids)
    {
        ChunkTask task{id, id - m_cursor, m_config.chunk_size};
        io::spawn(m_ioc,
                  [this, task, &eof_seen](io::yield_context yield)
                  {
                      try
                      {
                          auto outcome = fetch_chunk(
                              m_ioc, m_transport, m_aggregator, m_progress,
                              task, m_config.retry, yield);
                          if (outcome == WorkerOutcome::EofSignaled)
                              eof_seen = true;
                      }
                      catch (const boost::coroutines::detail::forced_unwind &)
                      {
                          // Coroutine teardown, must reach the coroutine entry
                          throw;
                      }
                      catch (const std::exception &e)
                      {
                          log_verbose("Worker for chunk {} aborted: {}",
                                      task.id, e.what());
                          m_aggregator.append_error(
                              task.id, FetchErrorKind::WorkerAbort, e.what());
                      }
                      catch (...)
                      {
                          log_verbose("Worker for chunk {} aborted: "
                                      "unknown exception",
                                      task.id);
                          m_aggregator.append_error(
                              task.id, FetchErrorKind::WorkerAbort,
                              "unknown exception");
                      }
                  });
    }

    // Every spawned worker has finished once run() returns on all threads
    std::vector<std::thread> threads;
    for (std::size_t i = 1; i < m_config.io_threads; i++)
    {
        threads.emplace_back([this]() { m_ioc.run(); });
    }
    m_ioc.run();
    for (auto &thread : threads)
    {
        thread.join();
    }

    return eof_seen.load();
}

RunResult Scheduler::run()
{
    while (!m_global_eof)
    {
        if (interrupted())
        {
            log_verbose("Interrupted before batch starting at chunk {}",
                        m_cursor);
            break;
        }

        std::vector<chunk_id_t> expected(m_config.concurrency);
        std::iota(expected.begin(), expected.end(), m_cursor);

        std::vector<chunk_id_t> to_fetch;
        for (auto id : expected)
        {
            if (!m_aggregator.is_processed(id))
                to_fetch.push_back(id);
        }

        m_rounds++;
        if (m_round_observer)
            m_round_observer(m_rounds, m_cursor, to_fetch);

        if (run_round(to_fetch))
        {
            m_global_eof = true;
            break;
        }

        auto missing = m_aggregator.missing(expected);
        if (missing.empty())
        {
            m_cursor += m_config.concurrency;
            m_batch_retry_count = 0;
            continue;
        }

        log_verbose("Some chunks failed to download: [{}]",
                    fmt::join(missing, ", "));
        m_batch_retry_count++;
        if (m_batch_retry_count > m_config.max_batch_retries)
        {
            log_verbose("Max retries reached for batch starting at chunk {}. "
                        "Moving to next batch.",
                        m_cursor);
            m_lost.insert(m_lost.end(), missing.begin(), missing.end());
            m_cursor += m_config.concurrency;
            m_batch_retry_count = 0;
        }
    }

    RunResult result;
    result.chunks = m_aggregator.take_chunks();
    result.errors = m_aggregator.errors();
    result.eof = m_global_eof;
    result.lost = m_lost;
    result.rounds = m_rounds;
    result.total_bytes = m_aggregator.total_bytes();
    return result;
}
