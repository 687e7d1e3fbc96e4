#include <algorithm>

#include <boost/asio/steady_timer.hpp>

#include "log.hpp"
#include "worker.hpp"

namespace beast = boost::beast;
namespace io = boost::asio;

// Caps the delay at base_delay * 65536
constexpr std::size_t MAX_BACKOFF_EXPONENT = 16;

std::chrono::milliseconds backoff_delay(const RetryPolicy &policy,
                                        std::size_t attempt)
{
    return policy.base_delay *
           (1LL << std::min<std::size_t>(attempt, MAX_BACKOFF_EXPONENT));
}

WorkerOutcome fetch_chunk(io::io_context &ioc, Transport &transport,
                          Aggregator &aggregator, ProgressSink &progress,
                          const ChunkTask &task, const RetryPolicy &policy,
                          io::yield_context yield)
{
    auto [start, end] = chunk_range(task.id, task.chunk_size);
    auto on_progress = [&progress, &task](std::size_t bytes_so_far)
    { progress.worker_progress(task.worker_index, bytes_so_far); };

    std::size_t attempts = 0;
    while (true)
    {
        progress.worker_started(task.worker_index, task.chunk_size);

        beast::error_code ec;
        auto result = transport.fetch(start, end, on_progress, yield, ec);
        if (!ec)
        {
            if (result.eof)
            {
                log_verbose("Chunk {}: end of resource", task.id);
                return WorkerOutcome::EofSignaled;
            }

            auto size = result.body.size();
            if (aggregator.insert_chunk(Chunk{task.id, std::move(result.body)}))
            {
                progress.total_bytes(aggregator.add_bytes(size));
            }
            aggregator.mark_processed(task.id);
            return WorkerOutcome::Success;
        }

        auto message = ec.message();
        log_verbose("Error downloading chunk {}: {} ({})", task.id, message,
                    to_string(result.error_kind));
        aggregator.append_error(task.id, result.error_kind, message);

        attempts++;
        if (attempts > policy.max_chunk_retries)
        {
            log_verbose("Failed to download chunk {} after {} attempts",
                        task.id, attempts);
            return WorkerOutcome::Failed;
        }

        auto delay = backoff_delay(policy, attempts);
        log_verbose("Retrying chunk {} after {}ms", task.id, delay.count());
        io::steady_timer timer(ioc, delay);
        timer.async_wait(yield[ec]);
        if (ec)
        {
            log_verbose("Chunk {}: backoff wait interrupted: {}", task.id,
                        ec.message());
        }
    }
}
