#pragma once

#include <chrono>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include "aggregator.hpp"
#include "progress_sink.hpp"
#include "request.hpp"

enum class WorkerOutcome
{
    Success,
    EofSignaled,
    Failed
};

struct RetryPolicy
{
    std::size_t max_chunk_retries = 2;
    std::chrono::milliseconds base_delay{50};
};

struct ChunkTask
{
    chunk_id_t id;
    std::size_t worker_index;
    std::size_t chunk_size;
};

/**
 * Delay slept before retry number `attempt` (1-based): base_delay * 2^attempt,
 * with the exponent capped at 16
 */
std::chrono::milliseconds backoff_delay(const RetryPolicy &policy,
                                        std::size_t attempt);

/**
 * Fetches one chunk, retrying transport failures with exponential backoff.
 *
 * Every failed attempt is appended to the aggregator's error log. A successful
 * non-empty response is recorded as a chunk and its id marked processed. An
 * end-of-resource response leaves the aggregator untouched.
 *
 * @return Success, EofSignaled, or Failed once max_chunk_retries + 1 attempts
 * have failed
 */
WorkerOutcome fetch_chunk(boost::asio::io_context &ioc, Transport &transport,
                          Aggregator &aggregator, ProgressSink &progress,
                          const ChunkTask &task, const RetryPolicy &policy,
                          boost::asio::yield_context yield);
