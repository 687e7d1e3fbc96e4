#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "chunk.hpp"
#include "progress_sink.hpp"
#include "request.hpp"
#include "scheduler.hpp"

struct FetchConfig
{
    std::string host = "127.0.0.1";
    unsigned short port = 8080;
    std::size_t chunk_size = 64 * 1024;
    std::size_t concurrency = 4;
    std::size_t max_chunk_retries = 2;
    std::size_t max_batch_retries = 3;
    std::optional<std::string> expected_checksum;
    TransportTimeouts timeouts;
    std::chrono::milliseconds base_delay{50};
    std::size_t io_threads = 1;
};

struct RunOutcome
{
    bytes_t assembled;
    std::string digest_hex;
    std::vector<ChunkError> errors;
    std::optional<bool> checksum_matched;
    bool eof = false;
    std::size_t chunks_captured = 0;
    // Chunks lost to force-advanced batches
    std::vector<chunk_id_t> gaps;
    std::size_t rounds = 0;
};

SchedulerConfig to_scheduler_config(const FetchConfig &config);

// Assembles and verifies the terminal state of a scheduler run
RunOutcome finish_run(RunResult result,
                      const std::optional<std::string> &expected_checksum);

class Downloader {
  public:
    Downloader(boost::asio::io_context &ioc, Transport &transport,
               ProgressSink &progress, FetchConfig config);

    RunOutcome run();

    void interrupt() { m_scheduler.interrupt(); }

  private:
    FetchConfig m_config;
    Scheduler m_scheduler;
};
