#include "assembler.hpp"
#include "downloader.hpp"
#include "log.hpp"
#include "verifier.hpp"

namespace io = boost::asio;

SchedulerConfig to_scheduler_config(const FetchConfig &config)
{
    SchedulerConfig scheduler_config;
    scheduler_config.chunk_size = config.chunk_size;
    scheduler_config.concurrency = config.concurrency;
    scheduler_config.max_batch_retries = config.max_batch_retries;
    scheduler_config.retry.max_chunk_retries = config.max_chunk_retries;
    scheduler_config.retry.base_delay = config.base_delay;
    scheduler_config.io_threads = config.io_threads;
    return scheduler_config;
}

RunOutcome finish_run(RunResult result,
                      const std::optional<std::string> &expected_checksum)
{
    RunOutcome outcome;
    outcome.assembled = assemble(result.chunks);
    outcome.gaps = std::move(result.lost);
    outcome.chunks_captured = result.chunks.size();
    outcome.errors = std::move(result.errors);
    outcome.eof = result.eof;
    outcome.rounds = result.rounds;

    auto verification = verify(outcome.assembled, expected_checksum);
    outcome.digest_hex = std::move(verification.digest_hex);
    outcome.checksum_matched = verification.matched;
    if (outcome.checksum_matched == false)
    {
        log_verbose("{}: expected {}, got {}",
                    to_string(FetchErrorKind::ChecksumMismatch),
                    *expected_checksum, outcome.digest_hex);
    }
    return outcome;
}

Downloader::Downloader(io::io_context &ioc, Transport &transport,
                       ProgressSink &progress, FetchConfig config)
    : m_config(std::move(config)),
      m_scheduler(ioc, transport, progress, to_scheduler_config(m_config))
{}

RunOutcome Downloader::run()
{
    log_verbose("Fetching {}:{} in {} byte chunks, {} at a time",
                m_config.host, m_config.port, m_config.chunk_size,
                m_config.concurrency);
    return finish_run(m_scheduler.run(), m_config.expected_checksum);
}
