#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include <boost/asio/deadline_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/program_options.hpp>
#include <fmt/core.h>

#include "downloader.hpp"
#include "log.hpp"
#include "output.hpp"
#include "progress.hpp"
#include "request.hpp"
#include "timer.hpp"

namespace io = boost::asio;

void do_monitoring(io::io_context &ioc, Progress &progress,
                   io::signal_set &signals_handler, io::yield_context yield)
{
    io::deadline_timer timer(ioc);
    while (!progress.finished())
    {
        progress.update_progress_bars();
        timer.expires_from_now(boost::posix_time::milliseconds(200));
        timer.async_wait(yield);
    }
    progress.mark_as_completed();
    signals_handler.cancel();
}

struct Options
{
    FetchConfig fetch;
    std::size_t chunk_size_kib;
    std::size_t read_timeout;
    std::size_t connect_timeout;
    std::size_t write_timeout;
    std::optional<std::string> output_filename;
    bool verbose;
};

auto parse_options(int argc, char *argv[])
{
    Options options;
    namespace po = boost::program_options;
    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "show this help message")(
        "host,H",
        po::value<std::string>(&options.fetch.host)->default_value("127.0.0.1"),
        "server hostname or IP address")(
        "port,p",
        po::value<unsigned short>(&options.fetch.port)->default_value(8080),
        "server port")(
        "chunk-size,c",
        po::value<std::size_t>(&options.chunk_size_kib)->default_value(64),
        "chunk size in KiB")(
        "threads,t",
        po::value<std::size_t>(&options.fetch.concurrency)->default_value(4),
        "number of concurrent downloads")(
        "io-threads,j",
        po::value<std::size_t>(&options.fetch.io_threads)->default_value(1),
        "number of threads driving the downloads")(
        "output,o", po::value<std::string>(),
        "save downloaded data to FILE")(
        "verify,v", po::value<std::string>(),
        "verify SHA-256 hash of downloaded data")(
        "chunk-retries",
        po::value<std::size_t>(&options.fetch.max_chunk_retries)
            ->default_value(2),
        "retries of a failed chunk request")(
        "batch-retries",
        po::value<std::size_t>(&options.fetch.max_batch_retries)
            ->default_value(3),
        "retries of an incomplete batch before skipping it")(
        "timeout,T",
        po::value<std::size_t>(&options.read_timeout)->default_value(5000),
        "read timeout in milliseconds")(
        "connect-timeout",
        po::value<std::size_t>(&options.connect_timeout)->default_value(3000),
        "connect timeout in milliseconds")(
        "write-timeout",
        po::value<std::size_t>(&options.write_timeout)->default_value(2000),
        "write timeout in milliseconds")(
        "verbose", "enable verbose output with detailed error messages");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help"))
    {
        std::cout << desc << '\n';
        exit(EXIT_SUCCESS);
    }
    if (options.chunk_size_kib == 0)
    {
        throw po::error("--chunk-size must be at least 1 KiB");
    }
    if (options.fetch.concurrency == 0)
    {
        throw po::error("--threads must be at least 1");
    }

    options.fetch.chunk_size = options.chunk_size_kib * 1024;
    options.fetch.timeouts.read = std::chrono::milliseconds(options.read_timeout);
    options.fetch.timeouts.connect =
        std::chrono::milliseconds(options.connect_timeout);
    options.fetch.timeouts.write =
        std::chrono::milliseconds(options.write_timeout);
    if (vm.count("output"))
        options.output_filename = vm["output"].as<std::string>();
    if (vm.count("verify"))
        options.fetch.expected_checksum = vm["verify"].as<std::string>();
    options.verbose = vm.count("verbose") > 0;
    return options;
}

void report(const RunOutcome &outcome, const FetchConfig &config,
            const Timer &timer)
{
    auto size = outcome.assembled.size();
    fmt::print("\nDownload completed in {:.2f}s\n", timer.get_seconds());
    fmt::print("Total size: {} bytes ({:.2f} KiB)\n", size, size / 1024.f);
    fmt::print("Average speed: {:.2f} KiB/s\n", timer.kib_per_sec(size));
    fmt::print("SHA-256 hash: {}\n", outcome.digest_hex);
    if (!outcome.eof)
    {
        log_error("End of resource was not reached, output may be incomplete");
    }
    if (!outcome.gaps.empty())
    {
        log_error("{} chunks were skipped after exhausting batch retries",
                  outcome.gaps.size());
    }

    if (outcome.checksum_matched)
    {
        if (*outcome.checksum_matched)
        {
            fmt::print("Checksum verification: PASSED\n");
        }
        else
        {
            log_error("Checksum verification: FAILED");
            log_error("Expected: {}", *config.expected_checksum);
            log_error("Actual:   {}", outcome.digest_hex);
        }
    }

    if (!outcome.errors.empty())
    {
        log_error("\n{} errors occurred during download:",
                  outcome.errors.size());
        if (verbose_enabled())
        {
            for (const auto &error : outcome.errors)
            {
                log_error("Chunk {}: {} ({})", error.id, error.message,
                          to_string(error.kind));
            }
        }
        else
        {
            log_error("Use --verbose for detailed error information");
        }
    }
}

int main(int argc, char *argv[])
{
    Options options;
    try
    {
        options = parse_options(argc, argv);
    }
    catch (const boost::program_options::error &e)
    {
        log_error("{}", e.what());
        return EXIT_FAILURE;
    }
    set_verbose(options.verbose);

    fmt::print("Starting download from {}:{}\n", options.fetch.host,
               options.fetch.port);

    io::io_context download_ioc;
    TcpTransport transport(download_ioc, options.fetch.host,
                           options.fetch.port, options.fetch.timeouts);
    Progress progress{options.fetch.concurrency, options.fetch.chunk_size};
    Downloader downloader(download_ioc, transport, progress, options.fetch);

    io::io_context ioc;

    // Stop scheduling new batches on the first signal
    io::signal_set signals_handler(ioc, SIGINT, SIGTERM);
    signals_handler.async_wait(
        [&downloader](const boost::system::error_code &error, int)
        {
            if (!error)
                downloader.interrupt();
        });

    Timer timer;
    RunOutcome outcome;
    std::thread download_thread(
        [&]()
        {
            outcome = downloader.run();
            progress.finish();
        });

    io::spawn(ioc,
              [&progress, &ioc, &signals_handler](auto yield_context) {
                  do_monitoring(ioc, progress, signals_handler, yield_context);
              });

    ioc.run();
    download_thread.join();

    report(outcome, options.fetch, timer);

    if (options.output_filename)
    {
        try
        {
            write_output(outcome.assembled, *options.output_filename);
        }
        catch (const std::system_error &e)
        {
            log_error("Failed to save '{}': {}", *options.output_filename,
                      e.what());
            return EXIT_FAILURE;
        }
    }

    if (outcome.checksum_matched == false)
    {
        log_error("Checksum verification failed");
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
