#define BOOST_TEST_MODULE scheduler
#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "assembler.hpp"
#include "digest.hpp"
#include "downloader.hpp"
#include "scheduler.hpp"
#include "test_helpers.hpp"

namespace io = boost::asio;

namespace {

using rounds_t = std::vector<std::vector<chunk_id_t>>;

SchedulerConfig make_config(std::size_t chunk_size, std::size_t concurrency)
{
    SchedulerConfig config;
    config.chunk_size = chunk_size;
    config.concurrency = concurrency;
    config.retry.base_delay = std::chrono::milliseconds(1);
    return config;
}

struct SchedulerFixture
{
    RunResult run(Transport &transport, SchedulerConfig config)
    {
        Scheduler scheduler(ioc, transport, progress, config);
        scheduler.set_round_observer(
            [this](std::size_t, chunk_id_t, const std::vector<chunk_id_t> &ids)
            { rounds.push_back(ids); });
        return scheduler.run();
    }

    io::io_context ioc;
    NullProgressSink progress;
    rounds_t rounds;
};

}

BOOST_FIXTURE_TEST_CASE( two_chunks_then_invalid_range, SchedulerFixture )
{
    std::string chunk0 = "0123456789";
    std::string chunk1 = "abcdefghij";
    ScriptedTransport transport(10, resource_script(chunk0 + chunk1, 10));

    auto result = run(transport, make_config(10, 2));

    BOOST_CHECK( result.eof );
    BOOST_CHECK( result.errors.empty() );
    BOOST_REQUIRE_EQUAL( result.chunks.size(), 2u );

    auto data = assemble(result.chunks);
    BOOST_CHECK_EQUAL( data.size(), 20u );
    BOOST_CHECK_EQUAL( to_text(data), chunk0 + chunk1 );
    BOOST_CHECK_EQUAL( Digest(data).hexstring(),
                       Digest(make_bytes(chunk0 + chunk1)).hexstring() );
    BOOST_CHECK_EQUAL( result.total_bytes, 20u );

    rounds_t expected{{0, 1}, {2, 3}};
    BOOST_CHECK( rounds == expected );
}

BOOST_FIXTURE_TEST_CASE( incomplete_batch_retries_only_missing_ids, SchedulerFixture )
{
    std::string resource = "aaaaaaaaaabbbbbbbbbbcccccccccc";
    auto serve = resource_script(resource, 10);
    // Chunk 1 fails every attempt of the first round
    ScriptedTransport transport(10, [serve](chunk_id_t id, std::size_t attempt) {
        if (id == 1 && attempt < 3)
            return ScriptedReply::fail();
        return serve(id, attempt);
    });

    auto result = run(transport, make_config(10, 3));

    rounds_t expected{{0, 1, 2}, {1}, {3, 4, 5}};
    BOOST_CHECK( rounds == expected );
    BOOST_CHECK( result.eof );
    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)), resource );

    BOOST_CHECK_EQUAL( transport.calls(0), 1u );
    BOOST_CHECK_EQUAL( transport.calls(1), 4u );
    BOOST_CHECK_EQUAL( transport.calls(2), 1u );
    BOOST_REQUIRE_EQUAL( result.errors.size(), 3u );
    for (const auto &error : result.errors)
        BOOST_CHECK_EQUAL( error.id, 1u );
}

BOOST_FIXTURE_TEST_CASE( exhausted_batch_is_force_advanced, SchedulerFixture )
{
    auto serve = resource_script("aaaaaaaaaabbbbbbbbbbcccccccccc", 10);
    ScriptedTransport transport(10, [serve](chunk_id_t id, std::size_t attempt) {
        if (id == 1)
            return ScriptedReply::fail();
        return serve(id, attempt);
    });
    auto config = make_config(10, 2);
    config.retry.max_chunk_retries = 0;
    config.max_batch_retries = 3;

    auto result = run(transport, config);

    rounds_t expected{{0, 1}, {1}, {1}, {1}, {2, 3}};
    BOOST_CHECK( rounds == expected );
    BOOST_CHECK( result.eof );
    BOOST_CHECK_EQUAL( result.rounds, 5u );
    BOOST_CHECK_EQUAL( transport.calls(1), config.max_batch_retries + 1 );
    BOOST_CHECK_EQUAL( result.errors.size(), config.max_batch_retries + 1 );

    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)),
                       "aaaaaaaaaacccccccccc" );
    BOOST_REQUIRE_EQUAL( result.lost.size(), 1u );
    BOOST_CHECK_EQUAL( result.lost.front(), 1u );
}

BOOST_FIXTURE_TEST_CASE( aborted_worker_is_recovered_by_batch_retry, SchedulerFixture )
{
    auto serve = resource_script("aaaaabbbbb", 5);
    ScriptedTransport transport(5, [serve](chunk_id_t id, std::size_t attempt) {
        if (id == 0 && attempt == 0)
            return ScriptedReply::abort();
        return serve(id, attempt);
    });

    auto result = run(transport, make_config(5, 2));

    rounds_t expected{{0, 1}, {0}, {2, 3}};
    BOOST_CHECK( rounds == expected );
    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)), "aaaaabbbbb" );
    BOOST_REQUIRE_EQUAL( result.errors.size(), 1u );
    BOOST_CHECK_EQUAL( result.errors.front().id, 0u );
    BOOST_CHECK( result.errors.front().kind == FetchErrorKind::WorkerAbort );
}

BOOST_FIXTURE_TEST_CASE( non_standard_exception_is_a_worker_abort, SchedulerFixture )
{
    auto serve = resource_script("aaaaabbbbb", 5);
    ScriptedTransport transport(5, [serve](chunk_id_t id, std::size_t attempt) {
        if (id == 0 && attempt == 0)
            return ScriptedReply::foreign_abort();
        return serve(id, attempt);
    });

    RunResult result;
    BOOST_REQUIRE_NO_THROW( result = run(transport, make_config(5, 2)) );

    BOOST_CHECK( result.eof );
    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)), "aaaaabbbbb" );
    BOOST_REQUIRE_EQUAL( result.errors.size(), 1u );
    BOOST_CHECK( result.errors.front().kind == FetchErrorKind::WorkerAbort );
    BOOST_CHECK_EQUAL( result.errors.front().message, "unknown exception" );
}

BOOST_FIXTURE_TEST_CASE( non_standard_exception_on_extra_io_threads, SchedulerFixture )
{
    ScriptedTransport transport(1, [](chunk_id_t id, std::size_t attempt) {
        if (id >= 8)
            return ScriptedReply::eof();
        if (attempt == 0 && id % 2 == 1)
            return ScriptedReply::foreign_abort();
        return ScriptedReply::data_of(std::string(1, static_cast<char>('a' + id)));
    });
    auto config = make_config(1, 4);
    config.io_threads = 3;

    RunResult result;
    BOOST_REQUIRE_NO_THROW( result = run(transport, config) );

    BOOST_CHECK( result.eof );
    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)), "abcdefgh" );
    BOOST_CHECK_EQUAL( result.errors.size(), 4u );
}

BOOST_FIXTURE_TEST_CASE( batch_lost_right_before_the_end_is_reported, SchedulerFixture )
{
    // Chunk 1 never arrives and chunk 2 is already past the end
    ScriptedTransport transport(2, [](chunk_id_t id, std::size_t) {
        if (id == 0)
            return ScriptedReply::data_of("ab");
        if (id == 1)
            return ScriptedReply::fail();
        return ScriptedReply::eof();
    });
    auto config = make_config(2, 2);
    config.retry.max_chunk_retries = 0;

    auto result = run(transport, config);

    BOOST_CHECK( result.eof );
    BOOST_CHECK_EQUAL( transport.calls(1), config.max_batch_retries + 1 );
    BOOST_REQUIRE_EQUAL( result.lost.size(), 1u );
    BOOST_CHECK_EQUAL( result.lost.front(), 1u );

    auto outcome = finish_run(std::move(result), std::nullopt);
    BOOST_CHECK_EQUAL( to_text(outcome.assembled), "ab" );
    BOOST_REQUIRE_EQUAL( outcome.gaps.size(), 1u );
    BOOST_CHECK_EQUAL( outcome.gaps.front(), 1u );
}

BOOST_FIXTURE_TEST_CASE( eof_mid_round_keeps_sibling_results, SchedulerFixture )
{
    // Chunk 2 is the end, chunk 3 still answers with data
    ScriptedTransport transport(4, [](chunk_id_t id, std::size_t) {
        if (id == 2)
            return ScriptedReply::eof();
        return ScriptedReply::data_of(std::string(4, static_cast<char>('a' + id)));
    });

    auto result = run(transport, make_config(4, 4));

    BOOST_CHECK( result.eof );
    BOOST_CHECK_EQUAL( result.rounds, 1u );
    BOOST_CHECK_EQUAL( transport.total_calls(), 4u );
    BOOST_CHECK_EQUAL( result.chunks.size(), 3u );
    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)), "aaaabbbbdddd" );
}

BOOST_FIXTURE_TEST_CASE( output_order_ignores_completion_order, SchedulerFixture )
{
    std::string resource = "00001111222233334444555566667777";
    ScriptedTransport transport(4, resource_script(resource, 4));
    // Lower ids finish last
    transport.set_delay(ioc, [](chunk_id_t id) {
        return std::chrono::milliseconds(5 * (8 - static_cast<long>(id % 8)));
    });

    auto result = run(transport, make_config(4, 8));

    BOOST_CHECK( result.eof );
    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)), resource );
}

BOOST_FIXTURE_TEST_CASE( several_io_threads_capture_every_chunk, SchedulerFixture )
{
    std::string resource;
    for (int i = 0; i != 200; i++)
        resource += static_cast<char>('a' + i % 26);

    ScriptedTransport transport(3, resource_script(resource, 3));
    transport.set_delay(ioc, [](chunk_id_t id) {
        return std::chrono::milliseconds(id % 3);
    });
    auto config = make_config(3, 8);
    config.io_threads = 4;

    auto result = run(transport, config);

    BOOST_CHECK( result.eof );
    BOOST_CHECK( result.errors.empty() );
    BOOST_CHECK_EQUAL( to_text(assemble(result.chunks)), resource );
    for (chunk_id_t id = 0; id * 3 < resource.size(); id++)
        BOOST_CHECK_EQUAL( transport.calls(id), 1u );
}

BOOST_FIXTURE_TEST_CASE( interrupt_stops_after_the_current_round, SchedulerFixture )
{
    ScriptedTransport transport(
        2, [](chunk_id_t, std::size_t) { return ScriptedReply::data_of("zz"); });

    Scheduler scheduler(ioc, transport, progress, make_config(2, 3));
    scheduler.set_round_observer(
        [&scheduler](std::size_t round, chunk_id_t, const std::vector<chunk_id_t> &)
        {
            if (round == 2)
                scheduler.interrupt();
        });
    auto result = scheduler.run();

    BOOST_CHECK( !result.eof );
    BOOST_CHECK_EQUAL( result.rounds, 2u );
    BOOST_CHECK_EQUAL( result.chunks.size(), 6u );
    BOOST_CHECK_EQUAL( scheduler.cursor(), 6u );
}

BOOST_AUTO_TEST_CASE( rejects_zero_concurrency )
{
    io::io_context ioc;
    NullProgressSink progress;
    ScriptedTransport transport(1, resource_script("", 1));
    BOOST_CHECK_THROW( Scheduler(ioc, transport, progress, make_config(1, 0)),
                       std::invalid_argument );
}
