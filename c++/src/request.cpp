#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <fmt/core.h>

#include "log.hpp"
#include "request.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace io = boost::asio;
using tcp = io::ip::tcp;

constexpr std::string_view HEADER_DELIMITER = "\r\n\r\n";
constexpr std::size_t READ_BLOCK_SIZE = 8192;

ResponseParts parse_response(const bytes_t &response)
{
    auto delimiter = std::search(response.begin(), response.end(),
                                 HEADER_DELIMITER.begin(),
                                 HEADER_DELIMITER.end());
    if (delimiter == response.end())
    {
        return ResponseParts{};
    }
    auto headers_end = std::next(delimiter, HEADER_DELIMITER.size());
    return ResponseParts{std::string(response.begin(), headers_end),
                         bytes_t(headers_end, response.end()), true};
}

bool is_eof_response(const ResponseParts &parts)
{
    return parts.headers.find(EOF_MARKER) != std::string::npos ||
           parts.body.empty();
}

TcpTransport::TcpTransport(io::io_context &ioc, std::string host,
                           unsigned short port, TransportTimeouts timeouts)
    : m_ioc(ioc), m_host(std::move(host)), m_port(port), m_timeouts(timeouts)
{}

FetchResult TcpTransport::fetch(std::size_t start, std::size_t end,
                                const progress_fn_t &on_progress,
                                io::yield_context yield, beast::error_code &ec)
{
    FetchResult result;

    tcp::resolver resolver(m_ioc);
    auto endpoints =
        resolver.async_resolve(m_host, std::to_string(m_port), yield[ec]);
    if (ec)
    {
        result.error_kind = FetchErrorKind::Connect;
        return result;
    }

    beast::tcp_stream stream(m_ioc);
    stream.expires_after(m_timeouts.connect);
    stream.async_connect(endpoints, yield[ec]);
    if (ec)
    {
        result.error_kind = FetchErrorKind::Connect;
        return result;
    }

    http::request<http::empty_body> req{http::verb::get, "/", 11};
    req.set(http::field::host, fmt::format("{}:{}", m_host, m_port));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::range, fmt::format("bytes={}-{}", start, end));
    req.set(http::field::connection, "close");

    stream.expires_after(m_timeouts.write);
    http::async_write(stream, req, yield[ec]);
    if (ec)
    {
        result.error_kind = FetchErrorKind::IO;
        return result;
    }

    // The server closes the connection once the response is sent
    bytes_t response;
    response.reserve(end - start + 1024);
    std::array<char, READ_BLOCK_SIZE> buffer;
    while (true)
    {
        stream.expires_after(m_timeouts.read);
        auto n = stream.async_read_some(io::buffer(buffer), yield[ec]);
        if (n > 0)
        {
            response.insert(response.end(), buffer.begin(),
                            std::next(buffer.begin(), n));
            if (on_progress)
                on_progress(response.size());
        }
        if (ec == io::error::eof)
        {
            ec = {};
            break;
        }
        if (ec == beast::error::timeout && !response.empty())
        {
            log_verbose("range {}-{}: read timed out after {} bytes, "
                        "keeping what arrived",
                        start, end, response.size());
            ec = {};
            break;
        }
        if (ec)
        {
            result.error_kind = FetchErrorKind::IO;
            return result;
        }
    }

    auto parts = parse_response(response);
    if (!parts.delimited && !response.empty())
    {
        log_verbose("range {}-{}: no header delimiter in {} bytes, "
                    "treating as no data",
                    start, end, response.size());
    }
    result.eof = is_eof_response(parts);
    result.headers = std::move(parts.headers);
    result.body = std::move(parts.body);
    return result;
}
