#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>

#include "chunk.hpp"

// Header text the server uses instead of a status code when a range lies past
// the end of the resource
constexpr std::string_view EOF_MARKER = "400 Invalid range:";

using progress_fn_t = std::function<void(std::size_t bytes_so_far)>;

struct FetchResult
{
    bytes_t body;
    std::string headers;
    bool eof = false;
    // Meaningful only when the error_code passed to fetch() is set
    FetchErrorKind error_kind = FetchErrorKind::IO;
};

struct ResponseParts
{
    std::string headers;
    bytes_t body;
    bool delimited = false;
};

// Splits a raw response at the first blank line. Without one, both parts are
// empty.
ResponseParts parse_response(const bytes_t &response);

bool is_eof_response(const ResponseParts &parts);

struct TransportTimeouts
{
    std::chrono::milliseconds connect{3000};
    std::chrono::milliseconds read{5000};
    std::chrono::milliseconds write{2000};
};

class Transport {
  public:
    virtual ~Transport() = default;

    // Fetches bytes [start, end] of the resource. Transport failures are
    // reported through ec, never thrown.
    virtual FetchResult fetch(std::size_t start, std::size_t end,
                              const progress_fn_t &on_progress,
                              boost::asio::yield_context yield,
                              boost::beast::error_code &ec) = 0;
};

// One fresh TCP connection per fetch, closed by the server after the response
class TcpTransport : public Transport {
  public:
    TcpTransport(boost::asio::io_context &ioc, std::string host,
                 unsigned short port, TransportTimeouts timeouts = {});

    FetchResult fetch(std::size_t start, std::size_t end,
                      const progress_fn_t &on_progress,
                      boost::asio::yield_context yield,
                      boost::beast::error_code &ec) override;

  private:
    boost::asio::io_context &m_ioc;
    std::string m_host;
    unsigned short m_port;
    TransportTimeouts m_timeouts;
};
