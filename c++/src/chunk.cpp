#include "chunk.hpp"

std::string_view to_string(FetchErrorKind kind)
{
    switch (kind)
    {
    case FetchErrorKind::Connect:
        return "connect error";
    case FetchErrorKind::IO:
        return "I/O error";
    case FetchErrorKind::Protocol:
        return "protocol error";
    case FetchErrorKind::ChecksumMismatch:
        return "checksum mismatch";
    case FetchErrorKind::WorkerAbort:
        return "worker abort";
    }
    return "unknown error";
}
