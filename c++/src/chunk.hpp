#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using chunk_id_t = std::size_t;
using bytes_t = std::vector<char>;

struct Chunk
{
    chunk_id_t id;
    bytes_t data;
};

// Byte range [first, second) covered by a chunk id
inline std::pair<std::size_t, std::size_t> chunk_range(chunk_id_t id,
                                                       std::size_t chunk_size)
{
    return {id * chunk_size, id * chunk_size + chunk_size};
}

enum class FetchErrorKind
{
    Connect,
    IO,
    Protocol,
    ChecksumMismatch,
    WorkerAbort
};

std::string_view to_string(FetchErrorKind kind);

struct ChunkError
{
    chunk_id_t id;
    FetchErrorKind kind;
    std::string message;
};
