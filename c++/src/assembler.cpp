#include "assembler.hpp"

bytes_t assemble(const std::map<chunk_id_t, Chunk> &chunks)
{
    std::size_t total_size = 0;
    for (const auto &[id, chunk] : chunks)
    {
        total_size += chunk.data.size();
    }

    bytes_t data;
    data.reserve(total_size);
    for (const auto &[id, chunk] : chunks)
    {
        data.insert(data.end(), chunk.data.begin(), chunk.data.end());
    }
    return data;
}
