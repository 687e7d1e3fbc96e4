#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "chunk.hpp"

// Shared store of everything the workers produce during a run. Every
// container has its own lock, held only for the in-memory update.
class Aggregator {

  public:
    // Keeps the first capture of an id; later captures are dropped
    bool insert_chunk(Chunk chunk)
    {
        auto _lock = std::unique_lock{m_chunks_mutex};
        auto id = chunk.id;
        return m_chunks.try_emplace(id, std::move(chunk)).second;
    }

    void mark_processed(chunk_id_t id)
    {
        auto _lock = std::unique_lock{m_processed_mutex};
        m_processed.insert(id);
    }

    bool is_processed(chunk_id_t id) const
    {
        auto _lock = std::shared_lock{m_processed_mutex};
        return m_processed.contains(id);
    }

    std::vector<chunk_id_t> missing(const std::vector<chunk_id_t> &expected) const
    {
        std::vector<chunk_id_t> result;
        auto _lock = std::shared_lock{m_processed_mutex};
        for (auto id : expected)
        {
            if (!m_processed.contains(id))
                result.push_back(id);
        }
        return result;
    }

    std::size_t processed_count() const
    {
        auto _lock = std::shared_lock{m_processed_mutex};
        return m_processed.size();
    }

    void append_error(chunk_id_t id, FetchErrorKind kind, std::string message)
    {
        auto _lock = std::unique_lock{m_errors_mutex};
        m_errors.push_back(ChunkError{id, kind, std::move(message)});
    }

    std::vector<ChunkError> errors() const
    {
        auto _lock = std::unique_lock{m_errors_mutex};
        return m_errors;
    }

    // Returns the running total
    std::size_t add_bytes(std::size_t bytes)
    {
        return m_total_bytes.fetch_add(bytes) + bytes;
    }

    std::size_t total_bytes() const { return m_total_bytes.load(); }

    std::map<chunk_id_t, Chunk> take_chunks()
    {
        auto _lock = std::unique_lock{m_chunks_mutex};
        return std::exchange(m_chunks, {});
    }

  private:
    mutable std::mutex m_chunks_mutex;
    std::map<chunk_id_t, Chunk> m_chunks;

    mutable std::shared_mutex m_processed_mutex;
    std::set<chunk_id_t> m_processed;

    mutable std::mutex m_errors_mutex;
    std::vector<ChunkError> m_errors;

    std::atomic<std::size_t> m_total_bytes{0};
};
