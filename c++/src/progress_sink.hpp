#pragma once

#include <cstddef>

// Observer of transfer progress. Rendering lives outside the download core.
class ProgressSink {
  public:
    virtual ~ProgressSink() = default;

    virtual void worker_started(std::size_t worker_index,
                                std::size_t expected_total) = 0;
    virtual void worker_progress(std::size_t worker_index,
                                 std::size_t bytes_so_far) = 0;
    virtual void total_bytes(std::size_t bytes) = 0;
};

class NullProgressSink : public ProgressSink {
  public:
    void worker_started(std::size_t, std::size_t) {}
    void worker_progress(std::size_t, std::size_t) {}
    void total_bytes(std::size_t) {}
};
