#pragma once

#include <map>

#include "chunk.hpp"

// Concatenates captured chunks in ascending id order. Ids that were never
// captured leave no trace in the output.
bytes_t assemble(const std::map<chunk_id_t, Chunk> &chunks);
