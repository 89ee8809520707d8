#pragma once

#include <cstdint>
#include <vector>

#include "../../msg/status.h"
#include "../model/ChunkModel.h"

namespace pl::locator {

// Rejects a query reaching past the end of the file.
pl::msg::Status CheckRange(uint64_t start, uint64_t length, uint64_t file_length);

// Maps [start, start + length) onto the ascending chunk map, one block per
// overlapped chunk, each trimmed to the query. Pure: the same inputs always
// give the same output.
//
// Chunks ending at or before the cursor are skipped. A chunk starting past the
// cursor (a hole in the map) or a map ending before the query does fails with
// kProtocolError, and out is left untouched.
pl::msg::Status ResolveRange(const ChunkMap& chunk_map,
                             uint64_t start,
                             uint64_t length,
                             std::vector<BlockLocation>* out);

} // namespace pl::locator
