#pragma once

#include <cstdint>
#include <string>

#include "../../msg/status.h"
#include "../model/ChunkModel.h"

namespace pl::locator {

// Where a file's chunk map comes from. Implementations keep no per-file state
// and may be called concurrently.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    // Records come back in the order the source produced them. On failure
    // out is left untouched.
    virtual pl::msg::Status ResolveChunkMap(uint64_t file_id, uint64_t file_length, ChunkMap* out) = 0;

    virtual std::string Describe() const = 0;
};

} // namespace pl::locator
