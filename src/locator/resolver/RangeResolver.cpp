#include "RangeResolver.h"

#include <algorithm>
#include <string>
#include <utility>

namespace pl::locator {

pl::msg::Status CheckRange(uint64_t start, uint64_t length, uint64_t file_length) {
    if (start > file_length || length > file_length - start) {
        return pl::msg::Status::PreconditionFailed("start+len must be less or equal than file length (start=" +
                                                   std::to_string(start) + ", len=" + std::to_string(length) +
                                                   ", file length=" + std::to_string(file_length) + ")");
    }
    return pl::msg::Status::Ok();
}

pl::msg::Status ResolveRange(const ChunkMap& chunk_map,
                             uint64_t start,
                             uint64_t length,
                             std::vector<BlockLocation>* out) {
    if (!out) {
        return pl::msg::Status::InvalidArgument("Output block list is null");
    }

    std::vector<BlockLocation> blocks;
    uint64_t begin = start;
    uint64_t remaining = length;
    for (const auto& location : chunk_map) {
        if (remaining == 0) {
            break;
        }
        const ChunkDescriptor& chunk = location.chunk();
        if (chunk.End() <= begin) {
            continue;
        }
        if (begin < chunk.offset()) {
            return pl::msg::Status::ProtocolError("chunk map has no chunk covering offset " + std::to_string(begin) +
                                                  ", next chunk starts at " + std::to_string(chunk.offset()));
        }

        BlockLocation block;
        block.offset = begin;
        block.length = std::min(chunk.End() - begin, remaining);
        block.hosts = location.ServiceableHosts();
        begin += block.length;
        remaining -= block.length;
        blocks.push_back(std::move(block));
    }

    if (remaining > 0) {
        return pl::msg::Status::ProtocolError("chunk map ends before offset " + std::to_string(begin) + ", " +
                                              std::to_string(remaining) + " bytes of the range uncovered");
    }

    *out = std::move(blocks);
    return pl::msg::Status::Ok();
}

} // namespace pl::locator
