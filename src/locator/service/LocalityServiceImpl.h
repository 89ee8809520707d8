#pragma once

#include <string>

#include "../../msg/locality_messages.h"
#include "../config/LocatorConfig.h"
#include "../path/PathMapper.h"
#include "../source/ChunkSource.h"
#include "../source/FileIdentityResolver.h"

namespace pl::locator {

// Answers locality questions for files on the mounted filesystem. Every call
// fetches a fresh chunk map; nothing is cached between calls.
class LocalityServiceImpl {
public:
    LocalityServiceImpl(const LocatorConfig& config,
                        ChunkSource* chunk_source,
                        const FileIdentityResolver* identity_resolver);

    pl::msg::BlockLocationsReply GetBlockLocations(const pl::msg::BlockLocationsRequest& request) const;
    pl::msg::ChunkMapReply GetChunkMap(const pl::msg::ChunkMapRequest& request) const;
    pl::msg::FileStatusReply GetFileStatus(const pl::msg::FileStatusRequest& request) const;

    const PathMapper& path_mapper() const { return path_mapper_; }

private:
    pl::msg::Status FetchChunkMap(uint64_t file_id, uint64_t file_length, ChunkMap* chunk_map) const;

    LocatorConfig config_;
    PathMapper path_mapper_;
    ChunkSource* chunk_source_{};
    const FileIdentityResolver* identity_resolver_{};
};

} // namespace pl::locator
