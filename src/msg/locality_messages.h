#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "status.h"

namespace pl::msg {

struct BlockLocationsRequest {
    std::string path;
    uint64_t start{0};
    uint64_t length{0};
};

struct BlockLocationInfo {
    uint64_t offset{0};
    uint64_t length{0};
    std::vector<std::string> hosts;
};

struct BlockLocationsReply {
    Status status;
    uint64_t file_length{0};
    std::vector<BlockLocationInfo> blocks;
};

struct ChunkMapRequest {
    uint64_t file_id{0};
    uint64_t file_length{0};
};

struct ReplicaInfo {
    int32_t replica_id{0};
    std::string node_name;
    std::string address;
    bool enabled{false};
    bool up{false};
};

struct ChunkLocationInfo {
    uint64_t offset{0};
    uint64_t length{0};
    uint64_t file_length{0};
    std::vector<ReplicaInfo> replicas;
};

struct ChunkMapReply {
    Status status;
    std::vector<ChunkLocationInfo> chunks;
};

struct FileStatusRequest {
    std::string path;
};

struct FileStatusInfo {
    std::string path;
    std::string local_path;
    uint64_t length{0};
    bool is_dir{false};
    uint32_t replication{0};
    uint64_t block_size{0};
    uint64_t modification_time_ms{0};
    std::string owner;
    std::string group;
    // ls -l style, e.g. "-rw-r--r--".
    std::string permission;
};

struct FileStatusReply {
    Status status;
    FileStatusInfo info;
};

} // namespace pl::msg
