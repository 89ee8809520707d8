#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace pl::locator {

struct LocatorConfig {
    std::string mount_point{"/net"};
    std::string control_node;
    std::string virtual_fs{"filesystem"};
    std::string user_name;
    std::string chunk_endpoint{"http://localhost:14149/mproxy/map_obj"};
    int32_t connect_timeout_ms{10000};
    int32_t request_timeout_ms{-1};
    uint32_t max_connections_per_host{10};
    uint64_t default_block_size{64ULL * 1024ULL * 1024ULL};
    uint32_t default_replication{2};
    std::unordered_map<std::string, uint64_t> vfs_block_size;
    std::unordered_map<std::string, uint32_t> vfs_replication;

    uint64_t BlockSizeFor(const std::string& vfs) const;
    uint32_t ReplicationFor(const std::string& vfs) const;

    static LocatorConfig LoadFromFile(const std::string& path, std::string* error);
};

} // namespace pl::locator
