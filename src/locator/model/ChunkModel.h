#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pl::locator {

// One storage node holding a copy of a chunk.
class ReplicaDescriptor {
public:
    ReplicaDescriptor(std::string node_name, std::string address, bool enabled, bool up);

    const std::string& node_name() const { return node_name_; }
    const std::string& address() const { return address_; }
    bool enabled() const { return enabled_; }
    bool up() const { return up_; }

    // Node may be handed to a scheduler as a locality hint.
    bool Serviceable() const { return enabled_ && up_; }

    bool operator==(const ReplicaDescriptor& other) const;
    bool operator!=(const ReplicaDescriptor& other) const { return !(*this == other); }

    std::string ToString() const;

private:
    std::string node_name_;
    std::string address_;
    bool enabled_{true};
    bool up_{true};
};

struct ReplicaDescriptorHash {
    size_t operator()(const ReplicaDescriptor& replica) const;
};

// A contiguous byte segment [offset, offset + length) of a file.
// Equality compares the segment only; ordering is by offset.
class ChunkDescriptor {
public:
    ChunkDescriptor(uint64_t offset, uint64_t length);

    uint64_t offset() const { return offset_; }
    uint64_t length() const { return length_; }
    // Saturates instead of wrapping.
    uint64_t End() const;

    bool operator==(const ChunkDescriptor& other) const {
        return offset_ == other.offset_ && length_ == other.length_;
    }
    bool operator!=(const ChunkDescriptor& other) const { return !(*this == other); }
    bool operator<(const ChunkDescriptor& other) const { return offset_ < other.offset_; }

    std::string ToString() const;

private:
    uint64_t offset_{0};
    uint64_t length_{0};
};

struct ChunkDescriptorHash {
    size_t operator()(const ChunkDescriptor& chunk) const;
};

// Replica group id paired with the physical node filling that slot.
struct ReplicaSlot {
    int32_t replica_id{0};
    ReplicaDescriptor replica;

    bool operator==(const ReplicaSlot& other) const {
        return replica_id == other.replica_id && replica == other.replica;
    }
};

class ChunkLocation {
public:
    ChunkLocation(ChunkDescriptor chunk, std::vector<ReplicaSlot> replicas, uint64_t file_length);

    const ChunkDescriptor& chunk() const { return chunk_; }
    const std::vector<ReplicaSlot>& replicas() const { return replicas_; }
    uint64_t file_length() const { return file_length_; }

    std::vector<int32_t> ReplicaIds() const;
    // Names of enabled and up replicas, in server order.
    std::vector<std::string> ServiceableHosts() const;

    std::string ToString() const;

private:
    ChunkDescriptor chunk_;
    std::vector<ReplicaSlot> replicas_;
    uint64_t file_length_{0};
};

using ChunkMap = std::vector<ChunkLocation>;

struct BlockLocation {
    uint64_t offset{0};
    uint64_t length{0};
    std::vector<std::string> hosts;

    bool operator==(const BlockLocation& other) const {
        return offset == other.offset && length == other.length && hosts == other.hosts;
    }
    bool operator!=(const BlockLocation& other) const { return !(*this == other); }

    std::string ToString() const;
};

} // namespace pl::locator
