#include "ChunkModel.h"

#include <functional>
#include <limits>
#include <sstream>
#include <utility>

namespace pl::locator {

namespace {

void HashCombine(size_t* seed, size_t value) {
    *seed ^= value + 0x9e3779b97f4a7c15ULL + (*seed << 6) + (*seed >> 2);
}

} // namespace

ReplicaDescriptor::ReplicaDescriptor(std::string node_name, std::string address, bool enabled, bool up)
    : node_name_(std::move(node_name)), address_(std::move(address)), enabled_(enabled), up_(up) {}

bool ReplicaDescriptor::operator==(const ReplicaDescriptor& other) const {
    return enabled_ == other.enabled_ && up_ == other.up_ && node_name_ == other.node_name_ &&
           address_ == other.address_;
}

std::string ReplicaDescriptor::ToString() const {
    std::ostringstream out;
    out << "replica{name=" << node_name_ << ", addr=" << address_ << ", enabled=" << (enabled_ ? "true" : "false")
        << ", up=" << (up_ ? "true" : "false") << "}";
    return out.str();
}

size_t ReplicaDescriptorHash::operator()(const ReplicaDescriptor& replica) const {
    size_t seed = 0;
    HashCombine(&seed, std::hash<std::string>()(replica.node_name()));
    HashCombine(&seed, std::hash<std::string>()(replica.address()));
    HashCombine(&seed, std::hash<bool>()(replica.enabled()));
    HashCombine(&seed, std::hash<bool>()(replica.up()));
    return seed;
}

ChunkDescriptor::ChunkDescriptor(uint64_t offset, uint64_t length) : offset_(offset), length_(length) {}

uint64_t ChunkDescriptor::End() const {
    if (length_ > std::numeric_limits<uint64_t>::max() - offset_) {
        return std::numeric_limits<uint64_t>::max();
    }
    return offset_ + length_;
}

std::string ChunkDescriptor::ToString() const {
    std::ostringstream out;
    out << "chunk{offset=" << offset_ << ", length=" << length_ << "}";
    return out.str();
}

size_t ChunkDescriptorHash::operator()(const ChunkDescriptor& chunk) const {
    size_t seed = 0;
    HashCombine(&seed, std::hash<uint64_t>()(chunk.offset()));
    HashCombine(&seed, std::hash<uint64_t>()(chunk.length()));
    return seed;
}

ChunkLocation::ChunkLocation(ChunkDescriptor chunk, std::vector<ReplicaSlot> replicas, uint64_t file_length)
    : chunk_(chunk), replicas_(std::move(replicas)), file_length_(file_length) {}

std::vector<int32_t> ChunkLocation::ReplicaIds() const {
    std::vector<int32_t> ids;
    ids.reserve(replicas_.size());
    for (const auto& slot : replicas_) {
        ids.push_back(slot.replica_id);
    }
    return ids;
}

std::vector<std::string> ChunkLocation::ServiceableHosts() const {
    std::vector<std::string> hosts;
    for (const auto& slot : replicas_) {
        if (slot.replica.Serviceable()) {
            hosts.push_back(slot.replica.node_name());
        }
    }
    return hosts;
}

std::string ChunkLocation::ToString() const {
    std::ostringstream out;
    out << chunk_.ToString() << " file_length=" << file_length_;
    for (const auto& slot : replicas_) {
        out << "\n  vid=" << slot.replica_id << " " << slot.replica.ToString();
    }
    return out.str();
}

std::string BlockLocation::ToString() const {
    std::ostringstream out;
    out << "block{offset=" << offset << ", length=" << length << ", hosts=[";
    for (size_t i = 0; i < hosts.size(); ++i) {
        if (i > 0) {
            out << ",";
        }
        out << hosts[i];
    }
    out << "]}";
    return out.str();
}

} // namespace pl::locator
