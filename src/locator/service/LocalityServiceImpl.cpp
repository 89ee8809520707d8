#include "LocalityServiceImpl.h"

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include "../resolver/RangeResolver.h"

namespace pl::locator {

namespace {

std::string PermissionString(mode_t mode) {
    std::string text(10, '-');
    if (S_ISDIR(mode)) {
        text[0] = 'd';
    } else if (S_ISLNK(mode)) {
        text[0] = 'l';
    }
    const mode_t bits[9] = {S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP, S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH};
    const char marks[3] = {'r', 'w', 'x'};
    for (size_t i = 0; i < 9; ++i) {
        if (mode & bits[i]) {
            text[i + 1] = marks[i % 3];
        }
    }
    return text;
}

std::string OwnerName(uid_t uid) {
    std::vector<char> buffer(16384);
    struct passwd pw;
    struct passwd* result = nullptr;
    if (getpwuid_r(uid, &pw, buffer.data(), buffer.size(), &result) == 0 && result) {
        return result->pw_name;
    }
    return std::to_string(uid);
}

std::string GroupName(gid_t gid) {
    std::vector<char> buffer(16384);
    struct group gr;
    struct group* result = nullptr;
    if (getgrgid_r(gid, &gr, buffer.data(), buffer.size(), &result) == 0 && result) {
        return result->gr_name;
    }
    return std::to_string(gid);
}

pl::msg::ChunkLocationInfo ToChunkLocationInfo(const ChunkLocation& location) {
    pl::msg::ChunkLocationInfo info;
    info.offset = location.chunk().offset();
    info.length = location.chunk().length();
    info.file_length = location.file_length();
    for (const auto& slot : location.replicas()) {
        pl::msg::ReplicaInfo replica;
        replica.replica_id = slot.replica_id;
        replica.node_name = slot.replica.node_name();
        replica.address = slot.replica.address();
        replica.enabled = slot.replica.enabled();
        replica.up = slot.replica.up();
        info.replicas.push_back(std::move(replica));
    }
    return info;
}

} // namespace

LocalityServiceImpl::LocalityServiceImpl(const LocatorConfig& config,
                                         ChunkSource* chunk_source,
                                         const FileIdentityResolver* identity_resolver)
    : config_(config),
      path_mapper_(config_),
      chunk_source_(chunk_source),
      identity_resolver_(identity_resolver) {}

pl::msg::Status LocalityServiceImpl::FetchChunkMap(uint64_t file_id, uint64_t file_length, ChunkMap* chunk_map) const {
    pl::msg::Status st = chunk_source_->ResolveChunkMap(file_id, file_length, chunk_map);
    if (!st.ok()) {
        return st.Annotate("can not fetch chunk locations from " + chunk_source_->Describe());
    }
    return st;
}

pl::msg::BlockLocationsReply LocalityServiceImpl::GetBlockLocations(
    const pl::msg::BlockLocationsRequest& request) const {
    pl::msg::BlockLocationsReply reply;
    if (!chunk_source_ || !identity_resolver_) {
        reply.status = pl::msg::Status::InternalError("Service not initialized");
        return reply;
    }

    std::string local_path;
    reply.status = path_mapper_.ToLocalPath(request.path, &local_path);
    if (!reply.status.ok()) {
        return reply;
    }

    uint64_t file_length = 0;
    reply.status = identity_resolver_->GetFileLength(local_path, &file_length);
    if (!reply.status.ok()) {
        return reply;
    }
    reply.file_length = file_length;

    reply.status = CheckRange(request.start, request.length, file_length);
    if (!reply.status.ok() || request.length == 0) {
        return reply;
    }

    uint64_t file_id = 0;
    reply.status = identity_resolver_->GetFileId(local_path, &file_id);
    if (!reply.status.ok()) {
        return reply;
    }

    ChunkMap chunk_map;
    reply.status = FetchChunkMap(file_id, file_length, &chunk_map);
    if (!reply.status.ok()) {
        return reply;
    }
    std::stable_sort(chunk_map.begin(), chunk_map.end(), [](const ChunkLocation& a, const ChunkLocation& b) {
        return a.chunk() < b.chunk();
    });

    std::vector<BlockLocation> blocks;
    reply.status = ResolveRange(chunk_map, request.start, request.length, &blocks);
    if (!reply.status.ok()) {
        reply.status = reply.status.Annotate(request.path);
        return reply;
    }

    reply.blocks.reserve(blocks.size());
    for (auto& block : blocks) {
        pl::msg::BlockLocationInfo info;
        info.offset = block.offset;
        info.length = block.length;
        info.hosts = std::move(block.hosts);
        reply.blocks.push_back(std::move(info));
    }
    return reply;
}

pl::msg::ChunkMapReply LocalityServiceImpl::GetChunkMap(const pl::msg::ChunkMapRequest& request) const {
    pl::msg::ChunkMapReply reply;
    if (!chunk_source_) {
        reply.status = pl::msg::Status::InternalError("Service not initialized");
        return reply;
    }

    ChunkMap chunk_map;
    reply.status = FetchChunkMap(request.file_id, request.file_length, &chunk_map);
    if (!reply.status.ok()) {
        return reply;
    }
    reply.chunks.reserve(chunk_map.size());
    for (const auto& location : chunk_map) {
        reply.chunks.push_back(ToChunkLocationInfo(location));
    }
    return reply;
}

pl::msg::FileStatusReply LocalityServiceImpl::GetFileStatus(const pl::msg::FileStatusRequest& request) const {
    pl::msg::FileStatusReply reply;

    std::string local_path;
    reply.status = path_mapper_.ToLocalPath(request.path, &local_path);
    if (!reply.status.ok()) {
        return reply;
    }
    std::string virtual_fs;
    reply.status = path_mapper_.VirtualFsOf(request.path, &virtual_fs);
    if (!reply.status.ok()) {
        return reply;
    }

    struct stat st;
    if (::stat(local_path.c_str(), &st) != 0) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            reply.status = pl::msg::Status::NotFound("File " + request.path + " does not exist");
        } else {
            reply.status = pl::msg::Status::IoError("stat " + local_path + " failed: " + std::strerror(err));
        }
        return reply;
    }

    pl::msg::FileStatusInfo& info = reply.info;
    info.path = request.path;
    info.local_path = local_path;
    info.length = static_cast<uint64_t>(st.st_size);
    info.is_dir = S_ISDIR(st.st_mode);
    info.replication = config_.ReplicationFor(virtual_fs);
    info.block_size = config_.BlockSizeFor(virtual_fs);
    info.modification_time_ms = static_cast<uint64_t>(st.st_mtim.tv_sec) * 1000ULL +
                                static_cast<uint64_t>(st.st_mtim.tv_nsec) / 1000000ULL;
    info.owner = OwnerName(st.st_uid);
    info.group = GroupName(st.st_gid);
    info.permission = PermissionString(st.st_mode);
    reply.status = pl::msg::Status::Ok();
    return reply;
}

} // namespace pl::locator
