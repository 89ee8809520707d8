#include "BrpcLocalityService.h"

#include <brpc/closure_guard.h>
#include <brpc/controller.h>

#include <iostream>
#include <string>

#include "../../msg/status.h"

namespace pl::locator {

namespace {

pl::rpc::LocalityStatusCode ToProtoStatusCode(pl::msg::StatusCode code) {
    switch (code) {
        case pl::msg::StatusCode::kOk:
            return pl::rpc::LOC_OK;
        case pl::msg::StatusCode::kInvalidArgument:
            return pl::rpc::LOC_INVALID_ARGUMENT;
        case pl::msg::StatusCode::kNotFound:
            return pl::rpc::LOC_NOT_FOUND;
        case pl::msg::StatusCode::kIoError:
            return pl::rpc::LOC_IO_ERROR;
        case pl::msg::StatusCode::kTransportError:
            return pl::rpc::LOC_TRANSPORT_ERROR;
        case pl::msg::StatusCode::kProtocolError:
            return pl::rpc::LOC_PROTOCOL_ERROR;
        case pl::msg::StatusCode::kPreconditionFailed:
            return pl::rpc::LOC_PRECONDITION_FAILED;
        case pl::msg::StatusCode::kIdentityError:
            return pl::rpc::LOC_IDENTITY_ERROR;
        case pl::msg::StatusCode::kInternalError:
        default:
            return pl::rpc::LOC_INTERNAL_ERROR;
    }
}

void FillStatus(const pl::msg::Status& status, pl::rpc::LocalityStatus* out) {
    if (!out) {
        return;
    }
    out->set_code(ToProtoStatusCode(status.code));
    out->set_message(status.message);
}

void FillNotInitialized(pl::rpc::LocalityStatus* out) {
    FillStatus(pl::msg::Status::InternalError("Service not initialized"), out);
}

} // namespace

BrpcLocalityService::BrpcLocalityService(const LocalityServiceImpl* service, bool log_failures)
    : service_(service), log_failures_(log_failures) {}

void BrpcLocalityService::LogFailure(const char* op, const std::string& subject, const pl::msg::Status& status) const {
    if (!log_failures_ || status.ok()) {
        return;
    }
    std::cerr << op << "(" << subject << ") failed, code=" << pl::msg::StatusCodeName(status.code)
              << ", msg=" << status.message << std::endl;
}

void BrpcLocalityService::GetBlockLocations(google::protobuf::RpcController* cntl_base,
                                            const pl::rpc::GetBlockLocationsRequest* request,
                                            pl::rpc::GetBlockLocationsReply* response,
                                            google::protobuf::Closure* done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl_base;
    if (!service_ || !request || !response) {
        FillNotInitialized(response ? response->mutable_status() : nullptr);
        return;
    }

    pl::msg::BlockLocationsRequest internal_req;
    internal_req.path = request->path();
    internal_req.start = request->start();
    internal_req.length = request->length();

    pl::msg::BlockLocationsReply internal_reply = service_->GetBlockLocations(internal_req);
    FillStatus(internal_reply.status, response->mutable_status());
    LogFailure("GetBlockLocations", internal_req.path, internal_reply.status);
    if (!internal_reply.status.ok()) {
        return;
    }
    response->set_file_length(internal_reply.file_length);
    for (const auto& block : internal_reply.blocks) {
        pl::rpc::BlockLocation* out = response->add_blocks();
        out->set_offset(block.offset);
        out->set_length(block.length);
        for (const auto& host : block.hosts) {
            out->add_hosts(host);
        }
    }
}

void BrpcLocalityService::GetChunkMap(google::protobuf::RpcController* cntl_base,
                                      const pl::rpc::GetChunkMapRequest* request,
                                      pl::rpc::GetChunkMapReply* response,
                                      google::protobuf::Closure* done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl_base;
    if (!service_ || !request || !response) {
        FillNotInitialized(response ? response->mutable_status() : nullptr);
        return;
    }

    pl::msg::ChunkMapRequest internal_req;
    internal_req.file_id = request->file_id();
    internal_req.file_length = request->file_length();

    pl::msg::ChunkMapReply internal_reply = service_->GetChunkMap(internal_req);
    FillStatus(internal_reply.status, response->mutable_status());
    LogFailure("GetChunkMap", std::to_string(internal_req.file_id), internal_reply.status);
    if (!internal_reply.status.ok()) {
        return;
    }
    for (const auto& chunk : internal_reply.chunks) {
        pl::rpc::ChunkLocation* out = response->add_chunks();
        out->set_offset(chunk.offset);
        out->set_length(chunk.length);
        out->set_file_length(chunk.file_length);
        for (const auto& replica : chunk.replicas) {
            pl::rpc::Replica* item = out->add_replicas();
            item->set_replica_id(replica.replica_id);
            item->set_node_name(replica.node_name);
            item->set_address(replica.address);
            item->set_enabled(replica.enabled);
            item->set_up(replica.up);
        }
    }
}

void BrpcLocalityService::GetFileStatus(google::protobuf::RpcController* cntl_base,
                                        const pl::rpc::GetFileStatusRequest* request,
                                        pl::rpc::GetFileStatusReply* response,
                                        google::protobuf::Closure* done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl_base;
    if (!service_ || !request || !response) {
        FillNotInitialized(response ? response->mutable_status() : nullptr);
        return;
    }

    pl::msg::FileStatusRequest internal_req;
    internal_req.path = request->path();

    pl::msg::FileStatusReply internal_reply = service_->GetFileStatus(internal_req);
    FillStatus(internal_reply.status, response->mutable_status());
    LogFailure("GetFileStatus", internal_req.path, internal_reply.status);
    if (!internal_reply.status.ok()) {
        return;
    }
    const pl::msg::FileStatusInfo& info = internal_reply.info;
    pl::rpc::FileStatus* out = response->mutable_file_status();
    out->set_path(info.path);
    out->set_local_path(info.local_path);
    out->set_length(info.length);
    out->set_is_dir(info.is_dir);
    out->set_replication(info.replication);
    out->set_block_size(info.block_size);
    out->set_modification_time_ms(info.modification_time_ms);
    out->set_owner(info.owner);
    out->set_group(info.group);
    out->set_permission(info.permission);
}

} // namespace pl::locator
