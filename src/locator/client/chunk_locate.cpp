#include <brpc/channel.h>
#include <brpc/controller.h>
#include <gflags/gflags.h>

#include <iostream>
#include <string>

#include "locality.pb.h"

DEFINE_string(server, "127.0.0.1:14150", "Locality server address");
DEFINE_string(mode, "blocks", "Mode: blocks/chunks/status");
DEFINE_string(path, "", "Logical path for blocks/status");
DEFINE_uint64(start, 0, "Range start for blocks");
DEFINE_uint64(length, 0, "Range length for blocks, 0 means up to end of file");
DEFINE_uint64(file_id, 0, "File id (inode) for chunks");
DEFINE_uint64(file_length, 0, "File length for chunks");
DEFINE_int32(timeout_ms, 15000, "RPC timeout in ms");

namespace {

bool StatusOk(const pl::rpc::LocalityStatus& status) {
    return status.code() == pl::rpc::LOC_OK;
}

void PrintStatus(const pl::rpc::LocalityStatus& status) {
    std::cout << "status=" << pl::rpc::LocalityStatusCode_Name(status.code()) << " message=" << status.message()
              << std::endl;
}

void PrintHosts(const google::protobuf::RepeatedPtrField<std::string>& hosts) {
    std::cout << " hosts=";
    for (int i = 0; i < hosts.size(); ++i) {
        std::cout << (i > 0 ? "," : "") << hosts.Get(i);
    }
    std::cout << std::endl;
}

int RunStatus(pl::rpc::LocalityService_Stub* stub, pl::rpc::FileStatus* file_status) {
    pl::rpc::GetFileStatusRequest request;
    request.set_path(FLAGS_path);
    pl::rpc::GetFileStatusReply response;
    brpc::Controller cntl;
    stub->GetFileStatus(&cntl, &request, &response, nullptr);
    if (cntl.Failed()) {
        std::cerr << "GetFileStatus RPC failed: " << cntl.ErrorText() << std::endl;
        return 1;
    }
    if (!StatusOk(response.status())) {
        PrintStatus(response.status());
        return 1;
    }
    if (file_status) {
        *file_status = response.file_status();
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    google::ParseCommandLineFlags(&argc, &argv, true);

    brpc::Channel channel;
    brpc::ChannelOptions options;
    options.protocol = "baidu_std";
    options.timeout_ms = FLAGS_timeout_ms;
    options.max_retry = 0;
    if (channel.Init(FLAGS_server.c_str(), &options) != 0) {
        std::cerr << "Failed to init channel to " << FLAGS_server << std::endl;
        return 1;
    }
    pl::rpc::LocalityService_Stub stub(&channel);

    if (FLAGS_mode == "status") {
        pl::rpc::FileStatus file_status;
        if (RunStatus(&stub, &file_status) != 0) {
            return 1;
        }
        std::cout << file_status.permission() << " " << file_status.owner() << " " << file_status.group() << " "
                  << file_status.length() << " repl=" << file_status.replication()
                  << " bs=" << file_status.block_size() << " mtime_ms=" << file_status.modification_time_ms() << " "
                  << file_status.path() << " -> " << file_status.local_path() << std::endl;
        return 0;
    }

    if (FLAGS_mode == "chunks") {
        pl::rpc::GetChunkMapRequest request;
        request.set_file_id(FLAGS_file_id);
        request.set_file_length(FLAGS_file_length);
        pl::rpc::GetChunkMapReply response;
        brpc::Controller cntl;
        stub.GetChunkMap(&cntl, &request, &response, nullptr);
        if (cntl.Failed()) {
            std::cerr << "GetChunkMap RPC failed: " << cntl.ErrorText() << std::endl;
            return 1;
        }
        PrintStatus(response.status());
        if (!StatusOk(response.status())) {
            return 1;
        }
        for (const auto& chunk : response.chunks()) {
            std::cout << "chunk offset=" << chunk.offset() << " length=" << chunk.length() << std::endl;
            for (const auto& replica : chunk.replicas()) {
                std::cout << "  vid=" << replica.replica_id() << " name=" << replica.node_name()
                          << " addr=" << replica.address() << " enabled=" << replica.enabled()
                          << " up=" << replica.up() << std::endl;
            }
        }
        return 0;
    }

    if (FLAGS_mode != "blocks") {
        std::cerr << "Unknown --mode " << FLAGS_mode << ", expected blocks/chunks/status" << std::endl;
        return 1;
    }
    if (FLAGS_path.empty()) {
        std::cerr << "Missing --path" << std::endl;
        return 1;
    }

    uint64_t length = FLAGS_length;
    if (length == 0) {
        pl::rpc::FileStatus file_status;
        if (RunStatus(&stub, &file_status) != 0) {
            return 1;
        }
        length = file_status.length() > FLAGS_start ? file_status.length() - FLAGS_start : 0;
    }

    pl::rpc::GetBlockLocationsRequest request;
    request.set_path(FLAGS_path);
    request.set_start(FLAGS_start);
    request.set_length(length);
    pl::rpc::GetBlockLocationsReply response;
    brpc::Controller cntl;
    stub.GetBlockLocations(&cntl, &request, &response, nullptr);
    if (cntl.Failed()) {
        std::cerr << "GetBlockLocations RPC failed: " << cntl.ErrorText() << std::endl;
        return 1;
    }
    PrintStatus(response.status());
    if (!StatusOk(response.status())) {
        return 1;
    }
    std::cout << "file_length=" << response.file_length() << " blocks=" << response.blocks_size() << std::endl;
    for (const auto& block : response.blocks()) {
        std::cout << "block offset=" << block.offset() << " length=" << block.length();
        PrintHosts(block.hosts());
    }
    return 0;
}
