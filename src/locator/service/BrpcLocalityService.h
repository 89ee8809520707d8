#pragma once

#include "LocalityServiceImpl.h"
#include "locality.pb.h"

namespace pl::locator {

class BrpcLocalityService : public pl::rpc::LocalityService {
public:
    BrpcLocalityService(const LocalityServiceImpl* service, bool log_failures);

    void GetBlockLocations(google::protobuf::RpcController* cntl_base,
                           const pl::rpc::GetBlockLocationsRequest* request,
                           pl::rpc::GetBlockLocationsReply* response,
                           google::protobuf::Closure* done) override;

    void GetChunkMap(google::protobuf::RpcController* cntl_base,
                     const pl::rpc::GetChunkMapRequest* request,
                     pl::rpc::GetChunkMapReply* response,
                     google::protobuf::Closure* done) override;

    void GetFileStatus(google::protobuf::RpcController* cntl_base,
                       const pl::rpc::GetFileStatusRequest* request,
                       pl::rpc::GetFileStatusReply* response,
                       google::protobuf::Closure* done) override;

private:
    void LogFailure(const char* op, const std::string& subject, const pl::msg::Status& status) const;

    const LocalityServiceImpl* service_{};
    bool log_failures_{false};
};

} // namespace pl::locator
