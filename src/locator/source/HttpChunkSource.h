#pragma once

#include <brpc/channel.h>

#include <cstdint>
#include <string>

#include "../protocol/AddressResolver.h"
#include "ChunkSource.h"

namespace pl::locator {

struct HttpChunkSourceOptions {
    // http://host[:port]/path of the map_obj resource.
    std::string endpoint;
    int32_t connect_timeout_ms{10000};
    int32_t timeout_ms{-1};
    AddressResolver resolver{CanonicalizeAddress};
};

// Fetches chunk_list documents with GET <endpoint>?inum=<file_id> and decodes
// the body while it streams in. Requests share one pooled channel.
class HttpChunkSource : public ChunkSource {
public:
    static constexpr const char* kDefaultPath = "/mproxy/map_obj";
    static constexpr const char* kDefaultEndpoint = "http://localhost:14149/mproxy/map_obj";

    explicit HttpChunkSource(HttpChunkSourceOptions options);

    pl::msg::Status Init();

    pl::msg::Status ResolveChunkMap(uint64_t file_id, uint64_t file_length, ChunkMap* out) override;

    std::string Describe() const override;

    static pl::msg::Status ParseEndpoint(const std::string& endpoint, std::string* server, std::string* path);

private:
    std::string BuildRequestUri(uint64_t file_id) const;

    HttpChunkSourceOptions options_;
    std::string server_;
    std::string path_;
    brpc::Channel channel_;
    bool initialized_{false};
};

} // namespace pl::locator
