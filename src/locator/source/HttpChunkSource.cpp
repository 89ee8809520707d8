#include "HttpChunkSource.h"

#include <brpc/controller.h>
#include <brpc/progressive_reader.h>
#include <bthread/countdown_event.h>
#include <butil/status.h>

#include <cerrno>
#include <utility>

#include "../protocol/ChunkListParser.h"

namespace pl::locator {

namespace {

constexpr char kHttpScheme[] = "http://";
constexpr int kHttpOk = 200;

// Feeds body parts to the decoder as they arrive. Returning an error from
// OnReadOnePart makes brpc close the connection.
class ChunkListReader : public brpc::ProgressiveReader {
public:
    explicit ChunkListReader(ChunkListParser* parser) : parser_(parser), done_(1) {}
    ~ChunkListReader() override = default;

    butil::Status OnReadOnePart(const void* data, size_t length) override {
        if (!parser_) {
            return butil::Status(ECANCELED, "response discarded");
        }
        pl::msg::Status st = parser_->Feed(static_cast<const char*>(data), length);
        if (!st.ok()) {
            return butil::Status(EPROTO, "%s", st.message.c_str());
        }
        return butil::Status::OK();
    }

    void OnEndOfMessage(const butil::Status& status) override {
        end_status_ = status;
        done_.signal();
    }

    void Wait() { done_.wait(); }

    const butil::Status& end_status() const { return end_status_; }

private:
    ChunkListParser* parser_{};
    bthread::CountdownEvent done_;
    butil::Status end_status_;
};

bool HasPort(const std::string& server) {
    if (!server.empty() && server[0] == '[') {
        size_t close = server.find(']');
        return close != std::string::npos && close + 1 < server.size() && server[close + 1] == ':';
    }
    return server.find(':') != std::string::npos;
}

} // namespace

HttpChunkSource::HttpChunkSource(HttpChunkSourceOptions options) : options_(std::move(options)) {}

pl::msg::Status HttpChunkSource::ParseEndpoint(const std::string& endpoint, std::string* server, std::string* path) {
    if (!server || !path) {
        return pl::msg::Status::InvalidArgument("Output endpoint parts are null");
    }
    std::string rest = endpoint;
    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        if (rest.compare(0, scheme_end + 3, kHttpScheme) != 0) {
            return pl::msg::Status::InvalidArgument("Unsupported endpoint scheme: " + endpoint);
        }
        rest = rest.substr(scheme_end + 3);
    }
    size_t query = rest.find('?');
    if (query != std::string::npos) {
        rest = rest.substr(0, query);
    }

    size_t slash = rest.find('/');
    std::string host_port = slash == std::string::npos ? rest : rest.substr(0, slash);
    std::string resource = slash == std::string::npos ? std::string() : rest.substr(slash);
    if (host_port.empty()) {
        return pl::msg::Status::InvalidArgument("Endpoint has no host: " + endpoint);
    }
    if (!HasPort(host_port)) {
        host_port += ":80";
    }
    if (resource.empty() || resource == "/") {
        resource = kDefaultPath;
    }
    *server = host_port;
    *path = resource;
    return pl::msg::Status::Ok();
}

pl::msg::Status HttpChunkSource::Init() {
    if (initialized_) {
        return pl::msg::Status::Ok();
    }
    const std::string endpoint = options_.endpoint.empty() ? kDefaultEndpoint : options_.endpoint;
    pl::msg::Status st = ParseEndpoint(endpoint, &server_, &path_);
    if (!st.ok()) {
        return st;
    }
    if (!options_.resolver) {
        return pl::msg::Status::InvalidArgument("Address resolver is empty");
    }

    brpc::ChannelOptions options;
    options.protocol = "http";
    options.connection_type = "pooled";
    options.connect_timeout_ms = options_.connect_timeout_ms;
    options.timeout_ms = options_.timeout_ms;
    options.max_retry = 0;
    if (channel_.Init(server_.c_str(), &options) != 0) {
        return pl::msg::Status::TransportError("Failed to init channel to " + server_);
    }
    initialized_ = true;
    return pl::msg::Status::Ok();
}

std::string HttpChunkSource::BuildRequestUri(uint64_t file_id) const {
    return path_ + "?inum=" + std::to_string(file_id);
}

pl::msg::Status HttpChunkSource::ResolveChunkMap(uint64_t file_id, uint64_t file_length, ChunkMap* out) {
    if (!out) {
        return pl::msg::Status::InvalidArgument("Output chunk map is null");
    }
    if (!initialized_) {
        return pl::msg::Status::InternalError("Chunk source not initialized");
    }

    const std::string uri = BuildRequestUri(file_id);
    const std::string url = std::string(kHttpScheme) + server_ + uri;

    brpc::Controller cntl;
    cntl.http_request().uri() = uri;
    cntl.http_request().set_method(brpc::HTTP_METHOD_GET);
    cntl.response_will_be_read_progressively();
    channel_.CallMethod(nullptr, &cntl, nullptr, nullptr, nullptr);
    if (cntl.Failed()) {
        if (cntl.ErrorCode() == brpc::EHTTP) {
            return pl::msg::Status::TransportError("HTTP status code " +
                                                   std::to_string(cntl.http_response().status_code()) +
                                                   " for URL " + url);
        }
        return pl::msg::Status::TransportError("GET " + url + " failed: " + cntl.ErrorText());
    }

    const int status_code = cntl.http_response().status_code();
    if (status_code != kHttpOk) {
        ChunkListReader discard(nullptr);
        cntl.ReadProgressiveAttachmentBy(&discard);
        discard.Wait();
        return pl::msg::Status::TransportError("HTTP status code " + std::to_string(status_code) + " for URL " + url);
    }

    ChunkListParser parser(file_length, options_.resolver);
    ChunkListReader reader(&parser);
    cntl.ReadProgressiveAttachmentBy(&reader);
    reader.Wait();

    if (!parser.status().ok()) {
        return parser.status().Annotate("GET " + url);
    }
    if (!reader.end_status().ok()) {
        return pl::msg::Status::TransportError("GET " + url + " aborted after " +
                                               std::to_string(parser.bytes_fed()) +
                                               " bytes: " + reader.end_status().error_str());
    }

    ChunkMap records;
    pl::msg::Status st = parser.Finish(&records);
    if (!st.ok()) {
        return st.Annotate("GET " + url);
    }
    *out = std::move(records);
    return pl::msg::Status::Ok();
}

std::string HttpChunkSource::Describe() const {
    return "HttpChunkSource[endpoint=" + std::string(kHttpScheme) + server_ + path_ + "]";
}

} // namespace pl::locator
