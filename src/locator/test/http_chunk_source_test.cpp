#include <brpc/closure_guard.h>
#include <brpc/controller.h>
#include <brpc/server.h>
#include <gflags/gflags.h>

#include <atomic>
#include <exception>
#include <iostream>
#include <string>

#include "../source/HttpChunkSource.h"
#include "map_proxy.pb.h"

DEFINE_int32(min_port, 18600, "Lowest port tried for the fake map proxy");
DEFINE_int32(max_port, 18999, "Highest port tried for the fake map proxy");
DEFINE_int32(large_chunks, 2000, "Chunks in the document served for the streaming test");

namespace {

using pl::locator::ChunkMap;
using pl::locator::HttpChunkSource;
using pl::locator::HttpChunkSourceOptions;
using pl::msg::Status;
using pl::msg::StatusCode;

// File ids the fake map proxy knows how to answer.
constexpr uint64_t kValidId = 1;
constexpr uint64_t kMissingAttributeId = 7;
constexpr uint64_t kTruncatedId = 8;
constexpr uint64_t kLargeId = 9;
constexpr uint64_t kAcceptedId = 202;
constexpr uint64_t kNotFoundId = 404;
constexpr uint64_t kServerErrorId = 500;

const char kValidDocument[] =
    "<?xml version=\"1.0\"?>\n"
    "<chunk_list>\n"
    "  <chunk offset=\"0\" chunk_size=\"100\">\n"
    "    <map>\n"
    "      <copy ip_addr=\"10.10.2.200\" name=\"sn1\" vid=\"1\" />\n"
    "      <copy ip_addr=\"10.10.2.201\" name=\"sn2\" vid=\"3\" />\n"
    "    </map>\n"
    "  </chunk>\n"
    "  <chunk offset=\"100\" chunk_size=\"50\">\n"
    "    <map><copy ip_addr=\"10.10.2.202\" name=\"sn3\" vid=\"2\" /></map>\n"
    "  </chunk>\n"
    "</chunk_list>\n";

std::string LargeDocument(int chunks) {
    std::string doc = "<?xml version=\"1.0\"?>\n<chunk_list>\n";
    for (int i = 0; i < chunks; ++i) {
        doc += "  <chunk offset=\"" + std::to_string(static_cast<uint64_t>(i) * 4096) +
               "\" chunk_size=\"4096\"><map><copy ip_addr=\"10.0." + std::to_string(i % 250) + "." +
               std::to_string(i % 200 + 1) + "\" name=\"sn" + std::to_string(i % 16) + "\" vid=\"" +
               std::to_string(i) + "\" /></map></chunk>\n";
    }
    doc += "</chunk_list>\n";
    return doc;
}

class FakeMapProxy : public pl::test::MapProxyService {
public:
    void map_obj(google::protobuf::RpcController* cntl_base,
                 const pl::test::MapObjRequest* /*request*/,
                 pl::test::MapObjResponse* /*response*/,
                 google::protobuf::Closure* done) override {
        brpc::ClosureGuard done_guard(done);
        brpc::Controller* cntl = static_cast<brpc::Controller*>(cntl_base);
        ++requests_;

        const std::string* inum = cntl->http_request().uri().GetQuery("inum");
        uint64_t file_id = 0;
        if (inum) {
            try {
                file_id = std::stoull(*inum);
            } catch (const std::exception&) {
                file_id = 0;
            }
        }
        last_file_id_ = file_id;
        cntl->http_response().set_content_type("text/xml");

        switch (file_id) {
            case kValidId:
                cntl->response_attachment().append(kValidDocument);
                break;
            case kMissingAttributeId:
                cntl->response_attachment().append(
                    "<chunk_list><chunk offset=\"0\"><map><copy ip_addr=\"1.2.3.4\" name=\"a\" vid=\"1\"/>"
                    "</map></chunk></chunk_list>");
                break;
            case kTruncatedId:
                cntl->response_attachment().append(
                    "<chunk_list><chunk offset=\"0\" chunk_size=\"10\"><map><copy ip_addr=\"1.2.3.4\" name=\"a\"");
                break;
            case kLargeId:
                cntl->response_attachment().append(LargeDocument(FLAGS_large_chunks));
                break;
            case kAcceptedId:
                cntl->http_response().set_status_code(202);
                cntl->response_attachment().append(kValidDocument);
                break;
            case kServerErrorId:
                cntl->http_response().set_status_code(500);
                cntl->response_attachment().append("internal failure");
                break;
            default:
                cntl->http_response().set_status_code(404);
                cntl->response_attachment().append("no such inode");
                break;
        }
    }

    int requests() const { return requests_.load(); }
    uint64_t last_file_id() const { return last_file_id_.load(); }

private:
    std::atomic<int> requests_{0};
    std::atomic<uint64_t> last_file_id_{0};
};

Status IdentityResolve(const std::string& host, std::string* out) {
    *out = host;
    return Status::Ok();
}

bool Check(bool condition, const char* test, const std::string& what) {
    if (!condition) {
        std::cerr << test << " failed: " << what << std::endl;
    }
    return condition;
}

HttpChunkSourceOptions OptionsFor(int port) {
    HttpChunkSourceOptions options;
    options.endpoint = "http://127.0.0.1:" + std::to_string(port) + "/mproxy/map_obj";
    options.connect_timeout_ms = 1000;
    options.timeout_ms = 10000;
    options.resolver = IdentityResolve;
    return options;
}

bool TestValidDocument(HttpChunkSource* source, const FakeMapProxy& proxy) {
    const char* name = "ValidDocument";
    ChunkMap records;
    Status st = source->ResolveChunkMap(kValidId, 150, &records);
    bool ok = Check(st.ok(), name, st.message);
    ok &= Check(proxy.last_file_id() == kValidId, name, "inum query must carry the file id");
    ok &= Check(records.size() == 2, name, "record count " + std::to_string(records.size()));
    if (records.size() == 2) {
        ok &= Check(records[0].chunk().offset() == 0 && records[0].chunk().length() == 100, name, "first chunk");
        ok &= Check(records[0].replicas().size() == 2 && records[0].replicas()[1].replica_id == 3 &&
                        records[0].replicas()[1].replica.node_name() == "sn2",
                    name, "first chunk replicas");
        ok &= Check(records[1].chunk().offset() == 100 && records[1].file_length() == 150, name, "second chunk");
    }
    return ok;
}

bool TestHttpErrors(HttpChunkSource* source) {
    const char* name = "HttpErrors";
    bool ok = true;
    const uint64_t ids[] = {kNotFoundId, kServerErrorId, kAcceptedId};
    for (uint64_t id : ids) {
        ChunkMap records;
        Status st = source->ResolveChunkMap(id, 100, &records);
        ok &= Check(st.code == StatusCode::kTransportError, name,
                    "inum=" + std::to_string(id) + " expected transport error, got " + st.message);
        ok &= Check(st.message.find(std::to_string(id)) != std::string::npos, name,
                    "message must name the status code: " + st.message);
        ok &= Check(records.empty(), name, "no records on failure");
    }
    return ok;
}

bool TestMalformedDocuments(HttpChunkSource* source) {
    const char* name = "MalformedDocuments";
    ChunkMap records;
    Status st = source->ResolveChunkMap(kMissingAttributeId, 100, &records);
    bool ok = Check(st.code == StatusCode::kProtocolError, name, "missing attribute: " + st.message);
    ok &= Check(st.message.find("chunk_size") != std::string::npos, name, st.message);

    st = source->ResolveChunkMap(kTruncatedId, 100, &records);
    ok &= Check(st.code == StatusCode::kProtocolError, name, "truncated body: " + st.message);
    ok &= Check(records.empty(), name, "no records on failure");
    return ok;
}

bool TestLargeDocument(HttpChunkSource* source) {
    const char* name = "LargeDocument";
    const uint64_t file_length = static_cast<uint64_t>(FLAGS_large_chunks) * 4096;
    ChunkMap records;
    Status st = source->ResolveChunkMap(kLargeId, file_length, &records);
    bool ok = Check(st.ok(), name, st.message);
    ok &= Check(records.size() == static_cast<size_t>(FLAGS_large_chunks), name,
                "record count " + std::to_string(records.size()));
    if (!records.empty()) {
        ok &= Check(records.back().chunk().End() == file_length, name, "last chunk must end at file length");
        ok &= Check(records.back().replicas()[0].replica_id == FLAGS_large_chunks - 1, name, "document order");
    }
    return ok;
}

bool TestRepeatedCallsFetchAgain(HttpChunkSource* source, const FakeMapProxy& proxy) {
    const char* name = "RepeatedCallsFetchAgain";
    const int before = proxy.requests();
    ChunkMap first;
    ChunkMap second;
    bool ok = Check(source->ResolveChunkMap(kValidId, 150, &first).ok(), name, "first fetch");
    ok &= Check(source->ResolveChunkMap(kValidId, 150, &second).ok(), name, "second fetch");
    ok &= Check(proxy.requests() - before == 2, name, "each call must reach the server");
    ok &= Check(first.size() == second.size(), name, "same document, same records");
    return ok;
}

bool TestUnreachableEndpoint() {
    const char* name = "UnreachableEndpoint";
    HttpChunkSourceOptions options;
    options.endpoint = "http://127.0.0.1:1/mproxy/map_obj";
    options.connect_timeout_ms = 500;
    options.timeout_ms = 2000;
    options.resolver = IdentityResolve;
    HttpChunkSource source(options);
    Status st = source.Init();
    bool ok = Check(st.ok(), name, "init: " + st.message);
    ChunkMap records;
    st = source.ResolveChunkMap(kValidId, 100, &records);
    ok &= Check(st.code == StatusCode::kTransportError, name, "expected transport error, got " + st.message);
    return ok;
}

bool TestUninitialized() {
    const char* name = "Uninitialized";
    HttpChunkSource source(OptionsFor(1));
    ChunkMap records;
    Status st = source.ResolveChunkMap(kValidId, 100, &records);
    return Check(st.code == StatusCode::kInternalError, name, st.message);
}

bool TestParseEndpoint() {
    const char* name = "ParseEndpoint";
    std::string server;
    std::string path;
    bool ok = Check(HttpChunkSource::ParseEndpoint("http://mds1:14149/mproxy/map_obj?x=1", &server, &path).ok() &&
                        server == "mds1:14149" && path == "/mproxy/map_obj",
                    name, "full endpoint: " + server + path);
    ok &= Check(HttpChunkSource::ParseEndpoint("http://mds1", &server, &path).ok() && server == "mds1:80" &&
                    path == HttpChunkSource::kDefaultPath,
                name, "defaults: " + server + path);
    ok &= Check(HttpChunkSource::ParseEndpoint("mds2:8080/custom", &server, &path).ok() && server == "mds2:8080" &&
                    path == "/custom",
                name, "no scheme: " + server + path);
    ok &= Check(HttpChunkSource::ParseEndpoint("http://[::1]/p", &server, &path).ok() && server == "[::1]:80", name,
                "ipv6 literal: " + server);
    ok &= Check(HttpChunkSource::ParseEndpoint("https://mds1/p", &server, &path).code ==
                    StatusCode::kInvalidArgument,
                name, "https must be rejected");
    ok &= Check(HttpChunkSource::ParseEndpoint("http:///p", &server, &path).code == StatusCode::kInvalidArgument,
                name, "missing host must be rejected");

    HttpChunkSource source(OptionsFor(14149));
    ok &= Check(source.Init().ok(), name, "init");
    ok &= Check(source.Describe() == "HttpChunkSource[endpoint=http://127.0.0.1:14149/mproxy/map_obj]", name,
                source.Describe());
    return ok;
}

} // namespace

int main(int argc, char* argv[]) {
    google::ParseCommandLineFlags(&argc, &argv, true);

    FakeMapProxy proxy;
    brpc::Server server;
    if (server.AddService(&proxy, brpc::SERVER_DOESNT_OWN_SERVICE, "/mproxy/map_obj => map_obj") != 0) {
        std::cerr << "Failed to add fake map proxy" << std::endl;
        return 1;
    }
    brpc::ServerOptions options;
    if (server.Start(brpc::PortRange(FLAGS_min_port, FLAGS_max_port), &options) != 0) {
        std::cerr << "Failed to start fake map proxy in [" << FLAGS_min_port << ", " << FLAGS_max_port << "]"
                  << std::endl;
        return 1;
    }
    const int port = server.listen_address().port;

    HttpChunkSource source(OptionsFor(port));
    Status init_status = source.Init();
    if (!init_status.ok()) {
        std::cerr << "Chunk source init failed: " << init_status.message << std::endl;
        return 1;
    }

    int failed = 0;
    failed += TestValidDocument(&source, proxy) ? 0 : 1;
    failed += TestHttpErrors(&source) ? 0 : 1;
    failed += TestMalformedDocuments(&source) ? 0 : 1;
    failed += TestLargeDocument(&source) ? 0 : 1;
    failed += TestRepeatedCallsFetchAgain(&source, proxy) ? 0 : 1;
    failed += TestUnreachableEndpoint() ? 0 : 1;
    failed += TestUninitialized() ? 0 : 1;
    failed += TestParseEndpoint() ? 0 : 1;

    server.Stop(0);
    server.Join();

    if (failed > 0) {
        std::cerr << failed << " http chunk source test(s) failed" << std::endl;
        return 1;
    }
    std::cout << "http chunk source tests passed" << std::endl;
    return 0;
}
