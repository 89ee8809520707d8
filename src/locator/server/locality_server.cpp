#include <brpc/server.h>
#include <gflags/gflags.h>

#include <iostream>
#include <string>

#include "../config/LocatorConfig.h"
#include "../service/BrpcLocalityService.h"
#include "../service/LocalityServiceImpl.h"
#include "../source/FileIdentityResolver.h"
#include "../source/HttpChunkSource.h"

DEFINE_string(config, "", "Path to locality server config file");
DEFINE_int32(port, 14150, "Port for locality brpc server");
DEFINE_int32(idle_timeout_sec, -1, "Idle timeout for connections");
DEFINE_bool(log_failures, false, "Log every failed locality request to stderr");
DEFINE_bool(create_home_dir, false, "Create the user's home directory under the mount if missing");

int main(int argc, char* argv[]) {
    google::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_config.empty()) {
        std::cerr << "Missing --config, please specify config file path" << std::endl;
        return 1;
    }

    std::string error;
    pl::locator::LocatorConfig cfg = pl::locator::LocatorConfig::LoadFromFile(FLAGS_config, &error);
    if (!error.empty()) {
        std::cerr << "Failed to load config: " << error << std::endl;
        return 1;
    }

    // brpc bounds pooled connections per endpoint with this flag.
    const std::string pool_size = std::to_string(cfg.max_connections_per_host);
    if (google::SetCommandLineOption("max_connection_pool_size", pool_size.c_str()).empty()) {
        std::cerr << "Failed to set max_connection_pool_size=" << pool_size << std::endl;
    }

    pl::locator::HttpChunkSourceOptions source_options;
    source_options.endpoint = cfg.chunk_endpoint;
    source_options.connect_timeout_ms = cfg.connect_timeout_ms;
    source_options.timeout_ms = cfg.request_timeout_ms;
    pl::locator::HttpChunkSource chunk_source(source_options);
    pl::msg::Status init_status = chunk_source.Init();
    if (!init_status.ok()) {
        std::cerr << "Chunk source init failed: " << init_status.message << std::endl;
        return 1;
    }

    pl::locator::FileIdentityResolver identity_resolver;
    pl::locator::LocalityServiceImpl locality_service(cfg, &chunk_source, &identity_resolver);
    if (!locality_service.path_mapper().MountPointExists()) {
        std::cerr << "Mount path " << locality_service.path_mapper().MountPath()
                  << " does not exist, lookups will fail until it is mounted" << std::endl;
    } else if (FLAGS_create_home_dir) {
        pl::msg::Status home_status = locality_service.path_mapper().CreateHomeDirectory();
        if (!home_status.ok()) {
            std::cerr << home_status.message << std::endl;
            return 1;
        }
    }
    pl::locator::BrpcLocalityService brpc_service(&locality_service, FLAGS_log_failures);

    brpc::Server server;
    if (server.AddService(&brpc_service, brpc::SERVER_DOESNT_OWN_SERVICE) != 0) {
        std::cerr << "Failed to add locality service" << std::endl;
        return 1;
    }

    brpc::ServerOptions options;
    options.idle_timeout_sec = FLAGS_idle_timeout_sec;

    if (server.Start(FLAGS_port, &options) != 0) {
        std::cerr << "Failed to start locality server on port " << FLAGS_port << std::endl;
        return 1;
    }

    std::cerr << "Locality server on port " << FLAGS_port << " using " << chunk_source.Describe() << std::endl;
    server.RunUntilAskedToQuit();
    return 0;
}
