#include <gflags/gflags.h>
#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "../config/LocatorConfig.h"

namespace {

using pl::locator::LocatorConfig;

bool Check(bool condition, const char* test, const std::string& what) {
    if (!condition) {
        std::cerr << test << " failed: " << what << std::endl;
    }
    return condition;
}

std::string WriteConfig(const std::string& tag, const std::string& body) {
    std::string path = (std::filesystem::temp_directory_path() /
                        ("pl_locator_config_" + std::to_string(::getpid()) + "_" + tag + ".conf"))
                           .string();
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path;
}

LocatorConfig Load(const std::string& tag, const std::string& body, std::string* error) {
    const std::string path = WriteConfig(tag, body);
    LocatorConfig cfg = LocatorConfig::LoadFromFile(path, error);
    std::remove(path.c_str());
    return cfg;
}

bool TestDefaults() {
    const char* name = "Defaults";
    std::string error;
    LocatorConfig cfg = Load("defaults", "CONTROL_NODE=ctrl1\nUSER_NAME=alice\n", &error);
    bool ok = Check(error.empty(), name, error);
    ok &= Check(cfg.control_node == "ctrl1" && cfg.user_name == "alice", name, "explicit keys");
    ok &= Check(cfg.mount_point == "/net", name, "mount point " + cfg.mount_point);
    ok &= Check(cfg.virtual_fs == "filesystem", name, "virtual fs " + cfg.virtual_fs);
    ok &= Check(cfg.chunk_endpoint == "http://localhost:14149/mproxy/map_obj", name, cfg.chunk_endpoint);
    ok &= Check(cfg.connect_timeout_ms == 10000 && cfg.request_timeout_ms == -1, name, "timeouts");
    ok &= Check(cfg.max_connections_per_host == 10, name, "connections per host");
    ok &= Check(cfg.default_block_size == 64ULL * 1024 * 1024 && cfg.default_replication == 2, name,
                "block size and replication");
    return ok;
}

bool TestAllKeys() {
    const char* name = "AllKeys";
    std::string error;
    LocatorConfig cfg = Load("all",
                             "# locality server\n"
                             "MOUNT_POINT = /mnt/ps\n"
                             "CONTROL_NODE=ctrl2\n"
                             "VIRTUAL_FS=scratch\n"
                             "USER_NAME=bob\n"
                             "\n"
                             "CHUNK_ENDPOINT=http://10.1.1.1:8080/mproxy/map_obj\n"
                             "CONNECT_TIMEOUT_MS=2500\n"
                             "REQUEST_TIMEOUT_MS=30000\n"
                             "MAX_CONNECTIONS_PER_HOST=4\n"
                             "DEFAULT_BLOCK_SIZE=1048576\n"
                             "DEFAULT_REPLICATION=3\n"
                             "VFS_BLOCK_SIZE=scratch:4096; archive:8192\n"
                             "VFS_REPLICATION=archive:5\n"
                             "UNKNOWN_KEY=ignored\n",
                             &error);
    bool ok = Check(error.empty(), name, error);
    ok &= Check(cfg.mount_point == "/mnt/ps" && cfg.virtual_fs == "scratch", name, "mount and vfs");
    ok &= Check(cfg.chunk_endpoint == "http://10.1.1.1:8080/mproxy/map_obj", name, cfg.chunk_endpoint);
    ok &= Check(cfg.connect_timeout_ms == 2500 && cfg.request_timeout_ms == 30000, name, "timeouts");
    ok &= Check(cfg.max_connections_per_host == 4, name, "connections per host");
    ok &= Check(cfg.BlockSizeFor("scratch") == 4096 && cfg.BlockSizeFor("archive") == 8192, name,
                "per-vfs block size");
    ok &= Check(cfg.BlockSizeFor("other") == 1048576, name, "default block size");
    ok &= Check(cfg.ReplicationFor("archive") == 5 && cfg.ReplicationFor("scratch") == 3, name, "replication");
    return ok;
}

bool TestMissingControlNode() {
    const char* name = "MissingControlNode";
    std::string error;
    Load("no_ctrl", "MOUNT_POINT=/net\n", &error);
    return Check(error.find("CONTROL_NODE") != std::string::npos, name, "error: " + error);
}

bool TestInvalidValues() {
    const char* name = "InvalidValues";
    bool ok = true;
    const struct {
        const char* tag;
        const char* body;
        const char* needle;
    } cases[] = {
        {"bad_line", "CONTROL_NODE=c\nnot a key value\n", "Invalid config line 2"},
        {"bad_timeout", "CONTROL_NODE=c\nCONNECT_TIMEOUT_MS=soon\n", "CONNECT_TIMEOUT_MS"},
        {"neg_timeout", "CONTROL_NODE=c\nREQUEST_TIMEOUT_MS=-5\n", "REQUEST_TIMEOUT_MS"},
        {"zero_conn", "CONTROL_NODE=c\nMAX_CONNECTIONS_PER_HOST=0\n", "MAX_CONNECTIONS_PER_HOST"},
        {"zero_block", "CONTROL_NODE=c\nDEFAULT_BLOCK_SIZE=0\n", "DEFAULT_BLOCK_SIZE"},
        {"bad_repl", "CONTROL_NODE=c\nDEFAULT_REPLICATION=two\n", "DEFAULT_REPLICATION"},
        {"bad_vfs_bs", "CONTROL_NODE=c\nVFS_BLOCK_SIZE=scratch\n", "VFS_BLOCK_SIZE"},
        {"bad_vfs_repl", "CONTROL_NODE=c\nVFS_REPLICATION=:3\n", "VFS_REPLICATION"},
    };
    for (const auto& c : cases) {
        std::string error;
        Load(c.tag, c.body, &error);
        ok &= Check(error.find(c.needle) != std::string::npos, name,
                    std::string(c.tag) + " expected '" + c.needle + "', got '" + error + "'");
    }
    return ok;
}

bool TestMissingFile() {
    const char* name = "MissingFile";
    std::string error;
    LocatorConfig::LoadFromFile("/nonexistent/pl_locator.conf", &error);
    return Check(error.find("Failed to open config file") != std::string::npos, name, error);
}

} // namespace

int main(int argc, char* argv[]) {
    google::ParseCommandLineFlags(&argc, &argv, true);

    int failed = 0;
    failed += TestDefaults() ? 0 : 1;
    failed += TestAllKeys() ? 0 : 1;
    failed += TestMissingControlNode() ? 0 : 1;
    failed += TestInvalidValues() ? 0 : 1;
    failed += TestMissingFile() ? 0 : 1;

    if (failed > 0) {
        std::cerr << failed << " locator config test(s) failed" << std::endl;
        return 1;
    }
    std::cout << "locator config tests passed" << std::endl;
    return 0;
}
