#include "LocatorConfig.h"

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace pl::locator {

namespace {

std::string Trim(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), value.end());
    return value;
}

std::vector<std::string> Split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::string token;
    std::istringstream stream(input);
    while (std::getline(stream, token, delimiter)) {
        token = Trim(token);
        if (!token.empty()) {
            parts.push_back(token);
        }
    }
    return parts;
}

bool ParseUint64(const std::string& text, uint64_t* out) {
    if (!out || text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        return false;
    }
    try {
        *out = static_cast<uint64_t>(std::stoull(text));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParsePositiveUint32(const std::string& text, uint32_t* out) {
    uint64_t value = 0;
    if (!out || !ParseUint64(text, &value) || value == 0 || value > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    *out = static_cast<uint32_t>(value);
    return true;
}

// Accepts -1 for "no limit".
bool ParseTimeoutMs(const std::string& text, int32_t* out) {
    if (!out) {
        return false;
    }
    if (text == "-1") {
        *out = -1;
        return true;
    }
    uint64_t value = 0;
    if (!ParseUint64(text, &value) || value > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        return false;
    }
    *out = static_cast<int32_t>(value);
    return true;
}

template <typename T>
bool ParseVfsOverrides(const std::string& value,
                       bool (*parse)(const std::string&, T*),
                       std::unordered_map<std::string, T>* out,
                       std::string* bad_entry) {
    out->clear();
    for (const auto& entry : Split(value, ';')) {
        size_t sep = entry.find(':');
        if (sep == std::string::npos) {
            *bad_entry = entry;
            return false;
        }
        std::string vfs = Trim(entry.substr(0, sep));
        T parsed{};
        if (vfs.empty() || !parse(Trim(entry.substr(sep + 1)), &parsed)) {
            *bad_entry = entry;
            return false;
        }
        (*out)[vfs] = parsed;
    }
    return true;
}

bool ParsePositiveUint64(const std::string& text, uint64_t* out) {
    return ParseUint64(text, out) && *out > 0;
}

std::string EffectiveUserName() {
    struct passwd* pw = getpwuid(geteuid());
    return pw && pw->pw_name ? std::string(pw->pw_name) : std::string();
}

} // namespace

uint64_t LocatorConfig::BlockSizeFor(const std::string& vfs) const {
    auto it = vfs_block_size.find(vfs);
    return it != vfs_block_size.end() ? it->second : default_block_size;
}

uint32_t LocatorConfig::ReplicationFor(const std::string& vfs) const {
    auto it = vfs_replication.find(vfs);
    return it != vfs_replication.end() ? it->second : default_replication;
}

LocatorConfig LocatorConfig::LoadFromFile(const std::string& path, std::string* error) {
    LocatorConfig cfg;
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config file: " + path;
        }
        return cfg;
    }

    auto fail = [&](const std::string& message) {
        if (error) {
            *error = message;
        }
        return LocatorConfig{};
    };

    std::string line;
    size_t line_no = 0;
    while (std::getline(input, line)) {
        ++line_no;
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            return fail("Invalid config line " + std::to_string(line_no) + ": " + line);
        }
        std::string key = Trim(trimmed.substr(0, eq));
        std::string value = Trim(trimmed.substr(eq + 1));
        const std::string at_line = " at line " + std::to_string(line_no);
        std::string bad_entry;
        if (key == "MOUNT_POINT") {
            cfg.mount_point = value;
        } else if (key == "CONTROL_NODE") {
            cfg.control_node = value;
        } else if (key == "VIRTUAL_FS") {
            cfg.virtual_fs = value;
        } else if (key == "USER_NAME") {
            cfg.user_name = value;
        } else if (key == "CHUNK_ENDPOINT") {
            cfg.chunk_endpoint = value;
        } else if (key == "CONNECT_TIMEOUT_MS") {
            if (!ParseTimeoutMs(value, &cfg.connect_timeout_ms)) {
                return fail("Invalid CONNECT_TIMEOUT_MS" + at_line);
            }
        } else if (key == "REQUEST_TIMEOUT_MS") {
            if (!ParseTimeoutMs(value, &cfg.request_timeout_ms)) {
                return fail("Invalid REQUEST_TIMEOUT_MS" + at_line);
            }
        } else if (key == "MAX_CONNECTIONS_PER_HOST") {
            if (!ParsePositiveUint32(value, &cfg.max_connections_per_host)) {
                return fail("Invalid MAX_CONNECTIONS_PER_HOST" + at_line);
            }
        } else if (key == "DEFAULT_BLOCK_SIZE") {
            if (!ParsePositiveUint64(value, &cfg.default_block_size)) {
                return fail("Invalid DEFAULT_BLOCK_SIZE" + at_line);
            }
        } else if (key == "DEFAULT_REPLICATION") {
            if (!ParsePositiveUint32(value, &cfg.default_replication)) {
                return fail("Invalid DEFAULT_REPLICATION" + at_line);
            }
        } else if (key == "VFS_BLOCK_SIZE") {
            if (!ParseVfsOverrides<uint64_t>(value, &ParsePositiveUint64, &cfg.vfs_block_size, &bad_entry)) {
                return fail("Invalid VFS_BLOCK_SIZE entry (expected vfs:bytes): " + bad_entry);
            }
        } else if (key == "VFS_REPLICATION") {
            if (!ParseVfsOverrides<uint32_t>(value, &ParsePositiveUint32, &cfg.vfs_replication, &bad_entry)) {
                return fail("Invalid VFS_REPLICATION entry (expected vfs:count): " + bad_entry);
            }
        }
    }

    if (cfg.control_node.empty()) {
        return fail("CONTROL_NODE is required");
    }
    if (cfg.mount_point.empty()) {
        return fail("MOUNT_POINT must not be empty");
    }
    if (cfg.virtual_fs.empty()) {
        cfg.virtual_fs = "filesystem";
    }
    if (cfg.user_name.empty()) {
        cfg.user_name = EffectiveUserName();
        if (cfg.user_name.empty()) {
            return fail("USER_NAME is required when the effective user has no passwd entry");
        }
    }

    return cfg;
}

} // namespace pl::locator
