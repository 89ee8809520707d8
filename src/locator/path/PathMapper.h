#pragma once

#include <string>

#include "../../msg/status.h"
#include "../config/LocatorConfig.h"

namespace pl::locator {

struct Authority {
    std::string virtual_fs;
    std::string control_node;
};

// Maps logical paths of the form psfs://<vfs>@<control-node>/<path>,
// /<path> or <relative-path> onto the local mount of the filesystem:
//   <mount>/<control-node>/<vfs>/<path>
// Relative paths are anchored at the user's home directory /user/<name>.
class PathMapper {
public:
    static constexpr const char* kScheme = "psfs";
    static constexpr const char* kDefaultVirtualFs = "filesystem";

    explicit PathMapper(const LocatorConfig& config);

    // "vfs@node" -> {vfs, node}; without '@' the whole authority is the node.
    static Authority ParseAuthority(const std::string& authority);

    pl::msg::Status ToLocalPath(const std::string& logical_path, std::string* local_path) const;
    pl::msg::Status VirtualFsOf(const std::string& logical_path, std::string* virtual_fs) const;

    std::string HomeDirectory() const;
    std::string MountPath() const;
    bool MountPointExists() const;
    pl::msg::Status CreateHomeDirectory() const;

private:
    pl::msg::Status Split(const std::string& logical_path, Authority* authority, std::string* path,
                          bool* absolute) const;

    std::string mount_point_;
    std::string control_node_;
    std::string virtual_fs_;
    std::string user_name_;
};

} // namespace pl::locator
