#include "PathMapper.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace pl::locator {

namespace {

std::string StripLeadingSlashes(const std::string& path) {
    size_t pos = path.find_first_not_of('/');
    return pos == std::string::npos ? std::string() : path.substr(pos);
}

bool IsWithin(const fs::path& base, const fs::path& candidate) {
    const std::string base_text = base.string();
    const std::string text = candidate.string();
    if (text.compare(0, base_text.size(), base_text) != 0) {
        return false;
    }
    return text.size() == base_text.size() || text[base_text.size()] == '/' || base_text.back() == '/';
}

} // namespace

PathMapper::PathMapper(const LocatorConfig& config)
    : mount_point_(config.mount_point),
      control_node_(config.control_node),
      virtual_fs_(config.virtual_fs.empty() ? kDefaultVirtualFs : config.virtual_fs),
      user_name_(config.user_name) {}

Authority PathMapper::ParseAuthority(const std::string& authority) {
    Authority parsed;
    size_t at = authority.find('@');
    if (at == std::string::npos) {
        parsed.virtual_fs = kDefaultVirtualFs;
        parsed.control_node = authority;
        return parsed;
    }
    parsed.virtual_fs = authority.substr(0, at);
    parsed.control_node = authority.substr(at + 1);
    return parsed;
}

pl::msg::Status PathMapper::Split(const std::string& logical_path,
                                  Authority* authority,
                                  std::string* path,
                                  bool* absolute) const {
    if (logical_path.empty()) {
        return pl::msg::Status::InvalidArgument("path is empty");
    }

    authority->virtual_fs = virtual_fs_;
    authority->control_node = control_node_;

    size_t scheme_end = logical_path.find("://");
    if (scheme_end == std::string::npos) {
        *absolute = logical_path[0] == '/';
        *path = logical_path;
        return pl::msg::Status::Ok();
    }

    if (logical_path.compare(0, scheme_end, kScheme) != 0) {
        return pl::msg::Status::InvalidArgument("Wrong FS scheme in " + logical_path + ", expected " + kScheme);
    }
    std::string rest = logical_path.substr(scheme_end + 3);
    size_t slash = rest.find('/');
    std::string authority_text = slash == std::string::npos ? rest : rest.substr(0, slash);
    *path = slash == std::string::npos ? std::string("/") : rest.substr(slash);
    *absolute = true;

    if (!authority_text.empty()) {
        *authority = ParseAuthority(authority_text);
        if (authority->control_node.empty()) {
            return pl::msg::Status::InvalidArgument("null host section for control node in " + logical_path);
        }
        if (authority->virtual_fs.empty()) {
            authority->virtual_fs = kDefaultVirtualFs;
        }
    }
    return pl::msg::Status::Ok();
}

pl::msg::Status PathMapper::ToLocalPath(const std::string& logical_path, std::string* local_path) const {
    if (!local_path) {
        return pl::msg::Status::InvalidArgument("Output path is null");
    }
    Authority authority;
    std::string path;
    bool absolute = false;
    pl::msg::Status st = Split(logical_path, &authority, &path, &absolute);
    if (!st.ok()) {
        return st;
    }

    fs::path base = (fs::path(mount_point_) / authority.control_node / authority.virtual_fs).lexically_normal();
    fs::path relative = absolute ? fs::path(StripLeadingSlashes(path))
                                 : fs::path(StripLeadingSlashes(HomeDirectory())) / path;
    fs::path full = (base / relative).lexically_normal();
    if (!IsWithin(base, full)) {
        return pl::msg::Status::InvalidArgument("path escapes the mount of " + authority.virtual_fs + ": " +
                                                logical_path);
    }

    std::string text = full.string();
    if (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    *local_path = text;
    return pl::msg::Status::Ok();
}

pl::msg::Status PathMapper::VirtualFsOf(const std::string& logical_path, std::string* virtual_fs) const {
    if (!virtual_fs) {
        return pl::msg::Status::InvalidArgument("Output virtual fs is null");
    }
    Authority authority;
    std::string path;
    bool absolute = false;
    pl::msg::Status st = Split(logical_path, &authority, &path, &absolute);
    if (!st.ok()) {
        return st;
    }
    *virtual_fs = authority.virtual_fs;
    return pl::msg::Status::Ok();
}

std::string PathMapper::HomeDirectory() const {
    return "/user/" + user_name_;
}

std::string PathMapper::MountPath() const {
    return (fs::path(mount_point_) / control_node_ / virtual_fs_).lexically_normal().string();
}

bool PathMapper::MountPointExists() const {
    std::error_code ec;
    return fs::exists(MountPath(), ec);
}

pl::msg::Status PathMapper::CreateHomeDirectory() const {
    fs::path home = fs::path(MountPath()) / StripLeadingSlashes(HomeDirectory());
    std::error_code ec;
    if (fs::is_directory(home, ec)) {
        return pl::msg::Status::Ok();
    }
    if (!fs::create_directories(home, ec) && ec) {
        return pl::msg::Status::IoError("Failed to create home directory " + home.string() + ": " + ec.message());
    }
    return pl::msg::Status::Ok();
}

} // namespace pl::locator
