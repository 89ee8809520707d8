#include "FileIdentityResolver.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>

namespace pl::locator {

pl::msg::Status FileIdentityResolver::GetFileId(const std::string& local_path, uint64_t* file_id) const {
    if (!file_id) {
        return pl::msg::Status::InvalidArgument("Output file id is null");
    }
    if (local_path.empty()) {
        return pl::msg::Status::IdentityError("Empty path");
    }
    struct stat st;
    if (::stat(local_path.c_str(), &st) != 0) {
        return pl::msg::Status::IdentityError("Inode determination failed for " + local_path + ": " +
                                              std::strerror(errno));
    }
    *file_id = static_cast<uint64_t>(st.st_ino);
    return pl::msg::Status::Ok();
}

pl::msg::Status FileIdentityResolver::GetFileLength(const std::string& local_path, uint64_t* length) const {
    if (!length) {
        return pl::msg::Status::InvalidArgument("Output length is null");
    }
    struct stat st;
    if (local_path.empty() || ::stat(local_path.c_str(), &st) != 0) {
        const int err = local_path.empty() ? ENOENT : errno;
        if (err == ENOENT || err == ENOTDIR) {
            return pl::msg::Status::NotFound("File " + local_path + " does not exist");
        }
        return pl::msg::Status::IoError("File size determination failed for " + local_path + ": " +
                                        std::strerror(err));
    }
    *length = static_cast<uint64_t>(st.st_size);
    return pl::msg::Status::Ok();
}

} // namespace pl::locator
