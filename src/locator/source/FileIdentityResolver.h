#pragma once

#include <cstdint>
#include <string>

#include "../../msg/status.h"

namespace pl::locator {

// Local view of a file on the mounted distributed filesystem.
class FileIdentityResolver {
public:
    virtual ~FileIdentityResolver() = default;

    // Stable numeric identity (inode number) the metadata service knows the file by.
    virtual pl::msg::Status GetFileId(const std::string& local_path, uint64_t* file_id) const;
    virtual pl::msg::Status GetFileLength(const std::string& local_path, uint64_t* length) const;
};

} // namespace pl::locator
