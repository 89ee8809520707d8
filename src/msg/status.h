#pragma once

#include <string>
#include <utility>

namespace pl::msg {

enum class StatusCode : int {
    kOk = 0,
    kInvalidArgument = 1,
    kNotFound = 2,
    kIoError = 3,
    kInternalError = 4,
    kTransportError = 5,
    kProtocolError = 6,
    kPreconditionFailed = 7,
    kIdentityError = 8
};

struct Status {
    StatusCode code{StatusCode::kOk};
    std::string message;

    bool ok() const { return code == StatusCode::kOk; }

    // Keeps the code, prefixes the message with the calling context.
    Status Annotate(const std::string& context) const {
        if (ok() || context.empty()) {
            return *this;
        }
        return {code, message.empty() ? context : context + ": " + message};
    }

    static Status Ok() { return {}; }
    static Status InvalidArgument(std::string msg) {
        return {StatusCode::kInvalidArgument, std::move(msg)};
    }
    static Status NotFound(std::string msg) {
        return {StatusCode::kNotFound, std::move(msg)};
    }
    static Status IoError(std::string msg) {
        return {StatusCode::kIoError, std::move(msg)};
    }
    static Status InternalError(std::string msg) {
        return {StatusCode::kInternalError, std::move(msg)};
    }
    static Status TransportError(std::string msg) {
        return {StatusCode::kTransportError, std::move(msg)};
    }
    static Status ProtocolError(std::string msg) {
        return {StatusCode::kProtocolError, std::move(msg)};
    }
    static Status PreconditionFailed(std::string msg) {
        return {StatusCode::kPreconditionFailed, std::move(msg)};
    }
    static Status IdentityError(std::string msg) {
        return {StatusCode::kIdentityError, std::move(msg)};
    }
};

inline const char* StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case StatusCode::kNotFound:
            return "NOT_FOUND";
        case StatusCode::kIoError:
            return "IO_ERROR";
        case StatusCode::kInternalError:
            return "INTERNAL_ERROR";
        case StatusCode::kTransportError:
            return "TRANSPORT_ERROR";
        case StatusCode::kProtocolError:
            return "PROTOCOL_ERROR";
        case StatusCode::kPreconditionFailed:
            return "PRECONDITION_FAILED";
        case StatusCode::kIdentityError:
            return "IDENTITY_ERROR";
    }
    return "UNKNOWN";
}

} // namespace pl::msg
