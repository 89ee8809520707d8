#include "AddressResolver.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cstring>

namespace pl::locator {

namespace {

bool LooksLikeDottedQuad(const std::string& host) {
    return std::all_of(host.begin(), host.end(), [](unsigned char ch) {
        return (ch >= '0' && ch <= '9') || ch == '.';
    });
}

bool FormatIpv4(const struct in_addr& addr, std::string* out) {
    char buffer[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &addr, buffer, sizeof(buffer))) {
        return false;
    }
    *out = buffer;
    return true;
}

bool FormatIpv6(const struct in6_addr& addr, std::string* out) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET6, &addr, buffer, sizeof(buffer))) {
        return false;
    }
    *out = buffer;
    return true;
}

} // namespace

pl::msg::Status FormatPreferredAddress(const struct addrinfo* list, std::string* out) {
    if (!out) {
        return pl::msg::Status::InvalidArgument("Output address is null");
    }
    const struct addrinfo* v4 = nullptr;
    const struct addrinfo* v6 = nullptr;
    for (const struct addrinfo* it = list; it; it = it->ai_next) {
        if (!it->ai_addr) {
            continue;
        }
        if (it->ai_family == AF_INET && !v4 && it->ai_addrlen >= sizeof(struct sockaddr_in)) {
            v4 = it;
            break;
        }
        if (it->ai_family == AF_INET6 && !v6 && it->ai_addrlen >= sizeof(struct sockaddr_in6)) {
            v6 = it;
        }
    }

    std::string text;
    if (v4) {
        struct sockaddr_in sin;
        std::memcpy(&sin, v4->ai_addr, sizeof(sin));
        if (FormatIpv4(sin.sin_addr, &text)) {
            *out = text;
            return pl::msg::Status::Ok();
        }
    } else if (v6) {
        struct sockaddr_in6 sin6;
        std::memcpy(&sin6, v6->ai_addr, sizeof(sin6));
        if (FormatIpv6(sin6.sin6_addr, &text)) {
            *out = text;
            return pl::msg::Status::Ok();
        }
    }
    return pl::msg::Status::ProtocolError("no IPv4 or IPv6 address in resolver answer");
}

pl::msg::Status CanonicalizeAddress(const std::string& host, std::string* out) {
    if (!out) {
        return pl::msg::Status::InvalidArgument("Output address is null");
    }
    if (host.empty()) {
        return pl::msg::Status::ProtocolError("empty ip_addr");
    }

    // glibc's inet_pton accepts only strict decimal quads.
    struct in_addr v4;
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        if (!FormatIpv4(v4, out)) {
            return pl::msg::Status::ProtocolError("cannot format ip_addr '" + host + "'");
        }
        return pl::msg::Status::Ok();
    }
    if (LooksLikeDottedQuad(host)) {
        return pl::msg::Status::ProtocolError("ambiguous IPv4 literal in ip_addr '" + host +
                                              "', expected four decimal octets without leading zeros");
    }
    struct in6_addr v6;
    if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        if (!FormatIpv6(v6, out)) {
            return pl::msg::Status::ProtocolError("cannot format ip_addr '" + host + "'");
        }
        return pl::msg::Status::Ok();
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || !result) {
        if (result) {
            freeaddrinfo(result);
        }
        return pl::msg::Status::ProtocolError("cannot resolve ip_addr '" + host + "': " +
                                              (rc != 0 ? gai_strerror(rc) : "empty answer"));
    }

    std::string address;
    pl::msg::Status st = FormatPreferredAddress(result, &address);
    freeaddrinfo(result);
    if (!st.ok()) {
        return st.Annotate("cannot resolve ip_addr '" + host + "'");
    }
    *out = address;
    return pl::msg::Status::Ok();
}

} // namespace pl::locator
