#pragma once

#include <functional>
#include <string>

#include "../../msg/status.h"

struct addrinfo;

namespace pl::locator {

// Resolves host to the canonical numeric form of one of its addresses.
using AddressResolver = std::function<pl::msg::Status(const std::string& host, std::string* out)>;

// Literals are taken as they are: dotted quads in strict decimal form, IPv6 in
// any RFC 4291 form. Anything that looks like a dotted quad but is not strict
// (leading zeros, shorthand like "10.1") is rejected. Names go to the system
// resolver and the first IPv4 address wins over IPv6.
pl::msg::Status CanonicalizeAddress(const std::string& host, std::string* out);

// Picks the first AF_INET entry of a getaddrinfo list, else the first AF_INET6.
pl::msg::Status FormatPreferredAddress(const struct addrinfo* list, std::string* out);

} // namespace pl::locator
