#include "core/types/Host.hpp"

#include <algorithm>
#include <cctype>

namespace hostwatch::core {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Drops a port already written into the authority and brackets bare IPv6 literals.
std::string normalizeAuthority(const std::string& authority) {
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        return close == std::string::npos ? authority : authority.substr(0, close + 1);
    }

    auto colons = std::count(authority.begin(), authority.end(), ':');
    if (colons == 1) {
        return authority.substr(0, authority.find(':'));
    }
    if (colons > 1) {
        return "[" + authority + "]";
    }
    return authority;
}

} // namespace

bool Host::isValid() const {
    return !address.empty() && port > 0 && port <= 65535;
}

std::string Host::canonicalUrl() const {
    std::string scheme;
    std::string rest;

    auto schemeEnd = address.find("://");
    if (schemeEnd != std::string::npos) {
        scheme = toLower(address.substr(0, schemeEnd));
        rest = address.substr(schemeEnd + 3);
    } else {
        scheme = port == 443 ? "https" : "http";
        rest = address;
    }

    auto pathStart = rest.find('/');
    std::string authority = normalizeAuthority(rest.substr(0, pathStart));
    std::string path = pathStart == std::string::npos ? "/" : rest.substr(pathStart);

    return scheme + "://" + authority + ":" + std::to_string(port) + path;
}

std::string Host::toString() const {
    return address + ":" + std::to_string(port);
}

} // namespace hostwatch::core
