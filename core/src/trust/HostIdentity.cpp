#include "remotix/HostIdentity.hpp"
#include <algorithm>
#include <cctype>

namespace remotix {

HostIdentity HostIdentity::make(const std::string& host, std::uint16_t port) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(host.begin(), host.end(), notSpace);
    auto last = std::find_if(host.rbegin(), host.rend(), notSpace).base();

    HostIdentity id;
    if (first < last) id.host.assign(first, last);
    std::transform(id.host.begin(), id.host.end(), id.host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    id.port = port;
    return id;
}

std::string HostIdentity::key() const {
    if (port == kDefaultPort) return host;
    return "[" + host + "]:" + std::to_string(port);
}

} // namespace remotix
