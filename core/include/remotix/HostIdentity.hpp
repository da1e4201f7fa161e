// Normalized (host, port) pair naming one endpoint's host key.
#pragma once
#include <cstdint>
#include <string>

namespace remotix {

struct HostIdentity {
    static constexpr std::uint16_t kDefaultPort = 22;

    std::string host;   // trimmed, lower-case
    std::uint16_t port = kDefaultPort;

    static HostIdentity make(const std::string& host, std::uint16_t port);

    // known_hosts style key: "host" for port 22, "[host]:port" otherwise.
    std::string key() const;

    bool operator==(const HostIdentity& o) const { return host == o.host && port == o.port; }
    bool operator!=(const HostIdentity& o) const { return !(*this == o); }
};

} // namespace remotix
