// Capability that fetches a host's public keys out-of-band.
// Output is known_hosts style text: one "host keytype base64key" per line.
#pragma once
#include <cstdint>
#include <string>

namespace remotix {

class HostKeyFetcher {
public:
    virtual ~HostKeyFetcher() = default;

    // Returns false and fills err when the host could not be scanned.
    virtual bool fetch(const std::string& host,
                       std::uint16_t port,
                       std::string& out,
                       std::string& err) = 0;
};

// Timeouts shared by the fetcher implementations.
struct FetchTimeouts {
    int attemptSeconds = 5;   // passed to the tool / per socket operation
    int overallMs = 10000;    // hard wall-clock bound for one fetch
};

} // namespace remotix
