// HostKeyFetcher running the external ssh-keyscan tool.
#pragma once
#include "HostKeyFetcher.hpp"

namespace remotix {

class KeyscanFetcher : public HostKeyFetcher {
public:
    explicit KeyscanFetcher(std::string program = "ssh-keyscan", FetchTimeouts timeouts = {});

    // Runs "<program> -p <port> -T <attemptSeconds> <host>". The process is
    // killed once overallMs elapses, whatever -T does.
    bool fetch(const std::string& host,
               std::uint16_t port,
               std::string& out,
               std::string& err) override;

private:
    std::string program_;
    FetchTimeouts timeouts_;
};

} // namespace remotix
