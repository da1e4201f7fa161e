// HostKeyFetcher that performs an SSH handshake in-process with libssh2 and
// reports the key the server negotiated. Needs no external tool, but yields a
// single key (the one libssh2 picked) instead of one per algorithm.
#pragma once
#include "HostKeyFetcher.hpp"
#include <QDeadlineTimer>

namespace remotix {

class Libssh2KeyFetcher : public HostKeyFetcher {
public:
    explicit Libssh2KeyFetcher(FetchTimeouts timeouts = {});

    bool fetch(const std::string& host,
               std::uint16_t port,
               std::string& out,
               std::string& err) override;

private:
    FetchTimeouts timeouts_;

    // Resolve and connect, each attempt bounded by timeouts_.attemptSeconds
    // and the whole call by deadline. Returns -1 on failure.
    int tcpConnect(const std::string& host, std::uint16_t port,
                   const QDeadlineTimer& deadline, std::string& err) const;
};

} // namespace remotix
