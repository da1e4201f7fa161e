// Owns the process-wide state: live sessions, the trust store and the
// verifier bound to it. Construct one and pass it to whoever needs it.
#pragma once
#include "ConnectionRegistry.hpp"
#include "HostKeyVerifier.hpp"
#include "Settings.hpp"
#include "TrustStore.hpp"
#include <memory>

namespace remotix {

class Context {
public:
    Context(std::unique_ptr<RemoteClient> prototype,
            std::unique_ptr<HostKeyFetcher> fetcher,
            const std::string& storeDir = {});

    // Fetcher and store location taken from settings.
    Context(std::unique_ptr<RemoteClient> prototype, const Settings& settings);

    ConnectionRegistry& connections() { return connections_; }
    TrustStore& trust() { return trust_; }
    HostKeyVerifier& hostKeys() { return verifier_; }

private:
    // Declaration order matters: verifier_ refers to trust_.
    TrustStore trust_;
    HostKeyVerifier verifier_;
    ConnectionRegistry connections_;
};

} // namespace remotix
