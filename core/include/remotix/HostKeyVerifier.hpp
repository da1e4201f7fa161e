// Trust-on-first-use host key verification.
// verify() only classifies; nothing is written until commit() is called.
#pragma once
#include "HostKeyFetcher.hpp"
#include "TrustStore.hpp"
#include <memory>
#include <string>
#include <vector>

namespace remotix {

struct FingerprintResult {
    enum class Status { New, Match, Changed, Error };

    Status status = Status::Error;
    std::string keyType;
    std::string fingerprint;          // "SHA256:..."
    std::string fullKey;              // "<keyType> <base64>"
    std::string previousFingerprint;  // Changed only
    std::string error;                // Error only
};

const char* toString(FingerprintResult::Status s);

// One "host keytype base64key" record from fetcher output.
struct ScannedKey {
    std::string host;
    std::string keyType;
    std::string base64;
};

class HostKeyVerifier {
public:
    // store is not owned and must outlive the verifier.
    HostKeyVerifier(std::unique_ptr<HostKeyFetcher> fetcher, TrustStore& store);

    FingerprintResult verify(const std::string& host, std::uint16_t port);

    // Persist a trust decision for (host, port). Returns false if the store
    // could not be written.
    bool commit(const std::string& host,
                std::uint16_t port,
                const std::string& keyType,
                const std::string& fingerprint,
                const std::string& fullKey);

    bool forget(const std::string& host, std::uint16_t port);

    // Parse fetcher output; comment, blank and short lines are skipped.
    static std::vector<ScannedKey> parseKeys(const std::string& text);

    // Pick one key: ssh-ed25519, then ecdsa-*, then ssh-rsa, else the first
    // line. Returns nullptr for an empty list.
    static const ScannedKey* selectPreferred(const std::vector<ScannedKey>& keys);

    // "SHA256:" + unpadded base64 of SHA-256 over the decoded key blob.
    static bool fingerprintOf(const std::string& base64Key, std::string& out, std::string& err);

private:
    std::unique_ptr<HostKeyFetcher> fetcher_;
    TrustStore& store_;
};

} // namespace remotix
