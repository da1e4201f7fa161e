// Persistent TOFU store: last trusted host key per HostIdentity.
// Backed by one JSON file that is rewritten atomically on every mutation.
#pragma once
#include "HostIdentity.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace remotix {

struct TrustRecord {
    std::string host;
    std::uint16_t port = HostIdentity::kDefaultPort;
    std::string keyType;      // e.g. "ssh-ed25519"
    std::string fingerprint;  // "SHA256:<base64 without padding>"
    std::string fullKey;      // "<keyType> <base64 key>"
    std::string addedAt;      // ISO-8601 UTC

    HostIdentity identity() const { return HostIdentity::make(host, port); }
};

class TrustStore {
public:
    static constexpr const char* kFileName = "known_hosts.json";

    // Loads <dir>/known_hosts.json, creating dir if needed. An empty dir
    // means the per-user default (~/.remotix).
    explicit TrustStore(const std::string& dir = {});

    static std::string defaultDirectory();

    // Insert or replace the record for its identity. addedAt is stamped
    // when empty. Returns false if the file could not be written; the
    // in-memory store keeps the change either way.
    bool add(TrustRecord record);
    bool remove(const HostIdentity& id);
    bool clear();

    std::optional<TrustRecord> get(const HostIdentity& id) const;
    std::vector<TrustRecord> getAll() const;
    bool has(const HostIdentity& id) const;
    std::size_t size() const;

    const std::string& filePath() const { return filePath_; }

private:
    void load();
    bool saveLocked() const;

    std::string filePath_;
    mutable std::mutex mtx_;                     // protects records_
    std::map<std::string, TrustRecord> records_; // key: HostIdentity::key()
};

} // namespace remotix
