// TOFU classification against TrustStore.
#include "remotix/HostKeyVerifier.hpp"
#include "remotix/Log.hpp"
#include <QByteArray>
#include <QCryptographicHash>
#include <sstream>

namespace remotix {

namespace {

int preferenceRank(const std::string& keyType) {
    if (keyType == "ssh-ed25519") return 3;
    if (keyType.compare(0, 6, "ecdsa-") == 0) return 2;
    if (keyType == "ssh-rsa") return 1;
    return 0;
}

FingerprintResult errorResult(const std::string& reason) {
    FingerprintResult r;
    r.status = FingerprintResult::Status::Error;
    r.error = reason;
    return r;
}

} // namespace

const char* toString(FingerprintResult::Status s) {
    switch (s) {
        case FingerprintResult::Status::New: return "new";
        case FingerprintResult::Status::Match: return "match";
        case FingerprintResult::Status::Changed: return "changed";
        case FingerprintResult::Status::Error: return "error";
    }
    return "error";
}

HostKeyVerifier::HostKeyVerifier(std::unique_ptr<HostKeyFetcher> fetcher, TrustStore& store)
    : fetcher_(std::move(fetcher)), store_(store) {}

std::vector<ScannedKey> HostKeyVerifier::parseKeys(const std::string& text) {
    std::vector<ScannedKey> keys;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line[start] == '#') continue;
        std::istringstream fields(line.substr(start));
        ScannedKey k;
        if (!(fields >> k.host >> k.keyType >> k.base64)) continue;
        keys.push_back(std::move(k));
    }
    return keys;
}

const ScannedKey* HostKeyVerifier::selectPreferred(const std::vector<ScannedKey>& keys) {
    const ScannedKey* best = nullptr;
    int bestRank = -1;
    for (const auto& k : keys) {
        const int rank = preferenceRank(k.keyType);
        if (rank > bestRank) {
            best = &k;
            bestRank = rank;
        }
    }
    return best;
}

bool HostKeyVerifier::fingerprintOf(const std::string& base64Key, std::string& out, std::string& err) {
    const auto decoded = QByteArray::fromBase64Encoding(QByteArray::fromStdString(base64Key),
                                                        QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded || decoded.decoded.isEmpty()) {
        err = "Could not decode host key (invalid base64)";
        return false;
    }
    const QByteArray digest = QCryptographicHash::hash(decoded.decoded, QCryptographicHash::Sha256);
    out = "SHA256:" + digest.toBase64(QByteArray::Base64Encoding | QByteArray::OmitTrailingEquals).toStdString();
    return true;
}

FingerprintResult HostKeyVerifier::verify(const std::string& host, std::uint16_t port) {
    const HostIdentity id = HostIdentity::make(host, port);
    if (id.host.empty()) return errorResult("Host is empty");

    std::string output;
    std::string err;
    if (!fetcher_->fetch(id.host, id.port, output, err)) {
        LOGW("Host key fetch failed for %s: %s", id.key().c_str(), err.c_str());
        return errorResult(err.empty() ? "Could not fetch host key" : err);
    }

    const std::vector<ScannedKey> keys = parseKeys(output);
    const ScannedKey* best = selectPreferred(keys);
    if (!best) return errorResult("Could not parse host key from scan output");

    FingerprintResult r;
    if (!fingerprintOf(best->base64, r.fingerprint, err)) return errorResult(err);
    r.keyType = best->keyType;
    r.fullKey = best->keyType + " " + best->base64;

    const auto known = store_.get(id);
    if (!known) {
        r.status = FingerprintResult::Status::New;
    } else if (known->fingerprint == r.fingerprint) {
        r.status = FingerprintResult::Status::Match;
    } else {
        r.status = FingerprintResult::Status::Changed;
        r.previousFingerprint = known->fingerprint;
        LOGW("Host key for %s changed: %s -> %s", id.key().c_str(),
             known->fingerprint.c_str(), r.fingerprint.c_str());
    }
    return r;
}

bool HostKeyVerifier::commit(const std::string& host,
                             std::uint16_t port,
                             const std::string& keyType,
                             const std::string& fingerprint,
                             const std::string& fullKey) {
    TrustRecord rec;
    rec.host = host;
    rec.port = port;
    rec.keyType = keyType;
    rec.fingerprint = fingerprint;
    rec.fullKey = fullKey;
    return store_.add(std::move(rec));
}

bool HostKeyVerifier::forget(const std::string& host, std::uint16_t port) {
    return store_.remove(HostIdentity::make(host, port));
}

} // namespace remotix
