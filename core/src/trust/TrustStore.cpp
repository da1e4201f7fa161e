// TrustStore persistence: JSON object keyed by host identity, written with
// QSaveFile so a crash mid-write never leaves a truncated file behind.
#include "remotix/TrustStore.hpp"
#include "remotix/Log.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

namespace remotix {

namespace {

QJsonObject toJson(const TrustRecord& r) {
    QJsonObject o;
    o.insert("host", QString::fromStdString(r.host));
    o.insert("port", static_cast<int>(r.port));
    o.insert("keyType", QString::fromStdString(r.keyType));
    o.insert("fingerprint", QString::fromStdString(r.fingerprint));
    o.insert("fullKey", QString::fromStdString(r.fullKey));
    o.insert("addedAt", QString::fromStdString(r.addedAt));
    return o;
}

bool fromJson(const QJsonObject& o, TrustRecord& r) {
    if (!o.value("host").isString() || !o.value("fingerprint").isString()) return false;
    // A missing port means 22; a non-numeric one is not guessed at.
    int port = HostIdentity::kDefaultPort;
    const QJsonValue portValue = o.value("port");
    if (!portValue.isUndefined()) {
        if (!portValue.isDouble()) return false;
        port = portValue.toInt(0);
    }
    if (port <= 0 || port > 65535) return false;
    r.host = o.value("host").toString().toStdString();
    r.port = static_cast<std::uint16_t>(port);
    r.keyType = o.value("keyType").toString().toStdString();
    r.fingerprint = o.value("fingerprint").toString().toStdString();
    r.fullKey = o.value("fullKey").toString().toStdString();
    r.addedAt = o.value("addedAt").toString().toStdString();
    return !r.host.empty() && !r.fingerprint.empty();
}

} // namespace

std::string TrustStore::defaultDirectory() {
    return QDir(QDir::homePath()).filePath(".remotix").toStdString();
}

TrustStore::TrustStore(const std::string& dir) {
    const QString base = QString::fromStdString(dir.empty() ? defaultDirectory() : dir);
    if (!QDir().mkpath(base)) {
        LOGE("Cannot create trust store directory %s", qPrintable(base));
    }
    filePath_ = QDir(base).filePath(kFileName).toStdString();
    load();
}

void TrustStore::load() {
    QFile f(QString::fromStdString(filePath_));
    if (!f.exists()) return;
    if (!f.open(QIODevice::ReadOnly)) {
        LOGE("Failed to read known hosts %s: %s", filePath_.c_str(), qPrintable(f.errorString()));
        return;
    }
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        LOGE("Failed to load known hosts %s: %s", filePath_.c_str(),
             perr.error != QJsonParseError::NoError ? qPrintable(perr.errorString()) : "not a JSON object");
        return;
    }
    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        TrustRecord r;
        if (!it.value().isObject() || !fromJson(it.value().toObject(), r)) {
            LOGW("Skipping malformed known host entry %s", qPrintable(it.key()));
            continue;
        }
        // Re-key on the normalized identity rather than trusting the file.
        records_[r.identity().key()] = std::move(r);
    }
    LOGI("Loaded %zu known host(s) from %s", records_.size(), filePath_.c_str());
}

bool TrustStore::saveLocked() const {
    QJsonObject root;
    for (const auto& kv : records_) {
        root.insert(QString::fromStdString(kv.first), toJson(kv.second));
    }
    QSaveFile f(QString::fromStdString(filePath_));
    if (!f.open(QIODevice::WriteOnly)) {
        LOGE("Failed to save known hosts %s: %s", filePath_.c_str(), qPrintable(f.errorString()));
        return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (f.write(data) != data.size() || !f.commit()) {
        LOGE("Failed to save known hosts %s: %s", filePath_.c_str(), qPrintable(f.errorString()));
        return false;
    }
    return true;
}

bool TrustStore::add(TrustRecord record) {
    const HostIdentity id = record.identity();
    record.host = id.host;
    if (record.addedAt.empty()) {
        record.addedAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
    }
    std::lock_guard<std::mutex> lk(mtx_);
    records_[id.key()] = std::move(record);
    LOGI("Added known host: %s", id.key().c_str());
    return saveLocked();
}

bool TrustStore::remove(const HostIdentity& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    records_.erase(id.key());
    LOGI("Removed known host: %s", id.key().c_str());
    return saveLocked();
}

bool TrustStore::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    records_.clear();
    LOGI("Cleared all known hosts");
    return saveLocked();
}

std::optional<TrustRecord> TrustStore::get(const HostIdentity& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(id.key());
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<TrustRecord> TrustStore::getAll() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TrustRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) out.push_back(kv.second);
    return out;
}

bool TrustStore::has(const HostIdentity& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return records_.count(id.key()) > 0;
}

std::size_t TrustStore::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return records_.size();
}

} // namespace remotix
