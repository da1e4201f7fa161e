// Session lifecycle and typed operations for ConnectionRegistry.
#include "remotix/ConnectionRegistry.hpp"
#include "remotix/Log.hpp"
#include <exception>
#include <utility>

namespace remotix {

namespace {

// Turn a transport's bool + message result into an exception on the future.
void check(bool ok, const std::string& err, const char* what) {
    if (ok) return;
    throw TransportError(err.empty() ? std::string(what) + " failed" : err);
}

} // namespace

ConnectionRegistry::ConnectionRegistry(std::unique_ptr<RemoteClient> prototype)
    : prototype_(std::move(prototype)) {}

ConnectionRegistry::~ConnectionRegistry() {
    closeAll();
}

void ConnectionRegistry::teardown(const std::string& id, std::unique_ptr<Session> s) {
    s->queue->shutdown();
    if (s->queue->onWorkerThread()) {
        // Called from one of this session's own operations. It still holds
        // the transport, so close it once that operation has returned.
        std::shared_ptr<Session> owned(std::move(s));
        owned->queue->retireAfterCurrent([id, owned]() {
            try {
                owned->transport->disconnect();
                LOGI("Disconnected: %s", id.c_str());
            } catch (const std::exception& e) {
                LOGE("Error closing %s: %s", id.c_str(), e.what());
            } catch (...) {
                LOGE("Error closing %s: unknown exception", id.c_str());
            }
        });
        return;
    }
    s->transport->disconnect();
    LOGI("Disconnected: %s", id.c_str());
}

void ConnectionRegistry::connect(const std::string& id, const ConnectionConfig& cfg) {
    // Close existing connection if any
    try {
        disconnect(id);
    } catch (const std::exception& e) {
        LOGE("Error closing previous session %s: %s", id.c_str(), e.what());
    } catch (...) {
        LOGE("Error closing previous session %s: unknown exception", id.c_str());
    }

    LOGI("Connecting %s to %s:%u (%s)", id.c_str(), cfg.host.c_str(),
         static_cast<unsigned>(cfg.port), toString(cfg.securityMode));

    std::string err;
    std::unique_ptr<RemoteClient> transport = prototype_->newConnectionLike(cfg, err);
    if (!transport) {
        LOGE("Connection failed for %s: %s", id.c_str(), err.c_str());
        throw ConnectionError(err.empty() ? "Connection failed" : err);
    }

    auto session = std::make_unique<Session>();
    session->transport = std::move(transport);
    session->config = cfg;
    session->queue = std::make_unique<OperationQueue>(id);

    std::unique_ptr<Session> displaced;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto& slot = sessions_[id];
        displaced = std::move(slot);
        slot = std::move(session);
    }
    // A concurrent connect for the same id won the race to the map.
    if (displaced) {
        LOGW("Replacing session %s opened concurrently", id.c_str());
        try {
            teardown(id, std::move(displaced));
        } catch (const std::exception& e) {
            LOGE("Error closing replaced session %s: %s", id.c_str(), e.what());
        } catch (...) {
            LOGE("Error closing replaced session %s: unknown exception", id.c_str());
        }
    }
    LOGI("Connected: %s", id.c_str());
}

void ConnectionRegistry::disconnect(const std::string& id) {
    std::unique_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        s = std::move(it->second);
        sessions_.erase(it);
    }
    teardown(id, std::move(s));
}

void ConnectionRegistry::closeAll() {
    std::unordered_map<std::string, std::unique_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        all.swap(sessions_);
    }
    if (all.empty()) return;
    LOGI("Closing all %zu connections...", all.size());
    for (auto& kv : all) {
        try {
            teardown(kv.first, std::move(kv.second));
        } catch (const std::exception& e) {
            LOGE("Error closing %s: %s", kv.first.c_str(), e.what());
        } catch (...) {
            LOGE("Error closing %s: unknown exception", kv.first.c_str());
        }
    }
    LOGI("All connections closed");
}

bool ConnectionRegistry::isConnected(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(id);
    return it != sessions_.end() && it->second->transport->isConnected();
}

std::size_t ConnectionRegistry::activeCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return sessions_.size();
}

ConnectionConfig ConnectionRegistry::config(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) throw NotConnectedError(id);
    return it->second->config;
}

std::future<std::vector<FileInfo>> ConnectionRegistry::list(const std::string& id,
                                                            const std::string& path) {
    return submit(id, [path](RemoteClient& c) {
        std::vector<FileInfo> out;
        std::string err;
        check(c.list(path, out, err), err, "list");
        return out;
    });
}

std::future<void> ConnectionRegistry::download(const std::string& id,
                                               const std::string& remote,
                                               const std::string& local) {
    return submit(id, [remote, local](RemoteClient& c) {
        std::string err;
        check(c.get(remote, local, err), err, "download");
        LOGI("Downloaded: %s -> %s", remote.c_str(), local.c_str());
    });
}

std::future<void> ConnectionRegistry::upload(const std::string& id,
                                             const std::string& local,
                                             const std::string& remote) {
    return submit(id, [local, remote](RemoteClient& c) {
        std::string err;
        check(c.put(local, remote, err), err, "upload");
        LOGI("Uploaded: %s -> %s", local.c_str(), remote.c_str());
    });
}

std::future<void> ConnectionRegistry::removeFile(const std::string& id, const std::string& path) {
    return submit(id, [path](RemoteClient& c) {
        std::string err;
        check(c.removeFile(path, err), err, "remove file");
        LOGI("Deleted file: %s", path.c_str());
    });
}

std::future<void> ConnectionRegistry::removeDir(const std::string& id, const std::string& path) {
    return submit(id, [path](RemoteClient& c) {
        std::string err;
        check(c.removeDir(path, err), err, "remove directory");
        LOGI("Deleted directory: %s", path.c_str());
    });
}

std::future<void> ConnectionRegistry::createDirectory(const std::string& id, const std::string& path) {
    return submit(id, [path](RemoteClient& c) {
        std::string err;
        check(c.mkdir(path, err), err, "create directory");
        LOGI("Created directory: %s", path.c_str());
    });
}

std::future<void> ConnectionRegistry::rename(const std::string& id,
                                             const std::string& from,
                                             const std::string& to) {
    return submit(id, [from, to](RemoteClient& c) {
        std::string err;
        check(c.rename(from, to, err), err, "rename");
        LOGI("Renamed: %s -> %s", from.c_str(), to.c_str());
    });
}

std::future<std::string> ConnectionRegistry::readFile(const std::string& id, const std::string& path) {
    return submit(id, [path](RemoteClient& c) {
        std::string content;
        std::string err;
        check(c.readFile(path, content, err), err, "read");
        LOGI("Read file: %s size: %zu", path.c_str(), content.size());
        return content;
    });
}

std::future<void> ConnectionRegistry::writeFile(const std::string& id,
                                                const std::string& path,
                                                const std::string& content) {
    return submit(id, [path, content](RemoteClient& c) {
        std::string err;
        check(c.writeFile(path, content, err), err, "write");
        LOGI("Wrote file: %s size: %zu", path.c_str(), content.size());
    });
}

} // namespace remotix
