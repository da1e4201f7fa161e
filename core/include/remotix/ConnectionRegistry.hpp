// Registry of live remote sessions keyed by connection id.
// Each session owns its transport and an OperationQueue; every operation on
// a connection is funnelled through that queue.
#pragma once
#include "Errors.hpp"
#include "OperationQueue.hpp"
#include "RemoteClient.hpp"
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace remotix {

class ConnectionRegistry {
public:
    // prototype is only used to create new sessions (newConnectionLike).
    explicit ConnectionRegistry(std::unique_ptr<RemoteClient> prototype);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Replace any session for id with a freshly opened one. The previous
    // session is closed first, so a failed reconnect leaves id unregistered.
    // Throws ConnectionError; nothing is stored for id on failure.
    void connect(const std::string& id, const ConnectionConfig& cfg);

    // Safe to call from an operation running on the same connection: the
    // transport is then closed right after that operation returns.
    void disconnect(const std::string& id);
    void closeAll();

    bool isConnected(const std::string& id) const;
    std::size_t activeCount() const;

    // Config snapshot of a live session. Throws NotConnectedError.
    ConnectionConfig config(const std::string& id) const;

    // Run fn(RemoteClient&) on the connection's queue.
    // For an unknown id the future holds NotConnectedError.
    // fn may disconnect its own connection; the client stays valid until
    // fn returns.
    template <typename Fn>
    auto submit(const std::string& id, Fn fn)
        -> std::future<std::invoke_result_t<Fn&, RemoteClient&>> {
        using R = std::invoke_result_t<Fn&, RemoteClient&>;
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            std::promise<R> p;
            p.set_exception(std::make_exception_ptr(NotConnectedError(id)));
            return p.get_future();
        }
        // The transport is released only after the queue has stopped or,
        // for a self-disconnect, after the running job, so the raw pointer
        // outlives every job that captures it.
        RemoteClient* client = it->second->transport.get();
        return it->second->queue->enqueue([client, fn = std::move(fn)]() mutable {
            return fn(*client);
        });
    }

    std::future<std::vector<FileInfo>> list(const std::string& id, const std::string& path);
    std::future<void> download(const std::string& id, const std::string& remote, const std::string& local);
    std::future<void> upload(const std::string& id, const std::string& local, const std::string& remote);
    std::future<void> removeFile(const std::string& id, const std::string& path);
    std::future<void> removeDir(const std::string& id, const std::string& path);
    std::future<void> createDirectory(const std::string& id, const std::string& path);
    std::future<void> rename(const std::string& id, const std::string& from, const std::string& to);
    std::future<std::string> readFile(const std::string& id, const std::string& path);
    std::future<void> writeFile(const std::string& id, const std::string& path, const std::string& content);

private:
    struct Session {
        std::unique_ptr<RemoteClient> transport;
        ConnectionConfig config;
        std::unique_ptr<OperationQueue> queue;
    };

    // Stop the queue, then close the transport.
    static void teardown(const std::string& id, std::unique_ptr<Session> s);

    std::unique_ptr<RemoteClient> prototype_;
    mutable std::mutex mtx_; // protects sessions_
    std::unordered_map<std::string, std::unique_ptr<Session>> sessions_;
};

} // namespace remotix
