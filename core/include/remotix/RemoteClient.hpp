// Abstract interface for one remote file-transfer session. Concrete backends
// implement this API; the registry drives them only through it.
// Implementations are not required to be reentrant: the registry never issues
// a second call on one instance before the previous call has returned.
#pragma once
#include "RemoteTypes.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace remotix {

class RemoteClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;

    virtual ~RemoteClient() = default;

    // Connect and disconnect
    virtual bool connect(const ConnectionConfig& cfg, std::string& err) = 0;
    virtual void disconnect() = 0;
    // May be called from any thread.
    virtual bool isConnected() const = 0;

    // Remote directory listing
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Download a remote file to a local path
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err,
                     ProgressCB progress = {}) = 0;

    // Upload a local file to a remote path
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err,
                     ProgressCB progress = {}) = 0;

    // Whole-file reads and writes through memory
    virtual bool readFile(const std::string& remote,
                          std::string& out,
                          std::string& err) = 0;

    virtual bool writeFile(const std::string& remote,
                           const std::string& content,
                           std::string& err) = 0;

    // Create a directory and any missing parents
    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err) = 0;

    // Create and connect a new session of the same backend type.
    // Returns nullptr and fills err on failure.
    virtual std::unique_ptr<RemoteClient> newConnectionLike(const ConnectionConfig& cfg,
                                                            std::string& err) = 0;
};

} // namespace remotix
