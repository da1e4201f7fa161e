// Simulated remote client backed by an in-memory file tree.
// Used by tests and for running the registry without a network.
#pragma once
#include "RemoteClient.hpp"
#include <atomic>
#include <map>

namespace remotix {

class MockRemoteClient : public RemoteClient {
public:
    MockRemoteClient();

    bool connect(const ConnectionConfig& cfg, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              std::string& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::string& err,
             ProgressCB progress = {}) override;

    bool put(const std::string& local,
             const std::string& remote,
             std::string& err,
             ProgressCB progress = {}) override;

    bool readFile(const std::string& remote,
                  std::string& out,
                  std::string& err) override;

    bool writeFile(const std::string& remote,
                   const std::string& content,
                   std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool removeDir(const std::string& remote_dir,
                   std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err) override;

    std::unique_ptr<RemoteClient> newConnectionLike(const ConnectionConfig& cfg,
                                                    std::string& err) override;

    // Config used by the last successful connect.
    const ConnectionConfig& lastConfig() const { return lastCfg_; }

private:
    struct Node {
        bool          is_dir = false;
        std::string   data;
        std::uint32_t mode  = 0644;
        std::uint64_t mtime = 0;
    };

    std::atomic<bool> connected_{false};
    ConnectionConfig lastCfg_{};

    // Absolute normalized path -> node. "/" always exists.
    std::map<std::string, Node> fs_;

    bool requireConnected(std::string& err) const;
    static std::string normalize(const std::string& path);
    static std::string parentOf(const std::string& path);
    static std::string baseName(const std::string& path);
    bool isDir(const std::string& path) const;
};

} // namespace remotix
