// Mock implementation: a small in-memory tree with POSIX-like semantics.
#include "remotix/MockRemoteClient.hpp"
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iterator>
#include <sstream>

namespace remotix {

namespace {

std::uint64_t nowEpoch() {
    return static_cast<std::uint64_t>(std::time(nullptr));
}

bool isUnder(const std::string& path, const std::string& dir) {
    if (dir == "/") return path != "/";
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/';
}

} // namespace

MockRemoteClient::MockRemoteClient() {
    const std::uint64_t t = nowEpoch();
    fs_["/"]           = Node{true, {}, 0755, t};
    fs_["/home"]       = Node{true, {}, 0755, t};
    fs_["/pub"]        = Node{true, {}, 0755, t};
    fs_["/readme.txt"] = Node{false, "Remotix mock server\n", 0644, t};
}

bool MockRemoteClient::connect(const ConnectionConfig& cfg, std::string& err) {
    if (cfg.host.empty() || cfg.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (cfg.port == 0) {
        err = "Invalid port 0";
        return false;
    }
    lastCfg_ = cfg;
    connected_ = true;
    return true;
}

void MockRemoteClient::disconnect() {
    connected_ = false;
}

std::unique_ptr<RemoteClient> MockRemoteClient::newConnectionLike(const ConnectionConfig& cfg,
                                                                  std::string& err) {
    auto p = std::make_unique<MockRemoteClient>();
    if (!p->connect(cfg, err)) return nullptr;
    return p;
}

bool MockRemoteClient::requireConnected(std::string& err) const {
    if (!connected_.load()) {
        err = "Not connected";
        return false;
    }
    return true;
}

std::string MockRemoteClient::normalize(const std::string& path) {
    std::string out = "/";
    std::istringstream in(path);
    std::string part;
    while (std::getline(in, part, '/')) {
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            out = parentOf(out);
            continue;
        }
        if (out.back() != '/') out += '/';
        out += part;
    }
    return out;
}

std::string MockRemoteClient::parentOf(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return path.substr(0, pos);
}

std::string MockRemoteClient::baseName(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool MockRemoteClient::isDir(const std::string& path) const {
    auto it = fs_.find(path);
    return it != fs_.end() && it->second.is_dir;
}

bool MockRemoteClient::list(const std::string& remote_path,
                            std::vector<FileInfo>& out,
                            std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string dir = normalize(remote_path);
    if (!isDir(dir)) {
        err = "No such directory: " + dir;
        return false;
    }
    out.clear();
    for (const auto& kv : fs_) {
        if (!isUnder(kv.first, dir) || parentOf(kv.first) != dir) continue;
        FileInfo fi;
        fi.name = baseName(kv.first);
        fi.is_dir = kv.second.is_dir;
        fi.size = kv.second.data.size();
        fi.mtime = kv.second.mtime;
        fi.mode = kv.second.mode;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockRemoteClient::readFile(const std::string& remote,
                                std::string& out,
                                std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string path = normalize(remote);
    auto it = fs_.find(path);
    if (it == fs_.end() || it->second.is_dir) {
        err = "No such file: " + path;
        return false;
    }
    out = it->second.data;
    return true;
}

bool MockRemoteClient::writeFile(const std::string& remote,
                                 const std::string& content,
                                 std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string path = normalize(remote);
    if (path == "/" || isDir(path)) {
        err = "Is a directory: " + path;
        return false;
    }
    if (!isDir(parentOf(path))) {
        err = "Parent directory does not exist: " + parentOf(path);
        return false;
    }
    Node& n = fs_[path];
    n.is_dir = false;
    n.data = content;
    n.mtime = nowEpoch();
    return true;
}

bool MockRemoteClient::get(const std::string& remote,
                           const std::string& local,
                           std::string& err,
                           ProgressCB progress) {
    std::string data;
    if (!readFile(remote, data, err)) return false;
    std::ofstream f(local, std::ios::binary | std::ios::trunc);
    if (!f) {
        err = "Cannot open local file for writing: " + local;
        return false;
    }
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!f) {
        err = "Write failed: " + local;
        return false;
    }
    if (progress) progress(data.size(), data.size());
    return true;
}

bool MockRemoteClient::put(const std::string& local,
                           const std::string& remote,
                           std::string& err,
                           ProgressCB progress) {
    if (!requireConnected(err)) return false;
    std::ifstream f(local, std::ios::binary);
    if (!f) {
        err = "Cannot open local file: " + local;
        return false;
    }
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!writeFile(remote, data, err)) return false;
    if (progress) progress(data.size(), data.size());
    return true;
}

bool MockRemoteClient::mkdir(const std::string& remote_dir, std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string path = normalize(remote_dir);
    std::string cur;
    std::istringstream in(path);
    std::string part;
    while (std::getline(in, part, '/')) {
        if (part.empty()) continue;
        cur += "/" + part;
        auto it = fs_.find(cur);
        if (it == fs_.end()) {
            fs_[cur] = Node{true, {}, 0755, nowEpoch()};
        } else if (!it->second.is_dir) {
            err = "Not a directory: " + cur;
            return false;
        }
    }
    return true;
}

bool MockRemoteClient::removeFile(const std::string& remote_path, std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string path = normalize(remote_path);
    auto it = fs_.find(path);
    if (it == fs_.end() || it->second.is_dir) {
        err = "No such file: " + path;
        return false;
    }
    fs_.erase(it);
    return true;
}

bool MockRemoteClient::removeDir(const std::string& remote_dir, std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string path = normalize(remote_dir);
    if (path == "/") {
        err = "Refusing to remove the root directory";
        return false;
    }
    if (!isDir(path)) {
        err = "No such directory: " + path;
        return false;
    }
    // Recursive, like FTP clients' removeDir.
    for (auto it = fs_.begin(); it != fs_.end();) {
        if (it->first == path || isUnder(it->first, path)) it = fs_.erase(it);
        else ++it;
    }
    return true;
}

bool MockRemoteClient::rename(const std::string& from,
                              const std::string& to,
                              std::string& err) {
    if (!requireConnected(err)) return false;
    const std::string src = normalize(from);
    const std::string dst = normalize(to);
    if (src == "/" || fs_.find(src) == fs_.end()) {
        err = "No such file or directory: " + src;
        return false;
    }
    if (fs_.find(dst) != fs_.end()) {
        err = "Destination exists: " + dst;
        return false;
    }
    if (!isDir(parentOf(dst))) {
        err = "Parent directory does not exist: " + parentOf(dst);
        return false;
    }
    if (isUnder(dst, src)) {
        err = "Cannot move a directory into itself: " + dst;
        return false;
    }
    std::map<std::string, Node> moved;
    for (auto it = fs_.begin(); it != fs_.end();) {
        if (it->first == src || isUnder(it->first, src)) {
            moved[dst + it->first.substr(src.size())] = std::move(it->second);
            it = fs_.erase(it);
        } else {
            ++it;
        }
    }
    fs_.insert(moved.begin(), moved.end());
    return true;
}

} // namespace remotix
