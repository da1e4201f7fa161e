// libssh2 host key fetch: TCP connect, SSH handshake, read the server key,
// disconnect. No authentication is attempted.
#include "remotix/Libssh2KeyFetcher.hpp"
#include "remotix/Log.hpp"
#include <libssh2.h>
#include <QByteArray>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace remotix {

namespace {

std::once_flag g_libssh2_init;

const char kTimeoutError[] = "Timeout fetching host key";

// Closes the socket and frees the session on every exit path.
struct FetchResources {
    int sock = -1;
    LIBSSH2_SESSION* session = nullptr;
    bool handshaken = false;

    ~FetchResources() {
        if (session) {
            // A stalled peer would make the goodbye block; only say it
            // after a completed handshake.
            if (handshaken) libssh2_session_disconnect(session, "host key fetch");
            libssh2_session_free(session);
        }
        if (sock != -1) ::close(sock);
    }
};

int remainingMs(const QDeadlineTimer& deadline) {
    const qint64 ms = deadline.remainingTime();
    if (ms < 0) return INT_MAX; // forever
    return static_cast<int>(std::min<qint64>(ms, INT_MAX));
}

// getaddrinfo has no timeout of its own. It runs on a helper thread and we
// stop waiting at the deadline; a late answer is freed by the helper.
struct Resolution {
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    int status = 0;
    struct addrinfo* res = nullptr;
};

int resolveBefore(const std::string& host, const std::string& port,
                  const QDeadlineTimer& deadline, struct addrinfo** out) {
    auto r = std::make_shared<Resolution>();
    std::thread([r, host, port]() {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo* res = nullptr;
        const int status = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);

        std::lock_guard<std::mutex> lk(r->mtx);
        if (r->abandoned) {
            if (res) freeaddrinfo(res);
            return;
        }
        r->status = status;
        r->res = res;
        r->done = true;
        r->cv.notify_one();
    }).detach();

    std::unique_lock<std::mutex> lk(r->mtx);
    if (!r->cv.wait_for(lk, std::chrono::milliseconds(remainingMs(deadline)),
                        [&r]() { return r->done; })) {
        r->abandoned = true;
        return EAI_AGAIN;
    }
    *out = r->res;
    return r->status;
}

const char* keyTypeName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "ssh-rsa";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "ssh-dss";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ecdsa-sha2-nistp256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ecdsa-sha2-nistp384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ecdsa-sha2-nistp521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ssh-ed25519";
#endif
        default: return nullptr;
    }
}

std::string lastError(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string("unknown error");
}

} // namespace

Libssh2KeyFetcher::Libssh2KeyFetcher(FetchTimeouts timeouts)
    : timeouts_(timeouts) {
    std::call_once(g_libssh2_init, []() {
        if (libssh2_init(0) != 0) LOGE("libssh2_init failed");
    });
}

int Libssh2KeyFetcher::tcpConnect(const std::string& host, std::uint16_t port,
                                  const QDeadlineTimer& deadline, std::string& err) const {
    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = resolveBefore(host, portStr, deadline, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return -1;
    }

    const int attemptMs = timeouts_.attemptSeconds * 1000;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        const int budgetMs = std::min(attemptMs, remainingMs(deadline));
        if (budgetMs <= 0) break;

        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;

        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = -1;
            if (::poll(&pfd, 1, budgetMs) == 1) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) == 0 && soErr == 0) rc = 0;
            }
        }
        if (rc == 0) {
            // Back to blocking for libssh2, with bounded reads and writes.
            ::fcntl(s, F_SETFL, flags);
            const int ioMs = std::max(1, std::min(attemptMs, remainingMs(deadline)));
            struct timeval tv{};
            tv.tv_sec = ioMs / 1000;
            tv.tv_usec = (ioMs % 1000) * 1000;
            ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            ::setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            freeaddrinfo(res);
            return s;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return -1;
}

bool Libssh2KeyFetcher::fetch(const std::string& host,
                              std::uint16_t port,
                              std::string& out,
                              std::string& err) {
    const QDeadlineTimer deadline(timeouts_.overallMs);

    FetchResources r;
    r.sock = tcpConnect(host, port, deadline, err);
    if (r.sock == -1) {
        if (deadline.hasExpired()) err = kTimeoutError;
        LOGW("Host key fetch failed: %s", err.c_str());
        return false;
    }
    if (deadline.hasExpired()) {
        err = kTimeoutError;
        return false;
    }

    r.session = libssh2_session_init();
    if (!r.session) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(r.session, 1);
    // Whatever the connect left of the overall budget.
    libssh2_session_set_timeout(r.session, std::max(1, remainingMs(deadline)));

    const int rc = libssh2_session_handshake(r.session, r.sock);
    if (rc != 0) {
        if (rc == LIBSSH2_ERROR_TIMEOUT || deadline.hasExpired()) {
            err = kTimeoutError;
        } else {
            err = "SSH handshake failed: " + lastError(r.session);
        }
        LOGW("Host key fetch %s:%u: %s", host.c_str(), static_cast<unsigned>(port), err.c_str());
        return false;
    }
    r.handshaken = true;

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(r.session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err = "Could not obtain host key";
        return false;
    }
    const char* typeName = keyTypeName(keytype);
    if (!typeName) {
        err = "Unsupported host key type " + std::to_string(keytype);
        return false;
    }

    const QByteArray b64 = QByteArray(hostkey, static_cast<qsizetype>(keylen)).toBase64();
    out = host + " " + typeName + " " + b64.toStdString() + "\n";
    return true;
}

} // namespace remotix
