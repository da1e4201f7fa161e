// Basic types shared by the session registry and the transport backends.
// Kept as plain structures so callers can copy and store them freely.
#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace remotix {

// Transport security for the control connection.
enum class SecurityMode {
    Plain,          // No TLS.
    ImplicitSecure  // TLS from the first byte (implicit FTPS).
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX permission bits
};

// Parameters for opening one remote session. The registry keeps a copy,
// so a session's config never changes after connect.
struct ConnectionConfig {
    std::string host;
    std::uint16_t port = 21;
    std::string username;
    std::optional<std::string> password;
    SecurityMode securityMode = SecurityMode::Plain;
};

inline const char* toString(SecurityMode m) {
    return m == SecurityMode::ImplicitSecure ? "implicit-secure" : "plain";
}

} // namespace remotix
