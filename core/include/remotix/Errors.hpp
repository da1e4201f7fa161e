// Exceptions raised by the session layer (registry and operation queues).
// Transports themselves report failures as bool + message; the registry
// converts those into TransportError on the caller's future.
#pragma once
#include <stdexcept>
#include <string>

namespace remotix {

class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& what) : std::runtime_error(what) {}
};

// Bad parameters or authentication failure while opening a session.
class ConnectionError : public RemoteError {
public:
    explicit ConnectionError(const std::string& what) : RemoteError(what) {}
};

// Operation addressed to a connection id with no live session.
class NotConnectedError : public RemoteError {
public:
    explicit NotConnectedError(const std::string& id)
        : RemoteError("Not connected: " + id), id_(id) {}
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

// Failure reported by the transport while running a queued operation.
class TransportError : public RemoteError {
public:
    explicit TransportError(const std::string& what) : RemoteError(what) {}
};

// Queued operation dropped because its connection was closed first.
class ConnectionClosedError : public RemoteError {
public:
    explicit ConnectionClosedError(const std::string& what) : RemoteError(what) {}
};

} // namespace remotix
