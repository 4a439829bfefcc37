#ifndef FRAGNET_NETWORK_ERROR_HPP
#define FRAGNET_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fragnet {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    CONNECTION_FAILED,
    CONNECTION_LOST,
    INVALID_MESSAGE,
    TIMEOUT,
    UNKNOWN_ERROR
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::CONNECTION_FAILED: return "Connection failed";
        case NetworkError::CONNECTION_LOST: return "Connection lost";
        case NetworkError::INVALID_MESSAGE: return "Invalid message";
        case NetworkError::TIMEOUT: return "Timeout";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

class NetworkException : public std::runtime_error {
public:
    NetworkException(NetworkError code, const std::string& message)
        : std::runtime_error(std::string(network_error_to_string(code)) + ": " + message)
        , code_(code) {}

    NetworkError code() const { return code_; }

private:
    NetworkError code_;
};

// The stream to a peer could not be opened
class PeerUnreachableError : public NetworkException {
public:
    explicit PeerUnreachableError(const std::string& message)
        : NetworkException(NetworkError::CONNECTION_FAILED, message) {}
};

// Bytes on the wire do not form the expected message
class ProtocolError : public NetworkException {
public:
    explicit ProtocolError(const std::string& message)
        : NetworkException(NetworkError::INVALID_MESSAGE, message) {}
};

// A read, write or connect did not complete within the stream's deadline
class TimeoutError : public NetworkException {
public:
    explicit TimeoutError(const std::string& message)
        : NetworkException(NetworkError::TIMEOUT, message) {}
};

} // namespace network
} // namespace fragnet

#endif // FRAGNET_NETWORK_ERROR_HPP
