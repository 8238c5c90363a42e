#pragma once

#include <stdexcept>
#include <string>

namespace droidrun {

// Failure kinds that cross a service boundary. Build and run failures are
// not here: they become an Error task status, never a transport-level error.
enum class ErrorCode {
    WORKER_BUSY,            // Worker already holds its build/run lock
    UNKNOWN_TICKET,         // Ticket absent from the store or registry
    NO_WORKER_AVAILABLE,    // Balancer could not reach any worker
    PROJECT_MISCONFIGURED,  // Project missing from config or on disk
    BAD_REQUEST,            // Malformed or incomplete request
    WRONG_WORKER,           // Poll addressed to a different worker id
    TRANSPORT_ERROR,        // Network failure or timeout between services
    INTERNAL                // Anything else
};

class TaskError : public std::runtime_error {
public:
    // request_sent is false only when the failure happened before any byte
    // of the request left this process (resolve or connect failed)
    TaskError(ErrorCode code, const std::string& message, bool request_sent = true)
        : std::runtime_error(message), code_(code), request_sent_(request_sent) {}

    ErrorCode code() const { return code_; }

    // False when the peer cannot have acted on the request
    bool request_sent() const { return request_sent_; }

private:
    ErrorCode code_;
    bool request_sent_;
};

// Wire name carried in the "error" field of a failed response
std::string error_code_to_string(ErrorCode code);

// Inverse of error_code_to_string; unknown names map to INTERNAL
ErrorCode error_code_from_string(const std::string& name);

// HTTP status used when the error is returned by a route handler
int error_code_to_http_status(ErrorCode code);

} // namespace droidrun
