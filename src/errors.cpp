#include "errors.h"

namespace droidrun {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::WORKER_BUSY: return "worker_locked";
        case ErrorCode::UNKNOWN_TICKET: return "unknown_ticket";
        case ErrorCode::NO_WORKER_AVAILABLE: return "no_worker_available";
        case ErrorCode::PROJECT_MISCONFIGURED: return "project_misconfigured";
        case ErrorCode::BAD_REQUEST: return "bad_request";
        case ErrorCode::WRONG_WORKER: return "wrong_worker";
        case ErrorCode::TRANSPORT_ERROR: return "transport_error";
        case ErrorCode::INTERNAL: return "internal";
    }
    return "internal";
}

ErrorCode error_code_from_string(const std::string& name) {
    if (name == "worker_locked") return ErrorCode::WORKER_BUSY;
    if (name == "unknown_ticket") return ErrorCode::UNKNOWN_TICKET;
    if (name == "no_worker_available") return ErrorCode::NO_WORKER_AVAILABLE;
    if (name == "project_misconfigured") return ErrorCode::PROJECT_MISCONFIGURED;
    if (name == "bad_request") return ErrorCode::BAD_REQUEST;
    if (name == "wrong_worker") return ErrorCode::WRONG_WORKER;
    if (name == "transport_error") return ErrorCode::TRANSPORT_ERROR;
    return ErrorCode::INTERNAL;
}

int error_code_to_http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::BAD_REQUEST: return 400;
        case ErrorCode::UNKNOWN_TICKET: return 404;
        case ErrorCode::TRANSPORT_ERROR: return 502;
        case ErrorCode::NO_WORKER_AVAILABLE: return 503;
        case ErrorCode::WORKER_BUSY:
        case ErrorCode::PROJECT_MISCONFIGURED:
        case ErrorCode::WRONG_WORKER:
        case ErrorCode::INTERNAL:
            return 500;
    }
    return 500;
}

} // namespace droidrun
