#pragma once

#include <string>
#include "constants.h"

namespace droidrun {

struct HttpClientResponse {
    int status_code = 0;
    std::string body;
};

// host:port pair, parsed from "host:port" or "http://host:port"
struct Endpoint {
    std::string host;
    int port = 0;

    std::string url() const { return "http://" + host + ":" + std::to_string(port); }
};

// Throws TaskError(BAD_REQUEST) on malformed input
Endpoint parse_endpoint(const std::string& text);

// Minimal blocking HTTP/1.1 client, one connection per request.
// Connection failures and timeouts throw TaskError(TRANSPORT_ERROR).
class HttpClient {
public:
    explicit HttpClient(Endpoint endpoint,
                        int connect_timeout_ms = WORKER_CONNECT_TIMEOUT_MS,
                        int io_timeout_ms = WORKER_IO_TIMEOUT_MS);

    HttpClientResponse get(const std::string& target);
    HttpClientResponse post(const std::string& target, const std::string& body);

    const Endpoint& endpoint() const { return endpoint_; }

    static HttpClientResponse parse_response(const std::string& raw);

private:
    Endpoint endpoint_;
    int connect_timeout_ms_;
    int io_timeout_ms_;

    HttpClientResponse send_request(const std::string& request);
    int connect_socket();
};

} // namespace droidrun
