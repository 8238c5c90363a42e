#include "http_client.h"
#include "http_server.h"
#include "errors.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace droidrun {

namespace {

void set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    fcntl(fd, F_SETFL, blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK));
}

// Closes the socket on every exit path
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) close(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

Endpoint parse_endpoint(const std::string& text) {
    std::string rest = text;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    }
    while (!rest.empty() && rest.back() == '/') rest.pop_back();

    size_t colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == rest.size()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Endpoint must be host:port, got: " + text);
    }

    Endpoint endpoint;
    endpoint.host = rest.substr(0, colon);
    try {
        endpoint.port = std::stoi(rest.substr(colon + 1));
    } catch (const std::exception&) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Invalid port in endpoint: " + text);
    }
    if (endpoint.port <= 0 || endpoint.port > 65535) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Port out of range in endpoint: " + text);
    }
    return endpoint;
}

HttpClient::HttpClient(Endpoint endpoint, int connect_timeout_ms, int io_timeout_ms)
    : endpoint_(std::move(endpoint)),
      connect_timeout_ms_(connect_timeout_ms),
      io_timeout_ms_(io_timeout_ms) {}

HttpClientResponse HttpClient::get(const std::string& target) {
    std::ostringstream request;
    request << "GET " << target << " HTTP/1.1\r\n"
            << "Host: " << endpoint_.host << ":" << endpoint_.port << "\r\n"
            << "Accept: application/json\r\n"
            << "Connection: close\r\n"
            << "\r\n";
    return send_request(request.str());
}

HttpClientResponse HttpClient::post(const std::string& target, const std::string& body) {
    std::ostringstream request;
    request << "POST " << target << " HTTP/1.1\r\n"
            << "Host: " << endpoint_.host << ":" << endpoint_.port << "\r\n"
            << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n"
            << "Connection: close\r\n"
            << "\r\n"
            << body;
    return send_request(request.str());
}

int HttpClient::connect_socket() {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(endpoint_.port);
    int rc = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR,
                        "Unable to resolve " + endpoint_.host + ": " + gai_strerror(rc), false);
    }

    int fd = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (fd < 0) {
        freeaddrinfo(result);
        throw TaskError(ErrorCode::TRANSPORT_ERROR, "Failed to create socket", false);
    }

    // Non-blocking connect so the connect timeout is enforced
    set_blocking(fd, false);
    rc = connect(fd, result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);

    if (rc < 0 && errno != EINPROGRESS) {
        close(fd);
        throw TaskError(ErrorCode::TRANSPORT_ERROR, "Unable to connect to " + endpoint_.url(), false);
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        rc = poll(&pfd, 1, connect_timeout_ms_);
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (rc <= 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            close(fd);
            throw TaskError(ErrorCode::TRANSPORT_ERROR,
                            "Timed out connecting to " + endpoint_.url(), false);
        }
    }
    set_blocking(fd, true);

    struct timeval tv;
    tv.tv_sec = io_timeout_ms_ / 1000;
    tv.tv_usec = (io_timeout_ms_ % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    return fd;
}

HttpClientResponse HttpClient::send_request(const std::string& request) {
    SocketGuard sock(connect_socket());

    if (!write_all(sock.get(), request)) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, "Failed to send request to " + endpoint_.url());
    }

    std::string response;
    char buffer[PIPE_BUFFER_SIZE];
    while (true) {
        ssize_t n = recv(sock.get(), buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TaskError(ErrorCode::TRANSPORT_ERROR,
                            "Timed out reading response from " + endpoint_.url());
        }
        if (n == 0) break;

        response.append(buffer, static_cast<size_t>(n));
        if (response.size() > MAX_RESPONSE_SIZE) {
            throw TaskError(ErrorCode::TRANSPORT_ERROR, "Response too large from " + endpoint_.url());
        }

        // Stop once Content-Length bytes of body have arrived
        size_t header_end = response.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;
        HttpRequest head = HttpServer::parse_request(response.substr(0, header_end + 4));
        auto it = head.headers.find("Content-Length");
        if (it != head.headers.end()) {
            size_t content_length = 0;
            try {
                content_length = std::stoul(it->second);
            } catch (const std::exception&) {
                throw TaskError(ErrorCode::TRANSPORT_ERROR, "Malformed Content-Length");
            }
            if (response.size() >= header_end + 4 + content_length) break;
        }
    }

    if (response.empty()) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, "Empty response from " + endpoint_.url());
    }
    return parse_response(response);
}

HttpClientResponse HttpClient::parse_response(const std::string& raw) {
    HttpClientResponse resp;

    size_t line_end = raw.find("\r\n");
    std::string status_line = raw.substr(0, line_end);
    size_t space = status_line.find(' ');
    if (status_line.compare(0, 5, "HTTP/") != 0 || space == std::string::npos) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, "Malformed HTTP status line");
    }
    try {
        resp.status_code = std::stoi(status_line.substr(space + 1, 3));
    } catch (const std::exception&) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, "Malformed HTTP status code");
    }

    // Reuse the request parser for headers and body; it ignores the first line
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end != std::string::npos) {
        HttpRequest parsed = HttpServer::parse_request(raw);
        resp.body = parsed.body;
    }
    return resp;
}

} // namespace droidrun
