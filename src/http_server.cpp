#include "http_server.h"
#include "constants.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <chrono>

namespace droidrun {

namespace {

const char* kPayloadTooLarge =
    "HTTP/1.1 413 Payload Too Large\r\n"
    "Content-Type: application/json\r\n"
    "Content-Length: 53\r\n\r\n"
    "{\"payload\":\"Request too large\",\"error\":\"bad_request\"}";

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Content-Length from a raw header block, or -1 if absent/invalid
long long find_content_length(const std::string& headers) {
    std::istringstream stream(headers);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (!iequals(line.substr(0, colon), "Content-Length")) continue;
        try {
            return std::stoll(line.substr(colon + 1));
        } catch (const std::exception&) {
            return -1;
        }
    }
    return -1;
}

} // namespace

std::string HttpRequest::query_param(const std::string& name) const {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        if (key == name) {
            return eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
        }
        pos = amp + 1;
    }
    return "";
}

HttpServer::HttpServer(int port, const std::string& host)
    : port_(port), host_(host), server_fd_(-1), running_(false),
      bound_port_(port), active_connections_(0) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::start() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Invalid bind address: " + host_);
    }

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(server_fd_, (struct sockaddr*)&addr, &addr_len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    std::cout << "[Http] Listening on " << host_ << ":" << bound_port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_ && errno == EINTR) continue;
            if (running_) continue;
            break;
        }

        char ip_buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf));
        std::string client_ip = ip_buf;

        // Handle in new thread (simple concurrency)
        ++active_connections_;
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
            --active_connections_;
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    // Handlers capture services owned by the caller; let them drain
    for (int i = 0; i < 500 && active_connections_ > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;
    size_t expected_size = 0;

    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        request_data.append(buffer, bytes_read);
        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, kPayloadTooLarge);
            return;
        }

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        long long content_length = find_content_length(request_data.substr(0, header_end));
        if (content_length < 0) break;  // No body

        expected_size = header_end + 4 + static_cast<size_t>(content_length);
        if (expected_size > MAX_REQUEST_SIZE) {
            write_all(client_fd, kPayloadTooLarge);
            return;
        }
        if (request_data.size() >= expected_size) break;
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);
    if (!write_all(client_fd, build_response(resp))) {
        std::cerr << "[Http] Client " << client_ip << " went away before the response for "
                  << req.method << " " << req.path << std::endl;
    }
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) {
    HttpResponse resp;

    // Check for exact match, then for prefix routes ("/download/" style)
    const HandlerFunc* handler = nullptr;
    auto it = routes_.find(req.method + " " + req.path);
    if (it != routes_.end()) {
        handler = &it->second;
    } else {
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);

            if (method == req.method && !path_pattern.empty() &&
                path_pattern.back() == '/' && req.path.find(path_pattern) == 0) {
                handler = &candidate;
                break;
            }
        }
    }

    if (!handler) {
        resp.status_code = 404;
        resp.body = "{\"payload\":\"Not found\",\"error\":\"bad_request\"}";
        return resp;
    }

    try {
        resp = (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[Http] Handler for " << req.method << " " << req.path
                  << " failed: " << e.what() << std::endl;
        resp = HttpResponse();
        resp.status_code = 500;
        resp.body = "{\"payload\":\"Internal error\",\"error\":\"internal\"}";
    }
    return resp;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t question = target.find('?');
        if (question != std::string::npos) {
            req.path = target.substr(0, question);
            req.query = target.substr(question + 1);
        } else {
            req.path = target;
        }
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
            req.headers[key] = value;
        }
    }

    // Rest is body, bounded by Content-Length when present
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
        long long content_length = find_content_length(head);
        if (content_length >= 0 && static_cast<size_t>(content_length) < req.body.size()) {
            req.body.resize(static_cast<size_t>(content_length));
        }
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

std::string url_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            decoded += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            decoded += c;
        }
    }
    return decoded;
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace droidrun
