#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>

namespace droidrun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;    // Without the query string
    std::string query;   // Raw text after '?', still url-encoded
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Decoded value of one query parameter, empty if absent
    std::string query_param(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP server - no external dependencies
class HttpServer {
public:
    explicit HttpServer(int port, const std::string& host = "0.0.0.0");
    ~HttpServer();

    // Register route handlers. A path ending in '/' also matches as a prefix.
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks)
    void start();

    // Stop accepting and wait for in-flight connections to finish
    void stop();

    // Port actually bound (differs from the constructor's when it was 0)
    int port() const { return bound_port_.load(); }
    bool listening() const { return running_.load(); }

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    int port_;
    std::string host_;
    int server_fd_;
    std::atomic<bool> running_;
    std::atomic<int> bound_port_;
    std::atomic<int> active_connections_;
    std::map<std::string, HandlerFunc> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
    HttpResponse dispatch(const HttpRequest& req);
};

// URL encoding for query parameters
std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// Writes the whole buffer to a socket, retrying on short writes
bool write_all(int fd, const std::string& data);

} // namespace droidrun
