/**
 * Unit tests for HttpServer
 *
 * Request parsing, query parameters, URL coding and response building.
 */

#include <gtest/gtest.h>
#include "../../src/http_server.h"
#include "../../src/http_client.h"
#include "../../src/errors.h"

using namespace droidrun;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    HttpResponse create_response(int status, const std::string& body) {
        HttpResponse resp;
        resp.status_code = status;
        resp.body = body;
        return resp;
    }
};

// ============================================================================
// Request Parsing
// ============================================================================

TEST_F(HttpServerTest, ParsesValidGetRequest) {
    // Given: A valid HTTP GET request
    std::string raw_request =
        "GET /health HTTP/1.1\r\n"
        "Host: localhost:8080\r\n"
        "User-Agent: curl/7.68.0\r\n"
        "\r\n";

    // When: Request is parsed
    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: Method, path and headers are extracted
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/health");
    EXPECT_TRUE(req.query.empty());
    EXPECT_EQ(req.headers["Host"], "localhost:8080");
    EXPECT_EQ(req.headers["User-Agent"], "curl/7.68.0");
    EXPECT_TRUE(req.body.empty());
}

TEST_F(HttpServerTest, ParsesPostRequestWithBody) {
    // Given: A POST request with a JSON body
    std::string body = "{\"ticket\":\"t1\",\"project\":\"Example\"}";
    std::string raw_request =
        "POST /rest/v1/task HTTP/1.1\r\n"
        "Host: localhost:8080\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;

    // When: Request is parsed
    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: The body is extracted whole
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/rest/v1/task");
    EXPECT_EQ(req.body, body);
}

TEST_F(HttpServerTest, BodyIsBoundedByContentLength) {
    // Given: Extra bytes after the declared body
    std::string raw_request =
        "POST /rest/v1/task HTTP/1.1\r\n"
        "Content-Length: 4\r\n"
        "\r\n"
        "{}{}trailing";

    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: Only Content-Length bytes are kept
    EXPECT_EQ(req.body, "{}{}");
}

TEST_F(HttpServerTest, SplitsQueryStringFromPath) {
    // Given: A status poll carrying its arguments in the query string
    std::string raw_request =
        "GET /rest/v1/task?request=%7B%22ticket%22%3A%22t1%22%7D&x=1 HTTP/1.1\r\n"
        "Host: localhost:8080\r\n"
        "\r\n";

    // When: Request is parsed
    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: Path excludes the query; parameters decode
    EXPECT_EQ(req.path, "/rest/v1/task");
    EXPECT_EQ(req.query, "request=%7B%22ticket%22%3A%22t1%22%7D&x=1");
    EXPECT_EQ(req.query_param("request"), "{\"ticket\":\"t1\"}");
    EXPECT_EQ(req.query_param("x"), "1");
    EXPECT_EQ(req.query_param("missing"), "");
}

TEST_F(HttpServerTest, QueryParamWithoutValue) {
    HttpRequest req;
    req.query = "flag&name=value";
    EXPECT_EQ(req.query_param("flag"), "");
    EXPECT_EQ(req.query_param("name"), "value");
}

// ============================================================================
// URL coding
// ============================================================================

TEST_F(HttpServerTest, UrlEncodeEscapesReservedCharacters) {
    EXPECT_EQ(url_encode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(url_encode("a b"), "a%20b");
    EXPECT_EQ(url_encode("{\"k\":1}"), "%7B%22k%22%3A1%7D");
    EXPECT_EQ(url_encode("a&b=c"), "a%26b%3Dc");
}

TEST_F(HttpServerTest, UrlDecodeHandlesPlusAndMalformedEscapes) {
    EXPECT_EQ(url_decode("a+b"), "a b");
    EXPECT_EQ(url_decode("%41%42"), "AB");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
}

TEST_F(HttpServerTest, UrlCodingRoundTripsJson) {
    std::string json = "{\"patches\":[{\"filename\":\"Example/a.xml\",\"contents\":\"<x a=\\\"1\\\"/>\\n\"}]}";
    EXPECT_EQ(url_decode(url_encode(json)), json);
}

// ============================================================================
// Response Building
// ============================================================================

TEST_F(HttpServerTest, BuildsValidHttpResponse) {
    // Given: A successful response with JSON body
    std::string body = "{\"payload\":\"ok\"}";
    HttpResponse resp = create_response(200, body);

    // When: Response is built
    std::string response = HttpServer::build_response(resp);

    // Then: Proper HTTP structure
    EXPECT_EQ(response.find("HTTP/1.1 200 OK"), 0u) << "Status line";
    EXPECT_NE(response.find("Content-Type: application/json"), std::string::npos);
    EXPECT_NE(response.find("Content-Length: " + std::to_string(body.length())), std::string::npos);
    EXPECT_NE(response.find("Connection: close"), std::string::npos);
    EXPECT_NE(response.find("Access-Control-Allow-Origin: *"), std::string::npos);
    EXPECT_EQ(response.substr(response.size() - body.size()), body);
}

TEST_F(HttpServerTest, MapsStatusCodesToReasonPhrases) {
    EXPECT_EQ(HttpServer::status_text(200), "OK");
    EXPECT_EQ(HttpServer::status_text(400), "Bad Request");
    EXPECT_EQ(HttpServer::status_text(404), "Not Found");
    EXPECT_EQ(HttpServer::status_text(413), "Payload Too Large");
    EXPECT_EQ(HttpServer::status_text(500), "Internal Server Error");
    EXPECT_EQ(HttpServer::status_text(502), "Bad Gateway");
    EXPECT_EQ(HttpServer::status_text(503), "Service Unavailable");
}

// ============================================================================
// Client-side parsing
// ============================================================================

TEST_F(HttpServerTest, ClientParsesServerResponse) {
    // Given: What the server writes for an error
    HttpResponse resp = create_response(404, "{\"payload\":\"Unknown ticket zzz\",\"error\":\"unknown_ticket\"}");

    // When: The client parses it back
    HttpClientResponse parsed = HttpClient::parse_response(HttpServer::build_response(resp));

    // Then: Status and body survive
    EXPECT_EQ(parsed.status_code, 404);
    EXPECT_EQ(parsed.body, resp.body);
}

TEST_F(HttpServerTest, ParsesEndpoints) {
    Endpoint plain = parse_endpoint("10.0.0.5:8080");
    EXPECT_EQ(plain.host, "10.0.0.5");
    EXPECT_EQ(plain.port, 8080);

    Endpoint url = parse_endpoint("http://worker-1:9000/");
    EXPECT_EQ(url.host, "worker-1");
    EXPECT_EQ(url.port, 9000);
    EXPECT_EQ(url.url(), "http://worker-1:9000");

    EXPECT_THROW(parse_endpoint("no-port"), TaskError);
    EXPECT_THROW(parse_endpoint("host:abc"), TaskError);
    EXPECT_THROW(parse_endpoint("host:70000"), TaskError);
}
