#pragma once

#include <string>
#include <functional>
#include <json/json.h>
#include "http_server.h"
#include "errors.h"

namespace droidrun {

// Parse a JSON document; throws TaskError(BAD_REQUEST) on malformed input
Json::Value parse_json(const std::string& text);

// Compact single-line JSON
std::string write_json(const Json::Value& value);

// Arguments of a request: the url-encoded "request" query parameter for
// GET, the body for POST. Always a JSON object.
Json::Value request_args(const HttpRequest& req);

// Required string member; throws TaskError(BAD_REQUEST) if missing
std::string require_string(const Json::Value& args, const std::string& key);

// {"payload": payload}
HttpResponse json_response(const Json::Value& payload, int status_code = 200);

// {"payload": message, "error": code}
HttpResponse error_response(ErrorCode code, const std::string& message);
HttpResponse error_response(const TaskError& error);

// The "payload" of a {"payload": ...} response. A non-200 status or an
// "error" member becomes TaskError with that code; an unreadable body is
// TaskError(TRANSPORT_ERROR).
Json::Value unwrap_payload(int status_code, const std::string& body);

// GET target carrying args as ?request=<url-encoded JSON>
std::string get_target(const std::string& path, const Json::Value& args);

// Runs a route body, turning a thrown TaskError into its error response.
// Other exceptions are left to the server's 500 handler.
HttpResponse with_task_errors(const std::function<HttpResponse()>& body);

} // namespace droidrun
