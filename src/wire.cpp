#include "wire.h"

#include <memory>
#include <sstream>

namespace droidrun {

Json::Value parse_json(const std::string& text) {
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);

    if (!Json::parseFromStream(builder, stream, &json, &errors)) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Malformed JSON: " + errors);
    }
    return json;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value request_args(const HttpRequest& req) {
    std::string text = req.method == "GET" ? req.query_param("request") : req.body;
    if (text.empty()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Missing request arguments");
    }

    Json::Value args = parse_json(text);
    if (!args.isObject()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Request arguments must be an object");
    }
    return args;
}

std::string require_string(const Json::Value& args, const std::string& key) {
    const Json::Value& value = args[key];
    if (!value.isString() || value.asString().empty()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Must specify " + key);
    }
    return value.asString();
}

HttpResponse json_response(const Json::Value& payload, int status_code) {
    HttpResponse resp;
    Json::Value body;
    body["payload"] = payload;
    resp.status_code = status_code;
    resp.body = write_json(body);
    return resp;
}

HttpResponse error_response(ErrorCode code, const std::string& message) {
    HttpResponse resp;
    Json::Value body;
    body["payload"] = message;
    body["error"] = error_code_to_string(code);
    resp.status_code = error_code_to_http_status(code);
    resp.body = write_json(body);
    return resp;
}

HttpResponse error_response(const TaskError& error) {
    return error_response(error.code(), error.what());
}

Json::Value unwrap_payload(int status_code, const std::string& body) {
    Json::Value json;
    try {
        json = parse_json(body);
    } catch (const TaskError&) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR,
                        "Unreadable response (HTTP " + std::to_string(status_code) + ")");
    }
    if (!json.isObject()) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, "Response is not a JSON object");
    }

    if (status_code != 200 || json.isMember("error")) {
        ErrorCode code = json["error"].isString() ? error_code_from_string(json["error"].asString())
                                                  : ErrorCode::INTERNAL;
        std::string message = json["payload"].isString()
            ? json["payload"].asString()
            : "Request failed (HTTP " + std::to_string(status_code) + ")";
        throw TaskError(code, message);
    }
    return json["payload"];
}

std::string get_target(const std::string& path, const Json::Value& args) {
    return path + "?request=" + url_encode(write_json(args));
}

HttpResponse with_task_errors(const std::function<HttpResponse()>& body) {
    try {
        return body();
    } catch (const TaskError& e) {
        return error_response(e);
    }
}

} // namespace droidrun
