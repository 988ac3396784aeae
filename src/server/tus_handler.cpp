#include "tus/server/tus_handler.hpp"
#include "tus/upload/metadata.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace tus {
namespace server {

using network::HttpContext;
using network::HttpMethod;
using network::HttpMethodUtils;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

std::optional<std::uint64_t> parse_unsigned(const std::string& text) {
    std::uint64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

// Media type without parameters, lowercased
std::string media_type(const std::string& content_type) {
    std::string type = content_type.substr(0, content_type.find(';'));
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back()))) {
        type.pop_back();
    }
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return type;
}

HttpResponse plain(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "text/plain");
    response.set_body(message + "\n");
    return response;
}

} // namespace

TusHandler::TusHandler(upload::UploadService& service)
    : service_(service) {
    register_routes();
}

void TusHandler::register_routes() {
    const std::string base = service_.config().upload_url;
    const std::string bare = base.size() > 1 ? base.substr(0, base.size() - 1) : base;
    const std::string resource = base + ":id";

    for (const auto& collection : {base, bare}) {
        router_.options(collection, [this](const HttpContext& ctx) { return handle_options(ctx); });
        router_.post(collection, [this](const HttpContext& ctx) { return handle_create(ctx); });
        router_.get(collection, [this](const HttpContext& ctx) { return handle_probe(ctx); });
        if (base == bare) {
            break;
        }
    }

    router_.options(resource, [this](const HttpContext& ctx) { return handle_options(ctx); });
    router_.head(resource, [this](const HttpContext& ctx) { return handle_status(ctx); });
    router_.patch(resource, [this](const HttpContext& ctx) { return handle_append(ctx); });
    router_.delete_(resource, [this](const HttpContext& ctx) { return handle_terminate(ctx); });
}

HttpResponse TusHandler::dispatch(const HttpRequest& request) const {
    HttpRequest effective = request;
    HttpResponse response;

    const std::string override_method = request.get_header("X-HTTP-Method-Override");
    if (!override_method.empty()) {
        effective.method = HttpMethodUtils::from_string(to_upper(override_method));
    }

    if (effective.method == HttpMethod::UNKNOWN) {
        response = plain(HttpStatus::BAD_REQUEST, "Unsupported method override: " + override_method);
    } else if (effective.method != HttpMethod::OPTIONS &&
               request.get_header("Tus-Resumable") != kTusResumable) {
        spdlog::warn("Rejected {} {}: unsupported Tus-Resumable '{}'",
                     HttpMethodUtils::to_string(effective.method), request.url,
                     request.get_header("Tus-Resumable"));
        response = plain(HttpStatus::PRECONDITION_FAILED, "Unsupported tus protocol version");
    } else {
        response = router_.handle_request(effective);
    }

    if (effective.method == HttpMethod::HEAD) {
        response.body.clear();
        response.headers.erase("Content-Length");
    }
    add_capability_headers(response);
    return response;
}

void TusHandler::add_capability_headers(HttpResponse& response) const {
    response.set_header("Tus-Resumable", kTusResumable);
    response.set_header("Tus-Version", kTusResumable);
    response.set_header("Tus-Extension", kTusExtensions);
    response.set_header("Tus-Max-Size", std::to_string(service_.config().max_file_size));
    response.set_header("Cache-Control", "no-store");
    response.set_header("Access-Control-Allow-Origin", "*");
    response.set_header("Access-Control-Allow-Methods", "PATCH,HEAD,GET,POST,DELETE,OPTIONS");
    response.set_header("Access-Control-Allow-Headers",
                        "Tus-Resumable,Upload-Length,Upload-Metadata,Upload-Offset,Content-Type,"
                        "X-HTTP-Method-Override,Message-Id");
    response.set_header("Access-Control-Expose-Headers",
                        "Tus-Resumable,Tus-Version,Tus-Extension,Tus-Max-Size,Upload-Length,"
                        "Upload-Metadata,Upload-Offset,Location,Tus-File-Exists,Tus-File-Name");
}

HttpStatus TusHandler::status_for(const Error& error, HttpMethod method) {
    switch (error.code) {
        case ErrorCode::ProtocolViolation: return HttpStatus::BAD_REQUEST;
        case ErrorCode::Conflict: return HttpStatus::CONFLICT;
        case ErrorCode::Gone: return method == HttpMethod::HEAD ? HttpStatus::NOT_FOUND : HttpStatus::GONE;
        case ErrorCode::TooLarge: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::InternalError: return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse TusHandler::error_response(const Error& error, HttpMethod method) {
    const auto status = status_for(error, method);
    if (status == HttpStatus::INTERNAL_SERVER_ERROR) {
        spdlog::error("{} failed: {}", HttpMethodUtils::to_string(method), error.message);
        return plain(status, "Internal server error");
    }
    spdlog::debug("{} rejected ({}): {}", HttpMethodUtils::to_string(method), to_string(error.code), error.message);
    return plain(status, error.message);
}

std::string TusHandler::location_for(const HttpRequest& request, const std::string& resource_id) const {
    const std::string path = service_.config().upload_url + resource_id;
    const std::string host = request.get_header("Host");
    if (host.empty()) {
        return path;
    }
    return "http://" + host + path;
}

HttpResponse TusHandler::handle_options(const HttpContext&) const {
    return HttpResponse(HttpStatus::NO_CONTENT);
}

HttpResponse TusHandler::handle_create(const HttpContext& ctx) const {
    const auto& request = ctx.request;

    if (request.has_header("Upload-Defer-Length")) {
        return plain(HttpStatus::BAD_REQUEST, "Upload-Defer-Length is not supported");
    }

    const auto length = parse_unsigned(request.get_header("Upload-Length"));
    if (!length) {
        return plain(HttpStatus::BAD_REQUEST, "Missing or invalid Upload-Length");
    }

    upload::Metadata metadata;
    if (request.has_header("Upload-Metadata")) {
        auto parsed = upload::parse_metadata(request.get_header("Upload-Metadata"));
        if (parsed.is_error()) {
            return error_response(parsed.error(), request.method);
        }
        metadata = std::move(parsed.value());
    }

    const std::string message_id = request.get_header("Message-Id");
    if (!message_id.empty()) {
        auto decoded = upload::decode_base64(message_id);
        if (decoded.is_error()) {
            return plain(HttpStatus::BAD_REQUEST, "Invalid Message-Id: " + decoded.error());
        }
        metadata["message_id"] = decoded.value();
    }

    auto it = metadata.find("filename");
    const std::string filename = it == metadata.end() ? "" : it->second;

    auto created = service_.create_upload(filename, *length, metadata);
    if (created.is_error()) {
        return error_response(created.error(), request.method);
    }

    HttpResponse response(HttpStatus::CREATED);
    response.set_header("Location", location_for(request, created.value()));
    return response;
}

HttpResponse TusHandler::handle_probe(const HttpContext& ctx) const {
    const auto& request = ctx.request;

    std::string filename;
    if (request.has_header("Upload-Metadata")) {
        auto parsed = upload::parse_metadata(request.get_header("Upload-Metadata"));
        if (parsed.is_error()) {
            return error_response(parsed.error(), request.method);
        }
        auto it = parsed.value().find("filename");
        if (it != parsed.value().end()) {
            filename = it->second;
        }
    }

    const auto probe = service_.probe_existence(filename);

    HttpResponse response(HttpStatus::OK);
    response.set_header("Tus-File-Exists", probe.exists ? "true" : "false");
    if (probe.exists) {
        response.set_header("Tus-File-Name", probe.filename);
    }
    return response;
}

HttpResponse TusHandler::handle_status(const HttpContext& ctx) const {
    auto status = service_.status(ctx.get_param("id"));
    if (status.is_error()) {
        return error_response(status.error(), HttpMethod::HEAD);
    }

    HttpResponse response(HttpStatus::OK);
    response.set_header("Upload-Offset", std::to_string(status.value().offset));
    response.set_header("Upload-Length", std::to_string(status.value().total_size));
    if (!status.value().metadata.empty()) {
        response.set_header("Upload-Metadata", upload::format_metadata(status.value().metadata));
    }
    return response;
}

HttpResponse TusHandler::handle_append(const HttpContext& ctx) const {
    const auto& request = ctx.request;

    if (media_type(request.get_header("Content-Type")) != kOffsetContentType) {
        return plain(HttpStatus::UNSUPPORTED_MEDIA_TYPE,
                     std::string("Content-Type must be ") + kOffsetContentType);
    }

    const auto offset = parse_unsigned(request.get_header("Upload-Offset"));
    if (!offset) {
        return plain(HttpStatus::BAD_REQUEST, "Missing or invalid Upload-Offset");
    }

    auto appended = service_.append(ctx.get_param("id"), *offset, request.body);
    if (appended.is_error()) {
        return error_response(appended.error(), request.method);
    }

    HttpResponse response(HttpStatus::NO_CONTENT);
    response.set_header("Upload-Offset", std::to_string(appended.value()));
    return response;
}

HttpResponse TusHandler::handle_terminate(const HttpContext& ctx) const {
    auto terminated = service_.terminate(ctx.get_param("id"));
    if (terminated.is_error()) {
        return error_response(terminated.error(), ctx.request.method);
    }
    return HttpResponse(HttpStatus::NO_CONTENT);
}

} // namespace server
} // namespace tus
