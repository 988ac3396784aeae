#pragma once

/**
 * @file tus_handler.hpp
 * @brief Maps tus 1.0.0 HTTP requests onto UploadService
 *
 * ROUTES (base = UploadConfig::upload_url, e.g. "/files/"):
 *   OPTIONS <base>, <base><id>   capability discovery        204
 *   POST    <base>               create                      201 + Location
 *   GET     <base>               file-check probe            200 + Tus-File-Exists
 *   HEAD    <base><id>           status                      200 + Upload-Offset, Upload-Length
 *   PATCH   <base><id>           append                      204 + Upload-Offset
 *   DELETE  <base><id>           terminate                   204
 *
 * Every response carries the capability headers (Tus-Resumable,
 * Tus-Version, Tus-Extension, Tus-Max-Size), Cache-Control: no-store and
 * the CORS headers browsers need to read them.
 */

#include "tus/core/error.hpp"
#include "tus/network/http_router.hpp"
#include "tus/network/http_types.hpp"
#include "tus/upload/service.hpp"

#include <string>

namespace tus {
namespace server {

class TusHandler {
public:
    static constexpr const char* kTusResumable = "1.0.0";
    static constexpr const char* kTusExtensions = "creation,termination,file-check";
    static constexpr const char* kOffsetContentType = "application/offset+octet-stream";

    explicit TusHandler(upload::UploadService& service);

    TusHandler(const TusHandler&) = delete;
    TusHandler& operator=(const TusHandler&) = delete;

    /**
     * @brief Entry point for the HTTP server
     *
     * Applies X-HTTP-Method-Override, enforces Tus-Resumable on everything
     * but OPTIONS, routes the request and decorates the response.
     */
    network::HttpResponse dispatch(const network::HttpRequest& request) const;

    const network::HttpRouter& router() const { return router_; }

    /**
     * @brief HTTP status for an upload-core failure
     *
     * Gone maps to 404 for HEAD (the status probe) and 410 otherwise.
     */
    static network::HttpStatus status_for(const Error& error, network::HttpMethod method);

private:
    void register_routes();

    network::HttpResponse handle_options(const network::HttpContext& ctx) const;
    network::HttpResponse handle_create(const network::HttpContext& ctx) const;
    network::HttpResponse handle_probe(const network::HttpContext& ctx) const;
    network::HttpResponse handle_status(const network::HttpContext& ctx) const;
    network::HttpResponse handle_append(const network::HttpContext& ctx) const;
    network::HttpResponse handle_terminate(const network::HttpContext& ctx) const;

    void add_capability_headers(network::HttpResponse& response) const;

    std::string location_for(const network::HttpRequest& request, const std::string& resource_id) const;

    static network::HttpResponse error_response(const Error& error, network::HttpMethod method);

    upload::UploadService& service_;
    network::HttpRouter router_;
};

} // namespace server
} // namespace tus
