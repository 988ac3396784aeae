#pragma once

#include "tus/network/http_parser.hpp"
#include "tus/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace tus {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted client connection
 *
 * Owns its socket and parser and keeps itself alive through
 * shared_from_this() while an async read or write is pending. Requests on
 * one connection are served strictly in order; HTTP/1.1 connections stay
 * open until the client closes them or sends "Connection: close".
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();

    /**
     * @brief Feed bytes to the parser and dispatch a completed request
     *
     * Bytes past the end of the current request are kept in pending_ and
     * parsed after the response has been written.
     */
    void consume(const char* data, std::size_t len);

    void dispatch(HttpRequest request);

    void do_write(const HttpResponse& response, bool keep_alive);

    void handle_error(const std::string& message);

    static bool wants_keep_alive(const HttpRequest& request);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
    std::string pending_;
};

/**
 * @brief Event-driven HTTP server on a Boost.Asio io_context
 *
 * The handler runs on whichever thread is executing io_context::run(); the
 * server itself holds no locks, so running the context from several
 * threads serves several connections in parallel.
 *
 * Usage:
 * ```cpp
 * asio::io_context io;
 * HttpServerAsio server(io, "0.0.0.0", 1080);
 * server.set_handler([&](const HttpRequest& req) { return handler.dispatch(req); });
 * io.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param port 0 picks an ephemeral port; see get_port()
     * @throws boost::system::system_error if the address cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& address,
                   uint16_t port,
                   std::size_t max_body_size = 64 * 1024 * 1024);

    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Stop accepting new connections
     */
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_size_;
    uint16_t port_;
};

} // namespace network
} // namespace tus
