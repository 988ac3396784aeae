#include "tus/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

#include <strings.h>

namespace tus {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (!ec) {
                consume(buffer_.data(), bytes_transferred);
            } else if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                spdlog::debug("Read error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::consume(const char* data, std::size_t len) {
    auto parse_result = parser_.parse(data, len);

    if (parse_result.is_error()) {
        handle_error("Parse error: " + parse_result.error());
        return;
    }

    if (!parse_result.value()) {
        do_read();
        return;
    }

    std::string rest(data + parser_.consumed(), data + len);
    pending_ = std::move(rest);
    dispatch(parser_.take_request());
}

void HttpConnection::dispatch(HttpRequest request) {
    const bool keep_alive = wants_keep_alive(request);

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }

    spdlog::info("{} {} -> {} ({} body bytes)",
                 HttpMethodUtils::to_string(request.method),
                 request.url,
                 response.status_code,
                 request.body.size());

    do_write(response, keep_alive);
}

void HttpConnection::do_write(const HttpResponse& response, bool keep_alive) {
    auto self = shared_from_this();

    auto data = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data, keep_alive](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }

            spdlog::debug("Sent {} bytes", bytes_transferred);

            if (!keep_alive) {
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
                return;
            }

            parser_.reset();
            if (pending_.empty()) {
                do_read();
                return;
            }

            std::string next;
            next.swap(pending_);
            consume(next.data(), next.size());
        }
    );
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(create_error_response(HttpStatus::BAD_REQUEST, message), false);
}

bool HttpConnection::wants_keep_alive(const HttpRequest& request) {
    const std::string connection = request.get_header("Connection");
    if (request.version == HttpVersion::HTTP_1_0) {
        return strcasecmp(connection.c_str(), "keep-alive") == 0;
    }
    return strcasecmp(connection.c_str(), "close") != 0;
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message + "\n");
    response.set_header("Content-Type", "text/plain");
    response.set_header("Connection", "close");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               const std::string& address,
                               uint16_t port,
                               std::size_t max_body_size)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , max_body_size_(max_body_size)
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server (Asio) listening on {}:{}", address, port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Failed to close acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }

            if (!ec) {
                spdlog::debug("Accepted connection from {}",
                              socket.remote_endpoint(ec).address().to_string());
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_size_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            if (acceptor_.is_open()) {
                do_accept();
            }
        }
    );
}

} // namespace network
} // namespace tus
