#pragma once

#include "fetchd/network/http_parser.hpp"
#include "fetchd/network/http_types.hpp"

#include <array>
#include <functional>
#include <memory>

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace fetchd {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection: read a request, write a response, close
 *
 * Kept alive by the shared_ptr captured in its pending async operations.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
};

/**
 * @brief Event-driven HTTP server on a Boost.Asio io_context
 *
 * The handler runs on whichever thread calls io_context.run(); it must
 * return quickly since it shares those threads with all connections.
 *
 * @code
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 5000);
 * server.set_handler([&router](const HttpRequest& req) { return router.handle_request(req); });
 * io_context.run();
 * @endcode
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context, uint16_t port);

    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Stop accepting new connections
     */
    void stop();

    /**
     * @brief Bound port; differs from the requested one when that was 0
     */
    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace network
} // namespace fetchd
