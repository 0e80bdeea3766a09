#include "telemetry/HttpServer.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <iostream>
#include <thread>

using namespace tandem;
namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

HttpServer::HttpServer(uint16_t port, const TelemetryState& telemetry,
                       const std::atomic<bool>& running, std::chrono::milliseconds io_timeout)
    : port_(port), telemetry_(telemetry), running_(running), io_timeout_(io_timeout) {}

HttpServer::Reply HttpServer::handle(const std::string& method, const std::string& target) const {
    if (method != "GET")
        return {405, "text/plain", "method not allowed\n"};

    const std::string path = target.substr(0, target.find('?'));
    if (path == "/metrics")
        return {200, "text/plain; version=0.0.4", telemetry_.to_prometheus()};
    if (path == "/health")
        return {200, "text/plain", running_.load() ? "ok\n" : "stopping\n"};
    if (path == "/" || path == "/snapshot")
        return {200, "application/json", telemetry_.to_json()};
    return {404, "text/plain", "not found\n"};
}

void HttpServer::run() {
    try {
        asio::io_context ioc;
        tcp::acceptor acceptor(ioc, {tcp::v4(), port_});
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.non_blocking(true);
        bound_port_.store(acceptor.local_endpoint().port());

        std::cout << "[TELEMETRY] Listening on " << bound_port_.load() << "\n";

        while (running_.load()) {
            tcp::socket socket(ioc);
            beast::error_code ec;
            acceptor.accept(socket, ec);

            if (ec == asio::error::would_block) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (ec) continue;

            // tcp_stream deadlines only apply to async operations, so each
            // one is driven to completion on ioc.
            beast::tcp_stream stream(std::move(socket));
            beast::flat_buffer buffer;
            http::request<http::string_body> req;

            stream.expires_after(io_timeout_);
            http::async_read(stream, buffer, req,
                             [&ec](beast::error_code e, std::size_t) { ec = e; });
            ioc.restart();
            ioc.run();
            if (ec) {
                std::cerr << "[TELEMETRY] Bad request: " << ec.message() << "\n";
                continue;
            }

            const Reply r = handle(std::string(req.method_string()), std::string(req.target()));

            http::response<http::string_body> res;
            res.version(req.version());
            res.result(static_cast<http::status>(r.status));
            res.set(http::field::server, "tandem");
            res.set(http::field::content_type, r.content_type);
            res.body() = r.body;
            res.prepare_payload();

            stream.expires_after(io_timeout_);
            http::async_write(stream, res,
                              [&ec](beast::error_code e, std::size_t) { ec = e; });
            ioc.restart();
            ioc.run();
            if (ec) {
                std::cerr << "[TELEMETRY] Write failed: " << ec.message() << "\n";
                continue;
            }
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    } catch (const std::exception& e) {
        std::cerr << "[TELEMETRY] " << e.what() << "\n";
    }
    std::cout << "[TELEMETRY] Stopped\n";
}
