#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace authrelay::server {

class Router;

struct ServerLimits {
    std::size_t maxBodyBytes{64 * 1024};
    // Applies to each read and each write. A login reply can take up to
    // maxAttempts * attemptTimeout to produce, which is not counted here.
    std::chrono::milliseconds ioTimeout{std::chrono::seconds{30}};
};

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io,
               std::shared_ptr<Router> router,
               std::string host,
               unsigned short port,
               ServerLimits limits = {});

    void start();
    void stop();

    // Port actually bound; differs from the configured one when that was 0.
    [[nodiscard]] unsigned short boundPort() const;

private:
    void doAccept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<Router> router_;
    std::string host_;
    unsigned short port_{};
    ServerLimits limits_;
    std::atomic<bool> running_{false};
};

} // namespace authrelay::server
