#include "authrelay/service/PoolMaintenance.hpp"
#include "authrelay/util/Logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>

#include <string>

namespace authrelay::service {

std::optional<std::chrono::milliseconds> probeResource(const model::Resource& resource,
                                                       std::chrono::milliseconds budget) {
    try {
        boost::asio::io_context io;
        boost::asio::ip::tcp::resolver resolver(io);
        boost::asio::ip::tcp::socket socket(io);
        boost::asio::steady_timer timer(io);
        std::optional<std::chrono::milliseconds> latency;

        std::string host = resource.host;
        if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
            host = host.substr(1, host.size() - 2);
        }

        auto start = std::chrono::steady_clock::now();
        auto endpoints = resolver.resolve(host, std::to_string(resource.port));

        boost::asio::async_connect(socket, endpoints,
                                   [&](const boost::system::error_code& ec,
                                       const boost::asio::ip::tcp::endpoint&) {
                                       if (!ec) {
                                           latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                               std::chrono::steady_clock::now() - start);
                                       }
                                       timer.cancel();
                                   });

        timer.expires_after(budget);
        timer.async_wait([&](const boost::system::error_code& ec) {
            if (!ec) {
                socket.cancel();
            }
        });

        io.run();

        if (latency) {
            boost::system::error_code ec;
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
        return latency;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, "Probe of " + resource.displayName() + " failed: " + ex.what());
    }
    return std::nullopt;
}

PoolMaintenance::PoolMaintenance(boost::asio::io_context& io,
                                 pool::ResourcePool& pool,
                                 std::chrono::milliseconds tick)
    : strand_(boost::asio::make_strand(io))
    , pool_(pool)
    , tick_(tick)
    , timer_(strand_) {}

void PoolMaintenance::start() {
    if (running_.exchange(true)) {
        return;
    }
    boost::asio::post(strand_, [this]() { scheduleTick(); });
}

void PoolMaintenance::stop() {
    running_ = false;
    // The timer is only touched on the strand.
    boost::asio::post(strand_, [this]() { timer_.cancel(); });
}

void PoolMaintenance::scheduleTick() {
    timer_.expires_after(tick_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        pool_.decay();
        scheduleTick();
    });
}

std::size_t PoolMaintenance::probeAll(std::chrono::milliseconds budget) {
    std::size_t reachable = 0;
    for (const auto& view : pool_.snapshot()) {
        if (auto latency = probeResource(view.resource, budget)) {
            ++reachable;
            util::log(util::LogLevel::debug, view.resource.displayName() + " reachable in " +
                                                 std::to_string(latency->count()) + " ms");
        } else {
            util::log(util::LogLevel::warn, view.resource.displayName() + " unreachable, backing off");
            pool_.reportOutcome(view.resource, model::ResourceReport::soft_failure);
        }
    }
    util::log(util::LogLevel::info, "Probe finished: " + std::to_string(reachable) + " of " +
                                        std::to_string(pool_.size()) + " resources reachable");
    return reachable;
}

} // namespace authrelay::service
