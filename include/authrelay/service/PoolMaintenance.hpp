#pragma once

#include "authrelay/pool/ResourcePool.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <optional>

namespace authrelay::service {

// TCP connect round-trip to the resource, nullopt when it cannot be
// reached within the budget.
std::optional<std::chrono::milliseconds> probeResource(const model::Resource& resource,
                                                       std::chrono::milliseconds budget);

// Background upkeep of the pool: periodic decay on the io_context,
// independent of request traffic, plus an optional reachability sweep.
class PoolMaintenance {
public:
    PoolMaintenance(boost::asio::io_context& io, pool::ResourcePool& pool, std::chrono::milliseconds tick);

    void start();
    void stop();

    // Reports every unreachable resource as a soft failure. Returns the
    // number of reachable resources.
    std::size_t probeAll(std::chrono::milliseconds budget = std::chrono::milliseconds{1500});

private:
    void scheduleTick();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    pool::ResourcePool& pool_;
    std::chrono::milliseconds tick_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
};

} // namespace authrelay::service
