#pragma once

#include "authrelay/pool/ResourcePool.hpp"
#include "authrelay/server/Router.hpp"
#include "authrelay/service/LoginService.hpp"

#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>

namespace authrelay::controller {

class LoginController {
public:
    // Logins run on `workers` so the retry loop never holds an I/O thread.
    LoginController(service::LoginService& loginService, pool::ResourcePool& pool, boost::asio::thread_pool& workers);

    void registerRoutes(server::Router& router);

private:
    void handleLogin(server::RequestContext& ctx);
    void handleResources(server::RequestContext& ctx);

    service::LoginService& loginService_;
    pool::ResourcePool& pool_;
    boost::asio::thread_pool& workers_;
};

boost::json::object toJson(const service::LoginReply& reply);
boost::json::array toJson(const std::vector<pool::ResourceView>& views);

} // namespace authrelay::controller
