#include "authrelay/controller/LoginController.hpp"
#include "authrelay/util/Clock.hpp"
#include "authrelay/util/JsonUtil.hpp"
#include "authrelay/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>

#include <stdexcept>

namespace authrelay::controller {
namespace {

void writeJson(server::RequestContext::HttpResponse& response, unsigned int status, const boost::json::value& body,
               bool raw) {
    response.result(status);
    response.set(boost::beast::http::field::content_type, "application/json");
    if (raw) {
        response.set("X-Api-Envelope", "skip");
    }
    response.body() = util::stringifyJson(body);
    response.prepare_payload();
}

boost::json::object errorBody(const std::string& description) {
    boost::json::object body;
    body["status"] = "ERROR";
    body["description"] = description;
    return body;
}

} // namespace

boost::json::object toJson(const service::LoginReply& reply) {
    boost::json::object body;
    body["status"] = reply.status;
    if (!reply.description.empty()) {
        body["description"] = reply.description;
    }
    if (reply.token) {
        body["login_code"] = *reply.token;
    }
    if (reply.usedProxy) {
        body["usedProxy"] = *reply.usedProxy;
    } else if (reply.status == "SUCCESS") {
        body["usedProxy"] = nullptr;
    }
    if (!reply.terminal.empty()) {
        body["outcome"] = reply.terminal;
    }
    body["attempts"] = reply.attempts;
    return body;
}

boost::json::array toJson(const std::vector<pool::ResourceView>& views) {
    boost::json::array items;
    for (const auto& view : views) {
        boost::json::object item;
        item["resource"] = view.resource.displayName();
        item["authenticated"] = view.resource.hasCredentials();
        item["available"] = view.available;
        item["cooldownMs"] = static_cast<std::int64_t>(view.stats.cooldown.count());
        item["successCount"] = view.stats.successCount;
        item["failCount"] = view.stats.failCount;
        item["useCount"] = view.stats.useCount;
        item["lastUsedAt"] = util::toEpochMillis(view.stats.lastUsedAt);
        items.push_back(std::move(item));
    }
    return items;
}

LoginController::LoginController(service::LoginService& loginService,
                                 pool::ResourcePool& pool,
                                 boost::asio::thread_pool& workers)
    : loginService_(loginService)
    , pool_(pool)
    , workers_(workers) {}

void LoginController::registerRoutes(server::Router& router) {
    router.addRoute("POST", "/api/v1/login-code", [this](server::RequestContext& ctx) { handleLogin(ctx); });
    router.addRoute("GET", "/api/v1/resources", [this](server::RequestContext& ctx) { handleResources(ctx); });
}

void LoginController::handleLogin(server::RequestContext& ctx) {
    service::LoginRequest request;
    try {
        auto json = util::parseJson(ctx.request.body());
        if (!json.is_object()) {
            throw std::invalid_argument("body must be a JSON object");
        }
        const auto& obj = json.as_object();
        request.url = util::getString(obj, "url").value_or("");
        request.username = util::getString(obj, "username").value_or("");
        request.password = util::getString(obj, "password").value_or("");
        request.proxy = util::getString(obj, "proxy");
        request.requestId = ctx.requestId;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "[request " + ctx.requestId + "] unreadable login body: " + ex.what());
        writeJson(ctx.response, 400, errorBody("Request body must be a JSON object"), true);
        return;
    }

    auto respond = ctx.defer();
    boost::asio::post(workers_, [this, request = std::move(request), respond, response = ctx.response]() mutable {
        try {
            auto reply = loginService_.login(request);
            writeJson(response, reply.httpStatus, toJson(reply), true);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "[request " + request.requestId + "] login failed: " + ex.what());
            writeJson(response, 500, errorBody("Internal server error"), true);
        }
        respond(std::move(response));
    });
}

void LoginController::handleResources(server::RequestContext& ctx) {
    writeJson(ctx.response, 200, toJson(pool_.snapshot()), false);
}

} // namespace authrelay::controller
