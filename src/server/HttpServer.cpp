#include "authrelay/server/HttpServer.hpp"
#include "authrelay/server/Router.hpp"
#include "authrelay/server/RequestContext.hpp"
#include "authrelay/util/Clock.hpp"
#include "authrelay/util/Ids.hpp"
#include "authrelay/util/Logging.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace authrelay::server {
namespace {

constexpr char kRequestIdHeader[] = "X-Request-Id";

std::string requestIdFor(const RequestContext::HttpRequest& request) {
    if (auto it = request.find(kRequestIdHeader); it != request.end() && !it->value().empty() &&
                                                  it->value().size() <= 64) {
        return std::string(it->value());
    }
    return util::randomId();
}

// {success, timestamp, path, data} for 2xx/3xx, {success, timestamp, path,
// error: {message, details}} otherwise.
boost::json::object makeEnvelope(bool success, boost::json::value payload, std::string_view path) {
    boost::json::object envelope;
    envelope["success"] = success;
    envelope["timestamp"] = util::formatIsoTimestamp(std::chrono::system_clock::now());
    envelope["path"] = path;
    if (success) {
        envelope["data"] = std::move(payload);
        return envelope;
    }

    boost::json::object error;
    if (payload.is_object()) {
        const auto& object = payload.as_object();
        for (const char* key : {"message", "description", "error"}) {
            if (auto it = object.if_contains(key); it && it->is_string()) {
                error["message"] = it->as_string();
                break;
            }
        }
    }
    if (!payload.is_null()) {
        error["details"] = std::move(payload);
    }
    envelope["error"] = std::move(error);
    return envelope;
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Router> router, ServerLimits limits)
        : stream_(std::move(socket)), router_(std::move(router)), limits_(limits) {
        boost::system::error_code ec;
        auto peer = stream_.socket().remote_endpoint(ec);
        if (!ec) {
            remoteAddress_ = peer.address().to_string();
        }
    }

    void start() { readRequest(); }

private:
    void readRequest() {
        parser_.emplace();
        parser_->body_limit(limits_.maxBodyBytes);
        stream_.expires_after(limits_.ioTimeout);
        boost::beast::http::async_read(stream_, buffer_, *parser_,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                if (ec == boost::beast::http::error::body_limit) {
                    util::log(util::LogLevel::warn, "Rejected oversized request from " + self->remoteAddress_);
                    self->doClose();
                    return;
                }
                if (ec) {
                    self->doClose();
                    return;
                }
                self->dispatch();
            }));
    }

    void dispatch() {
        auto shared = std::make_shared<RequestContext>();
        auto& ctx = *shared;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = parser_->release();
        ctx.requestId = requestIdFor(ctx.request);
        ctx.remoteAddress = remoteAddress_;
        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());
        ctx.response.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
        ctx.response.set(kRequestIdHeader, ctx.requestId);

        std::unordered_map<std::string, std::string> params;
        auto handler = router_->resolve(std::string(ctx.request.method_string()),
                                        std::string(ctx.request.target()), params);
        ctx.pathParameters = std::move(params);

        // First writer wins: either the handler's synchronous answer or
        // its deferred responder, never both.
        auto answered = std::make_shared<std::atomic<bool>>(false);
        bool deferred = false;

        if (!handler) {
            auto allowed = router_->allowedMethods(std::string(ctx.request.target()));
            if (allowed.empty()) {
                ctx.response.result(boost::beast::http::status::not_found);
                ctx.response.body() = R"({"error":"not_found"})";
            } else {
                std::string allow;
                for (const auto& method : allowed) {
                    allow += allow.empty() ? method : ", " + method;
                }
                ctx.response.result(boost::beast::http::status::method_not_allowed);
                ctx.response.set(boost::beast::http::field::allow, allow);
                ctx.response.body() = R"({"error":"method_not_allowed"})";
            }
            ctx.response.set(boost::beast::http::field::content_type, "application/json");
            ctx.response.prepare_payload();
        } else {
            ctx.defer = [self = shared_from_this(), shared, answered, &deferred]() -> RequestContext::Responder {
                deferred = true;
                return [self, shared, answered](RequestContext::HttpResponse response) {
                    if (answered->exchange(true)) {
                        return;
                    }
                    boost::asio::post(self->stream_.get_executor(),
                                      [self, shared, response = std::move(response)]() mutable {
                                          shared->response = std::move(response);
                                          self->finish(*shared);
                                      });
                };
            };
            try {
                handler(ctx);
            } catch (const std::exception& ex) {
                deferred = false;
                util::log(util::LogLevel::error, "[request " + ctx.requestId + "] handler for " +
                                                     std::string(ctx.request.target()) + " failed: " + ex.what());
                ctx.response.result(boost::beast::http::status::internal_server_error);
                ctx.response.set(boost::beast::http::field::content_type, "application/json");
                ctx.response.body() = R"({"error":"internal_error"})";
                ctx.response.prepare_payload();
            }
            // Drops the responder factory, and with it the context's
            // reference to itself.
            ctx.defer = nullptr;
        }

        if (deferred) {
            // No I/O is pending while the handler works; finish() re-arms
            // the timer before writing.
            stream_.expires_never();
            return;
        }
        if (answered->exchange(true)) {
            return;
        }
        finish(ctx);
    }

    void finish(RequestContext& ctx) {
        if (ctx.response.body().empty() && ctx.response.result() == boost::beast::http::status::unknown) {
            ctx.response.result(boost::beast::http::status::no_content);
            ctx.response.prepare_payload();
        }

        wrapJsonEnvelope(ctx);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.startedAt);
        util::log(util::LogLevel::debug, "[request " + ctx.requestId + "] " + ctx.remoteAddress + " " +
                                             std::string(ctx.request.method_string()) + " " +
                                             std::string(ctx.request.target()) + " -> " +
                                             std::to_string(ctx.response.result_int()) + " in " +
                                             std::to_string(elapsed.count()) + " ms");

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        stream_.expires_after(limits_.ioTimeout);
        boost::beast::http::async_write(stream_, *response,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                if (!response->keep_alive()) {
                    self->doClose();
                    return;
                }
                self->readRequest();
            }));
    }

    void doClose() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    void wrapJsonEnvelope(RequestContext& ctx) {
        auto& response = ctx.response;
        if (response.body().empty()) {
            return;
        }

        auto toLower = [](std::string value) {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
                return static_cast<char>(std::tolower(ch));
            });
            return value;
        };

        bool skip = false;
        if (auto header = response.find("X-Api-Envelope"); header != response.end()) {
            skip = toLower(std::string(header->value())) == "skip";
            response.erase(header);
        }
        if (skip) {
            return;
        }

        auto contentTypeIt = response.find(boost::beast::http::field::content_type);
        if (contentTypeIt == response.end() ||
            toLower(std::string(contentTypeIt->value())).find("application/json") == std::string::npos) {
            return;
        }

        boost::json::value parsed;
        try {
            parsed = boost::json::parse(response.body());
        } catch (const std::exception&) {
            parsed = boost::json::string(response.body());
        }

        const bool success = response.result_int() >= 200 && response.result_int() < 400;
        std::string target(ctx.request.target());
        if (auto query = target.find('?'); query != std::string::npos) {
            target.erase(query);
        }
        auto envelope = makeEnvelope(success, std::move(parsed), target);
        response.body() = boost::json::serialize(envelope);
        response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
        response.prepare_payload();
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<Router> router_;
    ServerLimits limits_;
    std::string remoteAddress_{"unknown"};
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io,
                       std::shared_ptr<Router> router,
                       std::string host,
                       unsigned short port,
                       ServerLimits limits)
    : io_(io)
    , acceptor_(io)
    , router_(std::move(router))
    , host_(std::move(host))
    , port_(port)
    , limits_(limits) {}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(host_), port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    util::log(util::LogLevel::info, "HTTP server bound to " + host_ + ":" + std::to_string(boundPort()));
    doAccept();
}

unsigned short HttpServer::boundPort() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }

            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), self->router_, self->limits_)->start();
            }

            self->doAccept();
        });
}

} // namespace authrelay::server
