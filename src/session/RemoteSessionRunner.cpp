#include "authrelay/session/RemoteSessionRunner.hpp"
#include "authrelay/util/JsonUtil.hpp"
#include "authrelay/util/Logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>

namespace authrelay::session {
namespace {
constexpr unsigned kHttpVersion = 11;
constexpr char kUserAgent[] = "authrelay/" BOOST_BEAST_VERSION_STRING;

std::string statusLine(const boost::beast::http::response<boost::beast::http::string_body>& response) {
    auto snippet = response.body().substr(0, std::min<std::size_t>(response.body().size(), 120));
    return std::to_string(response.result_int()) + " " + snippet;
}

} // namespace

WorkerEndpoint parseWorkerEndpoint(const std::string& url) {
    WorkerEndpoint parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported worker scheme: " + parsed.scheme);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find('/', hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    return parsed;
}

std::string buildWorkerJob(const SessionRequest& request) {
    boost::json::object job;
    job["sessionId"] = request.sessionId;
    job["url"] = request.targetUrl;
    job["username"] = request.credentials.username;
    job["password"] = request.credentials.password;
    job["timeoutMs"] = static_cast<std::int64_t>(request.timeout.count());
    if (request.resource) {
        boost::json::object proxy;
        proxy["server"] = request.resource->scheme + "://" + request.resource->authority();
        if (request.proxyAuthorization) {
            proxy["authorization"] = *request.proxyAuthorization;
        }
        job["proxy"] = std::move(proxy);
    } else {
        job["proxy"] = nullptr;
    }
    return util::stringifyJson(job);
}

SessionResult parseWorkerReply(const std::string& body) {
    boost::json::value json;
    try {
        json = util::parseJson(body);
    } catch (const std::exception& ex) {
        throw SessionRunnerError(std::string{"worker reply is not JSON: "} + ex.what());
    }
    if (!json.is_object()) {
        throw SessionRunnerError("worker reply must be a JSON object");
    }
    const auto& obj = json.as_object();
    SessionResult result;
    auto outcome = util::getString(obj, "outcome");
    if (!outcome) {
        outcome = util::getString(obj, "error");
    }
    if (!outcome) {
        // Older workers only send { token } on success.
        outcome = util::getString(obj, "token") ? std::optional<std::string>{"success"} : std::nullopt;
    }
    if (!outcome) {
        throw SessionRunnerError("worker reply carries no outcome");
    }
    result.outcome = model::parseSessionOutcome(*outcome);
    result.token = util::getString(obj, "token").value_or("");
    result.detail = util::getString(obj, "message").value_or(util::getString(obj, "description").value_or(""));
    if (result.outcome == model::SessionOutcome::success && result.token.empty()) {
        util::log(util::LogLevel::warn, "Worker reported success without a token");
        result.outcome = model::SessionOutcome::unclassified_failure;
        result.detail = "success reported without token";
    }
    return result;
}

RemoteSessionRunner::RemoteSessionRunner(const std::string& endpointUrl)
    : endpoint_(parseWorkerEndpoint(endpointUrl))
    , sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
}

SessionResult RemoteSessionRunner::run(const SessionRequest& request) {
    const auto body = buildWorkerJob(request);
    try {
        return parseWorkerReply(post(body, request.timeout));
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::beast::error::timeout) {
            SessionResult result;
            result.outcome = model::SessionOutcome::navigation_timeout;
            result.detail = "worker did not answer within " + std::to_string(request.timeout.count()) + " ms";
            return result;
        }
        throw SessionRunnerError(std::string{"worker transport failed: "} + ex.what());
    }
}

std::string RemoteSessionRunner::post(const std::string& body, std::chrono::milliseconds timeout) {
    namespace http = boost::beast::http;

    http::request<http::string_body> request{http::verb::post, endpoint_.target, kHttpVersion};
    request.set(http::field::host, endpoint_.host);
    request.set(http::field::user_agent, kUserAgent);
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();

    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(endpoint_.host, endpoint_.port);

    http::response<http::string_body> response;
    boost::beast::flat_buffer buffer;

    if (endpoint_.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io, sslContext_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
            throw SessionRunnerError("Failed to set SNI host name");
        }
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        lowest.connect(results);
        stream.handshake(boost::asio::ssl::stream_base::client);
        http::write(stream, request);
        http::read(stream, buffer, response);

        boost::system::error_code ec;
        stream.shutdown(ec);
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated) {
            util::log(util::LogLevel::debug, "TLS shutdown with worker: " + ec.message());
        }
    } else {
        boost::beast::tcp_stream stream(io);
        stream.expires_after(timeout);
        stream.connect(results);
        http::write(stream, request);
        http::read(stream, buffer, response);

        boost::system::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }

    if (response.result_int() < 200 || response.result_int() >= 300) {
        throw SessionRunnerError("worker replied " + statusLine(response));
    }
    return response.body();
}

} // namespace authrelay::session
