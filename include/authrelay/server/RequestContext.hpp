#pragma once

#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

namespace authrelay::server {

struct RequestContext {
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
    using Responder = std::function<void(HttpResponse)>;

    HttpRequest request;
    HttpResponse response;
    std::unordered_map<std::string, std::string> pathParameters;

    // Taken from X-Request-Id when the caller sends one, generated otherwise;
    // echoed back in the response.
    std::string requestId;
    std::string remoteAddress;
    std::chrono::steady_clock::time_point startedAt;

    // Installed by the server for the duration of the handler call. A
    // handler that answers from another thread calls defer() before it
    // returns and later passes the finished response to the responder,
    // starting from a copy of `response` so the preset headers survive.
    std::function<Responder()> defer;
};

} // namespace authrelay::server
