#pragma once

#include "authrelay/server/RequestContext.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace authrelay::server {

class Router {
public:
    using Handler = std::function<void(RequestContext&)>;
    using Parameters = std::unordered_map<std::string, std::string>;

    // Path segments starting with ':' capture into the parameters map.
    void addRoute(std::string method, std::string path, Handler handler);

    // Empty handler when nothing matches. The query string and a trailing
    // slash are ignored.
    Handler resolve(const std::string& method, const std::string& path, Parameters& params) const;

    // Methods registered for a path, for 405 answers.
    std::vector<std::string> allowedMethods(const std::string& path) const;

private:
    struct Segment {
        std::string text;
        bool capture{false};
    };

    struct RouteEntry {
        std::string method;
        std::vector<Segment> segments;
        Handler handler;
    };

    static bool matches(const RouteEntry& entry, const std::vector<std::string>& parts, Parameters* params);

    std::vector<RouteEntry> routes_;
};

std::vector<std::string> splitPath(const std::string& path);

} // namespace authrelay::server
