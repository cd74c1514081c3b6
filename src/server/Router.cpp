#include "authrelay/server/Router.hpp"

#include <algorithm>
#include <cctype>

namespace authrelay::server {
namespace {

std::string upper(std::string method) {
    std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return method;
}

} // namespace

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    const auto end = path.find('?');
    std::size_t start = 0;
    const auto limit = end == std::string::npos ? path.size() : end;
    while (start < limit) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos || slash > limit) {
            slash = limit;
        }
        if (slash > start) {
            parts.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

void Router::addRoute(std::string method, std::string path, Handler handler) {
    RouteEntry entry;
    entry.method = upper(std::move(method));
    entry.handler = std::move(handler);
    for (auto& part : splitPath(path)) {
        Segment segment;
        segment.capture = part.size() > 1 && part.front() == ':';
        segment.text = segment.capture ? part.substr(1) : std::move(part);
        entry.segments.push_back(std::move(segment));
    }
    routes_.push_back(std::move(entry));
}

bool Router::matches(const RouteEntry& entry, const std::vector<std::string>& parts, Parameters* params) {
    if (entry.segments.size() != parts.size()) {
        return false;
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& segment = entry.segments[i];
        if (!segment.capture && segment.text != parts[i]) {
            return false;
        }
    }
    if (params) {
        params->clear();
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (entry.segments[i].capture) {
                params->emplace(entry.segments[i].text, parts[i]);
            }
        }
    }
    return true;
}

Router::Handler Router::resolve(const std::string& method, const std::string& path, Parameters& params) const {
    const auto wanted = upper(method);
    const auto parts = splitPath(path);
    for (const auto& entry : routes_) {
        if (entry.method == wanted && matches(entry, parts, &params)) {
            return entry.handler;
        }
    }
    return nullptr;
}

std::vector<std::string> Router::allowedMethods(const std::string& path) const {
    std::vector<std::string> methods;
    const auto parts = splitPath(path);
    for (const auto& entry : routes_) {
        if (matches(entry, parts, nullptr) &&
            std::find(methods.begin(), methods.end(), entry.method) == methods.end()) {
            methods.push_back(entry.method);
        }
    }
    return methods;
}

} // namespace authrelay::server
