#include "authrelay/model/Resource.hpp"
#include "authrelay/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace authrelay::model {
namespace {

std::string_view trimView(std::string_view input) {
    const auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::string toLower(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::uint16_t defaultPortFor(const std::string& scheme) {
    if (scheme == "https") return 443;
    if (scheme == "socks4" || scheme == "socks5" || scheme == "socks5h") return 1080;
    return 80;
}

std::optional<std::uint16_t> parsePort(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

// Splits "host[:port]" honouring bracketed IPv6 literals.
bool splitHostPort(std::string_view hostPort, std::string& host, std::optional<std::uint16_t>& port) {
    if (hostPort.empty()) {
        return false;
    }
    std::string_view portView;
    if (hostPort.front() == '[') {
        auto close = hostPort.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host = std::string(hostPort.substr(0, close + 1));
        auto rest = hostPort.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return false;
            }
            portView = rest.substr(1);
        }
    } else {
        auto colon = hostPort.find(':');
        host = std::string(hostPort.substr(0, colon));
        if (colon != std::string_view::npos) {
            portView = hostPort.substr(colon + 1);
        }
    }
    if (host.empty() || host == "[]") {
        return false;
    }
    if (!portView.empty() || hostPort.back() == ':') {
        port = parsePort(portView);
        if (!port) {
            return false;
        }
    }
    return true;
}

void splitUserInfo(std::string_view userInfo, Resource& resource) {
    auto colon = userInfo.find(':');
    if (colon == std::string_view::npos) {
        resource.username = std::string(userInfo);
        return;
    }
    resource.username = std::string(userInfo.substr(0, colon));
    resource.password = std::string(userInfo.substr(colon + 1));
}

} // namespace

std::string Resource::key() const {
    std::string out = scheme + "://";
    if (hasCredentials()) {
        out += percentEncode(username);
        if (!password.empty()) {
            out += ':';
            out += percentEncode(password);
        }
        out += '@';
    }
    out += authority();
    return out;
}

std::string Resource::displayName() const {
    return scheme + "://" + authority();
}

std::string Resource::authority() const {
    return host + ":" + std::to_string(port);
}

std::optional<Resource> parseResource(std::string_view line, std::string_view defaultScheme) {
    auto text = trimView(line);
    if (text.empty()) {
        return std::nullopt;
    }

    Resource resource;
    auto schemeEnd = text.find("://");
    if (schemeEnd != std::string_view::npos) {
        resource.scheme = toLower(text.substr(0, schemeEnd));
        text = text.substr(schemeEnd + 3);
    } else {
        resource.scheme = toLower(defaultScheme);
    }
    if (resource.scheme.empty()) {
        return std::nullopt;
    }
    std::optional<std::uint16_t> port;
    auto at = text.rfind('@');
    const auto hostStart = (at == std::string_view::npos) ? 0 : at + 1;
    if (auto slash = text.find('/', hostStart); slash != std::string_view::npos) {
        text = text.substr(0, slash);
    }
    if (at != std::string_view::npos) {
        splitUserInfo(text.substr(0, at), resource);
        if (!splitHostPort(text.substr(at + 1), resource.host, port)) {
            return std::nullopt;
        }
    } else if (schemeEnd == std::string_view::npos &&
               std::count(text.begin(), text.end(), ':') >= 3 && text.front() != '[') {
        // host:port:user:pass as exported by most providers
        auto first = text.find(':');
        auto second = text.find(':', first + 1);
        resource.host = std::string(text.substr(0, first));
        port = parsePort(text.substr(first + 1, second - first - 1));
        if (resource.host.empty() || !port) {
            return std::nullopt;
        }
        splitUserInfo(text.substr(second + 1), resource);
    } else if (!splitHostPort(text, resource.host, port)) {
        return std::nullopt;
    }

    resource.host = toLower(resource.host);
    resource.port = port ? *port : defaultPortFor(resource.scheme);
    return resource;
}

std::vector<Resource> parseResourceList(std::string_view content, std::string_view defaultScheme) {
    std::vector<Resource> resources;
    std::unordered_set<std::string> seen;
    std::size_t lineNumber = 0;
    std::size_t start = 0;
    while (start <= content.size()) {
        auto pos = content.find('\n', start);
        auto length = (pos == std::string_view::npos) ? content.size() - start : pos - start;
        auto line = trimView(content.substr(start, length));
        start = (pos == std::string_view::npos) ? content.size() + 1 : pos + 1;
        ++lineNumber;

        if (line.empty() || line.front() == '#') {
            continue;
        }
        auto resource = parseResource(line, defaultScheme);
        if (!resource) {
            util::log(util::LogLevel::warn,
                      "Skipping malformed resource entry on line " + std::to_string(lineNumber));
            continue;
        }
        if (!seen.insert(resource->key()).second) {
            util::log(util::LogLevel::debug, "Skipping duplicate resource " + resource->displayName());
            continue;
        }
        resources.push_back(std::move(*resource));
    }
    return resources;
}

std::optional<std::string> authorizationHeader(const Resource& resource) {
    if (!resource.hasCredentials()) {
        return std::nullopt;
    }
    return "Basic " + base64Encode(resource.username + ":" + resource.password);
}

std::string percentEncode(std::string_view value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            c == '!' || c == '*' || c == '\'' || c == '(' || c == ')') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string base64Encode(std::string_view input) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(alphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }

    if (bitCount > -6) {
        output.push_back(alphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

} // namespace authrelay::model
