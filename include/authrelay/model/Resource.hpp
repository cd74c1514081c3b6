#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace authrelay::model {

// One egress identity. Credentials are kept raw; key() carries them
// percent-encoded.
struct Resource {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    std::uint16_t port{};

    [[nodiscard]] bool hasCredentials() const noexcept { return !username.empty() || !password.empty(); }

    // Canonical identity: scheme://[user[:pass]@]host:port
    [[nodiscard]] std::string key() const;

    // scheme://host:port, safe to log.
    [[nodiscard]] std::string displayName() const;

    // host:port, the form a session worker expects for its proxy server.
    [[nodiscard]] std::string authority() const;
};

inline bool operator==(const Resource& lhs, const Resource& rhs) {
    return lhs.scheme == rhs.scheme && lhs.host == rhs.host && lhs.port == rhs.port &&
           lhs.username == rhs.username && lhs.password == rhs.password;
}

std::optional<Resource> parseResource(std::string_view line, std::string_view defaultScheme = "http");

// Line-delimited list; blank lines and '#' comments are skipped, rejected
// lines are logged, duplicates (by key) are dropped.
std::vector<Resource> parseResourceList(std::string_view content, std::string_view defaultScheme = "http");

// "Basic <base64(user:pass)>" when the resource carries credentials.
std::optional<std::string> authorizationHeader(const Resource& resource);

std::string percentEncode(std::string_view value);
std::string base64Encode(std::string_view input);

} // namespace authrelay::model
