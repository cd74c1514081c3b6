#include "authrelay/util/JsonUtil.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace authrelay::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<std::string> readTextFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::optional<std::string> getString(const boost::json::object& obj, const char* key) {
    auto* value = obj.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const auto& str = value->as_string();
        return std::string(str.c_str(), str.size());
    }
    if (value->is_int64()) {
        return std::to_string(value->as_int64());
    }
    return std::nullopt;
}

std::optional<std::int64_t> getInt64(const boost::json::object& obj, const char* key) {
    auto* value = obj.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_int64()) {
        return value->as_int64();
    }
    if (value->is_uint64()) {
        return static_cast<std::int64_t>(value->as_uint64());
    }
    if (value->is_double()) {
        return static_cast<std::int64_t>(value->as_double());
    }
    if (value->is_string()) {
        try {
            return std::stoll(std::string(value->as_string()));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<double> getDouble(const boost::json::object& obj, const char* key) {
    auto* value = obj.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_double()) {
        return value->as_double();
    }
    if (value->is_int64()) {
        return static_cast<double>(value->as_int64());
    }
    if (value->is_uint64()) {
        return static_cast<double>(value->as_uint64());
    }
    if (value->is_string()) {
        try {
            return std::stod(std::string(value->as_string()));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> getBool(const boost::json::object& obj, const char* key) {
    auto* value = obj.if_contains(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_bool()) {
        return value->as_bool();
    }
    if (value->is_int64()) {
        return value->as_int64() != 0;
    }
    if (value->is_string()) {
        std::string lower(value->as_string().c_str(), value->as_string().size());
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lower == "true" || lower == "1" || lower == "yes") return true;
        if (lower == "false" || lower == "0" || lower == "no") return false;
    }
    return std::nullopt;
}

} // namespace authrelay::util
