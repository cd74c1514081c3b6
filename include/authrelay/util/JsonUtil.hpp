#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace authrelay::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Whole-file read; nullopt when the file is missing or unreadable.
std::optional<std::string> readTextFile(const std::filesystem::path& path);

std::optional<std::string> getString(const boost::json::object& obj, const char* key);
std::optional<std::int64_t> getInt64(const boost::json::object& obj, const char* key);
std::optional<double> getDouble(const boost::json::object& obj, const char* key);
std::optional<bool> getBool(const boost::json::object& obj, const char* key);

} // namespace authrelay::util
