#pragma once

#include <optional>
#include <string>

namespace gateway {
namespace common {

bool IEquals(const std::string& a, const std::string& b);
std::string ToLowerCopy(const std::string& s);

// True if a comma-separated header value contains token (case-insensitive).
bool HeaderContainsToken(const std::string& headerValue, const std::string& token);

// Minimal flat-JSON field extraction for admin request bodies.
std::optional<std::string> ExtractJsonString(const std::string& body, const std::string& key);
std::optional<double> ExtractJsonNumber(const std::string& body, const std::string& key);

// query may start with '?'. No percent-decoding.
std::string ExtractQueryParam(const std::string& query, const std::string& key);

} // namespace common
} // namespace gateway
