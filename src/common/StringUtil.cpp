#include "gateway/common/StringUtil.h"

#include <cctype>
#include <cstdlib>

namespace gateway {
namespace common {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool HeaderContainsToken(const std::string& headerValue, const std::string& token) {
    size_t i = 0;
    while (i < headerValue.size()) {
        while (i < headerValue.size() && (headerValue[i] == ' ' || headerValue[i] == '\t' || headerValue[i] == ',')) ++i;
        size_t start = i;
        while (i < headerValue.size() && headerValue[i] != ',') ++i;
        size_t end = i;
        while (end > start && (headerValue[end - 1] == ' ' || headerValue[end - 1] == '\t')) --end;
        if (end > start && IEquals(headerValue.substr(start, end - start), token)) return true;
        if (i < headerValue.size() && headerValue[i] == ',') ++i;
    }
    return false;
}

static size_t FindJsonValue(const std::string& body, const std::string& key) {
    const std::string needle = "\"" + key + "\"";
    size_t pos = body.find(needle);
    if (pos == std::string::npos) return std::string::npos;
    pos = body.find(':', pos + needle.size());
    if (pos == std::string::npos) return std::string::npos;
    ++pos;
    while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos]))) ++pos;
    return pos < body.size() ? pos : std::string::npos;
}

std::optional<std::string> ExtractJsonString(const std::string& body, const std::string& key) {
    size_t pos = FindJsonValue(body, key);
    if (pos == std::string::npos || body[pos] != '"') return std::nullopt;
    ++pos;
    size_t end = body.find('"', pos);
    if (end == std::string::npos) return std::nullopt;
    return body.substr(pos, end - pos);
}

std::optional<double> ExtractJsonNumber(const std::string& body, const std::string& key) {
    const size_t pos = FindJsonValue(body, key);
    if (pos == std::string::npos) return std::nullopt;
    const char* begin = body.c_str() + pos;
    char* endp = nullptr;
    const double v = std::strtod(begin, &endp);
    if (endp == begin) return std::nullopt;
    return v;
}

std::string ExtractQueryParam(const std::string& query, const std::string& key) {
    if (key.empty()) return {};
    std::string q = query;
    if (!q.empty() && q[0] == '?') q.erase(0, 1);
    size_t pos = 0;
    while (pos < q.size()) {
        size_t amp = q.find('&', pos);
        if (amp == std::string::npos) amp = q.size();
        size_t eq = q.find('=', pos);
        if (eq != std::string::npos && eq < amp) {
            if (q.compare(pos, eq - pos, key) == 0 && eq - pos == key.size()) {
                return q.substr(eq + 1, amp - (eq + 1));
            }
        }
        pos = (amp < q.size()) ? amp + 1 : q.size();
    }
    return {};
}

} // namespace common
} // namespace gateway
