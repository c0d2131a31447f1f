#pragma once

#include <map>
#include <string>

namespace gateway {
namespace protocol {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

// Field names compare case-insensitively; the first spelling seen is kept.
using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

} // namespace protocol
} // namespace gateway
