#pragma once

#include "gateway/common/noncopyable.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gateway {
namespace common {

// INI settings. Sections keep the order in which they appear in the file, so
// callers that care about declaration order (routes) can rely on it.
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;
    using NamedSection = std::pair<std::string, Section>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    bool HasSection(const std::string& section) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Sections whose name starts with prefix, in declaration order.
    std::vector<NamedSection> GetSectionsWithPrefix(const std::string& prefix) const;

    static std::string Trim(const std::string& s);
    // Splits on sep, trims each item and drops empty ones.
    static std::vector<std::string> SplitList(const std::string& s, char sep = ',');

private:
    Config() = default;

    static bool Parse(std::istream& in, std::vector<NamedSection>* out);
    const Section* FindLocked(const std::string& section) const;

    mutable std::mutex mutex_;
    std::vector<NamedSection> sections_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace gateway
