#include "gateway/common/Config.h"
#include "gateway/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gateway {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto start = std::find_if_not(s.begin(), s.end(), isSpace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::vector<std::string> Config::SplitList(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(s);
    while (std::getline(in, item, sep)) {
        item = Trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

bool Config::Parse(std::istream& in, std::vector<NamedSection>* out) {
    std::vector<NamedSection> parsed;
    parsed.emplace_back("global", Section());
    size_t current = 0;

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            const std::string name = Trim(line.substr(1, line.size() - 2));
            auto it = std::find_if(parsed.begin(), parsed.end(),
                                   [&](const NamedSection& s) { return s.first == name; });
            if (it == parsed.end()) {
                parsed.emplace_back(name, Section());
                current = parsed.size() - 1;
            } else {
                current = static_cast<size_t>(it - parsed.begin());
            }
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            LOG_WARN << "Config line " << lineNo << " ignored (no '='): " << line;
            continue;
        }
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (!key.empty()) parsed[current].second[key] = value;
    }
    if (parsed.front().second.empty()) {
        parsed.erase(parsed.begin());
    }
    out->swap(parsed);
    return true;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    std::vector<NamedSection> parsed;
    if (!Parse(file, &parsed)) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_ = std::move(parsed);
        loadedFilename_ = filename;
    }
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    std::vector<NamedSection> parsed;
    if (!Parse(in, &parsed)) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(parsed);
    return true;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

const Config::Section* Config::FindLocked(const std::string& section) const {
    for (const auto& s : sections_) {
        if (s.first == section) return &s.second;
    }
    return nullptr;
}

bool Config::HasSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindLocked(section) != nullptr;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Section* s = FindLocked(section);
    if (s == nullptr) return defaultVal;
    auto it = s->find(key);
    return it == s->end() ? defaultVal : it->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not an integer, using " << defaultVal;
        return defaultVal;
    }
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not a number, using " << defaultVal;
        return defaultVal;
    }
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    return defaultVal;
}

std::vector<Config::NamedSection> Config::GetSectionsWithPrefix(const std::string& prefix) const {
    std::vector<NamedSection> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& s : sections_) {
        if (s.first.rfind(prefix, 0) != 0) continue;
        out.push_back(s);
    }
    return out;
}

} // namespace common
} // namespace gateway
