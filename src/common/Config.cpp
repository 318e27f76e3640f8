#include "cmux/common/Config.h"
#include "cmux/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cmux {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

Config::SectionMap Config::Parse(std::istream& in) {
    SectionMap parsed;
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos != std::string::npos) {
            std::string key = Trim(line.substr(0, delimiterPos));
            std::string value = Trim(line.substr(delimiterPos + 1));
            if (!key.empty()) parsed[section][key] = value;
        }
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    SectionMap parsed = Parse(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    SectionMap parsed = Parse(in);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    loadedFilename_.clear();
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

bool Config::Has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    return sit != settings_.end() && sit->second.count(key) != 0;
}

std::string Config::DumpIni() const {
    SectionMap snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap = settings_;
    }

    std::ostringstream f;
    auto writeSection = [&](const std::string& section, const std::map<std::string, std::string>& kv) {
        f << "[" << section << "]\n";
        for (const auto& it : kv) {
            f << it.first << " = " << it.second << "\n";
        }
        f << "\n";
    };

    auto itg = snap.find("global");
    if (itg != snap.end()) {
        writeSection("global", itg->second);
        snap.erase(itg);
    }
    for (const auto& s : snap) {
        writeSection(s.first, s.second);
    }
    return f.str();
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    const std::int64_t v = GetInt64(section, key, defaultVal);
    if (v < INT32_MIN || v > INT32_MAX) {
        LOG_WARN << "Config [" << section << "] " << key << " out of range, using " << defaultVal;
        return defaultVal;
    }
    return static_cast<int>(v);
}

std::int64_t Config::GetInt64(const std::string& section, const std::string& key, std::int64_t defaultVal) const {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    errno = 0;
    char* endp = nullptr;
    const long long v = std::strtoll(val.c_str(), &endp, 10);
    if (endp == val.c_str() || *endp != '\0' || errno == ERANGE) {
        LOG_WARN << "Config [" << section << "] " << key << "=" << val << " is not an integer, using " << defaultVal;
        return defaultVal;
    }
    return static_cast<std::int64_t>(v);
}

} // namespace common
} // namespace cmux
