#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "cmux/common/noncopyable.h"

namespace cmux {
namespace common {

// INI settings: `[section]` headers, `key = value` lines, `#`/`;` comments.
// Keys before the first section header land in "global".
class Config : noncopyable {
public:
    using SectionMap = std::map<std::string, std::map<std::string, std::string>>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);
    void Clear();

    // Returns the last loaded config filename if available.
    std::optional<std::string> LoadedFilename() const;

    bool Has(const std::string& section, const std::string& key) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Get value as int; malformed values log a warning and yield the default.
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    std::int64_t GetInt64(const std::string& section, const std::string& key, std::int64_t defaultVal = 0) const;

    // Dump current settings to INI text.
    std::string DumpIni() const;

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static SectionMap Parse(std::istream& in);

    mutable std::mutex mutex_;
    SectionMap settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace cmux
