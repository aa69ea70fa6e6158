#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "devproxy/common/noncopyable.h"

namespace devproxy {
namespace common {

// INI settings read once at startup: "[section]" headers, "key = value" lines,
// '#' or ';' comments. Keys before the first header land in "global". Only the
// first '=' splits a line, so values such as "^/api => /" survive intact.
// Lines that are neither are logged with their line number and skipped.
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    // Replaces every setting. On failure the previous settings stay.
    bool Load(const std::string& filename);
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    // Whole-value decimal integers only; anything else logs a warning and yields defaultVal.
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    // Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Sections whose name starts with prefix, in name order.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix) const;

    static std::string Trim(const std::string& s);

private:
    Config() = default;
    static std::map<std::string, Section> Parse(std::istream& in, const std::string& origin);

    mutable std::mutex mutex_;
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace devproxy
