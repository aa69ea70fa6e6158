#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace devproxy {
namespace protocol {

// Header fields in arrival order with their original spelling.
// Lookups are case-insensitive; duplicate names are kept.
class HttpHeaders {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    void add(const std::string& name, const std::string& value) { fields_.emplace_back(name, value); }
    // Parses "Name: value" from [start, end); returns false if there is no colon or the name is empty.
    bool addLine(const char* start, const char* end);

    bool has(const std::string& name) const;
    // First value, or empty.
    std::string get(const std::string& name) const;
    // Replaces the first field named name in place and drops the others; appends when absent.
    void set(const std::string& name, const std::string& value);
    // Returns how many fields were removed.
    size_t remove(const std::string& name);
    // True if any comma separated element of any field named name equals token (case-insensitive).
    bool containsToken(const std::string& name, const std::string& token) const;

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    void clear() { fields_.clear(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    // "Name: value\r\n" for every field.
    void appendTo(std::string* out) const;

    static bool iequals(const std::string& a, const std::string& b);

private:
    std::vector<Field> fields_;
};

} // namespace protocol
} // namespace devproxy
