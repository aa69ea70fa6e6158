#include "devproxy/protocol/HttpHeaders.h"

#include <algorithm>
#include <cctype>

namespace devproxy {
namespace protocol {

namespace {

bool isOws(char c) {
    return c == ' ' || c == '\t';
}

std::string trimOws(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isOws(s[b])) ++b;
    while (e > b && isOws(s[e - 1])) --e;
    return s.substr(b, e - b);
}

} // namespace

bool HttpHeaders::iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool HttpHeaders::addLine(const char* start, const char* end) {
    const char* colon = std::find(start, end, ':');
    if (colon == end || colon == start) return false;
    std::string name(start, colon);
    // "Name : value" is a request smuggling vector; reject it.
    if (isOws(name.back())) return false;
    fields_.emplace_back(std::move(name), trimOws(std::string(colon + 1, end)));
    return true;
}

bool HttpHeaders::has(const std::string& name) const {
    for (const auto& f : fields_) {
        if (iequals(f.first, name)) return true;
    }
    return false;
}

std::string HttpHeaders::get(const std::string& name) const {
    for (const auto& f : fields_) {
        if (iequals(f.first, name)) return f.second;
    }
    return std::string();
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&name](const Field& f) { return iequals(f.first, name); });
    if (it == fields_.end()) {
        fields_.emplace_back(name, value);
        return;
    }
    it->second = value;
    const auto first = it - fields_.begin();
    fields_.erase(std::remove_if(fields_.begin() + first + 1, fields_.end(),
                                 [&name](const Field& f) { return iequals(f.first, name); }),
                  fields_.end());
}

size_t HttpHeaders::remove(const std::string& name) {
    const size_t before = fields_.size();
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&name](const Field& f) { return iequals(f.first, name); }),
                  fields_.end());
    return before - fields_.size();
}

bool HttpHeaders::containsToken(const std::string& name, const std::string& token) const {
    for (const auto& f : fields_) {
        if (!iequals(f.first, name)) continue;
        size_t pos = 0;
        const std::string& v = f.second;
        while (pos <= v.size()) {
            size_t comma = v.find(',', pos);
            if (comma == std::string::npos) comma = v.size();
            if (iequals(trimOws(v.substr(pos, comma - pos)), token)) return true;
            pos = comma + 1;
        }
    }
    return false;
}

void HttpHeaders::appendTo(std::string* out) const {
    for (const auto& f : fields_) {
        out->append(f.first);
        out->append(": ");
        out->append(f.second);
        out->append("\r\n");
    }
}

} // namespace protocol
} // namespace devproxy
