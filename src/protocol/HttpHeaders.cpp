#include "cmux/protocol/HttpHeaders.h"
#include "cmux/network/Buffer.h"

#include <algorithm>
#include <cctype>

namespace cmux {
namespace protocol {

namespace {

char ToLower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool IsOws(char c) {
    return c == ' ' || c == '\t';
}

} // namespace

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (ToLower(a[i]) != ToLower(b[i])) return false;
    }
    return true;
}

bool HeaderContainsTokenCI(const std::string& value, const std::string& token) {
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        size_t b = pos;
        size_t e = comma;
        while (b < e && IsOws(value[b])) ++b;
        while (e > b && IsOws(value[e - 1])) --e;
        if (IEquals(value.substr(b, e - b), token)) return true;
        pos = comma + 1;
    }
    return false;
}

bool HttpHeaders::AddLine(const char* begin, const char* end) {
    const char* colon = std::find(begin, end, ':');
    if (colon == end || colon == begin) return false;
    for (const char* p = begin; p < colon; ++p) {
        if (std::isspace(static_cast<unsigned char>(*p))) return false;
    }
    const char* vb = colon + 1;
    const char* ve = end;
    while (vb < ve && IsOws(*vb)) ++vb;
    while (ve > vb && IsOws(*(ve - 1))) --ve;
    fields_.emplace_back(std::string(begin, colon), std::string(vb, ve));
    return true;
}

void HttpHeaders::Set(const std::string& name, const std::string& value) {
    Remove(name);
    Add(name, value);
}

size_t HttpHeaders::Remove(const std::string& name) {
    const size_t before = fields_.size();
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&name](const Field& f) { return IEquals(f.first, name); }),
                  fields_.end());
    return before - fields_.size();
}

const std::string* HttpHeaders::Find(const std::string& name) const {
    for (const auto& f : fields_) {
        if (IEquals(f.first, name)) return &f.second;
    }
    return nullptr;
}

std::string HttpHeaders::Get(const std::string& name) const {
    const std::string* v = Find(name);
    return v ? *v : std::string();
}

std::vector<std::string> HttpHeaders::GetAll(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& f : fields_) {
        if (IEquals(f.first, name)) out.push_back(f.second);
    }
    return out;
}

bool HttpHeaders::HasToken(const std::string& name, const std::string& token) const {
    for (const auto& f : fields_) {
        if (IEquals(f.first, name) && HeaderContainsTokenCI(f.second, token)) return true;
    }
    return false;
}

void HttpHeaders::AppendTo(network::Buffer* out) const {
    for (const auto& f : fields_) {
        out->Append(f.first);
        out->Append(": ", 2);
        out->Append(f.second);
        out->Append("\r\n", 2);
    }
}

} // namespace protocol
} // namespace cmux
