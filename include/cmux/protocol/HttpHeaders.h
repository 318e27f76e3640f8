#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace cmux {
namespace network {
class Buffer;
}

namespace protocol {

bool IEquals(const std::string& a, const std::string& b);

// True if the comma separated list in value contains token (case-insensitive),
// e.g. HeaderContainsTokenCI("keep-alive, Upgrade", "upgrade").
bool HeaderContainsTokenCI(const std::string& value, const std::string& token);

// Header fields in arrival order. Names keep their original case and are
// compared case-insensitively; repeated fields are kept.
class HttpHeaders {
public:
    using Field = std::pair<std::string, std::string>;

    void Add(const std::string& name, const std::string& value) {
        fields_.emplace_back(name, value);
    }

    // Parses one "Name: value" line in [begin, end). Returns false on a line
    // without a colon, an empty name, or whitespace inside the name.
    bool AddLine(const char* begin, const char* end);

    // Replaces every field called name with a single one.
    void Set(const std::string& name, const std::string& value);

    // Returns the number of fields removed.
    size_t Remove(const std::string& name);

    bool Has(const std::string& name) const { return Find(name) != nullptr; }
    const std::string* Find(const std::string& name) const;
    std::string Get(const std::string& name) const;
    std::vector<std::string> GetAll(const std::string& name) const;
    // Token match across every field called name.
    bool HasToken(const std::string& name, const std::string& token) const;

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    const std::vector<Field>& fields() const { return fields_; }
    void clear() { fields_.clear(); }
    void swap(HttpHeaders& that) { fields_.swap(that.fields_); }

    // "Name: value\r\n" per field, no terminating blank line.
    void AppendTo(network::Buffer* out) const;

private:
    std::vector<Field> fields_;
};

} // namespace protocol
} // namespace cmux
