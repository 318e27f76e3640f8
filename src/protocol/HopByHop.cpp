#include "cmux/protocol/HopByHop.h"
#include "cmux/protocol/HttpHeaders.h"

#include <string>
#include <vector>

namespace cmux {
namespace protocol {

namespace {

const char* const kHopByHop[] = {
    "Connection", "Keep-Alive", "Proxy-Authenticate", "Proxy-Authorization",
    "TE", "Trailers", "Transfer-Encoding", "Upgrade", "Proxy-Connection",
};

const char* const kUpgradeHopByHop[] = {
    "Proxy-Connection", "Keep-Alive", "TE", "Transfer-Encoding", "Trailers",
};

std::vector<std::string> ConnectionTokens(const HttpHeaders& headers) {
    std::vector<std::string> tokens;
    for (const std::string& v : headers.GetAll("Connection")) {
        size_t pos = 0;
        while (pos <= v.size()) {
            size_t comma = v.find(',', pos);
            if (comma == std::string::npos) comma = v.size();
            const size_t b = v.find_first_not_of(" \t", pos);
            if (b != std::string::npos && b < comma) {
                size_t e = comma;
                while (e > b && (v[e - 1] == ' ' || v[e - 1] == '\t')) --e;
                tokens.push_back(v.substr(b, e - b));
            }
            pos = comma + 1;
        }
    }
    return tokens;
}

} // namespace

void StripHopByHopHeaders(HttpHeaders* headers) {
    for (const std::string& name : ConnectionTokens(*headers)) {
        headers->Remove(name);
    }
    for (const char* name : kHopByHop) {
        headers->Remove(name);
    }
}

void StripUpgradeHopHeaders(HttpHeaders* headers) {
    for (const char* name : kUpgradeHopByHop) {
        headers->Remove(name);
    }
}

} // namespace protocol
} // namespace cmux
