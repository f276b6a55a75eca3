#include "wsproxy/protocol/BackendUrl.h"

#include <cctype>
#include <cstdlib>

namespace wsproxy {
namespace protocol {

static std::string ToLower(const std::string& s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool BackendUrl::Parse(const std::string& url, BackendUrl* out, std::string* err) {
    const size_t sep = url.find("://");
    if (sep == std::string::npos) {
        if (err) *err = "missing scheme in '" + url + "'";
        return false;
    }
    const std::string scheme = ToLower(url.substr(0, sep));
    if (scheme == "wss" || scheme == "https") {
        if (err) *err = "TLS backends are not supported: '" + url + "'";
        return false;
    }
    if (scheme != "ws" && scheme != "http") {
        if (err) *err = "unsupported scheme '" + scheme + "'";
        return false;
    }

    const size_t authStart = sep + 3;
    size_t authEnd = url.find_first_of("/?#", authStart);
    if (authEnd == std::string::npos) authEnd = url.size();
    const std::string authority = url.substr(authStart, authEnd - authStart);
    if (authority.empty()) {
        if (err) *err = "missing host in '" + url + "'";
        return false;
    }
    if (authority.find('@') != std::string::npos || authority.find('[') != std::string::npos) {
        if (err) *err = "unsupported authority '" + authority + "'";
        return false;
    }

    BackendUrl result;
    result.scheme = scheme;
    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        const std::string portStr = authority.substr(colon + 1);
        char* endp = nullptr;
        const long port = std::strtol(portStr.c_str(), &endp, 10);
        if (portStr.empty() || *endp != '\0' || port <= 0 || port > 65535) {
            if (err) *err = "invalid port '" + portStr + "'";
            return false;
        }
        result.port = static_cast<uint16_t>(port);
    } else {
        result.host = authority;
    }
    if (result.host.empty()) {
        if (err) *err = "missing host in '" + url + "'";
        return false;
    }

    std::string target = url.substr(authEnd);
    const size_t hash = target.find('#');
    if (hash != std::string::npos) target.erase(hash);
    if (target.empty() || target[0] != '/') target.insert(0, "/");
    result.path = target;

    *out = result;
    return true;
}

std::string BackendUrl::hostHeader() const {
    if (port == 80) return host;
    return host + ":" + std::to_string(port);
}

std::string BackendUrl::toString() const {
    return scheme + "://" + host + ":" + std::to_string(port) + path;
}

} // namespace protocol
} // namespace wsproxy
