#pragma once

#include <cstdint>
#include <string>

namespace wsproxy {
namespace protocol {

// ws://host[:port][/path[?query]]; http:// is accepted as an alias for ws://.
struct BackendUrl {
    std::string scheme; // "ws" or "http"
    std::string host;
    uint16_t port{80};
    std::string path{"/"}; // request target including the query

    static bool Parse(const std::string& url, BackendUrl* out, std::string* err);

    // Value for the Host header; the port is omitted when it is 80.
    std::string hostHeader() const;
    std::string toString() const;
};

} // namespace protocol
} // namespace wsproxy
