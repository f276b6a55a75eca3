#pragma once

#include "wsproxy/network/Buffer.h"

#include <cstddef>
#include <map>
#include <string>

namespace wsproxy {
namespace protocol {

// Incremental parser for the head of an HTTP/1.x response, used on the
// dialing side of the upgrade handshake. Only the status line and headers are
// consumed; bytes after the blank line stay in the buffer.
class HttpResponseContext {
public:
    enum ParseState { kExpectHead, kGotAll, kError };

    static const size_t kMaxHeaderBytes = 8192;

    // Returns false once the head is malformed or too large.
    bool parseResponse(wsproxy::network::Buffer* buf);

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }

    void reset();

    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }
    std::string getHeader(const std::string& field) const;
    bool headerHasToken(const std::string& field, const std::string& token) const;

private:
    static std::string ToLowerCopy(const std::string& s);
    static bool IEquals(const std::string& a, const std::string& b);

    bool parseHeaderBlock(const std::string& headerBlock);

    ParseState state_{kExpectHead};

    int httpMajor_{1};
    int httpMinor_{1};
    int statusCode_{0};
    std::string reason_;

    std::map<std::string, std::string> headers_; // original case keys
};

} // namespace protocol
} // namespace wsproxy
