#pragma once

#include "wsproxy/protocol/HttpRequest.h"
#include "wsproxy/network/Buffer.h"

#include <chrono>

namespace wsproxy {
namespace protocol {

// Incremental parser for the head of an upgrade request. Parsing stops right
// after the blank line; whatever follows stays in the buffer.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kGotAll,
    };

    static const size_t kMaxHeaderBytes = 8192;

    HttpContext()
        : state_(kExpectRequestLine), consumed_(0) {}

    // return false if some error
    bool parseRequest(wsproxy::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset() {
        state_ = kExpectRequestLine;
        consumed_ = 0;
        HttpRequest dummy;
        request_.swap(dummy);
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);

    HttpRequestParseState state_;
    size_t consumed_;
    HttpRequest request_;
};

} // namespace protocol
} // namespace wsproxy
