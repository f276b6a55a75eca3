#include "wsproxy/network/Buffer.h"
#include "wsproxy/protocol/HttpContext.h"
#include "wsproxy/common/Logger.h"

#include <algorithm>
#include <cstdlib>

namespace wsproxy {
namespace protocol {

const size_t HttpContext::kMaxHeaderBytes;

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

// return false if any error
bool HttpContext::parseRequest(wsproxy::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    if (state_ == kGotAll) return true;
    bool ok = true;
    bool hasMore = true;
    while (hasMore) {
        const char* crlf = std::search(buf->Peek(), static_cast<const char*>(buf->BeginWrite()), "\r\n", "\r\n" + 2);
        if (crlf >= buf->BeginWrite()) {
            // Incomplete line; refuse to buffer an unbounded head.
            if (consumed_ + buf->ReadableBytes() > kMaxHeaderBytes) {
                LOG_WARN << "HttpContext: request head exceeds " << kMaxHeaderBytes << " bytes";
                ok = false;
            }
            break;
        }
        const size_t lineLen = crlf + 2 - buf->Peek();
        consumed_ += lineLen;
        if (consumed_ > kMaxHeaderBytes) {
            LOG_WARN << "HttpContext: request head exceeds " << kMaxHeaderBytes << " bytes";
            ok = false;
            break;
        }

        if (state_ == kExpectRequestLine) {
            ok = processRequestLine(buf->Peek(), crlf);
            if (!ok) break;
            buf->Retrieve(lineLen);
            state_ = kExpectHeaders;
        } else if (state_ == kExpectHeaders) {
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon != crlf) {
                request_.addHeader(buf->Peek(), colon, crlf);
                buf->Retrieve(lineLen);
            } else if (crlf == buf->Peek()) {
                // empty line, end of headers
                buf->Retrieve(lineLen);
                state_ = kGotAll;
                hasMore = false;

                // An upgrade request carries no body; anything after the head
                // belongs to the upgraded stream.
                const std::string cl = request_.getHeader("Content-Length");
                if (request_.hasHeader("Transfer-Encoding") ||
                    (!cl.empty() && std::strtoll(cl.c_str(), nullptr, 10) != 0)) {
                    ok = false;
                }
            } else {
                ok = false;
                break;
            }
        }
    }
    return ok;
}

} // namespace protocol
} // namespace wsproxy
