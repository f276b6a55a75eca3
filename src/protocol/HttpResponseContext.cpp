#include "wsproxy/protocol/HttpResponseContext.h"
#include "wsproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace wsproxy {
namespace protocol {

const size_t HttpResponseContext::kMaxHeaderBytes;

static bool parseNonNegative(const std::string& s, int* out) {
    if (s.empty()) return false;
    char* endp = nullptr;
    long v = std::strtol(s.c_str(), &endp, 10);
    if (endp == s.c_str() || *endp != '\0' || v < 0 || v > 999) return false;
    *out = static_cast<int>(v);
    return true;
}

std::string HttpResponseContext::ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool HttpResponseContext::IEquals(const std::string& a, const std::string& b) {
    return ToLowerCopy(a) == ToLowerCopy(b);
}

void HttpResponseContext::reset() {
    state_ = kExpectHead;
    httpMajor_ = 1;
    httpMinor_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
}

std::string HttpResponseContext::getHeader(const std::string& field) const {
    for (const auto& kv : headers_) {
        if (IEquals(kv.first, field)) return kv.second;
    }
    return std::string();
}

bool HttpResponseContext::headerHasToken(const std::string& field, const std::string& token) const {
    const std::string value = ToLowerCopy(getHeader(field));
    const std::string lt = ToLowerCopy(token);
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        size_t b = pos;
        size_t e = comma;
        while (b < e && (value[b] == ' ' || value[b] == '\t')) ++b;
        while (e > b && (value[e - 1] == ' ' || value[e - 1] == '\t')) --e;
        if (value.compare(b, e - b, lt) == 0 && e - b == lt.size()) return true;
        pos = comma + 1;
    }
    return false;
}

bool HttpResponseContext::parseResponse(wsproxy::network::Buffer* buf) {
    if (state_ == kGotAll) return true;
    if (state_ == kError) return false;

    const char* begin = buf->Peek();
    const char* end = buf->BeginWrite();
    static const char kCrlfCrlf[] = "\r\n\r\n";
    const char* dbl = std::search(begin, end, kCrlfCrlf, kCrlfCrlf + 4);
    if (dbl == end) {
        if (buf->ReadableBytes() > kMaxHeaderBytes) {
            LOG_WARN << "HttpResponseContext: response head exceeds " << kMaxHeaderBytes << " bytes";
            state_ = kError;
            return false;
        }
        return true;
    }

    const std::string headerBlock(begin, dbl + 4);
    buf->Retrieve(headerBlock.size());
    if (!parseHeaderBlock(headerBlock)) {
        state_ = kError;
        return false;
    }
    state_ = kGotAll;
    return true;
}

bool HttpResponseContext::parseHeaderBlock(const std::string& headerBlock) {
    headers_.clear();

    // Status line + headers separated by CRLF, ends with CRLFCRLF.
    size_t pos = 0;
    size_t lineEnd = headerBlock.find("\r\n", pos);
    if (lineEnd == std::string::npos) {
        return false;
    }
    const std::string statusLine = headerBlock.substr(0, lineEnd);
    pos = lineEnd + 2;

    // HTTP/1.1 101 Switching Protocols
    if (statusLine.rfind("HTTP/", 0) != 0) {
        return false;
    }
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos) {
        return false;
    }
    const std::string ver = statusLine.substr(5, sp1 - 5);
    const size_t dot = ver.find('.');
    if (dot == std::string::npos) {
        return false;
    }
    if (!parseNonNegative(ver.substr(0, dot), &httpMajor_) ||
        !parseNonNegative(ver.substr(dot + 1), &httpMinor_)) {
        return false;
    }
    size_t sp2 = statusLine.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) sp2 = statusLine.size();
    if (!parseNonNegative(statusLine.substr(sp1 + 1, sp2 - (sp1 + 1)), &statusCode_)) {
        return false;
    }
    reason_ = sp2 < statusLine.size() ? statusLine.substr(sp2 + 1) : std::string();

    // Headers
    while (pos < headerBlock.size()) {
        const size_t next = headerBlock.find("\r\n", pos);
        if (next == std::string::npos) break;
        if (next == pos) {
            pos += 2;
            break;
        }
        const std::string line = headerBlock.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        std::string val = line.substr(colon + 1);
        while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.erase(val.begin());
        while (!val.empty() && (val.back() == ' ' || val.back() == '\t')) val.pop_back();
        headers_[std::move(key)] = std::move(val);
    }
    return true;
}

} // namespace protocol
} // namespace wsproxy
