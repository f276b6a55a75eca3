#pragma once

#include <string>
#include <map>
#include <cctype>
#include <cstddef>

namespace wsproxy {
namespace protocol {

// Request line and headers of an HTTP/1.x request. Header names keep the case
// they arrived in; lookups are case-insensitive.
class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    bool setMethod(const char* start, const char* end) {
        std::string m(start, end);
        if (m == "GET") method_ = kGet;
        else if (m == "POST") method_ = kPost;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else method_ = kInvalid;
        return method_ != kInvalid;
    }

    Method getMethod() const { return method_; }
    const char* methodString() const {
        switch(method_) {
            case kGet: return "GET";
            case kPost: return "POST";
            case kHead: return "HEAD";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            default: return "UNKNOWN";
        }
    }

    void setPath(const char* start, const char* end) {
        path_.assign(start, end);
    }
    const std::string& path() const { return path_; }

    void setQuery(const char* start, const char* end) {
        query_.assign(start, end);
    }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && isspace(static_cast<unsigned char>(value[value.size()-1]))) {
            value.resize(value.size()-1);
        }
        // Repeated fields fold into one comma separated value.
        for (auto& header : headers_) {
            if (iequals_(header.first, field)) {
                header.second += ", " + value;
                return;
            }
        }
        headers_[field] = value;
    }

    std::string getHeader(const std::string& field) const {
        for (const auto& header : headers_) {
            if (iequals_(header.first, field)) {
                return header.second;
            }
        }
        return std::string();
    }

    bool hasHeader(const std::string& field) const {
        for (const auto& header : headers_) {
            if (iequals_(header.first, field)) return true;
        }
        return false;
    }

    // True if the comma separated header value lists token (case-insensitive),
    // e.g. "keep-alive, Upgrade" contains "upgrade".
    bool headerHasToken(const std::string& field, const std::string& token) const {
        const std::string value = getHeader(field);
        size_t pos = 0;
        while (pos <= value.size()) {
            size_t comma = value.find(',', pos);
            if (comma == std::string::npos) comma = value.size();
            size_t b = pos;
            size_t e = comma;
            while (b < e && isspace(static_cast<unsigned char>(value[b]))) ++b;
            while (e > b && isspace(static_cast<unsigned char>(value[e - 1]))) --e;
            if (iequals_(value.substr(b, e - b), token)) return true;
            pos = comma + 1;
        }
        return false;
    }

    const std::map<std::string, std::string>& headers() const { return headers_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
    }

    static bool iequals_(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) return false;
        }
        return true;
    }

private:
    Method method_;
    Version version_;
    std::string path_;
    std::string query_;
    std::map<std::string, std::string> headers_;
};

} // namespace protocol
} // namespace wsproxy
