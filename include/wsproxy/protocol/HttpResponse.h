#pragma once

#include <string>
#include <map>
#include <stdio.h>
#include <cstring>

#include "wsproxy/network/Buffer.h"

namespace wsproxy {
namespace protocol {

// Response head (plus optional body) written by the upgrade endpoint.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k101SwitchingProtocols = 101,
        k400BadRequest = 400,
        k404NotFound = 404,
        k426UpgradeRequired = 426,
        k500InternalServerError = 500,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    void setStatusCode(HttpStatusCode code) { statusCode_ = code; }
    HttpStatusCode statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) {
        headers_[key] = value;
    }

    void setBody(const std::string& body) { body_ = body; }

    void appendToBuffer(wsproxy::network::Buffer* output) const {
        char buf[32];
        snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
        output->Append(buf, strlen(buf));
        output->Append(statusMessage_);
        output->Append("\r\n");

        // 101 carries its own Connection: Upgrade header and no body.
        if (statusCode_ != k101SwitchingProtocols) {
            if (closeConnection_) {
                output->Append("Connection: close\r\n");
            }
            snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
            output->Append(buf, strlen(buf));
        }

        for (const auto& header : headers_) {
            output->Append(header.first);
            output->Append(": ");
            output->Append(header.second);
            output->Append("\r\n");
        }

        output->Append("\r\n");
        output->Append(body_);
    }

    std::string toString() const {
        wsproxy::network::Buffer buf;
        appendToBuffer(&buf);
        return buf.RetrieveAllAsString();
    }

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace wsproxy
