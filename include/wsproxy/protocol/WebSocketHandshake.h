#pragma once

#include "wsproxy/protocol/HttpRequest.h"
#include "wsproxy/protocol/HttpResponse.h"
#include "wsproxy/protocol/HttpResponseContext.h"
#include "wsproxy/protocol/BackendUrl.h"

#include <string>

namespace wsproxy {
namespace protocol {

// Opening handshake helpers for both ends of a connection.
class WebSocketHandshake {
public:
    // base64(SHA-1(key + GUID)).
    static std::string ComputeAcceptKey(const std::string& key);

    // Random 16 byte nonce, base64 encoded.
    static bool GenerateClientKey(std::string* key);

    // Checks an inbound request against the endpoint path. Returns
    // k101SwitchingProtocols when the upgrade may proceed, otherwise the
    // status to reject it with.
    static HttpResponse::HttpStatusCode ValidateUpgrade(const HttpRequest& req,
                                                        const std::string& path,
                                                        std::string* err);

    static HttpResponse BuildServerResponse(const std::string& clientKey);
    static HttpResponse BuildReject(HttpResponse::HttpStatusCode code, const std::string& detail);

    static std::string BuildClientRequest(const BackendUrl& url, const std::string& key);
    // Checks the backend's reply to BuildClientRequest.
    static bool ValidateServerResponse(const HttpResponseContext& resp,
                                       const std::string& key,
                                       std::string* err);

    static const char* const kGuid;
};

} // namespace protocol
} // namespace wsproxy
