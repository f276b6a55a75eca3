#include "wsproxy/protocol/WebSocketHandshake.h"
#include "wsproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace wsproxy {
namespace protocol {

const char* const WebSocketHandshake::kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

static std::string Base64(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::string WebSocketHandshake::ComputeAcceptKey(const std::string& key) {
    const std::string concat = key + kGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), digest);
    return Base64(digest, sizeof digest);
}

bool WebSocketHandshake::GenerateClientKey(std::string* key) {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof nonce) != 1) {
        LOG_ERROR << "WebSocketHandshake: RAND_bytes failed: " << ERR_get_error();
        return false;
    }
    *key = Base64(nonce, sizeof nonce);
    return true;
}

HttpResponse::HttpStatusCode WebSocketHandshake::ValidateUpgrade(const HttpRequest& req,
                                                                 const std::string& path,
                                                                 std::string* err) {
    if (req.path() != path) {
        if (err) *err = "no endpoint at " + req.path();
        return HttpResponse::k404NotFound;
    }
    if (req.getMethod() != HttpRequest::kGet) {
        if (err) *err = std::string("method ") + req.methodString() + " not allowed";
        return HttpResponse::k400BadRequest;
    }
    if (req.getVersion() != HttpRequest::kHttp11) {
        if (err) *err = "HTTP/1.1 required";
        return HttpResponse::k400BadRequest;
    }
    if (!req.headerHasToken("Upgrade", "websocket")) {
        if (err) *err = "missing 'Upgrade: websocket'";
        return HttpResponse::k400BadRequest;
    }
    if (!req.headerHasToken("Connection", "Upgrade")) {
        if (err) *err = "missing 'Connection: Upgrade'";
        return HttpResponse::k400BadRequest;
    }
    if (req.getHeader("Sec-WebSocket-Version") != "13") {
        if (err) *err = "unsupported Sec-WebSocket-Version '" + req.getHeader("Sec-WebSocket-Version") + "'";
        return HttpResponse::k426UpgradeRequired;
    }
    if (req.getHeader("Sec-WebSocket-Key").empty()) {
        if (err) *err = "missing Sec-WebSocket-Key";
        return HttpResponse::k400BadRequest;
    }
    return HttpResponse::k101SwitchingProtocols;
}

HttpResponse WebSocketHandshake::BuildServerResponse(const std::string& clientKey) {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k101SwitchingProtocols);
    resp.setStatusMessage("Switching Protocols");
    resp.addHeader("Upgrade", "websocket");
    resp.addHeader("Connection", "Upgrade");
    resp.addHeader("Sec-WebSocket-Accept", ComputeAcceptKey(clientKey));
    return resp;
}

HttpResponse WebSocketHandshake::BuildReject(HttpResponse::HttpStatusCode code, const std::string& detail) {
    HttpResponse resp(true);
    resp.setStatusCode(code);
    switch (code) {
        case HttpResponse::k404NotFound:
            resp.setStatusMessage("Not Found");
            break;
        case HttpResponse::k426UpgradeRequired:
            resp.setStatusMessage("Upgrade Required");
            resp.addHeader("Sec-WebSocket-Version", "13");
            break;
        case HttpResponse::k500InternalServerError:
            resp.setStatusMessage("Internal Server Error");
            break;
        default:
            resp.setStatusCode(HttpResponse::k400BadRequest);
            resp.setStatusMessage("Bad Request");
            break;
    }
    resp.setContentType("text/plain");
    resp.setBody(detail + "\n");
    return resp;
}

std::string WebSocketHandshake::BuildClientRequest(const BackendUrl& url, const std::string& key) {
    std::string req;
    req.reserve(256);
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.hostHeader() + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n";
    req += "\r\n";
    return req;
}

bool WebSocketHandshake::ValidateServerResponse(const HttpResponseContext& resp,
                                                const std::string& key,
                                                std::string* err) {
    if (resp.statusCode() != 101) {
        if (err) *err = "backend answered " + std::to_string(resp.statusCode()) + " " + resp.reason();
        return false;
    }
    if (!resp.headerHasToken("Upgrade", "websocket")) {
        if (err) *err = "backend response lacks 'Upgrade: websocket'";
        return false;
    }
    if (!resp.headerHasToken("Connection", "Upgrade")) {
        if (err) *err = "backend response lacks 'Connection: Upgrade'";
        return false;
    }
    if (resp.getHeader("Sec-WebSocket-Accept") != ComputeAcceptKey(key)) {
        if (err) *err = "invalid Sec-WebSocket-Accept";
        return false;
    }
    return true;
}

} // namespace protocol
} // namespace wsproxy
