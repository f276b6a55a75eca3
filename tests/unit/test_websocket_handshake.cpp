#include "wsproxy/protocol/WebSocketHandshake.h"
#include "wsproxy/protocol/HttpContext.h"
#include "wsproxy/protocol/HttpResponseContext.h"
#include "wsproxy/protocol/BackendUrl.h"
#include "wsproxy/network/Buffer.h"
#include "wsproxy/common/Logger.h"

#include <cassert>
#include <set>
#include <string>

using namespace wsproxy::protocol;
using wsproxy::network::Buffer;
using wsproxy::common::Logger;
using wsproxy::common::LogLevel;

static HttpRequest parseRequest(const std::string& text) {
    HttpContext ctx;
    Buffer buf;
    buf.Append(text);
    bool ok = ctx.parseRequest(&buf, std::chrono::system_clock::now());
    assert(ok);
    assert(ctx.gotAll());
    return ctx.request();
}

static std::string upgrade(const std::string& requestLine, const std::string& extraHeaders) {
    return requestLine + "\r\nHost: example.com\r\n" + extraHeaders + "\r\n";
}

static const char* kFullHeaders =
    "Upgrade: websocket\r\n"
    "Connection: Upgrade\r\n"
    "Sec-WebSocket-Version: 13\r\n"
    "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n";

static void testAcceptKey() {
    // RFC 6455 section 1.3.
    assert(WebSocketHandshake::ComputeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

static void testClientKeys() {
    std::set<std::string> keys;
    for (int i = 0; i < 16; ++i) {
        std::string key;
        assert(WebSocketHandshake::GenerateClientKey(&key));
        // 16 random bytes in base64.
        assert(key.size() == 24);
        assert(key.substr(22) == "==");
        keys.insert(key);
    }
    assert(keys.size() == 16);
}

static void testValidateUpgrade() {
    std::string err;
    assert(WebSocketHandshake::ValidateUpgrade(parseRequest(upgrade("GET /ws HTTP/1.1", kFullHeaders)), "/ws", &err) ==
           HttpResponse::k101SwitchingProtocols);

    // Header names and tokens are case-insensitive; Connection may list several tokens.
    assert(WebSocketHandshake::ValidateUpgrade(
               parseRequest(upgrade("GET /ws?x=1 HTTP/1.1",
                                    "upgrade: WebSocket\r\nconnection: keep-alive, upgrade\r\n"
                                    "sec-websocket-version: 13\r\nsec-websocket-key: abc\r\n")),
               "/ws", &err) == HttpResponse::k101SwitchingProtocols);

    assert(WebSocketHandshake::ValidateUpgrade(parseRequest(upgrade("GET /chat HTTP/1.1", kFullHeaders)), "/ws", &err) ==
           HttpResponse::k404NotFound);
    assert(WebSocketHandshake::ValidateUpgrade(parseRequest(upgrade("POST /ws HTTP/1.1", kFullHeaders)), "/ws", &err) ==
           HttpResponse::k400BadRequest);
    assert(WebSocketHandshake::ValidateUpgrade(parseRequest(upgrade("GET /ws HTTP/1.0", kFullHeaders)), "/ws", &err) ==
           HttpResponse::k400BadRequest);
    assert(WebSocketHandshake::ValidateUpgrade(
               parseRequest(upgrade("GET /ws HTTP/1.1",
                                    "Connection: Upgrade\r\nSec-WebSocket-Version: 13\r\nSec-WebSocket-Key: abc\r\n")),
               "/ws", &err) == HttpResponse::k400BadRequest);
    assert(WebSocketHandshake::ValidateUpgrade(
               parseRequest(upgrade("GET /ws HTTP/1.1",
                                    "Upgrade: websocket\r\nSec-WebSocket-Version: 13\r\nSec-WebSocket-Key: abc\r\n")),
               "/ws", &err) == HttpResponse::k400BadRequest);
    assert(WebSocketHandshake::ValidateUpgrade(
               parseRequest(upgrade("GET /ws HTTP/1.1",
                                    "Upgrade: websocket\r\nConnection: Upgrade\r\n"
                                    "Sec-WebSocket-Version: 8\r\nSec-WebSocket-Key: abc\r\n")),
               "/ws", &err) == HttpResponse::k426UpgradeRequired);
    assert(err.find("8") != std::string::npos);
    assert(WebSocketHandshake::ValidateUpgrade(
               parseRequest(upgrade("GET /ws HTTP/1.1",
                                    "Upgrade: websocket\r\nConnection: Upgrade\r\nSec-WebSocket-Version: 13\r\n")),
               "/ws", &err) == HttpResponse::k400BadRequest);
    assert(err.find("Sec-WebSocket-Key") != std::string::npos);
}

static void testResponses() {
    const std::string ok = WebSocketHandshake::BuildServerResponse("dGhlIHNhbXBsZSBub25jZQ==").toString();
    assert(ok.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
    assert(ok.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != std::string::npos);
    assert(ok.find("Upgrade: websocket\r\n") != std::string::npos);
    assert(ok.find("Content-Length") == std::string::npos);
    assert(ok.substr(ok.size() - 4) == "\r\n\r\n");

    const std::string r426 = WebSocketHandshake::BuildReject(HttpResponse::k426UpgradeRequired, "v").toString();
    assert(r426.find("HTTP/1.1 426 Upgrade Required\r\n") == 0);
    assert(r426.find("Sec-WebSocket-Version: 13\r\n") != std::string::npos);
    assert(r426.find("Connection: close\r\n") != std::string::npos);

    const std::string r404 = WebSocketHandshake::BuildReject(HttpResponse::k404NotFound, "gone").toString();
    assert(r404.find("HTTP/1.1 404 Not Found\r\n") == 0);
    assert(r404.substr(r404.size() - 5) == "gone\n");
}

static void testClientSide() {
    BackendUrl url;
    std::string err;
    assert(BackendUrl::Parse("ws://backend.local:9000/feed?x=1", &url, &err));

    std::string key;
    assert(WebSocketHandshake::GenerateClientKey(&key));
    const std::string req = WebSocketHandshake::BuildClientRequest(url, key);
    assert(req.find("GET /feed?x=1 HTTP/1.1\r\n") == 0);
    assert(req.find("Host: backend.local:9000\r\n") != std::string::npos);
    assert(req.find("Sec-WebSocket-Key: " + key + "\r\n") != std::string::npos);

    // The request we send is one our own acceptor would take.
    HttpRequest parsed = parseRequest(req);
    assert(WebSocketHandshake::ValidateUpgrade(parsed, "/feed", &err) == HttpResponse::k101SwitchingProtocols);

    Buffer buf;
    buf.Append(WebSocketHandshake::BuildServerResponse(key).toString());
    HttpResponseContext resp;
    assert(resp.parseResponse(&buf));
    assert(resp.gotAll());
    assert(WebSocketHandshake::ValidateServerResponse(resp, key, &err));
    assert(!WebSocketHandshake::ValidateServerResponse(resp, "another key", &err));
    assert(err == "invalid Sec-WebSocket-Accept");

    Buffer forbidden;
    forbidden.Append("HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n");
    HttpResponseContext denied;
    assert(denied.parseResponse(&forbidden));
    assert(!WebSocketHandshake::ValidateServerResponse(denied, key, &err));
    assert(err.find("403") != std::string::npos);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testAcceptKey();
    testClientKeys();
    testValidateUpgrade();
    testResponses();
    testClientSide();
    return 0;
}
