#pragma once

#include "wsproxy/network/Buffer.h"

#include <cstdint>
#include <cstddef>
#include <string>

namespace wsproxy {
namespace protocol {

// RFC 6455 opcodes.
enum class Opcode : uint8_t {
    kContinuation = 0x0,
    kText = 0x1,
    kBinary = 0x2,
    kClose = 0x8,
    kPing = 0x9,
    kPong = 0xA,
};

const char* OpcodeName(Opcode op);

// Close status codes used by the proxy.
enum CloseCode : uint16_t {
    kCloseNormal = 1000,
    kCloseGoingAway = 1001,
    kCloseProtocolError = 1002,
    kCloseNoStatus = 1005,
    kCloseTooBig = 1009,
    kCloseInternalError = 1011,
};

struct WebSocketFrame {
    bool fin{true};
    Opcode opcode{Opcode::kText};
    std::string payload; // unmasked
};

// Frame parser/encoder for one side of a connection. The server role expects
// masked frames and sends unmasked ones; the client role the other way round.
class WebSocketCodec {
public:
    enum Role { kServer, kClient };
    enum ParseResult { kIncomplete, kFrame, kError };

    static const size_t kMaxControlPayload = 125;

    WebSocketCodec(Role role, size_t maxPayloadBytes)
        : role_(role), maxPayloadBytes_(maxPayloadBytes) {}

    Role role() const { return role_; }

    // Consumes at most one frame from buf. On kError, err describes the
    // violation, closeCode is the status to close with (1002 or 1009) and the
    // buffer is left untouched.
    ParseResult Parse(wsproxy::network::Buffer* buf, WebSocketFrame* frame, std::string* err,
                      uint16_t* closeCode = nullptr) const;

    // Appends a single FIN frame. Fails only if a client mask cannot be drawn.
    bool Encode(Opcode opcode, const char* data, size_t len, wsproxy::network::Buffer* out) const;

    static bool IsControl(Opcode op) { return (static_cast<uint8_t>(op) & 0x8) != 0; }

    static std::string MakeClosePayload(uint16_t code, const std::string& reason);
    // An empty payload yields kCloseNoStatus.
    static bool ParseClosePayload(const std::string& payload, uint16_t* code, std::string* reason);

private:
    Role role_;
    size_t maxPayloadBytes_;
};

} // namespace protocol
} // namespace wsproxy
