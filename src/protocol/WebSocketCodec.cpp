#include "wsproxy/protocol/WebSocketCodec.h"
#include "wsproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>

namespace wsproxy {
namespace protocol {

const size_t WebSocketCodec::kMaxControlPayload;

const char* OpcodeName(Opcode op) {
    switch (op) {
        case Opcode::kContinuation: return "continuation";
        case Opcode::kText: return "text";
        case Opcode::kBinary: return "binary";
        case Opcode::kClose: return "close";
        case Opcode::kPing: return "ping";
        case Opcode::kPong: return "pong";
    }
    return "unknown";
}

static bool IsKnownOpcode(uint8_t op) {
    return op == 0x0 || op == 0x1 || op == 0x2 || op == 0x8 || op == 0x9 || op == 0xA;
}

// Reports a rejected frame together with the close code it maps to.
static WebSocketCodec::ParseResult Violation(uint16_t code, const std::string& what,
                                             std::string* err, uint16_t* closeCode) {
    if (err) *err = what;
    if (closeCode) *closeCode = code;
    return WebSocketCodec::kError;
}

WebSocketCodec::ParseResult WebSocketCodec::Parse(wsproxy::network::Buffer* buf,
                                                  WebSocketFrame* frame,
                                                  std::string* err,
                                                  uint16_t* closeCode) const {
    const size_t avail = buf->ReadableBytes();
    if (avail < 2) return kIncomplete;

    const uint8_t* p = reinterpret_cast<const uint8_t*>(buf->Peek());
    const bool fin = (p[0] & 0x80) != 0;
    const uint8_t rsv = p[0] & 0x70;
    const uint8_t op = p[0] & 0x0F;
    const bool masked = (p[1] & 0x80) != 0;
    uint64_t len = p[1] & 0x7F;

    if (rsv != 0) {
        return Violation(kCloseProtocolError, "reserved bits set", err, closeCode);
    }
    if (!IsKnownOpcode(op)) {
        return Violation(kCloseProtocolError, "unknown opcode " + std::to_string(op), err, closeCode);
    }
    const bool expectMasked = (role_ == kServer);
    if (masked != expectMasked) {
        return Violation(kCloseProtocolError,
                         expectMasked ? "unmasked client frame" : "masked server frame",
                         err, closeCode);
    }

    size_t off = 2;
    if (len == 126) {
        if (avail < off + 2) return kIncomplete;
        len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
        off += 2;
    } else if (len == 127) {
        if (avail < off + 8) return kIncomplete;
        len = 0;
        for (int i = 0; i < 8; ++i) {
            len = (len << 8) | p[2 + i];
        }
        if (len >> 63) {
            return Violation(kCloseProtocolError, "payload length has the most significant bit set",
                             err, closeCode);
        }
        off += 8;
    }

    const Opcode opcode = static_cast<Opcode>(op);
    if (IsControl(opcode)) {
        if (!fin) {
            return Violation(kCloseProtocolError, "fragmented control frame", err, closeCode);
        }
        if (len > kMaxControlPayload) {
            return Violation(kCloseProtocolError, "control frame payload too long", err, closeCode);
        }
    }
    if (len > maxPayloadBytes_) {
        return Violation(kCloseTooBig, "frame of " + std::to_string(len) + " bytes exceeds limit", err, closeCode);
    }

    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (avail < off + 4) return kIncomplete;
        for (int i = 0; i < 4; ++i) mask[i] = p[off + i];
        off += 4;
    }
    if (avail < off + len) return kIncomplete;

    frame->fin = fin;
    frame->opcode = opcode;
    frame->payload.assign(buf->Peek() + off, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < frame->payload.size(); ++i) {
            frame->payload[i] = static_cast<char>(static_cast<uint8_t>(frame->payload[i]) ^ mask[i % 4]);
        }
    }
    buf->Retrieve(off + static_cast<size_t>(len));
    return kFrame;
}

bool WebSocketCodec::Encode(Opcode opcode, const char* data, size_t len,
                            wsproxy::network::Buffer* out) const {
    char header[14];
    size_t hlen = 0;
    header[hlen++] = static_cast<char>(0x80 | static_cast<uint8_t>(opcode));

    const uint8_t maskBit = (role_ == kClient) ? 0x80 : 0x00;
    if (len <= 125) {
        header[hlen++] = static_cast<char>(maskBit | static_cast<uint8_t>(len));
    } else if (len <= 0xFFFF) {
        header[hlen++] = static_cast<char>(maskBit | 126);
        header[hlen++] = static_cast<char>((len >> 8) & 0xFF);
        header[hlen++] = static_cast<char>(len & 0xFF);
    } else {
        header[hlen++] = static_cast<char>(maskBit | 127);
        const uint64_t l = static_cast<uint64_t>(len);
        for (int i = 7; i >= 0; --i) {
            header[hlen++] = static_cast<char>((l >> (i * 8)) & 0xFF);
        }
    }

    if (role_ == kServer) {
        out->Append(header, hlen);
        out->Append(data, len);
        return true;
    }

    unsigned char mask[4];
    if (RAND_bytes(mask, sizeof mask) != 1) {
        LOG_ERROR << "WebSocketCodec::Encode RAND_bytes failed: " << ERR_get_error();
        return false;
    }
    for (int i = 0; i < 4; ++i) header[hlen++] = static_cast<char>(mask[i]);
    out->Append(header, hlen);

    out->EnsureWritableBytes(len);
    char* dst = out->BeginWrite();
    for (size_t i = 0; i < len; ++i) {
        dst[i] = static_cast<char>(static_cast<uint8_t>(data[i]) ^ mask[i % 4]);
    }
    out->HasWritten(len);
    return true;
}

std::string WebSocketCodec::MakeClosePayload(uint16_t code, const std::string& reason) {
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    // Keep the whole frame within the control frame limit.
    payload.append(reason, 0, std::min(reason.size(), kMaxControlPayload - 2));
    return payload;
}

bool WebSocketCodec::ParseClosePayload(const std::string& payload, uint16_t* code, std::string* reason) {
    if (payload.empty()) {
        *code = kCloseNoStatus;
        reason->clear();
        return true;
    }
    if (payload.size() < 2) return false;
    *code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
    reason->assign(payload, 2, std::string::npos);
    return true;
}

} // namespace protocol
} // namespace wsproxy
