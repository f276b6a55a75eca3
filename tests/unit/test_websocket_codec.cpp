#include "wsproxy/protocol/WebSocketCodec.h"
#include "wsproxy/network/Buffer.h"
#include "wsproxy/common/Logger.h"

#include <cassert>
#include <string>

using namespace wsproxy::protocol;
using wsproxy::network::Buffer;
using wsproxy::common::Logger;
using wsproxy::common::LogLevel;

static std::string maskedFrame(uint8_t b0, const std::string& payload) {
    const uint8_t mask[4] = {0x37, 0xfa, 0x21, 0x3d};
    std::string out;
    out.push_back(static_cast<char>(b0));
    out.push_back(static_cast<char>(0x80 | payload.size()));
    out.append(reinterpret_cast<const char*>(mask), 4);
    for (size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return out;
}

static void testRfcMaskedHello() {
    // RFC 6455 section 5.7, single-frame masked text message.
    const unsigned char bytes[] = {0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58};
    WebSocketCodec server(WebSocketCodec::kServer, 1024);
    Buffer buf;
    buf.Append(reinterpret_cast<const char*>(bytes), sizeof bytes);

    WebSocketFrame frame;
    std::string err;
    assert(server.Parse(&buf, &frame, &err) == WebSocketCodec::kFrame);
    assert(frame.fin);
    assert(frame.opcode == Opcode::kText);
    assert(frame.payload == "Hello");
    assert(buf.ReadableBytes() == 0);
}

static void testIncompleteInput() {
    WebSocketCodec server(WebSocketCodec::kServer, 1 << 20);
    const std::string whole = maskedFrame(0x82, std::string(100, 'z'));
    Buffer buf;
    WebSocketFrame frame;
    std::string err;
    for (size_t i = 0; i + 1 < whole.size(); ++i) {
        buf.Append(whole.data() + i, 1);
        assert(server.Parse(&buf, &frame, &err) == WebSocketCodec::kIncomplete);
    }
    buf.Append(whole.data() + whole.size() - 1, 1);
    assert(server.Parse(&buf, &frame, &err) == WebSocketCodec::kFrame);
    assert(frame.opcode == Opcode::kBinary);
    assert(frame.payload == std::string(100, 'z'));
}

static void testEncodeLengthsAndMasking() {
    WebSocketCodec server(WebSocketCodec::kServer, 1 << 20);
    WebSocketCodec client(WebSocketCodec::kClient, 1 << 20);

    const size_t sizes[] = {0, 125, 126, 65535, 65536};
    for (size_t n : sizes) {
        const std::string payload(n, 'p');

        Buffer wire;
        assert(server.Encode(Opcode::kBinary, payload.data(), payload.size(), &wire));
        // Server frames are never masked.
        assert((static_cast<uint8_t>(wire.Peek()[1]) & 0x80) == 0);
        WebSocketFrame frame;
        std::string err;
        assert(client.Parse(&wire, &frame, &err) == WebSocketCodec::kFrame);
        assert(frame.payload == payload);

        assert(client.Encode(Opcode::kText, payload.data(), payload.size(), &wire));
        assert((static_cast<uint8_t>(wire.Peek()[1]) & 0x80) != 0);
        assert(server.Parse(&wire, &frame, &err) == WebSocketCodec::kFrame);
        assert(frame.opcode == Opcode::kText);
        assert(frame.payload == payload);
    }

    Buffer wire;
    server.Encode(Opcode::kText, "x", 1, &wire);
    assert(static_cast<uint8_t>(wire.Peek()[0]) == 0x81);
    assert(static_cast<uint8_t>(wire.Peek()[1]) == 1);
    wire.RetrieveAll();
    server.Encode(Opcode::kText, std::string(126, 'x').data(), 126, &wire);
    assert(static_cast<uint8_t>(wire.Peek()[1]) == 126);
    wire.RetrieveAll();
    server.Encode(Opcode::kText, std::string(65536, 'x').data(), 65536, &wire);
    assert(static_cast<uint8_t>(wire.Peek()[1]) == 127);
}

static void expectError(WebSocketCodec::Role role, const std::string& bytes, const std::string& needle,
                        uint16_t expectedCode = wsproxy::protocol::kCloseProtocolError) {
    WebSocketCodec codec(role, 1000);
    Buffer buf;
    buf.Append(bytes);
    WebSocketFrame frame;
    std::string err;
    uint16_t code = 0;
    assert(codec.Parse(&buf, &frame, &err, &code) == WebSocketCodec::kError);
    assert(err.find(needle) != std::string::npos);
    assert(code == expectedCode);
    // The offending bytes are left in place.
    assert(buf.ReadableBytes() == bytes.size());
}

static void testProtocolViolations() {
    expectError(WebSocketCodec::kServer, std::string("\x81\x02hi", 4), "unmasked");
    expectError(WebSocketCodec::kClient, maskedFrame(0x81, "hi"), "masked server frame");
    expectError(WebSocketCodec::kServer, maskedFrame(0xC1, "hi"), "reserved");
    expectError(WebSocketCodec::kServer, maskedFrame(0x83, "hi"), "unknown opcode");
    expectError(WebSocketCodec::kServer, maskedFrame(0x09, "hi"), "fragmented control");

    std::string longPing;
    longPing.push_back(static_cast<char>(0x89));
    longPing.push_back(static_cast<char>(0x80 | 126));
    longPing.push_back(0);
    longPing.push_back(static_cast<char>(126));
    expectError(WebSocketCodec::kServer, longPing, "control frame payload too long");

    std::string huge;
    huge.push_back(static_cast<char>(0x82));
    huge.push_back(static_cast<char>(0x80 | 126));
    huge.push_back(static_cast<char>(0x10)); // 4096 > 1000
    huge.push_back(0);
    expectError(WebSocketCodec::kServer, huge, "exceeds limit", wsproxy::protocol::kCloseTooBig);

    std::string msb;
    msb.push_back(static_cast<char>(0x82));
    msb.push_back(static_cast<char>(0x80 | 127));
    msb.push_back(static_cast<char>(0x80));
    msb.append(7, '\0');
    expectError(WebSocketCodec::kServer, msb, "most significant bit");
}

static void testClosePayload() {
    const std::string payload = WebSocketCodec::MakeClosePayload(1001, "idle timeout");
    assert(payload.size() == 2 + 12);
    assert(static_cast<uint8_t>(payload[0]) == 0x03);
    assert(static_cast<uint8_t>(payload[1]) == 0xE9);

    uint16_t code = 0;
    std::string reason;
    assert(WebSocketCodec::ParseClosePayload(payload, &code, &reason));
    assert(code == kCloseGoingAway);
    assert(reason == "idle timeout");

    assert(WebSocketCodec::ParseClosePayload("", &code, &reason));
    assert(code == kCloseNoStatus);
    assert(reason.empty());

    assert(!WebSocketCodec::ParseClosePayload("x", &code, &reason));

    // Control frames are capped at 125 bytes.
    const std::string longReason = WebSocketCodec::MakeClosePayload(1000, std::string(300, 'r'));
    assert(longReason.size() == WebSocketCodec::kMaxControlPayload);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testRfcMaskedHello();
    testIncompleteInput();
    testEncodeLengthsAndMasking();
    testProtocolViolations();
    testClosePayload();
    return 0;
}
