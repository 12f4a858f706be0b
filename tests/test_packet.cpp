#include "test_framework.hpp"
#include "mock_transport.hpp"
#include "mctrl/rcon/packet.hpp"
#include "mctrl/rcon/error.hpp"
#include "mctrl/utils/buffer.hpp"

using namespace mctrl::rcon;
using namespace mctrl::test;

// Body of a frame (everything after the size field)
static std::vector<uint8_t> frameBody(const std::vector<uint8_t>& frame) {
    return std::vector<uint8_t>(frame.begin() + 4, frame.end());
}

// =============================================================================
// Encoding Tests
// =============================================================================

TEST(Packet_EncodeLayout) {
    auto data = PacketCodec::encode(Packet::command(7, "list"));

    // size + id + type + "list" + 2 pad bytes
    ASSERT_EQ(data.size(), 4u + 4 + 4 + 4 + 2);

    mctrl::utils::BufferReader reader(data);
    ASSERT_EQ(reader.readI32(), 14);
    ASSERT_EQ(reader.readI32(), 7);
    ASSERT_EQ(reader.readI32(), 2);
    ASSERT_STREQ(reader.readString(4), "list");
    ASSERT_EQ(reader.readU8(), 0);
    ASSERT_EQ(reader.readU8(), 0);
    ASSERT_FALSE(reader.hasMore());
    PASS();
}

TEST(Packet_EncodeLittleEndian) {
    auto data = PacketCodec::encode(Packet::authentication(0x01020304, "pw"));

    ASSERT_EQ(data[4], 0x04);
    ASSERT_EQ(data[5], 0x03);
    ASSERT_EQ(data[6], 0x02);
    ASSERT_EQ(data[7], 0x01);
    ASSERT_EQ(data[8], 3);
    PASS();
}

TEST(Packet_EncodeEmptyPayload) {
    auto data = PacketCodec::encode(Packet::probe(5));
    ASSERT_EQ(data.size(), 14u);
    ASSERT_EQ(data[0], 10);
    PASS();
}

TEST(Packet_EncodeNegativeId) {
    ASSERT_THROWS_KIND(PacketCodec::encode(Packet::command(-1, "list")), RconError, RconError::Kind::InvalidId);
    PASS();
}

TEST(Packet_EncodeMaxPayload) {
    std::string payload(MAX_CLIENT_PAYLOAD_SIZE, 'a');
    auto data = PacketCodec::encode(Packet::command(1, payload));
    ASSERT_EQ(data.size(), 4 + 10 + MAX_CLIENT_PAYLOAD_SIZE);
    PASS();
}

TEST(Packet_EncodePayloadTooBig) {
    std::string payload(MAX_CLIENT_PAYLOAD_SIZE + 1, 'a');
    try {
        PacketCodec::encode(Packet::command(1, payload));
    } catch (const RconError& e) {
        ASSERT_TRUE(e.kind() == RconError::Kind::PayloadTooBig);
        PASS();
    }
    _msg = "Expected PayloadTooBig";
    return false;
}

// =============================================================================
// Decoding Tests
// =============================================================================

TEST(Packet_DecodeResponse) {
    auto body = frameBody(serverFrame(42, PacketType::Response, "There are 0 of a max of 20 players online: "));

    Packet packet = PacketCodec::decode(body);
    ASSERT_EQ(packet.id, 42);
    ASSERT_TRUE(packet.type == PacketType::Response);
    ASSERT_STREQ(packet.payload, "There are 0 of a max of 20 players online: ");
    PASS();
}

TEST(Packet_DecodeAuthResult) {
    Packet packet = PacketCodec::decode(frameBody(serverFrame(-1, PacketType::Command, "")));
    ASSERT_EQ(packet.id, -1);
    ASSERT_TRUE(packet.type == PacketType::Command);
    ASSERT_TRUE(packet.payload.empty());
    PASS();
}

TEST(Packet_DecodeRoundtrip) {
    Packet original(1234, PacketType::Command, "say héllo wörld");
    auto encoded = PacketCodec::encode(original);

    Packet decoded = PacketCodec::decode(frameBody(encoded));
    ASSERT_EQ(decoded.id, original.id);
    ASSERT_TRUE(decoded.type == original.type);
    ASSERT_STREQ(decoded.payload, original.payload);
    PASS();
}

TEST(Packet_DecodeTooShort) {
    std::vector<uint8_t> body(9, 0);
    ASSERT_THROWS_KIND(PacketCodec::decode(body), RconError, RconError::Kind::Decode);
    PASS();
}

TEST(Packet_DecodeRejectsAuthenticationType) {
    auto body = frameBody(serverFrame(1, PacketType::Authentication, ""));
    ASSERT_THROWS_KIND(PacketCodec::decode(body), RconError, RconError::Kind::Decode);
    PASS();
}

TEST(Packet_DecodeMissingPadding) {
    auto body = frameBody(serverFrame(1, PacketType::Response, "ok"));
    body.back() = 'x';
    ASSERT_THROWS_KIND(PacketCodec::decode(body), RconError, RconError::Kind::Decode);
    PASS();
}

TEST(Packet_DecodeInvalidUtf8) {
    auto body = frameBody(serverFrame(1, PacketType::Response, std::string("\xC3\x28", 2)));
    ASSERT_THROWS_KIND(PacketCodec::decode(body), RconError, RconError::Kind::Decode);
    PASS();
}

// =============================================================================
// Framing Tests
// =============================================================================

TEST(Packet_CheckSizeBounds) {
    ASSERT_EQ(PacketCodec::checkSize(MIN_PACKET_SIZE), MIN_PACKET_SIZE);
    ASSERT_EQ(PacketCodec::checkSize(MAX_PACKET_SIZE), MAX_PACKET_SIZE);
    ASSERT_THROWS_KIND(PacketCodec::checkSize(9), RconError, RconError::Kind::Decode);
    ASSERT_THROWS_KIND(PacketCodec::checkSize(4107), RconError, RconError::Kind::Decode);
    ASSERT_THROWS_KIND(PacketCodec::checkSize(-5), RconError, RconError::Kind::Decode);
    PASS();
}

TEST(Packet_ReadFrameRejectsSizeBeforeBody) {
    auto wire = std::make_shared<MockWire>();
    wire->push(rawSizeField(5000));
    MockTransport transport(wire);

    // Only the size field is available: a body read would fail with Read
    ASSERT_THROWS_KIND(PacketCodec::readFrame(transport), RconError, RconError::Kind::Decode);
    ASSERT_EQ(wire->readPos, 4u);
    PASS();
}

TEST(Packet_ReadFrameMaximal) {
    auto wire = std::make_shared<MockWire>();
    wire->push(serverFrame(3, PacketType::Response, std::string(4096, 'x')));
    MockTransport transport(wire);

    Frame frame = PacketCodec::readFrame(transport);
    ASSERT_EQ(frame.size, MAX_PACKET_SIZE);
    ASSERT_TRUE(frame.isMaximal());
    ASSERT_EQ(frame.packet.payload.size(), 4096u);
    PASS();
}

TEST(Packet_ReadFrameTruncated) {
    auto wire = std::make_shared<MockWire>();
    auto frame = serverFrame(3, PacketType::Response, "hello");
    frame.resize(frame.size() - 3);
    wire->push(frame);
    MockTransport transport(wire);

    ASSERT_THROWS_KIND(PacketCodec::readFrame(transport), RconError, RconError::Kind::Read);
    PASS();
}

TEST(Packet_WritePacketRecordsFrame) {
    auto wire = std::make_shared<MockWire>();
    MockTransport transport(wire);

    PacketCodec::writePacket(transport, Packet::command(9, "save-all"));

    auto written = wire->writtenPackets();
    ASSERT_EQ(written.size(), 1u);
    ASSERT_EQ(written[0].id, 9);
    ASSERT_TRUE(written[0].type == PacketType::Command);
    ASSERT_STREQ(written[0].payload, "save-all");
    PASS();
}

// =============================================================================
// UTF-8 Validation Tests
// =============================================================================

static bool utf8(const std::string& s) {
    return mctrl::utils::isValidUtf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

TEST(Utf8_Valid) {
    ASSERT_TRUE(utf8(""));
    ASSERT_TRUE(utf8("plain ascii"));
    ASSERT_TRUE(utf8("\xC3\xA9"));              // é
    ASSERT_TRUE(utf8("\xE2\x82\xAC"));          // €
    ASSERT_TRUE(utf8("\xF0\x9F\x98\x80"));      // emoji
    ASSERT_TRUE(utf8("\xC2\xA7" "aRed"));       // section sign color code
    PASS();
}

TEST(Utf8_Invalid) {
    ASSERT_FALSE(utf8("\x80"));                 // stray continuation
    ASSERT_FALSE(utf8("\xC0\xAF"));             // overlong
    ASSERT_FALSE(utf8("\xE0\x80\xAF"));         // overlong
    ASSERT_FALSE(utf8("\xED\xA0\x80"));         // surrogate
    ASSERT_FALSE(utf8("\xF4\x90\x80\x80"));     // above U+10FFFF
    ASSERT_FALSE(utf8("\xE2\x82"));             // truncated
    PASS();
}
