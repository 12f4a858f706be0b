#include "test_framework.hpp"
#include "mock_transport.hpp"
#include "mctrl/rcon/client.hpp"
#include "mctrl/rcon/error.hpp"
#include "mctrl/rcon/fragment.hpp"

using namespace mctrl::rcon;
using namespace mctrl::test;

// Payload that makes a frame exactly MAX_PACKET_SIZE long
static std::string fullFramePayload(char fill) {
    return std::string(MAX_PACKET_SIZE - 10, fill);
}

static Authenticated fragmentSession(const std::shared_ptr<MockWire>& wire) {
    wire->push(serverFrame(0, PacketType::Command, ""));
    return Connected(std::make_unique<MockTransport>(wire))
        .authenticate(mctrl::utils::SecretString("pw"));
}

TEST(Fragment_MaximalFrameTriggersOneProbe) {
    auto wire = std::make_shared<MockWire>();
    Authenticated session = fragmentSession(wire);

    wire->push(serverFrame(1, PacketType::Response, fullFramePayload('a')));
    wire->push(serverFrame(1, PacketType::Response, fullFramePayload('b')));
    wire->push(serverFrame(1, PacketType::Response, "tail"));
    wire->push(serverFrame(2, PacketType::Response, END_OF_FRAGMENTS));

    std::string reply = session.command("help");

    ASSERT_EQ(reply.size(), 2 * fullFramePayload('a').size() + 4);
    ASSERT_STREQ(reply, fullFramePayload('a') + fullFramePayload('b') + "tail");

    auto written = wire->writtenPackets();
    ASSERT_EQ(written.size(), 3u);
    ASSERT_EQ(written[2].id, 2);
    ASSERT_TRUE(written[2].type == PacketType::Response);
    ASSERT_TRUE(written[2].payload.empty());

    // The probe id is consumed from the sequence
    ASSERT_EQ(session.lastId(), 2);
    PASS();
}

TEST(Fragment_ShortFrameNoProbe) {
    auto wire = std::make_shared<MockWire>();
    Authenticated session = fragmentSession(wire);

    wire->push(serverFrame(1, PacketType::Response, std::string(MAX_PACKET_SIZE - 11, 'z')));

    std::string reply = session.command("help");
    ASSERT_EQ(reply.size(), static_cast<size_t>(MAX_PACKET_SIZE - 11));
    ASSERT_EQ(wire->writtenPackets().size(), 2u);
    PASS();
}

TEST(Fragment_EndMarkerRightAfterFirstFrame) {
    auto wire = std::make_shared<MockWire>();
    MockTransport transport(wire);

    wire->push(serverFrame(6, PacketType::Response, END_OF_FRAGMENTS));

    std::string reply = readFragmented(transport, "head", 5, 6);
    ASSERT_STREQ(reply, "head");
    PASS();
}

TEST(Fragment_ForeignId) {
    auto wire = std::make_shared<MockWire>();
    MockTransport transport(wire);

    wire->push(serverFrame(5, PacketType::Response, "more"));
    wire->push(serverFrame(9, PacketType::Response, "other"));

    try {
        readFragmented(transport, "head", 5, 6);
    } catch (const RconError& e) {
        ASSERT_TRUE(e.kind() == RconError::Kind::IdMismatch);
        ASSERT_EQ(e.expectedId(), 6);
        ASSERT_EQ(e.actualId(), 9);
        PASS();
    }
    _msg = "Expected IdMismatch";
    return false;
}

TEST(Fragment_ProbeReplyWithOtherText) {
    auto wire = std::make_shared<MockWire>();
    MockTransport transport(wire);

    wire->push(serverFrame(6, PacketType::Response, "Unknown request 2"));

    ASSERT_THROWS_KIND(readFragmented(transport, "head", 5, 6), RconError, RconError::Kind::InvalidPacketType);
    PASS();
}

TEST(Fragment_ConnectionLostMidway) {
    auto wire = std::make_shared<MockWire>();
    MockTransport transport(wire);

    wire->push(serverFrame(5, PacketType::Response, "more"));

    ASSERT_THROWS_KIND(readFragmented(transport, "head", 5, 6), RconError, RconError::Kind::Read);
    PASS();
}
