// GoogleTest unit tests for the Speedwire packet codec
#include "proto/Data2Command.hpp"
#include "proto/Packet.hpp"
#include "proto/ProtoError.hpp"
#include <gtest/gtest.h>

#include <vector>

using namespace speedwire::proto;

namespace {

const std::vector<std::uint8_t> kDiscoveryRequestBytes = {
    0x53, 0x4D, 0x41, 0x00,             // "SMA\0"
    0x00, 0x04, 0x02, 0xA0,             // group tag
    0xFF, 0xFF, 0xFF, 0xFF,             // broadcast group
    0x00, 0x00, 0x00, 0x20,             // discovery entry, no data
    0x00, 0x00, 0x00, 0x00,             // end
};

} // namespace

TEST(PacketTest, DiscoveryRequestWireFormat)
{
    EXPECT_EQ(Packet::discovery_request().bytes(), kDiscoveryRequestBytes);
}

TEST(PacketTest, ReadDiscoveryRequest)
{
    Packet p;
    ASSERT_FALSE(p.read(kDiscoveryRequestBytes));
    EXPECT_EQ(p.group(), Packet::kBroadcastGroup);
    ASSERT_EQ(p.entries().size(), 1u);
    EXPECT_NE(p.find(tags::kDiscovery), nullptr);
    EXPECT_EQ(p.find(tags::kData2), nullptr);
}

TEST(PacketTest, ReadRejectsMalformedInput)
{
    Packet p;
    EXPECT_EQ(p.read(std::vector<std::uint8_t>{0x53, 0x4D}), make_error_code(proto_errc::too_short));

    auto bad_magic = kDiscoveryRequestBytes;
    bad_magic[0] = 'X';
    EXPECT_EQ(p.read(bad_magic), make_error_code(proto_errc::bad_magic));

    auto no_group = kDiscoveryRequestBytes;
    no_group[7] = 0xA1;
    EXPECT_EQ(p.read(no_group), make_error_code(proto_errc::missing_group));

    auto no_end = kDiscoveryRequestBytes;
    no_end.resize(16);
    EXPECT_EQ(p.read(no_end), make_error_code(proto_errc::missing_end));

    auto truncated = kDiscoveryRequestBytes;
    truncated[13] = 0x10; // entry claims 16 bytes
    EXPECT_EQ(p.read(truncated), make_error_code(proto_errc::truncated_entry));
}

TEST(PacketTest, FailedReadLeavesPacketUnchanged)
{
    Packet p(0x1234);
    p.add_entry(tags::kData2, {0x60, 0x65});
    EXPECT_TRUE(p.read(std::vector<std::uint8_t>{1, 2, 3}));
    EXPECT_EQ(p.group(), 0x1234u);
    EXPECT_EQ(p.protocol_id(), Data2Command::kProtocolId);
}

TEST(PacketTest, ErrorCategoryMessages)
{
    std::error_code ec = proto_errc::bad_magic;
    EXPECT_STREQ(ec.category().name(), "speedwire.proto");
    EXPECT_EQ(ec.message(), "missing SMA signature");
}

TEST(PacketTest, SummaryNamesGroupAndTags)
{
    const auto text = Packet::discovery_request().to_string();
    EXPECT_NE(text.find("group=0xffffffff"), std::string::npos);
    EXPECT_NE(text.find("tag=0x0020/0"), std::string::npos);
}

TEST(Data2CommandTest, LoginRequestLayout)
{
    const auto cmd = make_login_request(ClientIdentity{}, 5, "0000", 0x01020304);
    EXPECT_EQ(cmd.command, Data2Command::kLoginCommand);
    EXPECT_EQ(cmd.sequence(), 5);
    EXPECT_EQ(cmd.packet_id & Data2Command::kPacketIdFlag, Data2Command::kPacketIdFlag);
    ASSERT_EQ(cmd.params.size(), 28u);
    EXPECT_EQ(cmd.params[0], 0x07);          // user group
    EXPECT_EQ(cmd.params[8], 0x04);          // time, little endian
    EXPECT_EQ(cmd.params[16], '0' + 0x88);   // encoded password
    EXPECT_EQ(cmd.params[27], 0x88);         // padding

    const auto bytes = cmd.encode();
    EXPECT_EQ(bytes[0], 0x60);
    EXPECT_EQ(bytes[1], 0x65);
    EXPECT_EQ(bytes[2], (28 + 28) / 4);
}

TEST(Data2CommandTest, PacketCarriesCommand)
{
    Data2Command reply;
    reply.control = 0xE0;
    reply.src_susy_id = 0x0174;
    reply.src_serial = 2001234567;
    reply.error_code = Data2Command::kErrorInvalidPassword;
    reply.packet_id = 0x8009;
    reply.command = Data2Command::kLoginCommand | 1;

    Packet parsed;
    ASSERT_FALSE(parsed.read(reply.to_packet().bytes()));
    EXPECT_EQ(parsed.protocol_id(), Data2Command::kProtocolId);

    const auto decoded = Data2Command::from_packet(parsed);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->src_susy_id, 0x0174);
    EXPECT_EQ(decoded->src_serial, 2001234567u);
    EXPECT_EQ(decoded->error_code, Data2Command::kErrorInvalidPassword);
    EXPECT_EQ(decoded->sequence(), 9);
}

TEST(Data2CommandTest, DecodeRejectsForeignPayload)
{
    EXPECT_FALSE(Data2Command::decode(std::vector<std::uint8_t>{0x60, 0x69, 0x01}).has_value());
    EXPECT_FALSE(Data2Command::from_packet(Packet::discovery_request()).has_value());
}
