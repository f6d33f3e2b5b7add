#include "lifx_protocol/packet.hpp"

#include <gtest/gtest.h>

using namespace lifx_protocol;

TEST(PacketTest, ConstructorTakesOwnershipOfPayload) {
    std::vector<uint8_t> payload{1, 2, 3};
    Packet packet(101, PacketKind::GET, std::move(payload), uint16_t{107}, true);

    EXPECT_EQ(packet.type, 101);
    EXPECT_EQ(packet.kind, PacketKind::GET);
    EXPECT_EQ(packet.payload, (std::vector<uint8_t>{1, 2, 3}));
    ASSERT_TRUE(packet.stateType.has_value());
    EXPECT_EQ(*packet.stateType, 107);
    EXPECT_TRUE(packet.multiResponse);
}

TEST(PacketTest, DefaultsToOtherWithoutReplyType) {
    Packet packet;
    EXPECT_EQ(packet.kind, PacketKind::OTHER);
    EXPECT_TRUE(packet.payload.empty());
    EXPECT_FALSE(packet.stateType.has_value());
    EXPECT_EQ(kindToString(packet.kind), "OTHER");
    EXPECT_EQ(kindToString(PacketKind::SET), "SET");
}
