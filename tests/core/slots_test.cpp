#include "rediskit/core/slots.hpp"

#include <gtest/gtest.h>

#include "rediskit/core/errors.hpp"
#include "rediskit/core/raw_command.hpp"

namespace rediskit::core::test {

TEST(SlotsTest, Crc16ReferenceValue) {
    EXPECT_EQ(crc16("123456789"), 0x31C3);
    EXPECT_EQ(crc16(""), 0);
}

TEST(SlotsTest, KnownKeySlots) {
    EXPECT_EQ(key_slot("foo"), 12182);
    EXPECT_EQ(key_slot("bar"), 5061);
    EXPECT_LT(key_slot("some:long:key:name"), kSlotCount);
}

TEST(SlotsTest, HashTags) {
    EXPECT_EQ(key_slot("{user1000}.following"), key_slot("{user1000}.followers"));
    EXPECT_EQ(key_slot("{user1000}.following"), key_slot("user1000"));

    // empty tag: the whole key is hashed
    EXPECT_EQ(key_slot("foo{}{bar}"), crc16("foo{}{bar}") % kSlotCount);
    // only up to the first closing brace
    EXPECT_EQ(key_slot("foo{{bar}}zap"), key_slot("{bar"));
    // unterminated tag
    EXPECT_EQ(key_slot("foo{bar"), crc16("foo{bar") % kSlotCount);
}

TEST(SlotsTest, SlotRangeContains) {
    SlotRange range{100, 200};
    EXPECT_TRUE(range.contains(100));
    EXPECT_TRUE(range.contains(200));
    EXPECT_FALSE(range.contains(99));
    EXPECT_FALSE(range.contains(201));
    EXPECT_EQ(range.to_string(), "[100, 200]");
}

TEST(RawCommandTest, SlotOfKeyedCommand) {
    RawCommand command{{"MSET", "{a}1", "x", "{a}2", "y"}, Level::Cluster, {1, 3}};
    ASSERT_TRUE(command.slot().has_value());
    EXPECT_EQ(*command.slot(), key_slot("a"));
    EXPECT_EQ(command.keys(), (std::vector<std::string>{"{a}1", "{a}2"}));
}

TEST(RawCommandTest, KeylessCommandHasNoSlot) {
    RawCommand command{{"PING"}, Level::Node, {}};
    EXPECT_FALSE(command.slot().has_value());
}

TEST(RawCommandTest, CrossSlotThrows) {
    RawCommand command{{"DEL", "foo", "bar"}, Level::Cluster, {1, 2}};
    EXPECT_THROW((void)command.slot(), CrossSlotException);

    RawCommandPack pack;
    pack.commands.push_back(RawCommand{{"GET", "foo"}, Level::Cluster, {1}});
    pack.commands.push_back(RawCommand{{"PING"}, Level::Node, {}});
    EXPECT_EQ(pack.slot().value(), key_slot("foo"));

    pack.commands.push_back(RawCommand{{"GET", "bar"}, Level::Cluster, {1}});
    EXPECT_THROW((void)pack.slot(), CrossSlotException);
}

TEST(RawCommandTest, RequireLevel) {
    RawCommandPacks packs;
    RawCommandPack pack;
    pack.commands.push_back(RawCommand{{"GET", "k"}, Level::Cluster, {1}});
    pack.commands.push_back(RawCommand{{"WATCH", "k"}, Level::OperationOnly, {1}});
    packs.packs.push_back(pack);

    EXPECT_NO_THROW(packs.require_level(Level::OperationOnly, "node client"));
    EXPECT_NO_THROW(packs.require_level(Level::Connection, "connection client"));
    EXPECT_THROW(packs.require_level(Level::Node, "node client"), ForbiddenCommandException);
}

TEST(RawCommandTest, EncodeAndReplyCount) {
    RawCommandPacks packs;
    RawCommandPack pack;
    pack.commands.push_back(RawCommand{{"PING"}, Level::Node, {}});
    pack.commands.push_back(RawCommand{{"GET", "k"}, Level::Cluster, {1}});
    packs.packs.push_back(pack);

    EXPECT_EQ(packs.reply_count(), 2u);
    EXPECT_EQ(packs.encode(), "*1\r\n$4\r\nPING\r\n*2\r\n$3\r\nGET\r\n$1\r\nk\r\n");
}

}  // namespace rediskit::core::test
