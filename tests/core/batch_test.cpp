#include "rediskit/core/batch.hpp"

#include <gtest/gtest.h>

#include "rediskit/core/commands.hpp"
#include "rediskit/core/errors.hpp"

namespace rediskit::core::test {

using protocol::RespValue;

namespace {

std::vector<std::string> names(const RawCommandPacks& packs) {
    std::vector<std::string> result;
    for (const auto& pack : packs.packs) {
        for (const auto& command : pack.commands) {
            result.push_back(command.name());
        }
    }
    return result;
}

}  // namespace

TEST(BatchTest, SequenceConcatenatesAndDecodesInOrder) {
    auto batch = sequence(commands::set("k", "v"), commands::get("k"), commands::incr("n"));
    EXPECT_EQ(names(batch.packs()), (std::vector<std::string>{"SET", "GET", "INCR"}));

    auto [stored, value, counter] = batch.decode_replies(
        {RespValue::simple("OK"), RespValue::bulk("v"), RespValue::number(5)});
    EXPECT_TRUE(stored);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "v");
    EXPECT_EQ(counter, 5);
}

TEST(BatchTest, SequenceOfVector) {
    std::vector<Batch<std::optional<std::string>>> gets{commands::get("a"), commands::get("b")};
    auto batch = sequence(gets);
    auto values = batch.decode_replies({RespValue::nil(), RespValue::bulk("2")});
    ASSERT_EQ(values.size(), 2u);
    EXPECT_FALSE(values[0].has_value());
    ASSERT_TRUE(values[1].has_value());
    EXPECT_EQ(*values[1], "2");
}

TEST(BatchTest, Map) {
    auto batch = commands::incr("n").map([](int64_t n) { return n * 10; });
    EXPECT_EQ(batch.decode_replies({RespValue::number(4)}), 40);
}

TEST(BatchTest, MissingReplyThrows) {
    auto batch = sequence(commands::ping(), commands::ping());
    EXPECT_THROW(batch.decode_replies({RespValue::simple("PONG")}), UnexpectedReplyException);
}

TEST(BatchTest, ErrorReplyThrows) {
    auto batch = commands::incr("n");
    try {
        batch.decode_replies({RespValue::error("ERR value is not an integer")});
        FAIL() << "expected ErrorReplyException";
    } catch (const ErrorReplyException& e) {
        EXPECT_EQ(e.message(), "ERR value is not an integer");
    }
}

TEST(BatchTest, TransactionWrapsInMultiExec) {
    auto batch = sequence(commands::set("k", "v"), commands::incr("n")).transaction();
    EXPECT_TRUE(batch.transactional());
    ASSERT_EQ(batch.packs().packs.size(), 1u);
    EXPECT_EQ(names(batch.packs()), (std::vector<std::string>{"MULTI", "SET", "INCR", "EXEC"}));

    auto [stored, counter] = batch.decode_replies(
        {RespValue::simple("OK"), RespValue::simple("QUEUED"), RespValue::simple("QUEUED"),
         RespValue::array({RespValue::simple("OK"), RespValue::number(1)})});
    EXPECT_TRUE(stored);
    EXPECT_EQ(counter, 1);

    // already transactional: not wrapped twice
    EXPECT_EQ(batch.transaction().packs().reply_count(), 4u);
}

TEST(BatchTest, NilExecIsOptimisticLockFailure) {
    auto batch = commands::incr("n").transaction();
    EXPECT_THROW(batch.decode_replies({RespValue::simple("OK"), RespValue::simple("QUEUED"),
                                       RespValue::nil()}),
                 OptimisticLockException);
}

TEST(BatchTest, ExecAbortReportsQueueingError) {
    auto batch = sequence(commands::set("k", "v"), commands::incr("n")).transaction();
    try {
        batch.decode_replies({RespValue::simple("OK"), RespValue::simple("QUEUED"),
                              RespValue::error("ERR wrong number of arguments"),
                              RespValue::error("EXECABORT Transaction discarded")});
        FAIL() << "expected ErrorReplyException";
    } catch (const ErrorReplyException& e) {
        EXPECT_EQ(e.message(), "ERR wrong number of arguments");
    }
}

TEST(BatchTest, AtomicSkipsWrappingSingleCommand) {
    auto single = commands::incr("n").atomic();
    EXPECT_FALSE(single.transactional());
    EXPECT_EQ(names(single.packs()), (std::vector<std::string>{"INCR"}));

    auto group = sequence(commands::incr("a"), commands::incr("b")).atomic();
    EXPECT_TRUE(group.transactional());
}

}  // namespace rediskit::core::test
