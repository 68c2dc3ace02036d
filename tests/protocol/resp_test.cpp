#include "rediskit/protocol/resp.hpp"

#include <gtest/gtest.h>

#include "rediskit/core/errors.hpp"

namespace rediskit::protocol::test {

TEST(RespEncoderTest, EncodeCommand) {
    EXPECT_EQ(RespEncoder::encode_command({"SET", "key", "value"}),
              "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n");
}

TEST(RespEncoderTest, EncodeCommandWithEmptyAndBinaryArgs) {
    std::string binary("a\r\nb", 4);
    EXPECT_EQ(RespEncoder::encode_command({"SET", "", binary}),
              std::string("*3\r\n$3\r\nSET\r\n$0\r\n\r\n$4\r\na\r\nb\r\n"));
}

TEST(RespEncoderTest, EncodeValues) {
    EXPECT_EQ(RespEncoder::encode(RespValue::simple("OK")), "+OK\r\n");
    EXPECT_EQ(RespEncoder::encode(RespValue::error("ERR bad")), "-ERR bad\r\n");
    EXPECT_EQ(RespEncoder::encode(RespValue::number(-7)), ":-7\r\n");
    EXPECT_EQ(RespEncoder::encode(RespValue::nil()), "$-1\r\n");
    EXPECT_EQ(RespEncoder::encode(RespValue::array({RespValue::bulk("a"), RespValue::number(1)})),
              "*2\r\n$1\r\na\r\n:1\r\n");
}

TEST(RespParserTest, ParseEveryType) {
    RespParser parser;
    parser.feed("+OK\r\n-ERR oops\r\n:42\r\n$5\r\nhello\r\n$-1\r\n*-1\r\n");

    EXPECT_EQ(parser.next(), RespValue::simple("OK"));
    EXPECT_EQ(parser.next(), RespValue::error("ERR oops"));
    EXPECT_EQ(parser.next(), RespValue::number(42));
    EXPECT_EQ(parser.next(), RespValue::bulk("hello"));
    EXPECT_EQ(parser.next(), RespValue::nil());
    EXPECT_EQ(parser.next(), RespValue::nil());
    EXPECT_FALSE(parser.next().has_value());
    EXPECT_EQ(parser.buffered(), 0u);
}

TEST(RespParserTest, NestedArray) {
    RespParser parser;
    parser.feed("*2\r\n*2\r\n:0\r\n:5460\r\n$3\r\nfoo\r\n");

    auto value = parser.next();
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->is_array());
    ASSERT_EQ(value->elements.size(), 2u);
    EXPECT_EQ(value->elements[0].elements[1].integer, 5460);
    EXPECT_EQ(value->elements[1].str, "foo");
}

TEST(RespParserTest, IncompleteInputStaysBuffered) {
    RespParser parser;
    parser.feed("$5\r\nhel");
    EXPECT_FALSE(parser.next().has_value());

    parser.feed("lo\r\n*2\r\n:1\r\n");
    EXPECT_EQ(parser.next(), RespValue::bulk("hello"));
    EXPECT_FALSE(parser.next().has_value());

    parser.feed(":2\r\n");
    EXPECT_EQ(parser.next(), RespValue::array({RespValue::number(1), RespValue::number(2)}));
}

TEST(RespParserTest, ByteAtATime) {
    std::string wire = RespEncoder::encode(
        RespValue::array({RespValue::simple("QUEUED"), RespValue::bulk("x\r\ny")}));
    RespParser parser;
    for (std::size_t i = 0; i + 1 < wire.size(); ++i) {
        parser.feed(std::string_view(&wire[i], 1));
        EXPECT_FALSE(parser.next().has_value());
    }
    parser.feed(std::string_view(&wire.back(), 1));

    auto value = parser.next();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->elements[1].str, "x\r\ny");
}

TEST(RespParserTest, MalformedInputThrows) {
    RespParser bad_prefix;
    bad_prefix.feed("?what\r\n");
    EXPECT_THROW((void)bad_prefix.next(), core::ProtocolException);

    RespParser bad_integer;
    bad_integer.feed(":12x\r\n");
    EXPECT_THROW((void)bad_integer.next(), core::ProtocolException);

    RespParser bad_terminator;
    bad_terminator.feed("$2\r\nabXY");
    EXPECT_THROW((void)bad_terminator.next(), core::ProtocolException);

    RespParser bad_length;
    bad_length.feed("$-5\r\n");
    EXPECT_THROW((void)bad_length.next(), core::ProtocolException);
}

TEST(RespParserTest, Reset) {
    RespParser parser;
    parser.feed("$10\r\npartial");
    EXPECT_GT(parser.buffered(), 0u);
    parser.reset();
    EXPECT_EQ(parser.buffered(), 0u);

    parser.feed(":1\r\n");
    EXPECT_EQ(parser.next(), RespValue::number(1));
}

TEST(RespValueTest, ToString) {
    EXPECT_EQ(RespValue::simple("OK").to_string(), "OK");
    EXPECT_EQ(RespValue::error("ERR x").to_string(), "(error) ERR x");
    EXPECT_EQ(RespValue::number(3).to_string(), "(integer) 3");
    EXPECT_EQ(RespValue::bulk("v").to_string(), "\"v\"");
    EXPECT_EQ(RespValue::nil().to_string(), "(nil)");
    EXPECT_EQ(RespValue::array({}).to_string(), "(empty array)");
    EXPECT_EQ(RespValue::array({RespValue::bulk("a"), RespValue::number(2)}).to_string(),
              "1) \"a\"\n2) (integer) 2");
}

}  // namespace rediskit::protocol::test
