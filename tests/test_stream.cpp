#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "tcp_driver/stream.hpp"
#include "test_support.hpp"

using namespace tcp_driver;
using tcp_driver::testing::FakeConnection;

namespace {

    std::vector<std::uint8_t> bytes(std::initializer_list<int> v) {
        std::vector<std::uint8_t> out;
        for (int b : v) out.push_back(static_cast<std::uint8_t>(b));
        return out;
    }

    TEST(StreamTest, IntegersAreWrittenBigEndian) {
        FakeConnection conn({"h", 1});
        ASSERT_TRUE(stream::write_int<std::uint32_t>(conn, 0x01020304u));
        ASSERT_TRUE(stream::write_int<std::int16_t>(conn, -2));
        EXPECT_EQ(conn.written, bytes({0x01, 0x02, 0x03, 0x04, 0xff, 0xfe}));
    }

    TEST(StreamTest, IntegersAreReadBigEndianAcrossPartialReads) {
        FakeConnection conn({"h", 1});
        conn.max_chunk = 1;
        auto in = bytes({0x00, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00, 0x00, 0x00,
                         0x00, 0x00, 0x2a});
        conn.feed(in);

        auto a = stream::read_int<std::uint32_t>(conn);
        ASSERT_TRUE(a);
        EXPECT_EQ(a.value(), 256u);

        auto b = stream::read_int<std::int64_t>(conn);
        ASSERT_TRUE(b);
        EXPECT_EQ(b.value(), static_cast<std::int64_t>(0x800000000000002aULL));
    }

    TEST(StreamTest, ShortStringHasU16Prefix) {
        FakeConnection conn({"h", 1});
        ASSERT_TRUE(stream::write_short_string(conn, "ping"));
        EXPECT_EQ(conn.written, bytes({0x00, 0x04, 'p', 'i', 'n', 'g'}));

        conn.feed(conn.written);
        auto s = stream::read_short_string(conn);
        ASSERT_TRUE(s) << s.error().message;
        EXPECT_EQ(s.value(), "ping");
    }

    TEST(StreamTest, LongStringHasU32Prefix) {
        FakeConnection conn({"h", 1});
        ASSERT_TRUE(stream::write_string(conn, ""));
        ASSERT_TRUE(stream::write_string(conn, "ok"));
        EXPECT_EQ(conn.written,
                  bytes({0, 0, 0, 0, 0, 0, 0, 2, 'o', 'k'}));

        conn.feed(conn.written);
        auto empty = stream::read_string(conn);
        ASSERT_TRUE(empty);
        EXPECT_EQ(empty.value(), "");
        auto ok = stream::read_string(conn);
        ASSERT_TRUE(ok);
        EXPECT_EQ(ok.value(), "ok");
    }

    TEST(StreamTest, ShortStringRejectsOversizedInput) {
        FakeConnection conn({"h", 1});
        std::string big(70000, 'x');
        auto r = stream::write_short_string(conn, big);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, Error::Code::InvalidArgument);
        EXPECT_TRUE(conn.written.empty());
    }

    TEST(StreamTest, LengthAboveLimitFailsAndClosesConnection) {
        FakeConnection conn({"h", 1});
        conn.feed(bytes({0x00, 0x10, 0x00, 0x00}));

        auto r = stream::read_string(conn, 1024);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, Error::Code::ReadFailed);
        EXPECT_FALSE(conn.is_open());
    }

    TEST(StreamTest, TruncatedPayloadIsAReadError) {
        FakeConnection conn({"h", 1});
        conn.feed(bytes({0x00, 0x05, 'a', 'b'}));

        auto r = stream::read_short_string(conn);
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, Error::Code::ReadFailed);
    }

    TEST(StreamTest, RawBytes) {
        FakeConnection conn({"h", 1});
        auto payload = bytes({1, 2, 3, 4, 5});
        ASSERT_TRUE(stream::write_bytes(conn, payload));
        conn.feed(conn.written);

        auto r = stream::read_bytes(conn, 5);
        ASSERT_TRUE(r);
        EXPECT_EQ(r.value(), payload);

        auto none = stream::read_bytes(conn, 0);
        ASSERT_TRUE(none);
        EXPECT_TRUE(none.value().empty());
    }

}  // namespace
