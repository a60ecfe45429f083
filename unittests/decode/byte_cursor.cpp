#include "gtest/gtest.h"
#include "decode/test_writer.h"
#include "decode/byte_cursor.h"
#include <cmath>
#include <limits>

using namespace solaris::decode;

namespace
{
TEST(decode, cursor_integers)
{
    test::writer w;
    w.u8(0).u8(255).i8(-128).i8(127);
    w.i16(std::numeric_limits<int16>::min()).i16(-1).u16(65535);
    w.i32(std::numeric_limits<int32>::min()).i32(std::numeric_limits<int32>::max());
    w.u32(0xFFFFFFFF);
    w.i64(std::numeric_limits<int64>::min()).u64(0xFFFFFFFFFFFFFFFFULL);

    byte_cursor c(w.bytes());
    EXPECT_EQ(0, c.read_u8());
    EXPECT_EQ(255, c.read_u8());
    EXPECT_EQ(-128, c.read_i8());
    EXPECT_EQ(127, c.read_i8());
    EXPECT_EQ(std::numeric_limits<int16>::min(), c.read_i16());
    EXPECT_EQ(-1, c.read_i16());
    EXPECT_EQ(65535, c.read_u16());
    EXPECT_EQ(std::numeric_limits<int32>::min(), c.read_i32());
    EXPECT_EQ(std::numeric_limits<int32>::max(), c.read_i32());
    EXPECT_EQ(0xFFFFFFFFu, c.read_u32());
    EXPECT_EQ(std::numeric_limits<int64>::min(), c.read_i64());
    EXPECT_EQ(0xFFFFFFFFFFFFFFFFULL, c.read_u64());
    EXPECT_TRUE(c.eof());
    EXPECT_EQ(w.size(), c.position());
}

TEST(decode, cursor_little_endian)
{
    std::vector<uint8> buf = {0x01, 0x02, 0x03, 0x04};
    byte_cursor c(buf);
    EXPECT_EQ(0x04030201u, c.read_u32());

    byte_cursor c2(buf);
    EXPECT_EQ(0x0201, c2.read_u16());
    EXPECT_EQ(0x0403, c2.read_u16());
}

TEST(decode, cursor_bool)
{
    std::vector<uint8> buf = {0x00, 0x01, 0x02, 0xFF};
    byte_cursor c(buf);
    EXPECT_FALSE(c.read_bool());
    EXPECT_TRUE(c.read_bool());
    EXPECT_TRUE(c.read_bool());
    EXPECT_TRUE(c.read_bool());
    EXPECT_EQ(4u, c.position());
}

TEST(decode, cursor_floats)
{
    test::writer w;
    w.f32(1.5f).f32(-0.0f).f32(std::numeric_limits<float>::infinity());
    w.f32(std::numeric_limits<float>::quiet_NaN());
    w.f64(3.141592653589793).f64(-std::numeric_limits<double>::infinity());
    w.f64(std::numeric_limits<double>::quiet_NaN());

    byte_cursor c(w.bytes());
    EXPECT_EQ(1.5f, c.read_f32());
    float neg_zero = c.read_f32();
    EXPECT_EQ(0.0f, neg_zero);
    EXPECT_TRUE(std::signbit(neg_zero));
    EXPECT_TRUE(std::isinf(c.read_f32()));
    EXPECT_TRUE(std::isnan(c.read_f32()));
    EXPECT_EQ(3.141592653589793, c.read_f64());
    double inf = c.read_f64();
    EXPECT_TRUE(std::isinf(inf));
    EXPECT_LT(inf, 0);
    EXPECT_TRUE(std::isnan(c.read_f64()));
    EXPECT_TRUE(c.eof());
}

TEST(decode, cursor_truncated)
{
    std::vector<uint8> buf = {0x01, 0x02, 0x03};
    byte_cursor c(buf);
    EXPECT_THROW(c.read_i32(), bounds_error);

    byte_cursor c2(buf);
    c2.read_u16();
    try
    {
        c2.read_u16();
        FAIL() << "read past the end";
    }
    catch (bounds_error& e)
    {
        EXPECT_EQ(2u, e.position());
        EXPECT_EQ(2u, e.requested());
        EXPECT_EQ(3u, e.size());
    }

    byte_cursor empty(nullptr, 0);
    EXPECT_TRUE(empty.eof());
    EXPECT_THROW(empty.read_bool(), bounds_error);
    EXPECT_THROW(empty.read_f64(), decode_error);
}

TEST(decode, cursor_utf8)
{
    // "赛尔号" is 9 bytes of UTF-8
    std::string name = "\xE8\xB5\x9B\xE5\xB0\x94\xE5\x8F\xB7";
    test::writer w;
    w.raw(name).raw("ab");

    byte_cursor c(w.bytes());
    EXPECT_EQ(name, c.read_utf8(9));
    EXPECT_EQ(9u, c.position());
    EXPECT_EQ("", c.read_utf8(0));
    EXPECT_EQ("ab", c.read_utf8(2));
    EXPECT_THROW(c.read_utf8(1), bounds_error);
}

TEST(decode, cursor_invalid_utf8)
{
    // Truncated three byte sequence
    std::vector<uint8> buf = {'a', 0xE8, 0xB5, 'b'};
    byte_cursor c(buf);
    try
    {
        c.read_utf8(4);
        FAIL() << "invalid UTF-8 accepted";
    }
    catch (encoding_error& e)
    {
        EXPECT_EQ(0u, e.position());
        EXPECT_EQ(4u, e.length());
    }

    std::vector<uint8> lone = {0xFF};
    byte_cursor c2(lone);
    EXPECT_THROW(c2.read_utf8(1), encoding_error);
}

TEST(decode, cursor_seek_skip)
{
    std::vector<uint8> buf = {1, 2, 3, 4, 5};
    byte_cursor c(buf);
    c.skip(2);
    EXPECT_EQ(3, c.read_u8());
    EXPECT_EQ(2u, c.remaining());
    c.seek(0);
    EXPECT_EQ(1, c.read_u8());
    c.seek(5);
    EXPECT_TRUE(c.eof());
    EXPECT_THROW(c.seek(6), bounds_error);
    c.seek(4);
    EXPECT_THROW(c.skip(2), bounds_error);
}

TEST(decode, depth_guard)
{
    std::vector<uint8> buf = {0};
    byte_cursor c(buf, 2);
    EXPECT_EQ(0, c.depth());
    {
        depth_guard a(c);
        depth_guard b(c);
        EXPECT_EQ(2, c.depth());
        EXPECT_THROW(depth_guard d(c), depth_error);
        EXPECT_EQ(2, c.depth());
    }
    EXPECT_EQ(0, c.depth());
}

TEST(decode, to_bit_array)
{
    std::vector<bool> bits = to_bit_array(0x5, 4);
    ASSERT_EQ(4u, bits.size());
    EXPECT_TRUE(bits[0]);
    EXPECT_FALSE(bits[1]);
    EXPECT_TRUE(bits[2]);
    EXPECT_FALSE(bits[3]);

    EXPECT_TRUE(to_bit_array(0xFF, 0).empty());
    std::vector<bool> wide = to_bit_array(1ULL << 63, 70);
    ASSERT_EQ(70u, wide.size());
    EXPECT_TRUE(wide[63]);
    EXPECT_FALSE(wide[64]);
}
}
