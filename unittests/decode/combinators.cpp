#include "gtest/gtest.h"
#include "decode/test_writer.h"
#include "decode/combinators.h"

using namespace solaris::decode;

namespace
{
int32 read_id(byte_cursor& c)
{
    return c.read_i32();
}

struct item
{
    item() : id(0) {}

    int32 id;
    std::string name;
    std::vector<int32> kinds;
};

item read_item(byte_cursor& c)
{
    item i;
    i.id = c.read_i32();
    i.name = length_prefixed_string(c);
    i.kinds = optional_array(c, read_id);
    return i;
}
}

namespace
{
TEST(decode, length_prefixed_string)
{
    test::writer w;
    w.str("\xE8\xB5\x9B\xE5\xB0\x94\xE5\x8F\xB7").str("");

    byte_cursor c(w.bytes());
    EXPECT_EQ("\xE8\xB5\x9B\xE5\xB0\x94\xE5\x8F\xB7", length_prefixed_string(c));
    EXPECT_EQ(11u, c.position());
    EXPECT_EQ("", length_prefixed_string(c));
    EXPECT_TRUE(c.eof());

    // Length says 5, only 3 bytes follow
    test::writer bad;
    bad.u16(5).raw("abc");
    byte_cursor c2(bad.bytes());
    EXPECT_THROW(length_prefixed_string(c2), bounds_error);
}

TEST(decode, optional_gate)
{
    test::writer w;
    w.gate(false).gate(true).i32(42).i32(7);

    byte_cursor c(w.bytes());
    EXPECT_EQ(0, optional(c, read_id));
    EXPECT_EQ(1u, c.position());
    EXPECT_EQ(42, optional(c, read_id));
    EXPECT_EQ(6u, c.position());

    // Absent value is whatever the caller asks for
    std::vector<uint8> off = {0};
    byte_cursor c2(off);
    EXPECT_EQ(-1, optional(c2, read_id, -1));
    EXPECT_TRUE(c2.eof());
}

TEST(decode, optional_array_lengths)
{
    test::writer w;
    w.gate(false);
    w.array(0);
    w.array(3).i32(1).i32(2).i32(3);
    w.gate(true).i32(-5);

    byte_cursor c(w.bytes());
    EXPECT_TRUE(optional_array(c, read_id).empty());
    EXPECT_EQ(1u, c.position());

    EXPECT_TRUE(optional_array(c, read_id).empty());
    EXPECT_EQ(1u + 5u, c.position());

    std::vector<int32> three = optional_array(c, read_id);
    EXPECT_EQ((std::vector<int32>{1, 2, 3}), three);
    EXPECT_EQ(6u + 1 + 4 + 3 * 4, c.position());

    // Negative counts read no elements
    EXPECT_TRUE(optional_array(c, read_id).empty());
    EXPECT_TRUE(c.eof());
}

TEST(decode, optional_array_huge_count)
{
    // Count claims far more elements than the buffer holds
    test::writer w;
    w.array(0x7FFFFFFF).i32(1);
    byte_cursor c(w.bytes());
    EXPECT_THROW(optional_array(c, read_id), bounds_error);
}

TEST(decode, optional_record_depth)
{
    test::writer w;
    w.gate(true).i32(9);

    byte_cursor c(w.bytes(), 0);
    EXPECT_THROW(optional_record(c, read_id), depth_error);

    byte_cursor c2(w.bytes(), 1);
    EXPECT_EQ(9, optional_record(c2, read_id));
    EXPECT_EQ(0, c2.depth());
}

TEST(decode, composed_record)
{
    test::writer w;
    w.gate(true);
    w.array(2);
    w.i32(10).str("a").array(2).i32(1).i32(2);
    w.i32(11).str("b").gate(false);

    byte_cursor c(w.bytes());
    std::vector<item> items = document(c,
        [](byte_cursor& c)
        {
            return optional_array(c, read_item);
        },
        std::vector<item>());

    ASSERT_EQ(2u, items.size());
    EXPECT_EQ(10, items[0].id);
    EXPECT_EQ("a", items[0].name);
    EXPECT_EQ((std::vector<int32>{1, 2}), items[0].kinds);
    EXPECT_EQ(11, items[1].id);
    EXPECT_EQ("b", items[1].name);
    EXPECT_TRUE(items[1].kinds.empty());
    EXPECT_TRUE(c.eof());
}

TEST(decode, empty_document_gate)
{
    std::vector<uint8> buf = {0x00};
    byte_cursor c(buf);
    std::vector<item> items = document(c,
        [](byte_cursor& c)
        {
            return optional_array(c, read_item);
        },
        std::vector<item>());
    EXPECT_TRUE(items.empty());
    EXPECT_EQ(1u, c.position());
}
}
