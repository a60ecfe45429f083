#include "gtest/gtest.h"
#include "decode/test_writer.h"
#include "decode/document.h"
#include "decode/schema_decoder.h"
#include <cmath>
#include <limits>

using namespace solaris::decode;

namespace
{
// Outer { id, inner? }, Inner { tag, pairs?[] }, Pair { a, b }
document_schema nested_schema()
{
    schema_builder b;
    b.record("Pair").i32("a").string("b");
    b.record("Inner").u16("tag").array_of("pairs", "Pair");
    b.record("Outer").i32("id").record("inner", "Inner");
    return b.document("nested", "nested.bytes", "", "outer", "Outer");
}

// Self-referencing chain: Node { value, next? }
document_schema chain_schema()
{
    schema_builder b;
    b.record("Node").i32("value").record("next", "Node");
    return b.document("chain", "chain.bytes", "chain.json", "node", "Node");
}

std::vector<uint8> chain_buffer(int nodes)
{
    test::writer w;
    w.gate(true);
    for (int i = 0; i < nodes; ++i)
    {
        w.i32(i);
        w.gate(i + 1 < nodes);
    }
    return w.bytes();
}
}

namespace
{
TEST(decode, document_nested_recursion)
{
    test::writer w;
    w.gate(true);
    w.i32(1001);
    w.gate(true).u16(7);
    w.array(3);
    w.i32(1).str("one");
    w.i32(2).str("\xE8\xB5\x9B\xE5\xB0\x94\xE5\x8F\xB7");
    w.i32(-3).str("");

    document_schema schema = nested_schema();
    document_result res = decode_document(w.bytes(), schema);

    EXPECT_FALSE(res.empty);
    EXPECT_EQ(w.size(), res.consumed);
    EXPECT_FALSE(res.has_trailing_bytes());

    const value& outer = res.doc["outer"];
    EXPECT_EQ(1001, outer["id"].as_int());
    const value& inner = outer["inner"];
    EXPECT_EQ(7u, inner["tag"].as_uint());

    const value& pairs = inner["pairs"];
    ASSERT_EQ(3u, pairs.size());
    EXPECT_EQ(1, pairs[0]["a"].as_int());
    EXPECT_EQ("one", pairs[0]["b"].as_string());
    EXPECT_EQ(2, pairs[1]["a"].as_int());
    EXPECT_EQ(
        "\xE8\xB5\x9B\xE5\xB0\x94\xE5\x8F\xB7", pairs[1]["b"].as_string());
    EXPECT_EQ(-3, pairs[2]["a"].as_int());
    EXPECT_EQ("", pairs[2]["b"].as_string());

    // Fields come out in declaration order
    ASSERT_EQ(2u, outer.fields().size());
    EXPECT_EQ("id", outer.fields()[0].first);
    EXPECT_EQ("inner", outer.fields()[1].first);
}

TEST(decode, document_empty_gate)
{
    std::vector<uint8> buf = {0x00, 0xDE, 0xAD};
    document_schema schema = nested_schema();

    document_result res = decode_document(buf, schema);
    EXPECT_TRUE(res.empty);
    EXPECT_EQ(1u, res.consumed);
    EXPECT_TRUE(res.has_trailing_bytes());

    // Default empty document: root record with every field defaulted
    const value& outer = res.doc["outer"];
    EXPECT_EQ(0, outer["id"].as_int());
    EXPECT_TRUE(outer["inner"].is_null());
    EXPECT_EQ(empty_document(schema), res.doc);

    decode_options strict;
    strict.strict = true;
    EXPECT_THROW(decode_document(buf, schema, strict), trailing_data_error);

    std::vector<uint8> just_gate = {0x00};
    EXPECT_NO_THROW(decode_document(just_gate, schema, strict));
}

TEST(decode, document_empty_null_policy)
{
    schema_builder b;
    b.record("Root").array("ids", field_type::i32);
    document_schema schema = b.document(
        "ids", "ids.bytes", "", "root", "Root", absent_policy::null);
    EXPECT_EQ("ids.json", schema.output_file);

    std::vector<uint8> buf = {0x00};
    document_result res = decode_document(buf, schema);
    ASSERT_EQ(1u, res.doc.size());
    EXPECT_TRUE(res.doc["root"].is_null());
}

TEST(decode, document_truncated)
{
    test::writer w;
    w.gate(true).i32(5).gate(true).u16(1).array(2).i32(1).str("x").u8(0x02);

    document_schema schema = nested_schema();
    EXPECT_THROW(decode_document(w.bytes(), schema), bounds_error);

    std::vector<uint8> none;
    EXPECT_THROW(decode_document(none, schema), bounds_error);
}

TEST(decode, document_trailing_bytes)
{
    test::writer w;
    w.gate(true).i32(5).gate(false).u8(0xFF);

    document_schema schema = nested_schema();
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(6u, res.consumed);
    EXPECT_EQ(7u, res.size);
    EXPECT_TRUE(res.has_trailing_bytes());

    decode_options strict;
    strict.strict = true;
    try
    {
        decode_document(w.bytes(), schema, strict);
        FAIL() << "trailing byte accepted";
    }
    catch (trailing_data_error& e)
    {
        EXPECT_EQ(6u, e.position());
    }
}

TEST(decode, document_depth_ceiling)
{
    document_schema schema = chain_schema();

    // The root record is one level, every linked node one more
    decode_options opts;
    opts.max_depth = 5;
    document_result res = decode_document(chain_buffer(5), schema, opts);
    EXPECT_EQ(4, res.doc["node"]["next"]["next"]["next"]["next"]["value"].as_int());

    EXPECT_THROW(decode_document(chain_buffer(6), schema, opts), depth_error);

    // Default ceiling
    EXPECT_NO_THROW(
        decode_document(chain_buffer(SOLARIS_DEFAULT_MAX_DEPTH), schema));
    EXPECT_THROW(
        decode_document(chain_buffer(SOLARIS_DEFAULT_MAX_DEPTH + 1), schema),
        depth_error);
}

TEST(decode, document_self_reference_defaults)
{
    document_schema schema = chain_schema();
    value empty = empty_document(schema);
    EXPECT_EQ(0, empty["node"]["value"].as_int());
    EXPECT_TRUE(empty["node"]["next"].is_null());
}

TEST(decode, nullable_scalars)
{
    schema_builder b;
    b.record("Root")
        .nullable("level", field_type::i32)
        .nullable("note", field_type::string, absent_policy::null)
        .nullable("ratio", field_type::f64);
    document_schema schema =
        b.document("opt", "opt.bytes", "", "root", "Root");

    test::writer w;
    w.gate(true).gate(false).gate(true).str("hi").gate(false);
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);
    EXPECT_EQ(0, res.doc["root"]["level"].as_int());
    EXPECT_EQ("hi", res.doc["root"]["note"].as_string());
    EXPECT_EQ(0.0, res.doc["root"]["ratio"].as_float());

    test::writer w2;
    w2.gate(true).gate(true).i32(-9).gate(false).gate(true).f64(2.5);
    res = decode_document(w2.bytes(), schema);
    EXPECT_EQ(-9, res.doc["root"]["level"].as_int());
    EXPECT_TRUE(res.doc["root"]["note"].is_null());
    EXPECT_EQ(2.5, res.doc["root"]["ratio"].as_float());
}

TEST(decode, scalar_types)
{
    test::writer w;
    w.i8(-1).u8(200).u8(1).i16(-2).u16(60000).i32(-3).u32(4000000000u);
    w.i64(-4).u64(18000000000000000000ULL).f32(0.25f).f64(-1e300);

    byte_cursor c(w.bytes());
    EXPECT_EQ(-1, decode_scalar(c, field_type::i8).as_int());
    EXPECT_EQ(200u, decode_scalar(c, field_type::u8).as_uint());
    EXPECT_TRUE(decode_scalar(c, field_type::boolean).as_bool());
    EXPECT_EQ(-2, decode_scalar(c, field_type::i16).as_int());
    EXPECT_EQ(60000u, decode_scalar(c, field_type::u16).as_uint());
    EXPECT_EQ(-3, decode_scalar(c, field_type::i32).as_int());
    EXPECT_EQ(4000000000u, decode_scalar(c, field_type::u32).as_uint());
    EXPECT_EQ(-4, decode_scalar(c, field_type::i64).as_int());
    EXPECT_EQ(18000000000000000000ULL,
        decode_scalar(c, field_type::u64).as_uint());
    EXPECT_EQ(0.25, decode_scalar(c, field_type::f32).as_float());
    EXPECT_EQ(-1e300, decode_scalar(c, field_type::f64).as_float());
    EXPECT_TRUE(c.eof());

    EXPECT_THROW(decode_scalar(c, field_type::record), schema_error);
}

TEST(decode, float_rounding)
{
    test::writer w;
    w.f32(1.1f).f32(-0.125f).f32(0.375f).f64(1e300).f64(
        std::numeric_limits<double>::quiet_NaN());

    byte_cursor c(w.bytes());
    // 1.1f is 1.10000002384185791015625
    EXPECT_EQ(1.1, decode_scalar(c, field_type::f32, 2).as_float());
    // Exact ties go to the even digit
    EXPECT_EQ(-0.12, decode_scalar(c, field_type::f32, 2).as_float());
    EXPECT_EQ(0.38, decode_scalar(c, field_type::f32, 2).as_float());
    EXPECT_EQ(1e300, decode_scalar(c, field_type::f64, 2).as_float());
    EXPECT_TRUE(std::isnan(decode_scalar(c, field_type::f64, 2).as_float()));
}
}
