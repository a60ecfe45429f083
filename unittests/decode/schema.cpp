#include "gtest/gtest.h"
#include "decode/schema.h"
#include "decode/schema_decoder.h"
#include <cmath>
#include <stdexcept>

using namespace solaris::decode;

namespace
{
TEST(decode, field_type_names)
{
    field_type t;
    EXPECT_TRUE(parse_field_type("bool", t));
    EXPECT_EQ(field_type::boolean, t);
    EXPECT_TRUE(parse_field_type("u64", t));
    EXPECT_EQ(field_type::u64, t);
    EXPECT_FALSE(parse_field_type("int", t));
    EXPECT_EQ(field_type::u64, t);

    EXPECT_STREQ("string", field_type_name(field_type::string));
    EXPECT_TRUE(is_scalar(field_type::f32));
    EXPECT_FALSE(is_scalar(field_type::array));
}

TEST(decode, schema_builder_resolves_forward_references)
{
    schema_builder b;
    b.record("Root").array_of("kinds", "Kind").record("extra", "Kind");
    b.record("Kind").i32("id");
    std::shared_ptr<const schema_set> set = b.build();

    const record_schema* root = set->find("Root");
    const record_schema* kind = set->find("Kind");
    ASSERT_NE(nullptr, root);
    ASSERT_NE(nullptr, kind);
    EXPECT_EQ(kind, root->fields()[0].record);
    EXPECT_EQ(kind, root->fields()[1].record);
    EXPECT_TRUE(root->fields()[0].gated());
    EXPECT_FALSE(kind->fields()[0].gated());
    EXPECT_EQ(nullptr, set->find("Missing"));

    EXPECT_THROW(b.build(), schema_error);
}

TEST(decode, schema_builder_rejects)
{
    {
        schema_builder b;
        b.record("A").i32("x");
        EXPECT_THROW(b.record("A"), schema_error);
    }
    {
        schema_builder b;
        b.record("A").i32("x").string("x");
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        schema_builder b;
        b.record("A");
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        schema_builder b;
        b.record("A").record("b", "B");
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        schema_builder b;
        b.record("A").array("nested", field_type::array);
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        schema_builder b;
        b.record("A").nullable("r", field_type::record);
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        field f;
        f.name = "n";
        f.type = field_type::i32;
        f.round = 2;
        schema_builder b;
        b.record("A").add(f);
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        schema_builder b;
        b.record("A").f64("ratio", 16);
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        schema_builder b;
        EXPECT_THROW(b.build(), schema_error);
    }
    {
        schema_builder b;
        b.record("A").i32("x");
        EXPECT_THROW(b.document("doc", "doc.bytes", "", "root", "B"),
            schema_error);
    }
    {
        schema_builder b;
        b.record("A").i32("x");
        EXPECT_THROW(b.document("doc", "", "", "root", "A"), schema_error);
    }
}

TEST(decode, schema_default_record)
{
    schema_builder b;
    b.record("Sub").i32("x");
    b.record("Root")
        .i8("a")
        .u32("b")
        .boolean("c")
        .f32("d")
        .string("e")
        .array("f", field_type::string)
        .array("g", field_type::i32, absent_policy::null)
        .record("h", "Sub")
        .record("i", "Sub", absent_policy::type_default);
    std::shared_ptr<const schema_set> set = b.build();

    value v = default_record(*set->find("Root"));
    ASSERT_EQ(9u, v.size());
    EXPECT_EQ(value::kind::integer, v["a"].type());
    EXPECT_EQ(value::kind::uinteger, v["b"].type());
    EXPECT_FALSE(v["c"].as_bool());
    EXPECT_EQ(0.0, v["d"].as_float());
    EXPECT_EQ("", v["e"].as_string());
    EXPECT_EQ(value::kind::array, v["f"].type());
    EXPECT_EQ(0u, v["f"].size());
    EXPECT_TRUE(v["g"].is_null());
    EXPECT_TRUE(v["h"].is_null());
    EXPECT_EQ(0, v["i"]["x"].as_int());
}

TEST(decode, value_access)
{
    value rec = value::make_record();
    rec.add_field("id", value::make_int(-5));
    rec.add_field("big", value::make_uint(7));

    EXPECT_TRUE(rec.has("id"));
    EXPECT_FALSE(rec.has("name"));
    EXPECT_EQ(-5, rec["id"].as_int());
    EXPECT_EQ(7, rec["big"].as_int());
    EXPECT_THROW(rec["name"], std::out_of_range);
    EXPECT_THROW(rec["id"].as_uint(), std::logic_error);
    EXPECT_THROW(rec["id"].as_string(), std::logic_error);

    value arr = value::make_array();
    arr.push_back(value::make_string("a"));
    EXPECT_EQ(1u, arr.size());
    EXPECT_EQ("a", arr[0].as_string());
    EXPECT_THROW(arr[1], std::out_of_range);

    EXPECT_EQ(value::make_float(std::nan("")), value::make_float(std::nan("")));
    EXPECT_NE(value::make_int(1), value::make_uint(2));
    EXPECT_STREQ("record", kind_name(value::kind::record));
}
}
