#include "gtest/gtest.h"
#include "decode/test_writer.h"
#include "decode/document.h"
#include "decode/schema_loader.h"
#include <string>

using namespace solaris::decode;

namespace
{
const char* const skin_descriptor = R"({
  "name": "pet_skin_ext",
  "source": "pet_skin.bytes",
  "root_key": "pet_skins",
  "root": "PetSkins",
  "empty": "null",
  "records": {
    "PetSkins": [
      {"name": "skin", "type": "array", "element": "Skin"}
    ],
    "Skin": [
      {"name": "id", "type": "i32"},
      {"name": "name", "type": "string"},
      {"name": "scale", "type": "f32", "round": 1},
      {"name": "ids", "type": "array", "element": "u16", "absent": "null"},
      {"name": "year", "type": "i32", "nullable": true}
    ]
  }
})";

std::string expect_schema_error(const std::string& text)
{
    try
    {
        parse_schema(text, "test.json");
    }
    catch (schema_error& e)
    {
        return e.what();
    }
    ADD_FAILURE() << "no schema_error for " << text;
    return std::string();
}
}

namespace
{
TEST(decode, schema_loader_parses)
{
    document_schema schema = parse_schema(skin_descriptor, "skin.json");
    EXPECT_EQ("pet_skin_ext", schema.name);
    EXPECT_EQ("pet_skin.bytes", schema.source_file);
    EXPECT_EQ("pet_skin_ext.json", schema.output_file);
    EXPECT_EQ("pet_skins", schema.root_key);
    EXPECT_EQ(absent_policy::null, schema.empty);
    ASSERT_NE(nullptr, schema.root);
    EXPECT_EQ("PetSkins", schema.root->name());

    const record_schema* skin = schema.records->find("Skin");
    ASSERT_NE(nullptr, skin);
    ASSERT_EQ(5u, skin->fields().size());
    EXPECT_EQ("id", skin->fields()[0].name);
    EXPECT_EQ(field_type::f32, skin->fields()[2].type);
    EXPECT_EQ(1, skin->fields()[2].round);
    EXPECT_EQ(field_type::u16, skin->fields()[3].element);
    EXPECT_EQ(absent_policy::null, skin->fields()[3].absent);
    EXPECT_TRUE(skin->fields()[4].nullable);

    test::writer w;
    w.gate(true).array(1);
    w.i32(3).str("x").f32(2.25f).gate(false).gate(true).i32(2015);

    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);
    const value& s = res.doc["pet_skins"]["skin"][0];
    EXPECT_EQ(3, s["id"].as_int());
    EXPECT_EQ(2.3, s["scale"].as_float());
    EXPECT_TRUE(s["ids"].is_null());
    EXPECT_EQ(2015, s["year"].as_int());

    std::vector<uint8> empty = {0};
    EXPECT_TRUE(decode_document(empty, schema).doc["pet_skins"].is_null());
}

TEST(decode, schema_loader_errors)
{
    EXPECT_NE(std::string::npos, expect_schema_error("{").find("test.json"));
    expect_schema_error("[]");
    expect_schema_error(R"({"name": "a"})");
    expect_schema_error(R"({"name": "a", "source": "a.bytes", "root_key": "r",
        "root": "A", "records": {"A": [{"name": "x", "type": "int"}]}})");
    expect_schema_error(R"({"name": "a", "source": "a.bytes", "root_key": "r",
        "root": "A", "records": {"A": [{"name": "x", "type": "array"}]}})");
    expect_schema_error(R"({"name": "a", "source": "a.bytes", "root_key": "r",
        "root": "A", "records": {"A": [{"name": "x", "type": "record",
        "record": "Nope"}]}})");
    expect_schema_error(R"({"name": "a", "source": "a.bytes", "root_key": "r",
        "root": "A", "records": {"A": [{"name": "x", "type": "i32",
        "nullable": "yes"}]}})");
    expect_schema_error(R"({"name": "a", "source": "a.bytes", "root_key": "r",
        "root": "A", "empty": "maybe", "records": {"A": [{"name": "x",
        "type": "i32"}]}})");

    std::string dup = expect_schema_error(
        R"({"name": "a", "source": "a.bytes", "root_key": "r", "root": "A",
        "records": {"A": [{"name": "x", "type": "i32"},
        {"name": "x", "type": "i8"}]}})");
    EXPECT_EQ(0u, dup.find("test.json"));
    EXPECT_NE(std::string::npos, dup.find("A.x"));
}

TEST(decode, schema_loader_files)
{
    document_schema petbook =
        load_schema_file(SOLARIS_TEST_SCHEMA_DIR "/petbook.json");
    EXPECT_EQ("petbook.bytes", petbook.source_file);
    EXPECT_EQ("Root", petbook.root->name());

    // Nothing but the root gate: every optional part absent
    value doc = empty_document(petbook);
    const value& root = doc["root"];
    EXPECT_TRUE(root["hot_pet"].is_null());
    EXPECT_TRUE(root["hotspot"].is_null());
    EXPECT_EQ(0u, root["monster"].size());
    EXPECT_TRUE(root["rec_mintmark"].is_null());

    document_schema skill_type =
        load_schema_file(SOLARIS_TEST_SCHEMA_DIR "/skill_type.json");
    EXPECT_EQ("skillType.json", skill_type.output_file);

    test::writer w;
    w.gate(true).array(1);
    w.str("1").str("\xE7\x81\xAB").array(1).str("Fire").i32(2).i32(0);
    document_result res = decode_document(w.bytes(), skill_type);
    EXPECT_EQ(w.size(), res.consumed);
    EXPECT_EQ("Fire", res.doc["root"]["item"][0]["en"][0].as_string());

    EXPECT_THROW(load_schema_file(SOLARIS_TEST_SCHEMA_DIR "/missing.json"),
        schema_error);
}
}
