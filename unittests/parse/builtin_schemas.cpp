#include "gtest/gtest.h"
#include "decode/test_writer.h"
#include "decode/document.h"
#include "parse/builtin_schemas.h"
#include <set>

using namespace solaris::decode;
using namespace solaris::parse;

namespace
{
void write_move(test::writer& w, int32 id)
{
    w.i32(id).i32(10).i32(1).i32(0);
}

void write_sp_move(test::writer& w, int32 id)
{
    w.i32(id).i32(0).i32(2).i32(3);
}

std::vector<std::string> field_names(const value& rec)
{
    std::vector<std::string> names;
    for (auto& f : rec.fields())
        names.push_back(f.first);
    return names;
}
}

namespace
{
TEST(parse, builtin_catalog)
{
    std::vector<document_schema> schemas = builtin_schemas();
    ASSERT_EQ(6u, schemas.size());

    std::set<std::string> names, sources;
    for (auto& s : schemas)
    {
        EXPECT_TRUE(names.insert(s.name).second) << s.name;
        EXPECT_TRUE(sources.insert(s.source_file).second) << s.source_file;
        EXPECT_NE(nullptr, s.root) << s.name;

        // Every schema accepts the single-byte empty document
        std::vector<uint8> empty = {0};
        document_result res = decode_document(empty, s);
        EXPECT_TRUE(res.empty);
        EXPECT_EQ(1u, res.consumed);
        EXPECT_TRUE(res.doc.has(s.root_key));
    }
    EXPECT_TRUE(sources.count("monsters.bytes"));
    EXPECT_TRUE(sources.count("effectIcon.bytes"));
}

TEST(parse, achievements_conformance)
{
    test::writer w;
    w.gate(true);
    w.array(1); // type
    w.array(1); // branches
    w.array(1); // branch
    w.str("branch desc").i32(5).i32(1);
    w.array(1); // rule
    w.i32(0).i32(10).str("desc").i32(77).i32(0).str("3").str("ab");
    w.str("\xE5\x8B\x87\xE8\x80\x85").i32(0).i32(1).str("title").str("#fff");
    w.str("text").i32(1);
    w.str("type desc").i32(9);

    document_schema schema = achievements_schema();
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);

    const value& type = res.doc["achievement_rules"]["type"][0];
    EXPECT_EQ(9, type["id"].as_int());
    EXPECT_EQ("type desc", type["desc"].as_string());

    const value& branch = type["branches"][0]["branch"][0];
    EXPECT_EQ(5, branch["id"].as_int());
    EXPECT_EQ(1, branch["is_show_pro"].as_int());

    const value& rule = branch["rule"][0];
    EXPECT_EQ(77, rule["id"].as_int());
    EXPECT_EQ(10, rule["achievement_point"].as_int());
    EXPECT_EQ("\xE5\x8B\x87\xE8\x80\x85", rule["ach_name"].as_string());
    EXPECT_EQ("#fff", rule["title_color"].as_string());
}

TEST(parse, nature_conformance)
{
    test::writer w;
    w.gate(true).array(1);
    w.str("d1").str("d2").i32(3);
    w.f32(1.1f).f32(0.9f).f32(1.0f).f32(0.899999976f).f32(1.005f);
    w.str("name");

    document_schema schema = nature_schema();
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);

    const value& n = res.doc["root"]["nature"][0];
    EXPECT_EQ(1.1, n["sp_atk"].as_float());
    EXPECT_EQ(0.9, n["sp_def"].as_float());
    EXPECT_EQ(1.0, n["atk"].as_float());
    EXPECT_EQ(0.9, n["def"].as_float());
    EXPECT_EQ("name", n["name"].as_string());
}

TEST(parse, nature_rounding_ties)
{
    test::writer w;
    w.gate(true).array(1);
    w.str("").str("").i32(4);
    w.f32(0.125f).f32(1.125f).f32(2.625f).f32(-0.125f).f32(0.375f);
    w.str("");

    document_result res = decode_document(w.bytes(), nature_schema());
    const value& n = res.doc["root"]["nature"][0];
    EXPECT_EQ(0.12, n["sp_atk"].as_float());
    EXPECT_EQ(1.12, n["sp_def"].as_float());
    EXPECT_EQ(2.62, n["atk"].as_float());
    EXPECT_EQ(-0.12, n["def"].as_float());
    EXPECT_EQ(0.38, n["spd"].as_float());
}

TEST(parse, effect_icon_conformance)
{
    test::writer w;
    w.gate(true).array(1);
    w.i32(1).str("a").str("c");
    w.array(2).str("x").str("y"); // des
    w.i32(2).i32(3).i32(0).i32(0);
    w.gate(false); // kind
    w.i32(4).i32(5);
    w.array(1).i32(3001); // pet_id
    w.array(0);           // specific_id
    w.gate(false);        // tag
    w.i32(6).str("tips").i32(7);

    document_schema schema = effect_icon_schema();
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);

    const value& e = res.doc["root"]["effect"][0];
    EXPECT_EQ(2u, e["des"].size());
    EXPECT_EQ("y", e["des"][1].as_string());
    EXPECT_EQ(value::kind::array, e["kind"].type());
    EXPECT_EQ(0u, e["kind"].size());
    EXPECT_EQ(3001, e["pet_id"][0].as_int());
    EXPECT_EQ(0u, e["tag"].size());
    EXPECT_EQ(7, e["to"].as_int());
}

TEST(parse, pet_skin_conformance)
{
    test::writer w;
    w.gate(true).array(2);
    w.str("go").str("gt").i32(1).i32(100).str("skin one");
    w.array(1).i32(1).i32(0).i32(2).i32(3).i32(2020);
    w.i32(0);
    w.str("").str("").i32(2).i32(101).str("skin two").gate(false).i32(1);

    document_schema schema = pet_skin_schema();
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);

    const value& skins = res.doc["pet_skins"]["skin"];
    ASSERT_EQ(2u, skins.size());
    EXPECT_EQ(2020, skins[0]["skin_kind"][0]["year"].as_int());
    EXPECT_EQ(0u, skins[1]["skin_kind"].size());
    EXPECT_EQ("petSkin.json", schema.output_file);
}

TEST(parse, monsters_conformance)
{
    test::writer w;
    w.gate(true).array(1);
    w.i32(100).i32(0).i32(0).i32(90).str("def").i32(0).i32(0).i32(0);
    w.gate(false); // extra_moves
    w.i32(0).i32(1).i32(80).i32(3001);
    w.gate(true); // learnable_moves
    w.gate(false);
    w.array(2);
    write_move(w, 1);
    write_move(w, 2);
    w.array(1);
    write_sp_move(w, 3);
    w.gate(true); // move
    write_move(w, 4);
    w.i32(1).i32(3001);
    w.gate(false); // show_extra_moves
    w.i32(110).i32(95);
    w.gate(false); // sp_extra_moves
    w.i32(99).i32(0).i32(0).i32(8).i32(0).i32(1).i32(0);

    document_schema schema = monsters_schema();
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);

    const value& m = res.doc["monsters"]["monster"][0];
    EXPECT_EQ(3001, m["id"].as_int());
    EXPECT_TRUE(m["extra_moves"].is_null());
    EXPECT_TRUE(m["show_extra_moves"].is_null());
    EXPECT_EQ(1, m["is_fly_pet"].as_int());

    const value& learnable = m["learnable_moves"];
    EXPECT_EQ(0u, learnable["adv_move"].size());
    ASSERT_EQ(2u, learnable["move"].size());
    EXPECT_EQ(2, learnable["move"][1]["id"].as_int());
    EXPECT_EQ(3, learnable["sp_move"][0]["tag2"].as_int());
    EXPECT_EQ(4, m["move"]["id"].as_int());

    EXPECT_EQ((std::vector<std::string>{"id", "learning_lv", "rec", "tag"}),
        field_names(m["move"]));
}

TEST(parse, move_stones_conformance)
{
    test::writer w;
    w.gate(true).array(1);
    w.i32(1).i32(20);
    w.array(2);
    w.i32(10).array(2).i32(1).i32(2).gate(false);
    w.i32(11).gate(false).array(1).i32(5);
    w.str("stone").i32(80).i32(3);

    document_schema schema = move_stones_schema();
    document_result res = decode_document(w.bytes(), schema);
    EXPECT_EQ(w.size(), res.consumed);

    const value& effects = res.doc["root"]["move_stone"][0]["move_effect"];
    ASSERT_EQ(2u, effects.size());
    EXPECT_EQ(2u, effects[0]["side_effect"].size());
    EXPECT_TRUE(effects[0]["side_effect_arg"].is_null());
    EXPECT_TRUE(effects[1]["side_effect"].is_null());
    EXPECT_EQ(5, effects[1]["side_effect_arg"][0].as_int());

    std::vector<uint8> empty = {0};
    EXPECT_TRUE(decode_document(empty, schema).doc["root"].is_null());
}
}
