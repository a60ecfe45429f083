#include "gtest/gtest.h"
#include "Util.h"
#include "parse/output.h"
#include <limits>

using namespace solaris::decode;
using namespace solaris::parse;

namespace
{
TEST(parse, json_keeps_field_order)
{
    value rec = value::make_record();
    rec.add_field("zeta", value::make_int(-1));
    rec.add_field("alpha", value::make_uint(2));
    rec.add_field("name", value::make_string("\xE8\xB5\x9B\xE5\xB0\x94\xE5\x8F\xB7"));
    value list = value::make_array();
    list.push_back(value::make_bool(true));
    list.push_back(value());
    rec.add_field("list", list);
    rec.add_field("empty", value::make_array());

    value doc = value::make_record();
    doc.add_field("root", rec);

    EXPECT_EQ(
        "{\n"
        "  \"root\": {\n"
        "    \"zeta\": -1,\n"
        "    \"alpha\": 2,\n"
        "    \"name\": \"\xE8\xB5\x9B\xE5\xB0\x94\xE5\x8F\xB7\",\n"
        "    \"list\": [\n"
        "      true,\n"
        "      null\n"
        "    ],\n"
        "    \"empty\": []\n"
        "  }\n"
        "}\n",
        dump_document(doc));
}

TEST(parse, json_floats)
{
    value arr = value::make_array();
    arr.push_back(value::make_float(1.1));
    arr.push_back(value::make_float(std::numeric_limits<double>::quiet_NaN()));
    arr.push_back(value::make_float(std::numeric_limits<double>::infinity()));

    nlohmann::ordered_json j = to_json(arr);
    ASSERT_EQ(3u, j.size());
    EXPECT_EQ(1.1, j[0].get<double>());
    EXPECT_TRUE(j[1].is_null());
    EXPECT_TRUE(j[2].is_null());
}

TEST(parse, manifest)
{
    std::vector<job_result> results(3);
    results[0].schema = "nature";
    results[0].source_file = "nature.bytes";
    results[0].output_file = "nature.json";
    results[0].status = job_status::ok;
    results[0].size = 10;
    results[0].consumed = 10;
    results[0].source_crc = 0xcbf43926;
    results[0].output_crc = 0x1;

    results[1].schema = "monsters";
    results[1].status = job_status::failed;
    results[1].size = 3;
    results[1].error = "boom";

    results[2].schema = "pet_skin";

    nlohmann::ordered_json m = manifest_json(results);
    EXPECT_EQ(SOLARIS_MANIFEST_VERSION, m["version"].get<int>());
    EXPECT_EQ(3u, m["total"].get<size_t>());
    EXPECT_EQ(1u, m["ok"].get<size_t>());
    EXPECT_EQ(1u, m["failed"].get<size_t>());
    EXPECT_EQ(1u, m["missing"].get<size_t>());

    auto& docs = m["documents"];
    ASSERT_EQ(3u, docs.size());
    EXPECT_EQ("ok", docs[0]["status"].get<std::string>());
    EXPECT_EQ("cbf43926", docs[0]["source_crc32"].get<std::string>());
    EXPECT_EQ("1", docs[0]["output_crc32"].get<std::string>());
    EXPECT_EQ("failed", docs[1]["status"].get<std::string>());
    EXPECT_EQ("boom", docs[1]["error"].get<std::string>());
    EXPECT_EQ("missing", docs[2]["status"].get<std::string>());
    EXPECT_FALSE(docs[2].contains("size"));
}
}
