#include "gtest/gtest.h"
#include "Util.h"
#include "decode/schema_loader.h"
#include "parse/schema_registry.h"
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;
using namespace solaris::parse;

namespace
{
std::string descriptor(const std::string& name, const std::string& source)
{
    return R"({"name": ")" + name + R"(", "source": ")" + source +
           R"(", "root_key": "root", "root": "R", "records": {"R": [{"name": "id", "type": "i32"}]}})";
}

struct temp_dir
{
    temp_dir()
      : path(fs::temp_directory_path() / fs::unique_path("solaris-%%%%-%%%%"))
    {
        fs::create_directories(path);
    }
    ~temp_dir()
    {
        boost::system::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name) const
    {
        return (path / name).string();
    }

    fs::path path;
};
}

namespace
{
TEST(parse, registry_builtin)
{
    schema_registry reg;
    EXPECT_EQ(0u, reg.size());
    reg.add_builtin();
    EXPECT_EQ(6u, reg.size());

    const solaris::decode::document_schema* monsters = reg.find("monsters");
    ASSERT_NE(nullptr, monsters);
    EXPECT_EQ(monsters, reg.find_by_source("monsters.bytes"));
    EXPECT_EQ("petSkin.json", reg.find_by_source("pet_skin.bytes")->output_file);
    EXPECT_EQ(nullptr, reg.find("nope"));
    EXPECT_EQ(nullptr, reg.find_by_source(""));

    // Registration order is kept
    EXPECT_EQ("achievements", reg.schemas().front().name);

    reg.clear();
    EXPECT_EQ(0u, reg.size());
    EXPECT_EQ(nullptr, reg.find("monsters"));
}

TEST(parse, registry_replace)
{
    schema_registry reg;
    reg.add_builtin();

    solaris::decode::document_schema replacement =
        solaris::decode::parse_schema(
            descriptor("nature", "nature_v2.bytes"), "inline");
    EXPECT_FALSE(reg.add(replacement));
    EXPECT_EQ(6u, reg.size());
    EXPECT_EQ("nature_v2.bytes", reg.find("nature")->source_file);
    EXPECT_EQ(nullptr, reg.find_by_source("nature.bytes"));
    EXPECT_EQ(reg.find("nature"), reg.find_by_source("nature_v2.bytes"));

    EXPECT_TRUE(reg.add(solaris::decode::parse_schema(
        descriptor("extra", "extra.bytes"), "inline")));
    EXPECT_EQ(7u, reg.size());
    EXPECT_EQ("extra", reg.schemas().back().name);
}

TEST(parse, registry_load_directory)
{
    temp_dir dir;
    ASSERT_TRUE(WriteFileText(dir.file("b.json"), descriptor("b", "b.bytes")));
    ASSERT_TRUE(WriteFileText(dir.file("a.json"), descriptor("a", "a.bytes")));
    ASSERT_TRUE(WriteFileText(dir.file("broken.json"), "{\"name\": "));
    ASSERT_TRUE(WriteFileText(dir.file("notes.txt"), "not a schema"));

    schema_registry reg;
    EXPECT_EQ(1u, reg.load_directory(dir.path.string()));
    ASSERT_EQ(2u, reg.size());
    EXPECT_EQ("a", reg.schemas()[0].name);
    EXPECT_EQ("b", reg.schemas()[1].name);

    EXPECT_EQ(1u, reg.load_directory(dir.file("missing")));
    EXPECT_EQ(0u, reg.load_directory(SOLARIS_TEST_SCHEMA_DIR));
    EXPECT_NE(nullptr, reg.find_by_source("petbook.bytes"));
}

TEST(parse, registry_describe)
{
    schema_registry reg;
    reg.add(solaris::decode::parse_schema(descriptor("x", "x.bytes"), "i"));
    reg.add(solaris::decode::parse_schema(
        descriptor("long_one", "long_name.bytes"), "i"));

    EXPECT_EQ(
        "Found 2 schemas:\n"
        "x.bytes         -> x.json           x\n"
        "long_name.bytes -> long_one.json    long_one\n",
        reg.describe());
}
}
