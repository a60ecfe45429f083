#include "gtest/gtest.h"
#include "Util.h"
#include "decode/test_writer.h"
#include "parse/batch.h"
#include "parse/output.h"
#include "parse/schema_registry.h"
#include <boost/filesystem.hpp>
#include <stdexcept>
#include <string>

namespace fs = boost::filesystem;
using namespace solaris::parse;

namespace
{
struct batch_dirs
{
    batch_dirs()
      : root(fs::temp_directory_path() /
             fs::unique_path("solaris-batch-%%%%-%%%%")),
        source(root / "source"), output(root / "output")
    {
        fs::create_directories(source);
    }
    ~batch_dirs()
    {
        boost::system::error_code ec;
        fs::remove_all(root, ec);
    }

    void put(const std::string& name, const std::vector<uint8>& bytes) const
    {
        std::string text(bytes.begin(), bytes.end());
        ASSERT_TRUE(WriteFileText((source / name).string(), text));
    }

    batch_options options(unsigned int threads) const
    {
        batch_options opts;
        opts.source_dir = source.string();
        opts.output_dir = output.string();
        opts.threads = threads;
        return opts;
    }

    fs::path root, source, output;
};

std::vector<uint8> pet_skin_bytes()
{
    test::writer w;
    w.gate(true).array(1);
    w.str("go").str("gt").i32(1).i32(100).str("skin").gate(false).i32(0);
    return w.bytes();
}

const job_result& result_for(
    const std::vector<job_result>& results, const std::string& schema)
{
    for (auto& r : results)
        if (r.schema == schema)
            return r;
    throw std::runtime_error("no result for " + schema);
}
}

namespace
{
TEST(parse, batch_failure_isolation)
{
    batch_dirs dirs;
    dirs.put("pet_skin.bytes", pet_skin_bytes());
    dirs.put("nature.bytes", std::vector<uint8>{0x00});
    // Gate, then a count with nothing behind it
    dirs.put("monsters.bytes", std::vector<uint8>{0x01, 0x01, 0x05, 0x00});

    schema_registry reg;
    reg.add_builtin();
    batch_runner runner(reg, dirs.options(4));
    std::vector<job_result> results = runner.run();

    ASSERT_EQ(reg.size(), results.size());
    for (size_t i = 0; i < results.size(); ++i)
        EXPECT_EQ(reg.schemas()[i].name, results[i].schema);

    const job_result& skin = result_for(results, "pet_skin");
    EXPECT_EQ(job_status::ok, skin.status);
    EXPECT_EQ(pet_skin_bytes().size(), skin.consumed);
    EXPECT_NE(0u, skin.source_crc);
    EXPECT_NE(0u, skin.output_crc);

    const job_result& nature = result_for(results, "nature");
    EXPECT_EQ(job_status::ok, nature.status);
    EXPECT_TRUE(nature.empty);

    const job_result& monsters = result_for(results, "monsters");
    EXPECT_EQ(job_status::failed, monsters.status);
    EXPECT_FALSE(monsters.error.empty());

    EXPECT_EQ(job_status::missing, result_for(results, "achievements").status);
    EXPECT_EQ(1, batch_exit_code(results));

    std::vector<uint8> out;
    ASSERT_TRUE(ReadFileBytes((dirs.output / "petSkin.json").string(), out));
    std::string text(out.begin(), out.end());
    EXPECT_EQ(skin.output_crc, Crc32(text));
    EXPECT_NE(std::string::npos, text.find("\"pet_skins\""));
    EXPECT_NE(std::string::npos, text.find("\"skin_kind\": []"));

    EXPECT_TRUE(fs::exists(dirs.output / "nature.json"));
    EXPECT_FALSE(fs::exists(dirs.output / "monsters.json"));
    EXPECT_TRUE(fs::exists(dirs.output / SOLARIS_MANIFEST_FILE));
}

TEST(parse, batch_only_and_strict)
{
    batch_dirs dirs;
    std::vector<uint8> bytes = pet_skin_bytes();
    bytes.push_back(0xAA);
    dirs.put("pet_skin.bytes", bytes);

    schema_registry reg;
    reg.add_builtin();

    batch_options opts = dirs.options(1);
    opts.only = {"pet_skin", "unknown"};
    opts.write_manifest = false;

    std::vector<job_result> results = batch_runner(reg, opts).run();
    ASSERT_EQ(2u, results.size());
    EXPECT_EQ(job_status::failed, result_for(results, "unknown").status);
    const job_result& lenient = result_for(results, "pet_skin");
    EXPECT_EQ(job_status::ok, lenient.status);
    EXPECT_EQ(bytes.size() - 1, lenient.consumed);
    EXPECT_FALSE(fs::exists(dirs.output / SOLARIS_MANIFEST_FILE));

    opts.only = {"pet_skin"};
    opts.decode.strict = true;
    results = batch_runner(reg, opts).run();
    ASSERT_EQ(1u, results.size());
    EXPECT_EQ(job_status::failed, results[0].status);
    EXPECT_EQ(1, batch_exit_code(results));
}

TEST(parse, batch_nothing_to_do)
{
    batch_dirs dirs;
    schema_registry reg;
    reg.add_builtin();

    batch_options opts = dirs.options(0);
    opts.write_output = false;
    std::vector<job_result> results = batch_runner(reg, opts).run();
    for (auto& r : results)
        EXPECT_EQ(job_status::missing, r.status);
    EXPECT_EQ(0, batch_exit_code(results));
    EXPECT_FALSE(fs::exists(dirs.output));
}

TEST(parse, batch_unreadable_source)
{
    batch_dirs dirs;
    schema_registry reg;
    reg.add_builtin();

    // A path component too long for the filesystem fails the stat itself
    batch_options opts = dirs.options(2);
    opts.source_dir = (dirs.source / std::string(300, 'x')).string();
    opts.write_output = false;

    std::vector<job_result> results;
    ASSERT_NO_THROW(results = batch_runner(reg, opts).run());
    ASSERT_EQ(reg.size(), results.size());
    for (auto& r : results)
        EXPECT_EQ(job_status::missing, r.status);

    job_result r;
    ASSERT_NO_THROW(r = batch_runner(reg, opts).run_one(*reg.find("nature")));
    EXPECT_EQ(job_status::failed, r.status);
    EXPECT_NE(std::string::npos, r.error.find("could not read"));
    EXPECT_EQ(0, batch_exit_code(results));
}
}
