#include "gtest/gtest.h"
#include "logging.h"
#include "Util.h"
#include "Config/Config.h"
#include <boost/filesystem.hpp>
#include <cstdlib>

namespace fs = boost::filesystem;

namespace
{
const char* const conf_text =
    "# solaris-parse test config\n"
    "SourceDir = \"/data/client\"\n"
    "OutputDir = out\n"
    "Threads = 3\n"
    "MaxDepth = nope\n"
    "StrictTrailingBytes = 1\n"
    "WriteManifest = off\n"
    "\n"
    "[LOGGERS]\n"
    "test_conf = error\n"
    "test_conf.child = debug\n";

struct conf_file
{
    conf_file() : path(fs::temp_directory_path() / fs::unique_path("solaris-%%%%.conf"))
    {
        WriteFileText(path.string(), conf_text);
    }
    ~conf_file()
    {
        boost::system::error_code ec;
        fs::remove(path, ec);
    }

    fs::path path;
};
}

namespace
{
TEST(shared, config_values)
{
    conf_file file;
    Config config;
    ASSERT_TRUE(config.SetSource(file.path.string()));
    EXPECT_EQ(file.path.string(), config.GetFilename());

    EXPECT_EQ("/data/client", config.GetStringDefault("SourceDir", "x"));
    EXPECT_EQ("out", config.GetStringDefault("OutputDir", "x"));
    EXPECT_EQ("x", config.GetStringDefault("SchemaDir", "x"));
    EXPECT_EQ(3, config.GetIntDefault("Threads", 0));
    EXPECT_EQ(64, config.GetIntDefault("MaxDepth", 64));
    EXPECT_TRUE(config.GetBoolDefault("StrictTrailingBytes", false));
    EXPECT_FALSE(config.GetBoolDefault("WriteManifest", true));
    EXPECT_EQ("error", config.GetStringDefault("LOGGERS.test_conf", ""));
}

TEST(shared, config_missing_file)
{
    Config config;
    EXPECT_FALSE(config.SetSource("/nonexistent/solaris.conf"));
    EXPECT_EQ(7, config.GetIntDefault("Threads", 7));
}

TEST(shared, config_environment_override)
{
    conf_file file;
    Config config;
    ASSERT_TRUE(config.SetSource(file.path.string()));

    setenv("SOLARIS_THREADS", "12", 1);
    setenv("SOLARIS_SCHEMADIR", "/etc/schemas", 1);
    EXPECT_EQ(12, config.GetIntDefault("Threads", 0));
    EXPECT_EQ("/etc/schemas", config.GetStringDefault("SchemaDir", ""));
    unsetenv("SOLARIS_THREADS");
    unsetenv("SOLARIS_SCHEMADIR");

    EXPECT_EQ(3, config.GetIntDefault("Threads", 0));
}

TEST(shared, config_log_levels)
{
    conf_file file;
    Config config;
    ASSERT_TRUE(config.SetSource(file.path.string()));
    config.LoadLogLevels();

    EXPECT_EQ(LogLevel::error, logging.get_logger("test_conf").get_level());
    EXPECT_EQ(
        LogLevel::debug, logging.get_logger("test_conf.child").get_level());
    EXPECT_EQ(LogLevel::error,
        logging.get_logger("test_conf.other").get_level());
}
}
