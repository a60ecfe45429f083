#include "gtest/gtest.h"
#include "logging.h"
#include <cstdio>
#include <stdexcept>
#include <string>

namespace
{
// Captures everything logged while it's alive
struct capture
{
    capture() : file(tmpfile()) { logging.set_output(file); }
    ~capture()
    {
        logging.set_output(nullptr);
        if (file)
            fclose(file);
    }

    std::string text()
    {
        std::string out;
        fflush(file);
        rewind(file);
        char buf[256];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), file)) > 0)
            out.append(buf, n);
        return out;
    }

    FILE* file;
};
}

namespace
{
TEST(framework, log_level_parsing)
{
    LogLevel level = LogLevel::info;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(LogLevel::debug, level);
    EXPECT_TRUE(parse_log_level("4", level));
    EXPECT_EQ(LogLevel::error, level);
    EXPECT_FALSE(parse_log_level("loud", level));
    EXPECT_FALSE(parse_log_level("7", level));
    EXPECT_EQ(LogLevel::error, level);
}

TEST(framework, logger_hierarchy)
{
    auto& parent = logging.get_logger("test_hier");
    auto& child = logging.get_logger("test_hier.child");
    EXPECT_EQ("test_hier.child", child.name());
    EXPECT_EQ(&child, &logging.get_logger("test_hier.child"));
    EXPECT_EQ(&logging.get_logger(), &logging.get_logger("root"));

    parent.set_level(LogLevel::warning);
    EXPECT_EQ(LogLevel::warning, child.get_level());
    EXPECT_FALSE(child.enabled_for(LogLevel::info));
    EXPECT_TRUE(child.enabled_for(LogLevel::error));

    child.set_level(LogLevel::debug);
    EXPECT_TRUE(child.enabled_for(LogLevel::debug));
    EXPECT_FALSE(parent.enabled_for(LogLevel::debug));

    EXPECT_THROW(logging.get_logger("test_hier..x"), std::length_error);
}

TEST(framework, logger_output)
{
    auto& parent = logging.get_logger("test_out");
    auto& child = logging.get_logger("test_out.batch");
    parent.set_level(LogLevel::warning);

    capture cap;
    child.info("hidden %d", 1);
    child.warning("watch %s", "out");
    child.error("failed at %zu", static_cast<size_t>(12));

    EXPECT_EQ(
        "WARNING:test_out.batch:watch out\n"
        "ERROR:test_out.batch:failed at 12\n",
        cap.text());

    parent.set_level(LogLevel::ignored);
    child.critical("gone");
    EXPECT_EQ(std::string::npos, cap.text().find("gone"));
}
}
