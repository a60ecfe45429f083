#include "gtest/gtest.h"
#include "Util.h"
#include "LockedQueue.h"
#include <boost/filesystem.hpp>
#include <thread>

namespace fs = boost::filesystem;

namespace
{
TEST(shared, crc32)
{
    EXPECT_EQ(0xCBF43926u, Crc32(std::string("123456789")));
    EXPECT_EQ(0u, Crc32(nullptr, 0));
    EXPECT_EQ("cbf43926", Crc32Hex(0xCBF43926u));
    EXPECT_EQ("0", Crc32Hex(0));
}

TEST(shared, file_roundtrip)
{
    fs::path dir = fs::temp_directory_path() / fs::unique_path("solaris-%%%%");
    std::string file = (dir / "nested" / "data.bin").string();

    std::string payload("a\0b\xFF", 4);
    ASSERT_TRUE(WriteFileText(file, payload));

    std::vector<uint8> bytes;
    ASSERT_TRUE(ReadFileBytes(file, bytes));
    ASSERT_EQ(4u, bytes.size());
    EXPECT_EQ(0, bytes[1]);
    EXPECT_EQ(0xFF, bytes[3]);

    EXPECT_FALSE(ReadFileBytes((dir / "missing").string(), bytes));

    boost::system::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(shared, locked_queue)
{
    solaris::locked_queue<int> queue;
    EXPECT_TRUE(queue.empty());

    for (int i = 0; i < 1000; ++i)
        queue.push(i);
    EXPECT_EQ(1000u, queue.size());

    int first = -1;
    ASSERT_TRUE(queue.pop(first));
    EXPECT_EQ(0, first);

    std::vector<int> sums(4, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
        threads.emplace_back([&queue, &sums, t]()
            {
                int v;
                while (queue.pop(v))
                    sums[t] += v;
            });
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(999 * 1000 / 2, sums[0] + sums[1] + sums[2] + sums[3]);
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.pop(first));
}
}
