// ============================================================
// test_file_io.cpp -- Download naming and offered-name checks
// ============================================================

#include "../common/file_io.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

TEST(ClaimDestination, FirstFreeNameIsCreatedEmpty) {
    TempDir dir;
    fs::path first = file_io::claim_destination(dir.path(), "report.txt");
    EXPECT_EQ(first, dir.path() / "report.txt");
    EXPECT_TRUE(fs::exists(first));
    EXPECT_EQ(fs::file_size(first), 0u);

    fs::path second = file_io::claim_destination(dir.path(), "report.txt");
    EXPECT_EQ(second, dir.path() / "report (1).txt");

    fs::path bare = file_io::claim_destination(dir.path(), "README");
    EXPECT_EQ(bare, dir.path() / "README");
    EXPECT_EQ(file_io::claim_destination(dir.path(), "README"), dir.path() / "README (1)");
}

TEST(ClaimDestination, ExistingFileIsLeftAlone) {
    TempDir dir;
    write_file(dir.path() / "report.txt", make_bytes(64, 1));
    fs::path claimed = file_io::claim_destination(dir.path(), "report.txt");
    EXPECT_EQ(claimed, dir.path() / "report (1).txt");
    EXPECT_EQ(read_file(dir.path() / "report.txt"), make_bytes(64, 1));
}

TEST(ClaimDestination, ConcurrentDeliveriesNeverShareAName) {
    TempDir dir;
    const int kWorkers = 8;
    std::vector<fs::path> claimed(kWorkers);
    std::atomic<bool> go{false};
    std::vector<std::thread> workers;
    for (int i = 0; i < kWorkers; ++i) {
        workers.emplace_back([&, i] {
            while (!go) std::this_thread::yield();
            fs::path dest = file_io::claim_destination(dir.path(), "report.txt");
            fs::path part = dir.path() / ("part-" + std::to_string(i));
            write_file(part, make_bytes(100, (u32)i + 1));
            fs::rename(part, dest);
            claimed[i] = dest;
        });
    }
    go = true;
    for (auto& t : workers) t.join();

    std::set<fs::path> unique(claimed.begin(), claimed.end());
    EXPECT_EQ(unique.size(), (size_t)kWorkers);
    EXPECT_EQ(count_files(dir.path()), (size_t)kWorkers);
    for (int i = 0; i < kWorkers; ++i) {
        EXPECT_EQ(read_file(claimed[i]), make_bytes(100, (u32)i + 1));
    }
}

TEST(SafeBaseName, RefusesPathsAndSpecialNames) {
    std::string out;
    EXPECT_TRUE(file_io::safe_base_name("photo.jpg", out));
    EXPECT_EQ(out, "photo.jpg");
    EXPECT_FALSE(file_io::safe_base_name("", out));
    EXPECT_FALSE(file_io::safe_base_name("..", out));
    EXPECT_FALSE(file_io::safe_base_name("../etc/passwd", out));
    EXPECT_FALSE(file_io::safe_base_name("dir\\file", out));
    EXPECT_FALSE(file_io::safe_base_name("C:evil", out));
}
