// ============================================================
// test_bundle_builder.cpp -- Archive layout and split
// ============================================================

#include "../transfer/bundle_builder.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

class BundleBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        contents_ = {make_bytes(100000, 1), make_bytes(0, 2), make_bytes(4097, 3)};
        names_    = {"a.bin", "empty.txt", "c.dat"};
        for (size_t i = 0; i < names_.size(); ++i) {
            paths_.push_back(dir_.str("src/" + names_[i]));
            write_file(paths_.back(), contents_[i]);
        }
    }

    std::vector<u8> concatenated() const {
        std::vector<u8> all;
        for (auto& c : contents_) all.insert(all.end(), c.begin(), c.end());
        return all;
    }

    TempDir dir_;
    std::vector<std::vector<u8>> contents_;
    std::vector<std::string> names_;
    std::vector<std::string> paths_;
    std::atomic<bool> no_cancel_{false};
};

} // namespace

TEST_F(BundleBuilderTest, ArchiveIsFilesBackToBack) {
    BundleBuilder b;
    b.build(paths_);
    ASSERT_TRUE(b.write_archive(dir_.str("out.bundle"), no_cancel_));

    std::vector<u8> all = concatenated();
    EXPECT_EQ(b.total_size(), all.size());
    EXPECT_EQ(read_file(dir_.str("out.bundle")), all);
    EXPECT_EQ(b.stream_hash(), hash::xxh3_128(all.data(), all.size()));

    auto entries = b.entries();
    ASSERT_EQ(entries.size(), 3u);
    u64 offset = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].name, names_[i]);
        EXPECT_EQ(entries[i].size, contents_[i].size());
        EXPECT_EQ(entries[i].xxh3_128, hash::xxh3_128(contents_[i].data(), contents_[i].size()));
        EXPECT_EQ(b.files()[i].virtual_offset, offset);
        offset += contents_[i].size();
    }
}

TEST_F(BundleBuilderTest, SplitRestoresEveryFile) {
    BundleBuilder b;
    b.build(paths_);
    ASSERT_TRUE(b.write_archive(dir_.str("out.bundle"), no_cancel_));

    std::vector<std::string> outs;
    for (size_t i = 0; i < names_.size(); ++i) outs.push_back(dir_.str("split/" + names_[i]));

    EXPECT_EQ(split_archive(dir_.str("out.bundle"), b.entries(), outs), -1);
    for (size_t i = 0; i < outs.size(); ++i) {
        EXPECT_EQ(read_file(outs[i]), contents_[i]) << names_[i];
    }
}

TEST_F(BundleBuilderTest, SplitStopsAtFirstBadChecksum) {
    BundleBuilder b;
    b.build(paths_);
    ASSERT_TRUE(b.write_archive(dir_.str("out.bundle"), no_cancel_));

    auto entries = b.entries();
    entries[2].xxh3_128[0] ^= 0xFF;

    std::vector<std::string> outs;
    for (size_t i = 0; i < names_.size(); ++i) outs.push_back(dir_.str("split/" + names_[i]));

    EXPECT_EQ(split_archive(dir_.str("out.bundle"), entries, outs), 2);
    EXPECT_FALSE(fs::exists(outs[2]));
}

TEST_F(BundleBuilderTest, SplitRejectsSizeMismatch) {
    BundleBuilder b;
    b.build(paths_);
    ASSERT_TRUE(b.write_archive(dir_.str("out.bundle"), no_cancel_));

    auto entries = b.entries();
    entries[0].size += 1;
    std::vector<std::string> outs(3, dir_.str("x"));
    EXPECT_THROW(split_archive(dir_.str("out.bundle"), entries, outs), std::runtime_error);
    EXPECT_THROW(split_archive(dir_.str("out.bundle"), entries, {dir_.str("x")}), std::invalid_argument);
}

TEST_F(BundleBuilderTest, CancelStopsArchiving) {
    std::atomic<bool> cancel{true};
    BundleBuilder b;
    b.build(paths_);
    EXPECT_FALSE(b.write_archive(dir_.str("out.bundle"), cancel));
}

TEST_F(BundleBuilderTest, OnlyRegularFilesCanBeBundled) {
    BundleBuilder b;
    EXPECT_THROW(b.build({paths_[0], dir_.str("src")}), std::runtime_error);
    EXPECT_THROW(b.build({dir_.str("missing.bin")}), std::runtime_error);
}

TEST_F(BundleBuilderTest, HashFileMatchesOneShotHash) {
    hash::Hash128 h{};
    ASSERT_TRUE(hash_file(paths_[0], no_cancel_, h));
    EXPECT_EQ(h, hash::xxh3_128(contents_[0].data(), contents_[0].size()));

    ASSERT_TRUE(hash_file(paths_[1], no_cancel_, h));
    EXPECT_EQ(h, hash::xxh3_128(nullptr, 0));
}
