// SPDX-License-Identifier: Apache-2.0
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include "framescan/utility/sequence.hpp"

using namespace framescan::utility;
namespace fs = std::filesystem;

class SequenceTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("framescan_sequence_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        cwd_ = fs::current_path();
    }

    void TearDown() override {
        fs::current_path(cwd_);
        fs::remove_all(dir_);
    }

    void touch(const std::string &name) const { std::ofstream((dir_ / name).string()) << ""; }

    std::string path(const std::string &name) const { return (dir_ / name).string(); }

    fs::path dir_;
    fs::path cwd_;
};

TEST_F(SequenceTest, SkipsGaps) {
    for (const auto &name :
         {"a_001.img", "a_002.img", "a_004.img", "a_0003.img", "a_005.img.bak", "b.dat"})
        touch(name);

    EXPECT_EQ(
        find_matching_images(path("a_001.img")),
        std::vector<std::string>({path("a_001.img"), path("a_002.img"), path("a_004.img")}));

    // any member finds the whole sequence, it need not exist itself.
    EXPECT_EQ(find_matching_images(path("a_002.img")).size(), 3);
    EXPECT_EQ(find_matching_images(path("a_999.img")).size(), 3);

    EXPECT_EQ(
        find_matching_images(path("a_0003.img")),
        std::vector<std::string>({path("a_0003.img")}));
}

TEST_F(SequenceTest, NumericOrder) {
    for (const auto &name : {"image.0010", "image.0002", "image.0100", "image.0000"})
        touch(name);

    EXPECT_EQ(
        find_matching_images(path("image.0002")),
        std::vector<std::string>(
            {path("image.0000"), path("image.0002"), path("image.0010"), path("image.0100")}));
}

TEST_F(SequenceTest, RelativeToCurrentDirectory) {
    for (const auto &name : {"a_001.img", "a_002.img", "a_004.img"})
        touch(name);

    fs::current_path(dir_);

    EXPECT_EQ(
        find_matching_images("a_001.img"),
        std::vector<std::string>({"a_001.img", "a_002.img", "a_004.img"}));
}

TEST_F(SequenceTest, NoTemplate) {
    touch("README");

    EXPECT_EQ(find_matching_images("README"), std::vector<std::string>({"README"}));
    EXPECT_EQ(find_matching_images(path("README")), std::vector<std::string>({path("README")}));
    // never listed, so a missing directory doesn't matter.
    EXPECT_EQ(
        find_matching_images("/does/not/exist/README"),
        std::vector<std::string>({"/does/not/exist/README"}));
}

TEST_F(SequenceTest, MissingDirectory) {
    EXPECT_THROW(
        static_cast<void>(find_matching_images(path("missing/a_001.img"))),
        fs::filesystem_error);
}

TEST_F(SequenceTest, Bounded) {
    for (const auto &name : {"s_0.cbf", "s_5.cbf", "s_9.cbf", "s_10.cbf"})
        touch(name);

    const auto result = find_matching_images(path("s_5.cbf"));
    EXPECT_EQ(result.size(), 3);
    for (const auto &i : result)
        EXPECT_TRUE(fs::exists(i)) << i;
}

TEST(FrameSequenceTest, Test) {
    EXPECT_EQ(frame_sequence({}), "");
    EXPECT_EQ(frame_sequence({4}), "4");
    EXPECT_EQ(frame_sequence({1, 2, 3, 4}), "1-4");
    EXPECT_EQ(frame_sequence({1, 3}), "1,3");
    EXPECT_EQ(frame_sequence({1, 3, 5, 7}), "1-7x2");
    EXPECT_EQ(frame_sequence({1, 2, 4}), "1-2,4");
    EXPECT_EQ(frame_sequence({1, 3, 4}), "1,3,4");
    EXPECT_EQ(frame_sequence({1, 2, 3, 10, 20, 30}), "1-3,10-30x10");

    EXPECT_EQ(make_frame_sequence(5, 5, 0), "5");
    EXPECT_EQ(make_frame_sequence(5, 9, 2), "5-9x2");
}

TEST(PadTest, Test) {
    EXPECT_EQ(pad_spec(4), "%04d");
    EXPECT_EQ(pad_spec(1), "%01d");

    EXPECT_EQ(escape_percentage("50%_"), "50%%_");
}
