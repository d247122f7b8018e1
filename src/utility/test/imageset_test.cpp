// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include "framescan/error.hpp"
#include "framescan/utility/imageset.hpp"

using namespace framescan;
using namespace framescan::utility;

TEST(ImagesetTest, Group) {
    const auto imagesets = group_files_by_imageset({"a_001.img", "a_002.img", "b.dat"});

    ASSERT_EQ(imagesets.size(), 2);

    EXPECT_EQ(imagesets[0].name_, "a_###.img");
    EXPECT_TRUE(imagesets[0].is_sequence());
    EXPECT_EQ(*(imagesets[0].template_), FilenameTemplate("a_", 3, ".img"));
    EXPECT_EQ(
        imagesets[0].indices_,
        std::vector<std::optional<int64_t>>({int64_t(1), int64_t(2)}));
    EXPECT_EQ(imagesets[0].frames(), "1-2");

    EXPECT_EQ(imagesets[1].name_, "b.dat");
    EXPECT_FALSE(imagesets[1].is_sequence());
    EXPECT_EQ(imagesets[1].indices_, std::vector<std::optional<int64_t>>({std::nullopt}));
    EXPECT_EQ(imagesets[1].frames(), "");
}

TEST(ImagesetTest, InputOrder) {
    const auto imagesets = group_files_by_imageset(
        {"b_2.img", "a_1.img", "README", "b_1.img", "b_2.img", "README", "image.0001"});

    ASSERT_EQ(imagesets.size(), 4);
    EXPECT_EQ(imagesets[0].name_, "b_#.img");
    EXPECT_EQ(imagesets[1].name_, "a_#.img");
    EXPECT_EQ(imagesets[2].name_, "README");
    EXPECT_EQ(imagesets[3].name_, "image.####");

    // neither sorted nor deduplicated.
    EXPECT_EQ(
        imagesets[0].indices_,
        std::vector<std::optional<int64_t>>({int64_t(2), int64_t(1), int64_t(2)}));
    EXPECT_EQ(imagesets[0].frames(), "1-2");
    EXPECT_EQ(imagesets[2].count(), 2);
}

TEST(ImagesetTest, EveryFileOnce) {
    const std::vector<std::string> files{
        "x_0001.cbf",
        "x_0002.cbf",
        "x_001.cbf",
        "y.0001",
        "notes.txt",
        "notes.txt",
        "frame.10.cbf.gz",
        "",
        "x_0003.cbf"};
    const auto imagesets = group_files_by_imageset(files);

    size_t total = 0;
    for (const auto &i : imagesets)
        total += i.count();
    EXPECT_EQ(total, files.size());

    // different padding, different imageset.
    EXPECT_TRUE(find_imageset(imagesets, "x_####.cbf"));
    EXPECT_TRUE(find_imageset(imagesets, "x_###.cbf"));
    EXPECT_EQ(find_imageset(imagesets, "x_####.cbf")->frames(), "1-3");
    EXPECT_FALSE(find_imageset(imagesets, "x_#.cbf"));
    EXPECT_TRUE(find_imageset(imagesets, ""));
}

TEST(ImagesetTest, Placeholder) {
    const auto imagesets = group_files_by_imageset({"a_001.img"}, '@');
    ASSERT_EQ(imagesets.size(), 1);
    EXPECT_EQ(imagesets[0].name_, "a_@@@.img");

    EXPECT_THROW(group_files_by_imageset({"a_001.img"}, '0'), framescan_err);
}

TEST(ImagesetTest, Frames) {
    Imageset imageset("a_#.img");
    imageset.template_ = FilenameTemplate("a_", 1, ".img");
    for (const auto i : {9, 1, 2, 3, 5, 7})
        imageset.indices_.emplace_back(i);

    EXPECT_EQ(imageset.frames(), "1-3,5-9x2");

    imageset.indices_ = {int64_t(4)};
    EXPECT_EQ(imageset.frames(), "4");
}

TEST(ImagesetTest, Json) {
    const auto imagesets = group_files_by_imageset({"a_001.img", "a_003.img", "b.dat"});
    const nlohmann::json j = imagesets;

    EXPECT_EQ(
        j,
        R"([
            {
                "name": "a_###.img",
                "template": {"prefix": "a_", "digits": 3, "suffix": ".img"},
                "indices": [1, 3],
                "frames": "1,3"
            },
            {
                "name": "b.dat",
                "template": null,
                "indices": [null],
                "frames": ""
            }
        ])"_json);
}
