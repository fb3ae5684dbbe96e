/**
 * @file    recent_list_test.cpp
 * @brief   Recently viewed history
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/recent_list.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace loupe {
namespace {

using namespace std::chrono_literals;

TEST(RecentListTest, KeepsInsertionOrder) {
    RecentList recents;
    recents.record("/photos/a.png");
    recents.record("/photos/b.png");

    ASSERT_EQ(recents.size(), 2u);
    EXPECT_EQ(recents.items()[0].name(), "a.png");
    EXPECT_EQ(recents.items()[1].name(), "b.png");
}

TEST(RecentListTest, RevisitUpdatesEntryInPlace) {
    RecentList recents;
    const auto t0 = std::chrono::system_clock::time_point{} + 1000s;

    recents.record("/photos/a.png", t0);
    recents.record("/photos/b.png", t0 + 1s);
    const RecentItem& item = recents.record("/photos/a.png", t0 + 2s);

    EXPECT_EQ(recents.size(), 2u);
    EXPECT_EQ(item.view_count, 2u);
    EXPECT_EQ(item.last_viewed, t0 + 2s);
    EXPECT_EQ(recents.items().front().name(), "a.png");
    EXPECT_EQ(recents.items().back().name(), "b.png");
    EXPECT_EQ(recents.items().back().view_count, 1u);
}

TEST(RecentListTest, EvictsOldestAddedEvenIfRevisited) {
    RecentList recents(2);
    recents.record("/photos/a.png");
    recents.record("/photos/b.png");
    recents.record("/photos/a.png");
    recents.record("/photos/c.png");

    ASSERT_EQ(recents.size(), 2u);
    EXPECT_EQ(recents.items()[0].name(), "b.png");
    EXPECT_EQ(recents.items()[1].name(), "c.png");
    EXPECT_EQ(recents.items()[1].view_count, 1u);
}

TEST(RecentListTest, OldestFallOffPastCapacity) {
    RecentList recents;
    EXPECT_EQ(recents.capacity(), kDefaultRecentCapacity);

    for (int i = 0; i < 25; ++i) {
        recents.record("/photos/img" + std::to_string(i) + ".png");
    }

    ASSERT_EQ(recents.size(), kDefaultRecentCapacity);
    EXPECT_EQ(recents.items().front().name(), "img5.png");
    EXPECT_EQ(recents.items().back().name(), "img24.png");
}

TEST(RecentListTest, RecordsFileSize) {
    const auto file = std::filesystem::temp_directory_path() / "loupe_recent_size.png";
    std::ofstream(file, std::ios::binary) << "12345678";

    RecentList recents;
    EXPECT_EQ(recents.record(file).file_size, 8u);
    EXPECT_EQ(recents.record("/nowhere/missing.png").file_size, 0u);

    std::error_code ec;
    std::filesystem::remove(file, ec);
}

TEST(RecentListTest, ClearAndCapacityValidation) {
    RecentList recents(3);
    recents.record("/a.png");
    EXPECT_FALSE(recents.empty());
    recents.clear();
    EXPECT_TRUE(recents.empty());

    EXPECT_THROW((void)RecentList(0), std::invalid_argument);
}

}  // anonymous namespace
}  // namespace loupe
