/**
 * @file test_striped_map.cpp
 * @brief Layer 1 tests for the striped concurrent map.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "utils/striped_map.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace mydiarelay::tests;
using namespace mydiarelay::tests::helper;
using mydiarelay::utils::StripedMap;

class StripedMapTest : public PureApiTest
{
  protected:
    StripedMap<std::string, int, 4> map;
};

TEST_F(StripedMapTest, InsertOrAssignOverwrites)
{
    EXPECT_TRUE(map.insert_or_assign("a", 1));
    EXPECT_FALSE(map.insert_or_assign("a", 2));
    EXPECT_EQ(map.find("a"), 2);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(StripedMapTest, TryEmplaceKeepsExisting)
{
    EXPECT_TRUE(map.try_emplace("a", 1));
    EXPECT_FALSE(map.try_emplace("a", 2));
    EXPECT_EQ(map.find("a"), 1);
}

TEST_F(StripedMapTest, FindMissingIsEmpty)
{
    EXPECT_FALSE(map.find("nope").has_value());
    EXPECT_FALSE(map.contains("nope"));
    EXPECT_FALSE(map.erase("nope"));
}

TEST_F(StripedMapTest, EraseIfChecksPredicate)
{
    map.insert_or_assign("a", 1);
    EXPECT_FALSE(map.erase_if("a", [](const int &v) { return v == 2; }));
    EXPECT_TRUE(map.contains("a"));
    EXPECT_TRUE(map.erase_if("a", [](const int &v) { return v == 1; }));
    EXPECT_FALSE(map.contains("a"));
}

TEST_F(StripedMapTest, ExtractRemovesExactlyOnce)
{
    map.insert_or_assign("a", 5);
    auto first = map.extract("a");
    auto second = map.extract("a");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 5);
    EXPECT_FALSE(second.has_value());
}

TEST_F(StripedMapTest, ExtractAllIfSpansStripes)
{
    for (int i = 0; i < 20; ++i)
        map.insert_or_assign("k" + std::to_string(i), i);
    auto evens = map.extract_all_if([](const std::string &, const int &v) { return v % 2 == 0; });
    EXPECT_EQ(evens.size(), 10u);
    EXPECT_EQ(map.size(), 10u);
    map.for_each([](const std::string &, const int &v) { EXPECT_EQ(v % 2, 1); });
}

TEST_F(StripedMapTest, UpdateMutatesInPlace)
{
    map.insert_or_assign("a", 1);
    EXPECT_TRUE(map.update("a", [](int &v) { v += 10; }));
    EXPECT_FALSE(map.update("b", [](int &v) { v += 10; }));
    EXPECT_EQ(map.find("a"), 11);
}

TEST_F(StripedMapTest, ConcurrentInsertsAreNotLost)
{
    ThreadRacer racer(8);
    ASSERT_TRUE(racer.race(
        [&](int t)
        {
            for (int i = 0; i < 100; ++i)
                map.insert_or_assign(std::to_string(t) + ":" + std::to_string(i), i);
        }));
    EXPECT_EQ(map.size(), 800u);
    map.clear();
    EXPECT_EQ(map.size(), 0u);
}
