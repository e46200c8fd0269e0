/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <prioq/dsa/formatting/PriorityQueue.hpp>

#include <gmock/gmock.h>

#include <string>

//-------------------------------------------------------------------------

using namespace prioq;

using namespace testing;

//-------------------------------------------------------------------------

TEST(PriorityQueueFormatTest, EmptyQueue)
{
    EXPECT_EQ(fmt::format("{}", dsa::PriorityQueue<int>{}), "[]");
}

TEST(PriorityQueueFormatTest, RendersStorageOrder)
{
    // Storage order, not pop order: 2 sifts above 5 but stays below 1.
    auto queue = dsa::PriorityQueue<int>::minOrdering({1, 3, 5, 7, 9, 2});
    EXPECT_EQ(fmt::format("{}", queue), "[1, 3, 2, 7, 9, 5]");
}

TEST(PriorityQueueFormatTest, MaxOrderedStrings)
{
    auto queue = dsa::PriorityQueue<std::string>::maxOrdering({"a", "c", "b"});
    EXPECT_EQ(fmt::format("{}", queue), "[c, a, b]");
}

//-------------------------------------------------------------------------
