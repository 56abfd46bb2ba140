/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>
#include <unordered_set>

using namespace task_fabric;

TEST(FutureIdTest, DefaultIsNull) {
    FutureId id;
    EXPECT_TRUE(id.is_null());
    EXPECT_EQ(to_string(id), "null");
}

TEST(FutureIdTest, ToString) {
    FutureId id{.slot = 3, .generation = 1};
    EXPECT_FALSE(id.is_null());
    EXPECT_EQ(to_string(id), "3.1");
}

TEST(FutureIdTest, GenerationDistinguishesHandles) {
    FutureId a{.slot = 5, .generation = 0};
    FutureId b{.slot = 5, .generation = 1};
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);

    std::unordered_set<FutureId> ids{a, b, a};
    EXPECT_EQ(ids.size(), 2u);
}

TEST(TaskStateTest, ToString) {
    EXPECT_EQ(to_string(TaskState::Registered), "registered");
    EXPECT_EQ(to_string(TaskState::Pending), "pending");
    EXPECT_EQ(to_string(TaskState::Executing), "executing");
    EXPECT_EQ(to_string(TaskState::Resolved), "resolved");
    EXPECT_EQ(to_string(TaskState::Failed), "failed");
}

TEST(FutureStateTest, ToString) {
    EXPECT_EQ(to_string(FutureState::Pending), "pending");
    EXPECT_EQ(to_string(FutureState::Ready), "ready");
    EXPECT_EQ(to_string(FutureState::Failed), "failed");
}
