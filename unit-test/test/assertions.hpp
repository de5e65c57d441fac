#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "gtest/gtest.h"

namespace hjudge::test {

/**
 * @brief 比较两个 JSON，失败时输出两者的 JSON Patch 差异，便于定位评测结果中不一致的字段
 */
inline ::testing::AssertionResult json_equal(const char *actual_expression, const char *expected_expression,
                                             const nlohmann::json &actual, const nlohmann::json &expected) {
    if (actual == expected) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << actual_expression << " differs from " << expected_expression << "\n"
           << "  actual: " << actual.dump(2) << "\n"
           << "  expected: " << expected.dump(2) << "\n"
           << "  patch: " << nlohmann::json::diff(actual, expected).dump(2);
}

}  // namespace hjudge::test

#define EXPECT_JSON_EQ(actual, expected) EXPECT_PRED_FORMAT2(::hjudge::test::json_equal, actual, expected)

#define ASSERT_JSON_EQ(actual, expected) ASSERT_PRED_FORMAT2(::hjudge::test::json_equal, actual, expected)
