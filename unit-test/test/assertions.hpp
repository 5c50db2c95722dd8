#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

/**
 * @brief 输出两个 json 的内容以及它们之间的差异（json patch 格式）
 */
template <bool equal>
std::string formatJsonMismatch(const char *lhs_expression, const char *rhs_expression,
                               const nlohmann::json &lhs, const nlohmann::json &rhs) {
    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << "      Which is: " << lhs.dump(2) << std::endl
       << (equal ? "To be equal to: " : "Not to be equal to: ") << rhs_expression << std::endl
       << "      Which is: " << rhs.dump(2) << std::endl;
    if (equal)
        ss << "    Difference: " << nlohmann::json::diff(lhs, rhs).dump(2);
    return ss.str();
}

inline ::testing::AssertionResult jsonEqual(const char *lhs_expression,
                                            const char *rhs_expression,
                                            const nlohmann::json &lhs,
                                            const nlohmann::json &rhs) {
    if (lhs == rhs)
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << formatJsonMismatch<true>(lhs_expression, rhs_expression, lhs, rhs);
}

inline ::testing::AssertionResult jsonNotEqual(const char *lhs_expression,
                                               const char *rhs_expression,
                                               const nlohmann::json &lhs,
                                               const nlohmann::json &rhs) {
    if (lhs != rhs)
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << formatJsonMismatch<false>(lhs_expression, rhs_expression, lhs, rhs);
}

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_PRED_FORMAT2(jsonEqual, obj1, obj2)

#define EXPECT_JSON_NE(obj1, obj2) \
    EXPECT_PRED_FORMAT2(jsonNotEqual, obj1, obj2)

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_PRED_FORMAT2(jsonEqual, obj1, obj2)
