#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

namespace ojcore::test {

/**
 * @brief 比较两个 JSON 对象，不相等时打印两者的差异
 */
inline ::testing::AssertionResult json_equal(const char *lhs_expression,
                                             const char *rhs_expression,
                                             const nlohmann::json &lhs,
                                             const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << "      Which is: " << lhs.dump(2) << std::endl
       << "To be equal to: " << rhs_expression << std::endl
       << "      Which is: " << rhs.dump(2) << std::endl
       << "    Difference: " << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

}  // namespace ojcore::test

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_TRUE(::ojcore::test::json_equal(#obj1, #obj2, obj1, obj2))

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_TRUE(::ojcore::test::json_equal(#obj1, #obj2, obj1, obj2))
