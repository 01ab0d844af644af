#pragma once

#include <vector>
#include "common/status.hpp"
#include "judge/problem.hpp"
#include "judge/submission.hpp"

namespace arena {

/**
 * @brief 一次提交的得分
 */
struct score_result {
    int score = 0;

    int max_score = 0;

    /**
     * @brief 按分数得出的 grade，或者优先于分数的 fault
     */
    verdict result = grade::NOT_ATTEMPTED;
};

/**
 * @brief 根据测试点评测结果计算得分
 * 得分为所有通过的测试点的分数之和，满分为所有测试点的分数之和，
 * 测试点列表为空时满分为 fallback_points。
 *
 * 结论的计算方式：
 * 1. 存在编译错误、超时、运行错误的测试点时，结论为对应的 fault，
 *    优先级为 COMPILATION_ERROR > TIME_LIMIT_EXCEEDED > RUNTIME_ERROR；
 * 2. 满分大于 0 且得分等于满分时为 ACCEPTED；
 * 3. 得分大于 0 时为 PARTIAL；
 * 4. 否则为 ATTEMPTED。
 *
 * @param results 测试点评测结果，与 test_cases 一一对应
 * @throw std::logic_error results 与 test_cases 的长度不一致
 */
score_result score(const std::vector<test_result> &results, const std::vector<test_case> &test_cases, int fallback_points);

/**
 * @brief 判断输出是否正确：去除首尾空白字符后与标准输出完全一致
 */
bool outputs_match(const std::string &output, const std::string &expected_output);

}  // namespace arena
