#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace arena {

/**
 * @brief 一个测试点的评测结果
 */
struct test_result {
    /**
     * @brief 对应的测试点 id，与 problem.test_cases 中同一位置的测试点一致
     */
    std::string test_case_id;

    /**
     * @brief 去除首尾空白字符后输出与标准输出是否一致
     */
    bool passed = false;

    /**
     * @brief 本测试点的评测结果
     */
    arena::status status = status::PENDING;

    /**
     * @brief 本测试点程序运行的时钟时间，单位为毫秒
     * 基础设施错误时为 0
     */
    long long execution_time_ms = 0;

    /**
     * @brief 本测试点程序运行使用的内存，单位为 MB
     */
    double memory_used_mb = 0;

    /**
     * @brief memory_used_mb 是否是根据输出大小估算的值
     * 只有 resource_policy 提供了真实测量值时为 false
     */
    bool memory_estimated = true;

    /**
     * @brief 选手程序的标准输出
     */
    std::string output;

    /**
     * @brief 错误信息
     * 可能是选手程序的标准错误输出、编译信息、超时说明或者沙箱的内部错误
     */
    std::string error;
};

/**
 * @brief 一次评测的结果
 * 每次提交都会产生一个新的 submission，评测结束后不再修改
 */
struct submission {
    std::string id;

    std::string user_id;

    std::string contest_id;

    std::string problem_id;

    std::string language;

    std::string code;

    /**
     * @brief 评测结果，与题目的测试点一一对应，顺序一致
     */
    std::vector<test_result> test_results;

    int score = 0;

    int max_score = 0;

    long long total_execution_time_ms = 0;

    double total_memory_used_mb = 0;

    /**
     * @brief 是否有测试点的内存使用是估算值
     */
    bool memory_estimated = false;

    /**
     * @brief 提交状态
     * 评测中为 PENDING 或 RUNNING，评测结束后由 result 推导：
     * 部分正确和零分都记为 WRONG_ANSWER，参见 status_of
     */
    arena::status status = status::PENDING;

    /**
     * @brief 评测结论，区分按分数得出的 grade 与无法正常评测的 fault
     */
    arena::verdict result = grade::NOT_ATTEMPTED;

    std::chrono::system_clock::time_point submitted_at;

    std::optional<std::chrono::system_clock::time_point> evaluated_at;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.language << ":" << submit.contest_id << "-" << submit.problem_id << "-" << submit.id << "]";
    return os;
}

}  // namespace arena
