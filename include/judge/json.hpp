#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include "judge/problem.hpp"
#include "judge/submission.hpp"

/**
 * 题目和提交的 JSON 格式
 * 时间点序列化为 Unix 时间戳（毫秒）
 */
namespace arena {

void from_json(const nlohmann::json &j, test_case &value);
void to_json(nlohmann::json &j, const test_case &value);

/**
 * @code{.json}
 * {
 *     "id": "two-sum",
 *     "title": "Two Sum",
 *     "time_limit_ms": 1000,
 *     "memory_limit_mb": 256,
 *     "points": 100,
 *     "harness": { "python": "print(solve(input()))" },
 *     "code_templates": { "python": "def solve(s):\n    pass" },
 *     "test_cases": [
 *         { "id": "1", "input": "1 2", "expected_output": "3", "points": 40 },
 *         { "id": "2", "input": [3, 4], "expected_output": "7", "points": 60, "is_hidden": true }
 *     ]
 * }
 * @endcode
 * 非字符串的 input 会通过 dump() 序列化为文本，缺少 id 的测试点使用下标作为 id。
 * code_templates 中转义的 "\\n"、"\\t" 会被还原为换行符和制表符，
 * harness 原样保存，不做任何转换。
 */
void from_json(const nlohmann::json &j, problem &value);
void to_json(nlohmann::json &j, const problem &value);

void to_json(nlohmann::json &j, const test_result &value);
void from_json(const nlohmann::json &j, test_result &value);

/**
 * @brief 序列化提交
 * 选手程序的输出可能不是合法的 UTF-8，序列化时非法字节会被替换为 '?'
 */
void to_json(nlohmann::json &j, const submission &value);
void from_json(const nlohmann::json &j, submission &value);

long long to_epoch_ms(std::chrono::system_clock::time_point time);

std::chrono::system_clock::time_point from_epoch_ms(long long ms);

}  // namespace arena
