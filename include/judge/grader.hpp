#pragma once

#include <string>
#include "common/cancellation.hpp"
#include "judge/problem.hpp"
#include "judge/submission.hpp"
#include "runtime/language.hpp"
#include "runtime/sandbox.hpp"

namespace arena {

/**
 * @brief 评测一份提交：将选手代码在题目的所有测试点上依次运行并计算得分
 *
 * 评测流程：
 * 1. 查找语言，语言没有注册时直接拒绝评测，不会创建任何进程；
 * 2. 检查测试点数量乘以（时间限制 + 编译时间限制）是否超过 MAX_GRADING_TIME_MS，
 *    解释型语言不计编译时间；
 * 3. 合并评测框架，所有测试点共用同一份源代码；
 * 4. 按照题目中测试点的顺序依次调用沙箱，某个测试点编译失败后，
 *    剩余测试点直接记为同样的编译错误；
 * 5. 沙箱自身的错误只影响当前测试点，记为 SYSTEM_ERROR 后继续评测；
 * 6. 计算得分和结论。
 *
 * grader 本身不保存评测状态，多个线程可以同时使用同一个 grader 评测不同的提交，
 * 只要 sandbox 的实现是线程安全的（local_sandbox 是线程安全的）。
 */
struct grader {
    grader(const language_registry &languages, sandbox &box);

    /**
     * @brief 评测一份提交
     * @param code 选手代码
     * @param language 语言 id
     * @param prob 题目的快照
     * @param token 取消标记，被取消时正在运行的进程会被杀死
     * @return 评测完成的提交，test_results 与 prob.test_cases 一一对应
     * @throw unsupported_language 语言没有注册
     * @throw grading_rejected 最坏情况下的评测时间超过上限
     * @throw grading_cancelled 评测被取消
     */
    submission grade(const std::string &code, const std::string &language, const problem &prob,
                     const cancellation_token &token = cancellation_token()) const;

private:
    const language_registry &languages;
    sandbox &box;
};

/**
 * @brief 根据沙箱的运行结果生成测试点的评测结果
 */
test_result make_test_result(const test_case &testcase, const raw_result &raw);

}  // namespace arena
