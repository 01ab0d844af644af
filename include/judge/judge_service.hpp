#pragma once

#include <chrono>
#include <string>
#include "common/cancellation.hpp"
#include "contest/contest_result.hpp"
#include "judge/grader.hpp"
#include "store/contest_result_store.hpp"
#include "store/problem_store.hpp"

namespace arena {

/**
 * @brief 选手在比赛中的一次提交请求
 */
struct submit_request {
    std::string user_id;

    std::string contest_id;

    std::string problem_id;

    std::string language;

    std::string code;
};

/**
 * @brief 提交的评测结果，以及合并之后的比赛成绩
 */
struct submit_response {
    submission submit;

    contest_result standing;
};

/**
 * @brief 评测服务，将评测和比赛成绩的合并串起来
 *
 * 处理一次提交：
 * 1. 检查比赛存在、正在进行，且题目属于该比赛，否则拒绝评测；
 * 2. 检查选手的比赛成绩没有提交最终成绩；
 * 3. 读取题目的快照并评测；
 * 4. 读取比赛成绩（不存在时创建），合并评测结果并写回，
 *    写回时版本号冲突则重新读取再合并，最多重试 STORE_MAX_RETRIES 次。
 *
 * 不同提交可以在不同线程中并发调用 submit，
 * 同一个 (user_id, contest_id) 的合并通过存储的版本号串行化，
 * 因此不会丢失最高分或者重复累加用时。
 */
struct judge_service {
    judge_service(const grader &judge, store::problem_store &problems, store::contest_store &contests,
                  store::contest_result_store &results);

    /**
     * @brief 评测一次提交并合并到比赛成绩中
     * @param request 提交请求
     * @param token 取消标记，取消后正在运行的进程会被杀死，比赛成绩不会被修改
     * @param now 提交时间，用于检查比赛时间窗口
     * @throw grading_rejected 比赛不存在、不在比赛时间内、题目不属于比赛或者比赛成绩已提交
     * @throw unsupported_language 语言没有注册
     * @throw grading_cancelled 评测被取消
     * @throw store_error 存储无法访问，或者写回冲突次数超过上限
     */
    submit_response submit(const submit_request &request, const cancellation_token &token = cancellation_token(),
                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief 将已经评测完成的提交合并到比赛成绩中
     * 合并失败（版本号冲突）时重新读取并合并
     */
    contest_result record(const contest &c, const submission &submit, const cancellation_token &token,
                          std::chrono::system_clock::time_point now);

    /**
     * @brief 提交最终成绩
     * @throw grading_rejected 比赛不存在或者已经提交过最终成绩
     */
    contest_result finish(const std::string &user_id, const std::string &contest_id, int penalties,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    contest load_contest(const std::string &contest_id);

    contest_result load_or_create(const std::string &user_id, const contest &c, std::chrono::system_clock::time_point now);

    const grader &judge;
    store::problem_store &problems;
    store::contest_store &contests;
    store::contest_result_store &results;
};

}  // namespace arena
