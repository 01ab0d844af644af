#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "contest/contest.hpp"
#include "judge/problem.hpp"
#include "judge/submission.hpp"

/**
 * 这个头文件包含比赛成绩的合并算法
 * 比赛成绩的合并是纯函数：输入旧的成绩和一次提交的结果，返回新的成绩。
 * 读取、合并、写回之间的并发控制由 judge_service 和存储负责。
 */
namespace arena {

/**
 * @brief 选手在比赛中一道题目上的成绩
 */
struct problem_result {
    std::string problem_id;

    /**
     * @brief 历次提交的最高分，只会增加
     */
    int score = 0;

    int max_score = 0;

    /**
     * @brief 历次提交的运行时间之和，单位为毫秒
     */
    long long time_spent_ms = 0;

    int submission_count = 0;

    /**
     * @brief 第一次通过的时间，设置后不再改变
     */
    std::optional<std::chrono::system_clock::time_point> first_accepted_at;

    /**
     * @brief 只会按照 NOT_ATTEMPTED < ATTEMPTED < PARTIAL < ACCEPTED 的顺序前进
     */
    grade status = grade::NOT_ATTEMPTED;
};

/**
 * @brief 选手在一场比赛中的成绩，每个 (user_id, contest_id) 只有一份
 */
struct contest_result {
    std::string user_id;

    std::string contest_id;

    std::vector<problem_result> problem_results;

    /**
     * @brief 所有题目得分之和，由 calculate_totals 计算，不单独修改
     */
    int total_score = 0;

    /**
     * @brief 所有题目用时之和，单位为毫秒，由 calculate_totals 计算
     */
    long long total_time_ms = 0;

    int penalties = 0;

    /**
     * @brief 排名，只有 rank_results 之后才有值
     */
    std::optional<int> rank;

    std::chrono::system_clock::time_point started_at;

    std::optional<std::chrono::system_clock::time_point> completed_at;

    /**
     * @brief 比赛成绩是否已经提交，提交后不再接受新的提交
     */
    bool is_completed = false;

    /**
     * @brief 乐观并发控制的版本号，由存储维护，每次保存成功后加一
     */
    long long version = 0;

    problem_result *find(const std::string &problem_id);

    const problem_result *find(const std::string &problem_id) const;

    /**
     * @brief 重新计算 total_score 和 total_time_ms
     */
    void calculate_totals();
};

/**
 * @brief 合并到比赛成绩中的提交结果
 */
struct submission_outcome {
    int score = 0;

    int max_score = 0;

    /**
     * @brief 本次提交的运行时间，单位为毫秒
     */
    long long time_spent_ms = 0;
};

submission_outcome outcome_of(const submission &submit);

/**
 * @brief 根据分数计算题目的状态
 * 满分大于 0 且得分等于满分为 ACCEPTED，得分大于 0 为 PARTIAL，否则为 ATTEMPTED
 */
grade grade_of(int score, int max_score);

/**
 * @brief 创建比赛成绩，每道题目都是 NOT_ATTEMPTED
 * 题目的满分优先使用题目测试点的分数之和，其次是题目的分数，
 * 在 problems 中找不到的题目使用比赛中设置的分数
 * @param problems 已经读取到的比赛题目
 */
contest_result create_contest_result(const std::string &user_id, const contest &c, const std::vector<problem> &problems,
                                     std::chrono::system_clock::time_point now);

/**
 * @brief 将一次提交合并到比赛成绩中
 * 1. score 取历次提交的最大值；
 * 2. time_spent_ms 累加本次提交的运行时间；
 * 3. submission_count 加一；
 * 4. status 只前进不后退，ACCEPTED 之后不再改变；
 * 5. 第一次变为 ACCEPTED 且 is_first_accept 时设置 first_accepted_at，之后不再改变；
 * 6. 重新计算总分和总用时。
 * 如果比赛成绩中没有该题目，将以本次提交的满分创建一个新的题目成绩再合并。
 *
 * @param previous 旧的比赛成绩，不会被修改
 * @return 新的比赛成绩
 * @throw grading_rejected 比赛成绩已经提交
 */
contest_result apply_submission(contest_result previous, const std::string &problem_id, const submission_outcome &outcome,
                                bool is_first_accept, std::chrono::system_clock::time_point now);

/**
 * @brief 提交最终成绩，提交后比赛成绩不再改变
 * @throw grading_rejected 比赛成绩已经提交
 */
contest_result complete_contest(contest_result previous, int penalties, std::chrono::system_clock::time_point now);

/**
 * @brief 按照总分从高到低、总用时从低到高排序，并设置排名
 * 总分和总用时都相同的选手排名相同
 */
void rank_results(std::vector<contest_result> &results);

/**
 * @brief 解析时长，返回毫秒数
 * 支持 "HH:MM:SS"，以及纯数字：不超过 3600 时视为秒，否则视为毫秒。
 * 无法解析时返回 0
 */
long long parse_duration_ms(const std::string &value);

/**
 * @brief 将毫秒数格式化为 "HH:MM:SS"，负数视为 0
 */
std::string format_duration(long long ms);

}  // namespace arena
