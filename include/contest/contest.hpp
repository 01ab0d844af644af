#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace arena {

/**
 * @brief 比赛中的一道题目
 */
struct contest_problem {
    std::string problem_id;

    /**
     * @brief 题目在比赛中的顺序
     */
    int order = 0;

    /**
     * @brief 题目在比赛中的分数，无法读取题目时作为满分
     */
    int points = 100;
};

/**
 * @brief 表示一场比赛
 * 评测只使用比赛的题目列表和时间窗口
 */
struct contest {
    std::string id;

    std::string title;

    std::vector<contest_problem> problems;

    std::chrono::system_clock::time_point start_time;

    /**
     * @brief 比赛时长，单位为毫秒，默认 1 小时
     */
    long long duration_ms = 3600000;

    std::chrono::system_clock::time_point end_time() const;

    /**
     * @brief 比赛是否正在进行：start_time <= now <= end_time
     */
    bool is_running(std::chrono::system_clock::time_point now) const;

    /**
     * @brief 比赛是否已经结束：now > end_time
     */
    bool has_ended(std::chrono::system_clock::time_point now) const;

    /**
     * @brief 查找比赛中的题目
     * @return 题目不属于该比赛时返回 nullptr
     */
    const contest_problem *find_problem(const std::string &problem_id) const;
};

}  // namespace arena
