#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "contest/contest.hpp"
#include "judge/problem.hpp"

/**
 * 评测核心读取题目和比赛的接口
 * 题目和比赛的持久化不属于评测核心，部署时由调用方实现这些接口，
 * 比如从数据库读取。这里提供内存实现和基于 JSON 文件目录的实现。
 */
namespace arena::store {

/**
 * @brief 只读的题目存储
 */
struct problem_store {
    virtual ~problem_store();

    /**
     * @brief 根据 id 读取题目
     * @return 题目不存在时返回 std::nullopt
     * @throw store_error 存储无法访问
     */
    virtual std::optional<problem> find_problem(const std::string &problem_id) = 0;
};

/**
 * @brief 只读的比赛存储
 */
struct contest_store {
    virtual ~contest_store();

    /**
     * @brief 根据 id 读取比赛
     * @return 比赛不存在时返回 std::nullopt
     * @throw store_error 存储无法访问
     */
    virtual std::optional<contest> find_contest(const std::string &contest_id) = 0;
};

struct memory_problem_store : public problem_store {
    void put(const problem &prob);

    std::optional<problem> find_problem(const std::string &problem_id) override;

private:
    std::mutex mut;
    std::map<std::string, problem> problems;
};

struct memory_contest_store : public contest_store {
    void put(const contest &c);

    std::optional<contest> find_contest(const std::string &contest_id) override;

private:
    std::mutex mut;
    std::map<std::string, contest> contests;
};

/**
 * @brief 从目录中读取题目，每道题目是一个 <problem_id>.json 文件
 *
 * problem_dir
 * ├── two-sum.json
 * └── ...
 */
struct json_problem_store : public problem_store {
    explicit json_problem_store(const std::filesystem::path &problem_dir);

    std::optional<problem> find_problem(const std::string &problem_id) override;

private:
    std::filesystem::path problem_dir;
};

}  // namespace arena::store
