#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include "contest/contest_result.hpp"

namespace arena::store {

/**
 * @brief 比赛成绩的存储，以 (user_id, contest_id) 为键
 * 同一个键的并发读取-合并-写回通过版本号进行乐观并发控制：
 * save 只有在存储中的版本号与 result.version 相同时才会成功。
 */
struct contest_result_store {
    virtual ~contest_result_store();

    /**
     * @return 比赛成绩不存在时返回 std::nullopt
     * @throw store_error 存储无法访问
     */
    virtual std::optional<contest_result> find(const std::string &user_id, const std::string &contest_id) = 0;

    /**
     * @brief 创建比赛成绩
     * 如果另一个提交已经创建了该比赛成绩，则不覆盖，返回已经存在的比赛成绩
     * @param initial 初始的比赛成绩
     * @return 存储中的比赛成绩
     * @throw store_error 存储无法访问
     */
    virtual contest_result create(const contest_result &initial) = 0;

    /**
     * @brief 保存比赛成绩
     * @param result 要保存的比赛成绩，保存成功后 version 加一
     * @return false 若存储中的版本号与 result.version 不一致，此时需要重新读取并合并
     * @throw store_error 存储无法访问，或者比赛成绩不存在
     */
    virtual bool save(contest_result &result) = 0;
};

struct memory_contest_result_store : public contest_result_store {
    std::optional<contest_result> find(const std::string &user_id, const std::string &contest_id) override;

    contest_result create(const contest_result &initial) override;

    bool save(contest_result &result) override;

    /**
     * @brief 比赛的所有成绩，用于排行榜
     */
    std::vector<contest_result> list(const std::string &contest_id);

private:
    std::mutex mut;
    std::map<std::pair<std::string, std::string>, contest_result> results;
};

}  // namespace arena::store
