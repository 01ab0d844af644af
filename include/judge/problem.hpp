#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

/**
 * 这个头文件包含题目信息
 * 包含：
 * 1. test_case 类（表示一个测试点）
 * 2. problem 类（表示一道题目，评测时读取的是题目的快照）
 */
namespace arena {

/**
 * @brief 表示一个测试点
 */
struct test_case {
    /**
     * @brief 测试点的 id，评测结果通过 id 与测试点对应
     */
    std::string id;

    /**
     * @brief 输入数据，以 UTF-8 文本的形式写入选手程序的标准输入
     */
    std::string input;

    /**
     * @brief 标准输出
     * 比较时去除首尾空白字符，中间的空白字符必须完全一致
     */
    std::string expected_output;

    /**
     * @brief 是否对选手隐藏，只影响展示，不影响评分
     */
    bool is_hidden = false;

    /**
     * @brief 本测试点的分数，非负整数
     */
    int points = 1;
};

/**
 * @brief 评测框架，可以是所有语言共用的一段代码，也可以是按语言区分的代码
 */
using harness_code = std::variant<std::string, std::map<std::string, std::string>>;

/**
 * @brief 表示一道题目
 * 评测开始时调用方传入题目的快照，评测过程中不会再读取存储
 */
struct problem {
    std::string id;

    std::string title;

    /**
     * @brief 有序的测试点列表，评测结果的顺序与该列表一致
     */
    std::vector<test_case> test_cases;

    /**
     * @brief 每种语言的初始代码模板，只用于展示
     */
    std::map<std::string, std::string> code_templates;

    /**
     * @brief 追加在选手代码之后的评测框架
     */
    harness_code harness;

    /**
     * @brief 每个测试点的时钟时间限制，单位为毫秒
     * @note 非正数表示使用 DEFAULT_TIME_LIMIT_MS
     */
    int time_limit_ms = -1;

    /**
     * @brief 内存限制，单位为 MB
     * @note 沙箱本身不保证内存隔离，该值交给 resource_policy 执行
     */
    int memory_limit_mb = -1;

    /**
     * @brief 没有测试点时使用的题目分数
     */
    int points = 100;

    /**
     * @brief 题目的满分
     * 存在测试点时为所有测试点的分数之和，否则为 points
     */
    int max_score() const;

    /**
     * @brief 生效的时间限制，未设置时返回 DEFAULT_TIME_LIMIT_MS
     */
    int effective_time_limit_ms() const;

    /**
     * @brief 生效的内存限制，未设置时返回 DEFAULT_MEMORY_LIMIT_MB
     */
    int effective_memory_limit_mb() const;
};

/**
 * @brief 计算测试点列表的满分
 * @param fallback_points 测试点列表为空时返回的分数
 */
int sum_points(const std::vector<test_case> &test_cases, int fallback_points);

}  // namespace arena
