#pragma once

#include <string>
#include <variant>

namespace arena {

/**
 * @brief 表示数据点的评测结果，或者整个提交所处的评测阶段
 */
enum class status {
    /**
     * @brief 提交正在等待评测
     */
    PENDING = 0,

    /**
     * @brief 提交正在评测，还有测试点没有完成
     */
    RUNNING = 1,

    /**
     * @brief 本测试点的输出去除首尾空白字符后与标准输出一致
     */
    ACCEPTED = 2,

    /**
     * @brief 答案错误
     * 去除首尾空白字符后输出与标准输出不一致，中间的空白字符也会参与比较
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 用户程序运行时间超过时钟时间限制，进程树已被强制终止
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序因为信号崩溃，或者以非零返回值退出
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 用户程序无法通过编译
     * 编译错误时，所有测试点都将返回同样的编译信息
     */
    COMPILATION_ERROR = 6,

    /**
     * @brief 内部错误，沙箱自身无法完成评测
     * 比如无法创建临时文件或者无法 fork，只影响当前测试点
     */
    SYSTEM_ERROR = 7
};

const char *get_display_message(status);

/**
 * @brief 正常完成评测的提交或者比赛题目的得分状态
 */
enum class grade {
    NOT_ATTEMPTED = 0,
    ATTEMPTED = 1,
    PARTIAL = 2,
    ACCEPTED = 3
};

/**
 * @brief 无法正常比较输出的评测结果
 * 这类结果优先于按分数计算出的 grade
 */
enum class fault {
    COMPILATION_ERROR = 0,
    TIME_LIMIT_EXCEEDED = 1,
    RUNTIME_ERROR = 2
};

/**
 * @brief 提交的最终结论
 * 调用方通过 std::holds_alternative 区分 "评测完成但得了 0 分" 与 "根本无法评测"
 */
using verdict = std::variant<grade, fault>;

const char *to_string(grade);

const char *to_string(fault);

std::string to_string(const verdict &v);

grade parse_grade(const std::string &str);

verdict parse_verdict(const std::string &str);

bool is_fault(const verdict &v);

/**
 * @brief 将评测结论转换为提交状态
 * ACCEPTED 对应 status::ACCEPTED，PARTIAL、ATTEMPTED 对应 status::WRONG_ANSWER，
 * fault 对应同名的 status
 */
status status_of(const verdict &v);

}  // namespace arena
