#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace arena {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是沙箱无法创建临时文件、无法启动进程等基础设施问题，
 * 这类错误只影响当前测试点，不会中断整个提交的评测
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 提交使用了没有注册的编程语言
 * 在启动任何进程之前就会被拒绝
 */
struct unsupported_language : public judge_exception {
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 提交在评测开始之前被拒绝
 * 比如比赛不在进行中、题目不属于比赛、测试点数乘时间限制超过了评测时间上限
 */
struct grading_rejected : public judge_exception {
    grading_rejected();
    explicit grading_rejected(const std::string &message);
};

/**
 * @brief 提交的评测被调用方取消
 */
struct grading_cancelled : public judge_exception {
    grading_cancelled();
    explicit grading_cancelled(const std::string &message);
};

/**
 * @brief 表示比赛成绩存储的读写错误
 */
struct store_error : public judge_exception {
    store_error();
    explicit store_error(const std::string &message);
};

}  // namespace arena
