#pragma once

#include <sys/resource.h>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"

namespace arena {

/**
 * @brief 创建子进程所需的参数
 */
struct process_options {
    /**
     * @brief 命令行，argv[0] 会在 PATH 中查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path cwd;

    /**
     * @brief 写入子进程标准输入的数据，写完后关闭标准输入
     */
    std::string stdin_text;

    /**
     * @brief 时钟时间限制，单位为毫秒，非正数表示不限制
     */
    int time_limit_ms = -1;

    /**
     * @brief 每个输出流最多保留的字节数
     */
    std::size_t max_output_bytes = 64 << 20;

    /**
     * @brief 在子进程 fork 之后、exec 之前调用，用于设置资源限制
     * 只能调用 async-signal-safe 的函数，返回 false 表示设置失败，子进程将退出
     */
    std::function<bool()> before_exec;

    cancellation_token token;
};

/**
 * @brief 子进程的运行结果
 */
struct process_result {
    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 子进程的返回值，被信号杀死时为 128 + 信号编号
     */
    int exit_code = 0;

    /**
     * @brief 杀死子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 子进程因为超过时钟时间限制被杀死
     */
    bool timed_out = false;

    /**
     * @brief 子进程因为取消标记被杀死
     */
    bool cancelled = false;

    /**
     * @brief 输出超过 max_output_bytes 被截断
     */
    bool truncated = false;

    long long wall_time_ms = 0;

    /**
     * @brief wait4 返回的资源使用情况
     */
    struct rusage usage {};
};

/**
 * @brief 创建子进程并等待其结束
 * 子进程运行在独立的进程组中，超时或被取消时先发送 SIGTERM，
 * 再发送 SIGKILL 给整个进程组，因此子进程创建的后代进程也会被杀死。
 * 子进程退出后同样会杀死进程组中残留的后台进程。
 *
 * 子进程以非零返回值退出不会抛出异常，只记录在返回值中。
 * @throw internal_error 无法创建管道、无法 fork 或者 exec 失败
 */
process_result run_process(const process_options &options);

}  // namespace arena
