#pragma once

#include <sys/resource.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "common/cancellation.hpp"
#include "runtime/language.hpp"

namespace arena {

/**
 * @brief 一次运行的资源限制
 */
struct run_limits {
    /**
     * @brief 时钟时间限制，单位为毫秒
     */
    int time_limit_ms;

    /**
     * @brief 内存限制，单位为 MB，只有 resource_policy 支持时才会生效
     */
    int memory_limit_mb;
};

/**
 * @brief 沙箱一次运行的原始结果，尚未和标准输出进行比较
 */
struct raw_result {
    std::string stdout_text;

    std::string stderr_text;

    int exit_code = 0;

    /**
     * @brief 超过时钟时间限制，进程树已经被杀死
     */
    bool timed_out = false;

    /**
     * @brief 编译失败或者编译超时，此时程序没有运行
     */
    bool compile_failed = false;

    /**
     * @brief 编译器的输出，只有 compile_failed 时有值
     */
    std::string compile_output;

    /**
     * @brief 运行被取消
     */
    bool cancelled = false;

    long long wall_time_ms = 0;

    double memory_used_mb = 0;

    /**
     * @brief memory_used_mb 是否为估算值
     */
    bool memory_estimated = true;

    /**
     * @brief 给选手看的错误描述，程序正常退出时为空
     */
    std::string error;
};

/**
 * @brief 资源限制与测量策略
 * 默认不限制内存，内存使用量按照程序输出大小估算，并标记为估算值。
 */
struct resource_policy {
    virtual ~resource_policy();

    /**
     * @brief 在子进程 exec 之前调用
     * 只能调用 async-signal-safe 的函数
     * @return 是否设置成功
     */
    virtual bool apply(const run_limits &limits) const;

    /**
     * @brief 根据子进程的资源使用情况测量内存
     * @return 无法测量时返回 std::nullopt，调用方将使用估算值
     */
    virtual std::optional<double> measure(const struct rusage &usage) const;
};

/**
 * @brief 通过 setrlimit 限制地址空间，通过 ru_maxrss 测量内存峰值
 */
struct rlimit_policy : public resource_policy {
    bool apply(const run_limits &limits) const override;
    std::optional<double> measure(const struct rusage &usage) const override;
};

/**
 * @brief 沙箱的抽象接口
 * 评测器只依赖该接口，单元测试可以替换为不创建进程的实现
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 编译（如果需要）并运行源代码，将 input 写入程序的标准输入
     * 程序以非零返回值退出、超时、编译失败都记录在返回值中，不会抛出异常
     * @throw internal_error 沙箱自身无法完成运行，比如无法创建临时目录或者无法启动进程
     */
    virtual raw_result run(const std::string &source, const language_runtime &language, const std::string &input,
                           const run_limits &limits, const cancellation_token &token) = 0;
};

/**
 * @brief 在本机直接创建进程的沙箱
 * 每次运行都会在 run_dir 下创建一个独占的临时目录，
 * 无论运行结果如何，返回之前都会删除该目录（DEBUG 模式下保留）。
 */
struct local_sandbox : public sandbox {
    explicit local_sandbox(const std::filesystem::path &run_dir,
                           std::shared_ptr<resource_policy> policy = std::make_shared<resource_policy>());

    raw_result run(const std::string &source, const language_runtime &language, const std::string &input,
                   const run_limits &limits, const cancellation_token &token) override;

private:
    std::filesystem::path run_dir;
    std::shared_ptr<resource_policy> policy;
};

}  // namespace arena
