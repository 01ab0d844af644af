#pragma once

#include <cstddef>
#include <filesystem>

namespace arena {

/**
 * @brief 测试点的默认时钟时间限制，单位为毫秒
 * 题目没有设置时间限制（或者设置为非正数）时使用
 */
extern int DEFAULT_TIME_LIMIT_MS;

/**
 * @brief 题目的默认内存限制，单位为 MB
 */
extern int DEFAULT_MEMORY_LIMIT_MB;

/**
 * @brief 编译步骤的时钟时间限制，单位为毫秒
 * 编译器同样运行在沙箱中，也不允许无限期运行
 */
extern int COMPILE_TIME_LIMIT_MS;

/**
 * @brief 单个提交最坏情况下的评测时间上限，单位为毫秒
 * 测试点数量乘以时间限制超过该值的提交将直接被拒绝评测
 */
extern long long MAX_GRADING_TIME_MS;

/**
 * @brief 每个输出流最多保留的字节数，超过的部分会被读取并丢弃
 */
extern std::size_t MAX_OUTPUT_BYTES;

/**
 * @brief 比赛成绩乐观并发写入冲突时的最大重试次数
 */
extern int STORE_MAX_RETRIES;

/**
 * @brief 选手程序编译及运行的根目录
 * 每次运行都会在该目录下创建一个随机 uuid 命名的目录，运行结束后删除
 *
 * RUN_DIR
 * ├── 6f1c...-uuid // 一次运行（一个测试点）的产物目录
 * │   ├── main.cpp // 合并评测框架之后的源代码
 * │   └── main // 编译产物（仅编译型语言）
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，运行产物目录不会被删除，以便手动检查。
 */
extern bool DEBUG;

}  // namespace arena
