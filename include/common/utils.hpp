#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace arena {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param name 可执行文件名，如果包含 '/' 则直接检查该路径
 * @return 可执行文件的完整路径，找不到时返回空路径
 */
std::filesystem::path which(const std::string &name);

/**
 * @brief 将命令模板中的占位符替换为实际值
 * @param templ 命令模板，比如 {"g++", "{source}", "-o", "{binary}"}
 * @param values 占位符的值，键不包含大括号
 * @code{.cpp}
 *     // {"python3", "/tmp/run/main.py"}
 *     expand_command({"python3", "{source}"}, {{"source", "/tmp/run/main.py"}});
 * @endcode
 */
std::vector<std::string> expand_command(const std::vector<std::string> &templ, const std::map<std::string, std::string> &values);

/**
 * @brief 计时器，基于单调时钟，避免系统时间调整导致计时错误
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace arena
