#pragma once

#include <string>
#include "judge/problem.hpp"
#include "runtime/language.hpp"

namespace arena {

/**
 * @brief 查找题目为该语言配置的评测框架
 * @return 题目的评测框架是字符串时直接返回，是按语言区分的映射时返回该语言的框架，
 *         映射中不存在该语言时返回空串
 */
std::string resolve_harness(const problem &prob, const std::string &language);

/**
 * @brief 将选手代码和评测框架合并为一份源代码
 * 评测框架为空（或者只包含空白字符）时，原样返回选手代码。
 * 否则去除评测框架首尾的空白字符，返回：
 * @code
 * <user_code>
 * // HARNESS START
 * <harness>
 * // HARNESS END
 * @endcode
 * 其中注释标记使用该语言的单行注释语法。
 * 合并只依赖输入参数，没有副作用。
 */
std::string compose_harness(const std::string &user_code, const language_runtime &language, const problem &prob);

/**
 * @brief 同上，通过语言 id 查找语言
 * @throw unsupported_language 语言没有注册
 */
std::string compose_harness(const std::string &user_code, const std::string &language, const problem &prob, const language_registry &registry);

}  // namespace arena
