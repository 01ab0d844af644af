#pragma once

#include <filesystem>
#include <string>
#include "judge/problem.hpp"
#include "runtime/language.hpp"

/**
 * 测试用的环境
 * 测试使用 /bin/sh 作为确定性的 "语言"，不依赖 python、node、javac 是否安装：
 * 1. shell: 解释执行 main.sh；
 * 2. shell-compiled: 先用 sh -n 检查语法作为编译步骤，再执行 main.sh。
 */
namespace arena {

/**
 * @brief 将 RUN_DIR 设置为独立的临时目录
 */
void setup_test_environment();

/**
 * @brief 删除 setup_test_environment 创建的临时目录
 */
void teardown_test_environment();

/**
 * @brief 包含内置语言以及 shell、shell-compiled 的语言注册表
 */
const language_registry &test_languages();

/**
 * @brief 统计目录中的文件和子目录个数，目录不存在时返回 0
 */
std::size_t count_entries(const std::filesystem::path &dir);

test_case make_test_case(const std::string &id, const std::string &input, const std::string &expected_output, int points = 1);

}  // namespace arena
