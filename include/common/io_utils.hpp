#pragma once

#include <filesystem>
#include <string>

namespace arena {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将内容写入文件，文件存在时将被覆盖
 * @throw std::system_error 无法写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将非法的 UTF-8 字节替换为 '?'，以便输出可以被序列化为 JSON
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 语言配置中的源文件名会被拼接到临时目录下，如果文件名包含 "../"
 * 或者是绝对路径，那么可能覆盖临时目录以外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 独占的临时目录，析构时递归删除整个目录
 * 一次评测运行的所有产物（源文件、编译产物）都放在这个目录下，
 * 无论正常返回、超时还是抛出异常，离开作用域时目录都会被删除。
 */
struct scoped_directory {
    /**
     * @brief 在 parent 下创建一个随机 uuid 命名的目录
     * @throw std::filesystem::filesystem_error 无法创建目录
     */
    explicit scoped_directory(const std::filesystem::path &parent);
    scoped_directory(scoped_directory &&);
    ~scoped_directory();

    scoped_directory(const scoped_directory &) = delete;
    scoped_directory &operator=(const scoped_directory &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除目录
     * @return 是否删除成功，删除失败只记录日志
     */
    bool release();

    /**
     * @brief 保留目录，析构时不再删除，用于 DEBUG 模式下检查运行产物
     */
    void keep();

private:
    std::filesystem::path dir;
    bool valid;
};

}  // namespace arena
