#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * 这个头文件包含编程语言的运行方式
 * 我们有两种语言：
 * 1. interpreted_language: 解释执行的语言，比如 Python、JavaScript，
 *                          直接把源文件交给解释器运行。
 * 2. compiled_language: 需要编译的语言，比如 C++、Java，先调用编译器
 *                       生成可执行文件或字节码，再运行编译产物。
 * 语言只描述命令行，不负责创建进程，进程由 sandbox 创建并限制。
 */
namespace arena {

/**
 * @brief 表示选手程序编译失败
 * 只在沙箱内部使用，沙箱会将其转换为 raw_result::compile_failed
 */
struct compilation_error : public std::runtime_error {
    /**
     * @brief 编译器的输出
     */
    std::string error_log;

    explicit compilation_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 一次运行所使用的文件路径
 * 所有路径都在同一个独占的临时目录下，不同提交的运行互不干扰
 */
struct artifact_set {
    /**
     * @brief 本次运行的临时目录，也是进程的工作目录
     */
    std::filesystem::path dir;

    /**
     * @brief 合并评测框架之后的源文件
     */
    std::filesystem::path source;

    /**
     * @brief 编译产物，对于解释型语言为空
     */
    std::filesystem::path binary;
};

/**
 * @brief 表示一种编程语言的运行方式
 */
struct language_runtime {
    virtual ~language_runtime();

    /**
     * @brief 语言的 id，比如 python、javascript、cpp、java
     */
    virtual const std::string &name() const = 0;

    /**
     * @brief 源文件的后缀名，比如 .py
     */
    virtual std::string source_suffix() const = 0;

    /**
     * @brief 单行注释的前缀，合并评测框架时用于生成标记
     */
    virtual const std::string &comment_prefix() const = 0;

    /**
     * @brief 是否需要编译
     */
    virtual bool needs_compilation() const = 0;

    /**
     * @brief 将源代码写入临时目录
     * @param dir 本次运行独占的临时目录
     * @param source 合并评测框架之后的源代码
     * @return 本次运行使用的文件路径
     * @throw std::system_error 无法写入源文件
     */
    virtual artifact_set materialize(const std::filesystem::path &dir, const std::string &source) const = 0;

    /**
     * @brief 编译命令，对于解释型语言返回空列表
     */
    virtual std::vector<std::string> compile_command(const artifact_set &artifacts) const = 0;

    /**
     * @brief 运行命令，测试点的输入数据将写入该进程的标准输入
     */
    virtual std::vector<std::string> run_command(const artifact_set &artifacts) const = 0;
};

/**
 * @brief 通过命令模板描述的语言
 * 命令模板中可以使用占位符 {source}、{binary}、{dir}、{stem}
 */
struct template_language : public language_runtime {
    template_language(const std::string &name, const std::string &source_name, const std::string &comment, const std::vector<std::string> &run);

    const std::string &name() const override;
    std::string source_suffix() const override;
    const std::string &comment_prefix() const override;
    std::vector<std::string> run_command(const artifact_set &artifacts) const override;

protected:
    std::map<std::string, std::string> placeholders(const artifact_set &artifacts) const;

    std::string lang;

    /**
     * @brief 源文件名，比如 main.py，Java 必须为 Main.java 才能和主类名一致
     */
    std::string source_name;

    std::string comment;

    std::vector<std::string> run;
};

/**
 * @brief 解释型语言
 */
struct interpreted_language : public template_language {
    interpreted_language(const std::string &name, const std::string &source_name, const std::string &comment, const std::vector<std::string> &run);

    bool needs_compilation() const override;
    artifact_set materialize(const std::filesystem::path &dir, const std::string &source) const override;
    std::vector<std::string> compile_command(const artifact_set &artifacts) const override;
};

/**
 * @brief 编译型语言
 * 编译失败（返回值非零或者超时）时本次运行不会执行 run 步骤
 */
struct compiled_language : public template_language {
    /**
     * @param binary_name 编译产物的文件名，比如 main、Main.class
     */
    compiled_language(const std::string &name, const std::string &source_name, const std::string &binary_name, const std::string &comment,
                      const std::vector<std::string> &compile, const std::vector<std::string> &run);

    bool needs_compilation() const override;
    artifact_set materialize(const std::filesystem::path &dir, const std::string &source) const override;
    std::vector<std::string> compile_command(const artifact_set &artifacts) const override;

private:
    std::string binary_name;
    std::vector<std::string> compile;
};

/**
 * @brief 语言 id 到语言运行方式的映射
 * 在启动时构建完成，之后只读，可以被多个 worker 并发访问
 */
struct language_registry {
    /**
     * @brief 注册一种语言，已经存在的同名语言将被替换
     */
    void register_language(std::unique_ptr<language_runtime> &&language);

    /**
     * @brief 根据语言 id 查找语言
     * @throw unsupported_language 若语言没有注册
     */
    const language_runtime &at(const std::string &name) const;

    /**
     * @brief 根据语言 id 查找语言
     * @return 语言没有注册时返回 nullptr
     */
    const language_runtime *find(const std::string &name) const;

    bool contains(const std::string &name) const;

    std::vector<std::string> names() const;

    /**
     * @brief 注册内置的 python、javascript、cpp、java
     */
    void load_defaults();

    /**
     * @brief 从 JSON 配置文件加载语言，同名语言会覆盖内置配置
     * @code{.json}
     * {
     *     "cpp": {
     *         "type": "compiled",
     *         "source": "main.cpp",
     *         "binary": "main",
     *         "comment": "//",
     *         "compile": ["g++", "-O2", "-o", "{binary}", "{source}"],
     *         "run": ["{binary}"]
     *     }
     * }
     * @endcode
     */
    void load_json(const std::filesystem::path &config_path);

    /**
     * @brief 构建只包含内置语言的注册表
     */
    static language_registry with_defaults();

private:
    std::map<std::string, std::unique_ptr<language_runtime>> languages;
};

}  // namespace arena
