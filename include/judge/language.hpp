#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arbiter {

/**
 * @brief 需要先编译再运行的语言，比如 C++、Java
 */
struct compiled_language {
    /**
     * @brief 编译命令模板，比如 "g++ -O2 -o out {source_file}"
     */
    std::string build;

    /**
     * @brief 运行命令模板，比如 "./out"
     */
    std::string run;
};

/**
 * @brief 直接解释执行源代码的语言，比如 Python
 */
struct interpreted_language {
    std::string run;
};

/**
 * @brief 一种编程语言的配置
 *
 * 命令模板按照 shell 的规则切分参数（支持引号和转义），但不会经过 shell 执行，
 * 模板中的 {source_file} 会被替换为 source_file。
 * 一种语言是否需要编译是它的静态属性，在加载配置时确定。
 */
struct language {
    /**
     * @brief 配置中的语言名称，比如 python3、java、ocaml
     */
    std::string name;

    std::variant<compiled_language, interpreted_language> kind;

    /**
     * @brief 选手源代码保存的文件名，比如 Solution.java
     */
    std::string source_file;

    bool is_compiled() const;

    /**
     * @brief 展开后的编译命令，解释型语言返回 std::nullopt
     */
    std::optional<std::vector<std::string>> build_command() const;

    /**
     * @brief 展开后的运行命令
     */
    std::vector<std::string> run_command() const;
};

/**
 * @brief 展开命令模板
 * @param command_template 命令模板
 * @param source_file 用于替换 {source_file} 的文件名
 * @return 切分后的命令参数
 * @throw configuration_error 模板为空或者引号不匹配
 */
std::vector<std::string> expand_command(const std::string &command_template, const std::string &source_file);

/**
 * @brief 获取内置的语言预设
 * 支持 python3、java、cpp、c，版本号目前只用于日志。
 * @param name 预设名称
 * @param version 配置中写的版本，比如 "latest"、"21"
 * @throw configuration_error 预设不存在
 */
language preset_language(const std::string &name, const std::string &version);

/**
 * @brief 从配置中读取一种语言
 * 配置可以是一个字符串（使用内置预设，字符串为版本），也可以是一个对象：
 * {"build": "...", "run": "...", "source_file": "..."}，其中 build 可以省略。
 * @throw configuration_error 配置不合法时
 */
language parse_language(const std::string &name, const nlohmann::json &config);

}  // namespace arbiter
