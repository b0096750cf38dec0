#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将内容写入文件，文件已存在时覆盖
 * @throw std::system_error 写入失败时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 name 是一个不包含目录的普通文件名
 * 选手代码会以配置中的文件名写入临时目录，如果文件名包含 "/" 或者
 * 是 ".."，可能会写出临时目录导致安全问题。
 * @param name 被检查的文件名
 * @return name 本身
 * @throw std::invalid_argument 文件名不安全时
 */
std::string assert_safe_filename(const std::string &name);

/**
 * @brief 一个提交独占的临时工作目录
 * 构造时在 root 下创建一个随机命名的目录，析构时删除整个目录，
 * 包括其中的源代码和编译产物。只能移动，不能复制。
 *
 * SCRATCH_DIR
 * ├── 3f2c...  // 随机生成的 uuid，一个提交一个
 * │   ├── solution.py  // 选手源代码
 * │   └── out  // 编译产物
 * └── ...
 */
struct scratch_directory {
    /**
     * @param root 临时目录的父目录，不存在时会被创建
     * @param keep 为真时析构不删除目录（调试模式）
     * @throw sandbox_error 无法创建目录时
     */
    scratch_directory(const std::filesystem::path &root, bool keep = false);
    scratch_directory(scratch_directory &&other) noexcept;
    ~scratch_directory();

    scratch_directory(const scratch_directory &) = delete;
    scratch_directory &operator=(const scratch_directory &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除目录，之后 path() 不再可用
     */
    void release();

private:
    std::filesystem::path dir;
    bool keep;
    bool valid;
};

}  // namespace arbiter
