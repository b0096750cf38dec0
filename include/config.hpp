#pragma once

#include <filesystem>

namespace arbiter {

/**
 * @brief 选手程序编译及运行的根目录
 * 每个提交在其中独占一个随机命名的目录，评测结束后删除。
 * 若将这个文件夹放进内存盘，可以加速选手程序的 IO 性能。
 *
 * SCRATCH_DIR
 * ├── 3f2c... // 随机生成的 uuid，一个提交或者一次测试运行一个
 * │   ├── solution.py // 选手源代码，文件名由语言配置的 source_file 决定
 * │   └── solution // 编译产物（如果有编译步骤）
 * └── ...
 * @defaultValue /tmp/arbiter
 */
extern std::filesystem::path SCRATCH_DIR;

/**
 * @brief 历史提交记录文件，每行一个 JSON 对象
 * 为空时提交记录只保存在内存中。
 */
extern std::filesystem::path HISTORY_FILE;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除产生的提交目录，
 * 以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

/**
 * @brief 编译错误返回给选手时保留的最大长度
 */
extern std::size_t MAX_COMPILE_ERROR_LENGTH;

}  // namespace arbiter
