#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief isolate 可执行文件的路径
 * 可以通过命令行参数 --isolate 或者环境变量 ISOLATE 设置
 * @defaultValue "isolate"，即在 PATH 中查找
 */
extern std::filesystem::path ISOLATE_PATH;

/**
 * @brief 评测使用的 isolate 沙箱编号
 * 同一台机器上同时运行多个评测时，每个评测必须使用不同的沙箱编号
 */
extern int BOX_ID;

/**
 * @brief 是否使用 isolate 的 control group 模式（--cg）
 * 关闭后 cg-mem 限制将不起作用
 */
extern bool USE_CGROUPS;

/**
 * @brief 沙箱内运行命令时默认的 PATH 环境变量
 */
extern std::string SANDBOX_PATH_ENV;

/**
 * @brief 沙箱中运行辅助命令（比如编译器）时允许的最大进程数
 */
extern int SANDBOX_PROCESS_LIMIT;

/**
 * @brief 编译选手代码使用的编译器
 */
extern std::filesystem::path COMPILER_PATH;

/**
 * @brief 编译器 stderr 输出保留的最大字节数，避免评测结果无限增长
 */
extern std::size_t COMPILER_STDERR_LIMIT;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，将会输出每条在沙箱中执行的命令
 */
extern bool DEBUG;

}  // namespace grader
