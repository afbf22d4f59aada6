#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
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

namespace grader {

struct process_options {
    /**
     * @brief 额外设置的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 子进程的标准输入文件，为空时继承当前进程的标准输入
     */
    std::filesystem::path stdin_file;

    /**
     * @brief 是否捕获子进程的 stdout 和 stderr
     * 若为假，子进程直接继承当前进程的 stdout 和 stderr
     */
    bool capture_output = true;
};

struct process_result {
    /**
     * @brief 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 外部命令的 stdout 输出（原始字节）
     */
    std::string out;

    /**
     * @brief 外部命令的 stderr 输出（原始字节）
     */
    std::string err;
};

/**
 * @brief 执行外部命令，阻塞直到外部命令退出且输出全部读取完毕
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param options 环境变量、标准输入及是否捕获输出
 * @throw std::system_error 无法创建管道、子进程或者打开标准输入文件时
 */
process_result exec_program(const std::vector<std::string> &argv, const process_options &options);

/**
 * @brief 按照 POSIX shell 的规则转义一个参数
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief 将参数列表转义后用空格连接，结果可以直接粘贴到 shell 中执行
 */
std::string shell_join(const std::vector<std::string> &args);

/**
 * @brief 按照 POSIX shell 的规则（支持引号和转义）切分命令行
 */
std::vector<std::string> shell_split(const std::string &command);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
