#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/io_utils.hpp"

namespace grader {

/**
 * @brief 在沙箱中执行命令的结果
 */
struct command_result {
    int exit_code = -1;

    /**
     * @brief 命令的 stdout 输出，非法的 UTF-8 字节已经被替换
     */
    std::string out;

    /**
     * @brief 命令的 stderr 输出，非法的 UTF-8 字节已经被替换
     */
    std::string err;
};

/**
 * @brief 编译选手代码的结果
 */
struct compile_result : command_result {
    /**
     * @brief 实际执行的编译命令，用于展示给选手
     */
    std::string command;
};

/**
 * @brief 在沙箱中运行选手程序（测试点）的参数
 */
struct isolated_run {
    /**
     * @brief 选手程序的命令行，argv[0] 为沙箱内的可执行文件路径
     */
    std::vector<std::string> command;

    /**
     * @brief 资源限制，键为 isolate 的参数名，比如 wall-time、cg-mem，值为 0 表示不限制
     */
    std::map<std::string, double> limits;

    /**
     * @brief 传给选手程序的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief isolate 写入 metadata 的文件路径（沙箱外）
     */
    std::filesystem::path metadata_file;

    /**
     * @brief 选手程序 stdout 和 stderr 的文件名，相对于沙箱根目录
     */
    std::string stdout_name, stderr_name;

    /**
     * @brief 选手程序的标准输入，为空表示没有标准输入
     */
    std::filesystem::path stdin_file;
};

/**
 * @brief 将资源限制转换为 isolate 的参数，值为 0 的限制不会传给 isolate
 */
std::vector<std::string> limit_flags(const std::map<std::string, double> &limits);

/**
 * @brief 将环境变量转换为 isolate 的 -E 参数
 */
std::vector<std::string> env_flags(const std::map<std::string, std::string> &env);

/**
 * @brief 一个 isolate 沙箱
 * 每次评测都必须创建新的 sandbox 并调用 initialize，initialize 会清理同一编号沙箱中
 * 上一次评测残留的文件，从而避免不同提交之间互相影响。
 * 同一次评测中的所有测试点共享同一个沙箱，前一个测试点留下的文件对后一个测试点可见。
 *
 * 沙箱的文件结构：
 *
 * ROOT // isolate --init 输出的路径
 * └── box // 沙箱内程序的工作路径，选手代码被复制到这里
 *     ├── main.c // 选手代码
 *     ├── main // 编译好的选手程序
 *     ├── 0f3c...d2 // 选手程序的 stdout 输出，文件名随机生成
 *     └── 9a1b...7e // 选手程序的 stderr 输出
 */
struct sandbox {
    sandbox();

    /**
     * @param box_id isolate 的沙箱编号
     */
    explicit sandbox(int box_id);

    /**
     * @brief 清理上次残留的沙箱，并初始化新的沙箱
     * @throw sandbox_error isolate 无法清理或初始化沙箱时
     */
    void initialize();

    /**
     * @brief 沙箱的根目录，即 isolate --init 输出的路径
     */
    const std::filesystem::path &root() const;

    /**
     * @brief 将沙箱内的相对路径映射为沙箱外的绝对路径
     * @param path 相对于沙箱工作路径的路径
     * @note 仅用于放置和读取文件，不提供任何隔离保证
     */
    std::filesystem::path system_path(const std::string &path = "") const;

    /**
     * @brief 准备写入沙箱内的文件，返回沙箱外的绝对路径
     * 选手程序可能在沙箱中留下指向沙箱外的符号链接，路径上的符号链接、
     * 占据文件夹位置的文件以及占据文件位置的文件夹都会被删除，缺少的文件夹会被创建。
     * @param path 相对于沙箱工作路径的路径
     */
    std::filesystem::path input_path(const std::string &path) const;

    /**
     * @brief 沙箱内选手程序输出的文件在沙箱外的绝对路径
     * @param path 相对于沙箱工作路径的路径
     * @return 路径上存在符号链接或者目标不是普通文件时返回空
     */
    std::optional<std::filesystem::path> output_path(const std::string &path) const;

    /**
     * @brief 将沙箱外的文件复制到沙箱内
     * @param local 沙箱外的文件
     * @param box 沙箱内的目标路径
     */
    void copy(const std::filesystem::path &local, const std::string &box) const;

    /**
     * @brief 将文件夹的全部内容复制到沙箱工作路径下，已经存在的文件会被覆盖
     */
    void copy_tree(const std::filesystem::path &dir) const;

    /**
     * @brief 打开沙箱内的文件，文件不能是符号链接
     */
    std::ifstream open(const std::string &path) const;

    /**
     * @brief 在沙箱工作路径下创建临时文件，返回的对象析构时删除文件
     */
    std::unique_ptr<temporary_file> open_temporary(const std::string &suffix) const;

    /**
     * @brief 在沙箱中执行命令并等待其结束
     * @param command 命令行
     * @param env 环境变量，未设置 PATH 时使用 SANDBOX_PATH_ENV
     * @param stderr_to_stdout 是否将 stderr 合并到 stdout
     * @return 命令的返回值和输出
     */
    command_result run(const std::vector<std::string> &command, std::map<std::string, std::string> env = {}, bool stderr_to_stdout = false) const;

    /**
     * @brief 在沙箱中执行命令并等待其结束
     * @param command 命令行，按照 shell 的规则切分参数
     */
    command_result run(const std::string &command, const std::map<std::string, std::string> &env = {}, bool stderr_to_stdout = false) const;

    /**
     * @brief 在沙箱中执行命令，要求命令执行成功
     * @throw command_error 命令返回值非零时
     */
    command_result run_check(const std::string &command) const;

    /**
     * @brief 在资源限制下运行选手程序
     * @return isolate 的返回值，选手程序的运行结果需要读取 metadata 文件
     */
    int run_isolated(const isolated_run &options) const;

    /**
     * @brief 编译沙箱内的 C 语言代码，生成 main
     * @param flags 额外的编译选项
     * @param sources 要编译的源文件，为空时编译沙箱根目录下所有 .c 文件
     */
    compile_result compile(const std::vector<std::string> &flags = {}, std::vector<std::string> sources = {}) const;

private:
    int box_id;
    std::filesystem::path path;

    std::vector<std::string> isolate_command() const;
};

}  // namespace grader
