#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测开始前的准备工作失败
 * 比如题目文件夹不存在、结果文件夹无法创建，
 * 此时整个评测将被终止，并且不会产生评测报告
 */
struct setup_error : public grader_exception {
    setup_error();
    explicit setup_error(const std::string &message);
};

/**
 * @brief 表示 isolate 无法初始化或清理沙箱
 */
struct sandbox_error : public setup_error {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示题目配置错误
 * 比如 config.yml 格式错误、使用了不存在的过滤器、比较器、评测阶段，
 * 或者题目提供的扩展程序无法加载
 */
struct configuration_error : public grader_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示在沙箱中执行的命令返回了非零的返回值
 * 由 sandbox::run_check 抛出
 */
struct command_error : public grader_exception {
    command_error(const std::string &command, int exit_code);

    /**
     * @brief 执行失败的命令
     */
    const std::string command;

    /**
     * @brief 命令的返回值
     */
    const int exit_code;
};

}  // namespace grader
