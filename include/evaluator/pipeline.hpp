#pragma once

#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "evaluator/result.hpp"

/**
 * 这个头文件包含评测流程的各个阶段
 * config.yml 中的 pipeline 按顺序声明评测阶段：
 * @code{.yml}
 * pipeline:
 *   - type: compile
 *     flags: [-std=c11]
 *   - type: run
 *     command: ./prepare.sh
 *   - type: tests
 *     executable: ./main
 * @endcode
 * 每个声明都包含 type，可以包含 id、title，以及评测阶段自己的选项。
 */
namespace grader {

struct evaluation;

/**
 * @brief 评测阶段
 */
struct stage {
    virtual ~stage() = default;

    /**
     * @brief 评测阶段的 id，作为测试点结果文件夹的上一级文件夹名
     */
    std::string id;

    /**
     * @brief 展示给选手的标题
     */
    std::string title;

    /**
     * @brief 执行评测阶段
     * 结果中的 id 和 title 由 evaluation 填写
     */
    virtual stage_result run(evaluation &context) = 0;
};

typedef std::function<std::unique_ptr<stage>(const nlohmann::json &)> stage_factory;

/**
 * @brief 注册评测阶段类型，同类型的评测阶段会被覆盖
 * 内置类型：compile、run、tests
 */
void register_stage(const std::string &type, stage_factory factory);

/**
 * @brief 根据声明创建评测阶段
 * @throw configuration_error 声明没有 type 或者类型不存在时
 */
std::unique_ptr<stage> create_stage(const nlohmann::json &declaration);

/**
 * @brief 编译选手代码
 * 编译失败时评测阶段失败，之后的评测阶段不再执行
 */
struct compile_stage : public stage {
    explicit compile_stage(const nlohmann::json &declaration);

    /**
     * @brief 额外的编译选项
     */
    std::vector<std::string> flags;

    /**
     * @brief 要编译的源文件，为空时编译沙箱中所有 .c 文件
     */
    std::vector<std::string> sources;

    stage_result run(evaluation &context) override;
};

/**
 * @brief 在沙箱中执行一条命令，返回值非零时评测阶段失败
 */
struct command_stage : public stage {
    explicit command_stage(const nlohmann::json &declaration);

    std::string command;

    stage_result run(evaluation &context) override;
};

/**
 * @brief 依次运行所有测试点
 */
struct tests_stage : public stage {
    explicit tests_stage(const nlohmann::json &declaration);

    /**
     * @brief 沙箱中的选手程序
     */
    std::string executable = "./main";

    /**
     * @brief 传给选手程序的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 若为真，存在未通过的测试点时评测阶段失败
     */
    bool fail_on_error = false;

    stage_result run(evaluation &context) override;
};

}  // namespace grader
