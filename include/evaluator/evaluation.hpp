#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "evaluator/result.hpp"
#include "evaluator/test_set.hpp"
#include "sandbox.hpp"

/**
 * 这个头文件包含评测的入口
 * 一次评测的过程：
 * 1. 加载题目的测试点，清空结果文件夹
 * 2. 按顺序执行评测流程中的各个阶段，某个阶段失败后停止
 * 3. 将评测结果保存到结果文件夹中的 result.json
 */
namespace grader {

/**
 * @brief 一次评测
 * 评测阶段和自定义检查通过 evaluation 访问沙箱、测试点和题目文件
 */
struct evaluation {
    /**
     * @param task_path 题目文件夹
     * @param result_path 结果文件夹，构造时会被清空
     * @param box 已经初始化的沙箱
     * @param meta 调用方提供的额外信息
     * @throw setup_error 题目文件夹不存在时
     * @throw configuration_error 题目配置错误时
     */
    evaluation(const std::filesystem::path &task_path, const std::filesystem::path &result_path, sandbox &box, const std::map<std::string, std::string> &meta = {});

    sandbox &box;

    std::filesystem::path task_path;

    std::filesystem::path result_path;

    test_set tests;

    /**
     * @brief 题目文件夹中的文件路径
     */
    std::filesystem::path task_file(const std::string &path) const;

    /**
     * @brief 执行评测流程，并保存 result.json
     */
    evaluation_result run();

    /**
     * @brief 在沙箱中运行一个测试点
     * 选手程序运行出错、输出不正确都会记录在结果中，不会抛出异常
     * @param runner 运行测试点的评测阶段 id
     * @param test 测试点
     * @param executable 沙箱中的选手程序
     * @param env 传给选手程序的环境变量
     * @param title 测试点标题，为空时使用测试点自己的标题
     */
    test_result evaluate(const std::string &runner, const test &test, const std::string &executable, const std::map<std::string, std::string> &env = {}, const std::optional<std::string> &title = std::nullopt);
};

/**
 * @brief 评测一份提交
 * 初始化沙箱，将选手提交的文件复制到沙箱中，然后执行评测流程
 * @param task_path 题目文件夹
 * @param submission_path 选手提交的文件夹
 * @param result_path 结果文件夹
 * @param meta 调用方提供的额外信息
 * @throw setup_error 题目、提交文件夹不存在或者沙箱无法初始化时
 * @throw configuration_error 题目配置错误时
 */
evaluation_result evaluate(const std::filesystem::path &task_path, const std::filesystem::path &submission_path, const std::filesystem::path &result_path, const std::map<std::string, std::string> &meta = {});

}  // namespace grader
