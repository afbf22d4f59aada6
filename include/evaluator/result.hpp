#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "evaluator/file_ref.hpp"
#include "isolate.hpp"

/**
 * 这个头文件包含评测结果
 * 包含：
 * 1. test_result 类（表示一个测试点的评测结果）
 * 2. stage_result 类（表示一个评测阶段的结果）
 * 3. evaluation_result 类（表示一次评测的结果，最终保存为 result.json）
 */
namespace grader {

/**
 * @brief 测试点中的一个文件（stdout、stderr 或者其他文件）
 * 所有路径均为结果文件夹中的副本，报告中以相对于结果根目录的路径表示
 */
struct file_record {
    std::string name;

    /**
     * @brief 是否为输入文件（在运行选手程序之前放入沙箱）
     */
    bool input = false;

    /**
     * @brief 选手程序实际生成的文件，或者输入文件的副本
     */
    std::optional<std::filesystem::path> actual;

    /**
     * @brief 期望的文件
     */
    std::optional<std::filesystem::path> expected;

    /**
     * @brief 比较器生成的 HTML
     */
    std::optional<std::filesystem::path> html;

    /**
     * @brief 比较器生成的差异
     */
    std::optional<std::filesystem::path> diff;

    /**
     * @brief 比较前出现的问题，比如文件不存在
     */
    std::optional<std::string> error;
};

/**
 * @brief 测试点中的一个断言
 */
struct assertion {
    bool success = false;
    std::string message;

    /**
     * @brief 断言附带的可视化结果（HTML 文件，相对于结果根目录）
     */
    std::optional<std::string> output;
};

/**
 * @brief 一个测试点的评测结果
 *
 * 结果文件夹的结构：
 *
 * RESULT_DIR
 * ├── result.json // 评测报告
 * └── tests // 评测阶段的 id
 *     └── t1 // 测试点名称
 *         ├── stdin.input // 测试点的标准输入
 *         ├── stdout.actual // 选手程序的 stdout
 *         ├── stdout.expected // 期望的 stdout
 *         ├── stdout.diff // 比较器生成的差异
 *         └── out_data.txt.actual // 选手程序生成的 out/data.txt
 */
struct test_result {
    /**
     * @param result_root 评测的结果根目录
     * @param dir 测试点的结果文件夹
     * @param name 测试点名称
     */
    test_result(const std::filesystem::path &result_root, const std::filesystem::path &dir, const std::string &name);

    std::string name;

    std::string title;

    std::vector<file_record> files;

    /**
     * @brief 断言列表，全部成功时测试点才通过
     */
    std::vector<assertion> results;

    /**
     * @brief 错误列表，只要存在错误测试点就失败
     * 比如段错误、自定义检查失败
     */
    std::vector<std::string> errors;

    /**
     * @brief 选手程序的运行信息
     */
    isolate_result statistics;

    /**
     * @brief 运行选手程序的命令，用于展示给选手
     */
    std::string command;

    std::filesystem::path result_root;

    std::filesystem::path dir;

    /**
     * @brief 测试点是否通过：所有断言成功且没有错误
     */
    bool success() const;

    /**
     * @brief 追加断言
     */
    void add_result(bool passed, const std::string &message, const std::optional<std::string> &output = std::nullopt);

    /**
     * @brief 追加错误，错误总是会导致测试点失败
     */
    void add_error(const std::string &message);

    /**
     * @brief 保存选手程序生成的文件和期望的文件
     * @param name 文件名，stdout、stderr 或者沙箱内的路径
     * @param actual 选手程序生成的文件，不存在时不会保存
     * @param expected 期望的文件，可以为空
     * @param force_save 若为真，actual 不存在时保存一个空文件
     * @return 文件记录，actual 和 expected 都不存在时返回 nullptr
     */
    file_record *copy_result_file(const std::string &name, const std::filesystem::path &actual, const file_ref *expected = nullptr, bool force_save = false);

    /**
     * @brief 保存输入文件
     */
    file_record &copy_input_file(const std::string &name, const file_ref &file);

    /**
     * @brief 保存比较器生成的差异
     */
    void copy_diff(const std::string &name, const std::string &diff);

    /**
     * @brief 保存比较器生成的 HTML
     * @return HTML 文件相对于结果根目录的路径
     */
    std::string copy_html_result(const std::string &name, const std::string &html);

    /**
     * @brief 根据文件名查找文件记录
     */
    file_record *find_file(const std::string &name);

    /**
     * @brief 将结果文件夹中的路径转换为相对于结果根目录的路径
     */
    std::string relative(const std::filesystem::path &path) const;

private:
    std::filesystem::path artifact_path(const std::string &name, const std::string &kind) const;
    file_record &record(const std::string &name);
};

/**
 * @brief 一个评测阶段的结果
 */
struct stage_result {
    std::string id;

    std::string title;

    /**
     * @brief 评测阶段是否失败，失败后之后的评测阶段都不会执行
     */
    bool failed = false;

    /**
     * @brief 评测阶段特有的结果，比如编译命令、编译器输出
     */
    nlohmann::json fields = nlohmann::json::object();

    std::vector<test_result> tests;
};

/**
 * @brief 一次评测的结果
 */
struct evaluation_result {
    /**
     * @brief 按执行顺序保存的评测阶段结果
     */
    std::vector<stage_result> pipelines;

    /**
     * @brief 将评测结果保存为 JSON 文件
     */
    void save(const std::filesystem::path &path) const;
};

void to_json(nlohmann::json &j, const assertion &assertion);
void to_json(nlohmann::json &j, const test_result &result);
void to_json(nlohmann::json &j, const stage_result &result);
void to_json(nlohmann::json &j, const evaluation_result &result);

}  // namespace grader
