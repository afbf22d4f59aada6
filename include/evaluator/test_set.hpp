#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "evaluator/extension.hpp"
#include "evaluator/file_ref.hpp"
#include "evaluator/filters.hpp"

/**
 * 这个头文件包含题目的测试点
 * 包含：
 * 1. test 类（表示一个测试点）
 * 2. test_set 类（表示一道题目的所有测试点，从题目文件夹加载）
 *
 * 题目文件夹的结构：
 *
 * TASK_DIR
 * ├── config.yml // 题目配置（可选），包含 filters、limits、comparators、tests、pipeline
 * ├── script.so // 测试点生成器（可选）
 * ├── t1.in // 测试点 t1 的标准输入
 * ├── t1.out // 测试点 t1 期望的 stdout
 * ├── t1.err // 测试点 t1 期望的 stderr
 * ├── t1.test.so // 测试点 t1 的自定义检查
 * └── t1.result.txt.file // 测试点 t1 运行后期望生成的文件 result.txt
 */
namespace grader {

struct stage;

/**
 * @brief 测试点运行时涉及的额外文件
 */
struct test_file {
    /**
     * @brief 文件在沙箱中的路径（相对于沙箱工作路径）
     */
    std::string path;

    /**
     * @brief 文件内容
     * 对于输入文件，是运行前放入沙箱的内容；对于输出文件，是期望的内容
     */
    file_ptr file;

    /**
     * @brief 是否为输入文件
     */
    bool input = false;
};

/**
 * @brief 表示一个测试点
 */
struct test {
    explicit test(const std::string &name);

    /**
     * @brief 测试点名称，在 test_set 中唯一
     */
    std::string name;

    /**
     * @brief 测试点的标准输入，可以为空
     */
    file_ptr stdin_file;

    /**
     * @brief 期望的 stdout，为空时不比较
     */
    file_ptr stdout_file;

    /**
     * @brief 期望的 stderr，为空时不比较
     */
    file_ptr stderr_file;

    /**
     * @brief 展示给选手的标题，为空时使用测试点名称
     */
    std::optional<std::string> display_title;

    /**
     * @brief 传给选手程序的命令行参数
     */
    std::vector<std::string> args;

    /**
     * @brief 期望的返回值，为空时不检查返回值
     */
    std::optional<int> exit_code = 0;

    std::vector<test_file> files;

    /**
     * @brief 测试点额外使用的过滤器，在 test_set 的过滤器之后应用
     */
    std::vector<filter_ptr> filters;

    /**
     * @brief 测试点单独设置的资源限制，覆盖 test_set 的资源限制
     */
    std::map<std::string, double> limits;

    /**
     * @brief 自定义检查，可以为空
     */
    std::shared_ptr<checker> check;

    std::string title() const;

    /**
     * @brief 转义后的命令行参数，可以直接粘贴到 shell 中
     */
    std::string escaped_args() const;
};

/**
 * @brief 一道题目的所有测试点
 * 构造时从题目文件夹加载测试点，加载完成后不再修改。
 * 加载顺序：
 * 1. 根据文件名（*.out、*.err、*.test.so、*.file）发现测试点
 * 2. 读取 config.yml，可以修改已有的测试点或者增加新的测试点
 * 3. 运行 script.so 中的 generator，可以任意修改测试点
 */
struct test_set {
    /**
     * @param task_path 题目文件夹
     * @param meta 调用方提供的额外信息，可供 generator 和 checker 使用
     * @throw setup_error 题目文件夹不存在时
     * @throw configuration_error 题目配置错误时
     */
    explicit test_set(const std::filesystem::path &task_path, const std::map<std::string, std::string> &meta = {});
    test_set(const test_set &) = delete;
    ~test_set();

    /**
     * @brief 本题目加载的扩展程序
     * @note 必须是第一个成员，保证扩展程序创建的对象全部销毁后才卸载共享库
     */
    extension_registry extensions;

    std::filesystem::path task_path;

    /**
     * @brief 所有测试点共用的过滤器
     */
    std::vector<filter_ptr> filters;

    /**
     * @brief 所有测试点共用的资源限制，键为 isolate 的参数名
     * wall-time、time 单位为秒，cg-mem、stack、fsize 单位为 KB，值为 0 表示不限制
     */
    std::map<std::string, double> limits;

    /**
     * @brief 文件名到比较器类型的映射，未出现的文件使用 text 比较器
     */
    std::map<std::string, std::string> comparators;

    std::map<std::string, std::string> meta;

    /**
     * @brief 评测流程，按顺序执行
     */
    std::vector<std::unique_ptr<stage>> pipeline;

    /**
     * @brief 获取测试点，不存在时创建测试点并根据文件名关联题目文件夹中的文件
     * @param name 测试点名称
     * @return 测试点，重复调用返回同一个对象
     */
    test &create_test(const std::string &name);

    /**
     * @brief 查找测试点，不存在时返回 nullptr
     */
    test *find_test(const std::string &name);

    /**
     * @brief 按加入顺序排列的所有测试点
     */
    const std::vector<std::unique_ptr<test>> &tests() const;

    std::size_t size() const;

    /**
     * @brief 测试点实际使用的资源限制
     */
    std::map<std::string, double> effective_limits(const test &test) const;

    /**
     * @brief 题目文件夹中的文件路径
     */
    std::filesystem::path task_file(const std::string &path) const;

private:
    void load_tests();
    void load_config(const nlohmann::json &config);
    void load_limits(const nlohmann::json &config, std::map<std::string, double> &limits) const;

    std::vector<std::unique_ptr<test>> test_list;
    std::map<std::string, test *> index;
};

/**
 * @brief 默认的资源限制
 */
std::map<std::string, double> default_limits();

}  // namespace grader
