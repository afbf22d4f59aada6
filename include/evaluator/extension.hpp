#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含题目可以提供的扩展程序的接口
 * 扩展程序有两种：
 * 1. checker: <name>.test.so，在测试点的标准比较完成之后执行自定义检查
 * 2. generator: script.so，在题目加载完成后以编程的方式生成测试点
 *
 * 扩展程序是编译好的共享库，通过导出的工厂函数创建对象：
 * @code{.cpp}
 *     struct my_checker : grader::checker {
 *         std::optional<std::string> check(grader::test_result &result, grader::evaluation &context) override {
 *             if (result.statistics.exit_code != 42) return "program should exit with 42";
 *             return std::nullopt;
 *         }
 *     };
 *     GRADER_EXPORT_CHECKER(my_checker)
 * @endcode
 */
namespace grader {

struct test_result;
struct evaluation;
struct test_set;

/**
 * @brief 自定义检查
 */
struct checker {
    virtual ~checker() = default;

    /**
     * @param result 正在评测的测试点结果，可以在其中追加断言
     * @param context 当前的评测，可以通过它访问沙箱和题目文件
     * @return 非空时表示检查失败，返回值将作为错误记录到测试点结果中
     */
    virtual std::optional<std::string> check(test_result &result, evaluation &context) = 0;
};

/**
 * @brief 测试点生成器
 */
struct generator {
    virtual ~generator() = default;

    /**
     * @brief 向 tests 中添加测试点，或者修改已有的测试点
     */
    virtual void generate(test_set &tests) = 0;
};

/**
 * @brief 由函数实现的 checker，用于在程序内直接注册自定义检查
 */
struct function_checker : public checker {
    std::function<std::optional<std::string>(test_result &, evaluation &)> fn;

    explicit function_checker(std::function<std::optional<std::string>(test_result &, evaluation &)> fn) : fn(std::move(fn)) {}

    std::optional<std::string> check(test_result &result, evaluation &context) override {
        return fn(result, context);
    }
};

/**
 * @brief 由函数实现的 generator
 */
struct function_generator : public generator {
    std::function<void(test_set &)> fn;

    explicit function_generator(std::function<void(test_set &)> fn) : fn(std::move(fn)) {}

    void generate(test_set &tests) override {
        fn(tests);
    }
};

typedef checker *(*create_checker_fn)();
typedef generator *(*create_generator_fn)();

#define GRADER_CHECKER_SYMBOL "grader_create_checker"
#define GRADER_GENERATOR_SYMBOL "grader_create_generator"

#define GRADER_EXPORT_CHECKER(type) \
    extern "C" grader::checker *grader_create_checker() { return new type(); }

#define GRADER_EXPORT_GENERATOR(type) \
    extern "C" grader::generator *grader_create_generator() { return new type(); }

/**
 * @brief 通过 dlopen 加载的共享库，析构时 dlclose
 */
struct shared_library {
    /**
     * @throw configuration_error 共享库无法加载时
     */
    explicit shared_library(const std::filesystem::path &file);
    shared_library(const shared_library &) = delete;
    ~shared_library();

    /**
     * @brief 查找导出的符号
     * @return 符号地址，不存在时返回 nullptr
     */
    void *symbol(const std::string &name) const;

    const std::filesystem::path file;

private:
    void *handle;
};

/**
 * @brief 一个 test_set 加载的所有扩展程序
 * 扩展程序的生命周期与 test_set 相同，不存在全局共享的状态。
 * 析构时先销毁扩展程序创建的对象，再卸载共享库。
 */
struct extension_registry {
    extension_registry() = default;
    extension_registry(const extension_registry &) = delete;
    ~extension_registry();

    /**
     * @brief 加载共享库中的 checker
     * @throw configuration_error 共享库无法加载或者没有导出 grader_create_checker 时
     */
    std::shared_ptr<checker> load_checker(const std::filesystem::path &file);

    /**
     * @brief 加载共享库中的 generator
     * @throw configuration_error 共享库无法加载或者没有导出 grader_create_generator 时
     */
    std::shared_ptr<generator> load_generator(const std::filesystem::path &file);

    void add_checker(const std::shared_ptr<checker> &checker);

    void add_generator(const std::shared_ptr<generator> &generator);

    const std::vector<std::shared_ptr<generator>> &generators() const;

private:
    shared_library &open(const std::filesystem::path &file);

    std::vector<std::unique_ptr<shared_library>> libraries;
    std::vector<std::shared_ptr<checker>> checkers;
    std::vector<std::shared_ptr<generator>> generator_list;
};

}  // namespace grader
