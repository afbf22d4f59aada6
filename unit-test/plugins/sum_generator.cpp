#include <memory>
#include <string>
#include "evaluator/extension.hpp"
#include "evaluator/test_set.hpp"

/**
 * 生成三个测试点 gen1、gen2、gen3，程序参数为 i i，期望输出 2i
 */
struct sum_generator : public grader::generator {
    void generate(grader::test_set &tests) override {
        for (int i = 1; i <= 3; ++i) {
            auto &test = tests.create_test("gen" + std::to_string(i));
            test.args = {std::to_string(i), std::to_string(i)};
            test.stdout_file = std::make_shared<grader::text_file>(std::to_string(2 * i) + "\n");
            test.display_title = "Sum of " + std::to_string(i) + " and " + std::to_string(i);
            if (tests.meta.count("variant"))
                test.display_title = *test.display_title + " (" + tests.meta.at("variant") + ")";
        }
    }
};

GRADER_EXPORT_GENERATOR(sum_generator)
