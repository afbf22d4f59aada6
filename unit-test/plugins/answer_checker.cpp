#include <fstream>
#include "evaluator/extension.hpp"
#include "evaluator/result.hpp"

/**
 * 检查选手程序 stdout 的第一个单词是否为 42
 */
struct answer_checker : public grader::checker {
    std::optional<std::string> check(grader::test_result &result, grader::evaluation &) override {
        auto *out = result.find_file("stdout");
        if (!out || !out->actual) return "stdout is missing";

        std::ifstream fin(*out->actual);
        std::string answer;
        fin >> answer;
        if (answer != "42") return "expected answer 42, got " + answer;

        result.add_result(true, "answer is 42");
        return std::nullopt;
    }
};

GRADER_EXPORT_CHECKER(answer_checker)
