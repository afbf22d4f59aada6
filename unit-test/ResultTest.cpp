#include "common/io_utils.hpp"
#include "evaluator/result.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

class ResultTest : public ::testing::Test {
protected:
    fixture::temp_dir dir;
};

TEST_F(ResultTest, SuccessTest) {
    test_result result(dir.path, dir / "tests/t1", "t1");
    EXPECT_TRUE(fs::is_directory(dir / "tests/t1"));
    EXPECT_EQ(result.title, "t1");
    EXPECT_TRUE(result.success());

    result.add_result(true, "file stdout doesn't match");
    EXPECT_TRUE(result.success());

    result.add_result(false, "invalid exit code 1");
    EXPECT_FALSE(result.success());
}

TEST_F(ResultTest, ErrorTest) {
    test_result result(dir.path, dir / "tests/t1", "t1");
    result.add_result(true, "ok");
    result.add_error("Segmentation fault");
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.errors, vector<string>{"Segmentation fault"});
}

TEST_F(ResultTest, CopyResultFileTest) {
    test_result result(dir.path, dir / "tests/t1", "t1");
    auto actual = dir.write("box/out/data.txt", "actual");
    text_file expected("expected");

    auto *file = result.copy_result_file("out/data.txt", actual, &expected);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->actual->string(), (dir / "tests/t1/out_data.txt.actual").string());
    EXPECT_EQ(file->expected->string(), (dir / "tests/t1/out_data.txt.expected").string());
    EXPECT_EQ(read_file_content(*file->actual), "actual");
    EXPECT_EQ(read_file_content(*file->expected), "expected");
    EXPECT_EQ(result.relative(*file->actual), "tests/t1/out_data.txt.actual");
}

TEST_F(ResultTest, MissingActualTest) {
    test_result result(dir.path, dir / "tests/t1", "t1");

    EXPECT_EQ(result.copy_result_file("stderr", dir / "missing"), nullptr);
    EXPECT_TRUE(result.files.empty());

    auto *forced = result.copy_result_file("stdout", dir / "missing", nullptr, true);
    ASSERT_NE(forced, nullptr);
    EXPECT_EQ(read_file_content(*forced->actual), "");

    text_file expected("data");
    auto *file = result.copy_result_file("result.txt", dir / "missing", &expected);
    ASSERT_NE(file, nullptr);
    EXPECT_FALSE(file->actual);
    EXPECT_TRUE(file->expected);
}

TEST_F(ResultTest, JsonTest) {
    test_result result(dir.path, dir / "tests/t1", "t1");
    result.title = "First test";
    result.command = "./main < t1.in";
    result.copy_input_file("stdin", text_file("1 2\n"));
    result.copy_diff("stdout", "--- expected\n+++ actual\n-3\n+4\n");
    string html = result.copy_html_result("image.png", "<div></div>");
    EXPECT_EQ(html, "tests/t1/image.png.html");
    result.add_result(false, "file stdout doesn't match", html);
    result.statistics = parse_isolate_metadata({{"exitcode", "1"}, {"status", "RE"}});

    nlohmann::json expected = {
        {"name", "t1"},
        {"title", "First test"},
        {"success", false},
        {"command", "./main < t1.in"},
        {"exit_code", 1},
        {"status", "RE"},
        {"errors", nlohmann::json::array()},
        {"results", {{{"success", false}, {"message", "file stdout doesn't match"}, {"output", "tests/t1/image.png.html"}}}},
        {"files", {
            {{"name", "stdin"}, {"input", true}, {"actual", "tests/t1/stdin.input"}},
            {{"name", "stdout"}, {"diff", "tests/t1/stdout.diff"}},
            {{"name", "image.png"}, {"html", "tests/t1/image.png.html"}},
        }},
    };
    EXPECT_JSON_EQ(nlohmann::json(result), expected);
}

TEST_F(ResultTest, SaveTest) {
    evaluation_result evaluated;
    stage_result compile;
    compile.id = "gcc";
    compile.title = "Compilation";
    compile.fields = {{"command", "gcc main.c -o main"}, {"exit_code", 0}, {"stdout", ""}, {"stderr", "warning: \xff"}};
    evaluated.pipelines.push_back(compile);

    stage_result tests;
    tests.id = "tests";
    tests.title = "Tests";
    tests.tests.emplace_back(dir.path, dir / "tests/t1", "t1");
    evaluated.pipelines.push_back(move(tests));

    evaluated.save(dir / "result.json");
    auto report = nlohmann::json::parse(read_file_content(dir / "result.json"));
    ASSERT_TRUE(report.is_array());
    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report[0]["id"], "gcc");
    EXPECT_EQ(report[0]["failed"], false);
    EXPECT_EQ(report[0]["command"], "gcc main.c -o main");
    EXPECT_EQ(report[0]["stderr"], "warning: \xEF\xBF\xBD");
    EXPECT_EQ(report[0]["tests"], nlohmann::json::array());
    EXPECT_EQ(report[1]["tests"][0]["name"], "t1");
    EXPECT_EQ(report[1]["tests"][0]["success"], true);
}
