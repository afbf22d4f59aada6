#include <unistd.h>
#include <fstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "common/yaml_utils.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace grader;
namespace fs = std::filesystem;

TEST(UtilsTest, ShellQuoteTest) {
    EXPECT_EQ(shell_quote("main.c"), "main.c");
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(shell_join({"./main", "hello world", "-n"}), "./main 'hello world' -n");
}

TEST(UtilsTest, ShellSplitTest) {
    vector<string> expected = {"gcc", "-o", "a b", "x.c"};
    EXPECT_EQ(shell_split("gcc -o 'a b' x.c"), expected);
    EXPECT_EQ(shell_split("  echo   \"x y\"  "), (vector<string>{"echo", "x y"}));
}

TEST(UtilsTest, ExecProgramTest) {
    auto result = exec_program({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, {});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
}

TEST(UtilsTest, ExecProgramStdinAndEnvTest) {
    fixture::temp_dir dir;
    auto input = dir.write("input.txt", "1 2\n");

    process_options options;
    options.stdin_file = input;
    options.env["GRADER_TEST_VALUE"] = "42";
    auto result = exec_program({"/bin/sh", "-c", "cat; echo $GRADER_TEST_VALUE"}, options);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "1 2\n42\n");
}

TEST(UtilsTest, ExecProgramSignalTest) {
    auto result = exec_program({"/bin/sh", "-c", "kill -SEGV $$"}, {});
    EXPECT_EQ(result.exit_code, -1);
}

TEST(UtilsTest, ExecProgramNotFoundTest) {
    auto result = exec_program({"/nonexistent/program"}, {});
    EXPECT_EQ(result.exit_code, 127);
}

TEST(UtilsTest, SanitizeUtf8Test) {
    EXPECT_EQ(sanitize_utf8("a\xff" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(sanitize_utf8("中文"), "中文");
    EXPECT_EQ(truncate("abcdef", 3), "abc");
    EXPECT_EQ(truncate("abc", 10), "abc");
}

TEST(UtilsTest, SafePathTest) {
    EXPECT_EQ(assert_safe_path("out/data.txt"), "out/data.txt");
    EXPECT_THROW(assert_safe_path("../etc/passwd"), runtime_error);
    EXPECT_THROW(assert_safe_path("a/../../b"), runtime_error);
    EXPECT_THROW(assert_safe_path("/etc/passwd"), runtime_error);
}

TEST(UtilsTest, RandomTokenTest) {
    string a = random_token(), b = random_token();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_EQ(a.find('-'), string::npos);
    EXPECT_NE(a, b);
}

TEST(UtilsTest, TemporaryFileTest) {
    fixture::temp_dir dir;
    fs::path path;
    {
        temporary_file file(dir.path, "input.txt");
        path = file.path();
        file.stream() << "hello";
        file.stream().flush();
        EXPECT_TRUE(fs::exists(path));
        EXPECT_EQ(read_file_content(path), "hello");
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(UtilsTest, TemporaryFileRemovedOnExceptionTest) {
    fixture::temp_dir dir;
    fs::path path;
    try {
        temporary_file file(dir.path, "x");
        path = file.path();
        throw runtime_error("failure");
    } catch (runtime_error &) {
    }
    EXPECT_FALSE(path.empty());
    EXPECT_FALSE(fs::exists(path));
}

TEST(UtilsTest, DeferTest) {
    int value = 0;
    {
        defer { value = 1; };
        EXPECT_EQ(value, 0);
    }
    EXPECT_EQ(value, 1);
}

TEST(UtilsTest, FileContentTest) {
    fixture::temp_dir dir;
    write_file_content(dir / "a/b/c.txt", "content");
    EXPECT_EQ(read_file_content(dir / "a/b/c.txt"), "content");

    place_file(dir / "a/b/c.txt", dir / "d/e.txt");
    EXPECT_EQ(read_file_content(dir / "d/e.txt"), "content");

    recreate_directory(dir / "a");
    EXPECT_TRUE(fs::is_directory(dir / "a"));
    EXPECT_TRUE(fs::is_empty(dir / "a"));
}

TEST(UtilsTest, RecreateDirectoryFailureTest) {
    fixture::temp_dir dir;
    dir.write("file.txt", "not a directory");
    EXPECT_THROW(recreate_directory(dir / "file.txt/result"), fs::filesystem_error);
}

TEST(UtilsTest, RecreateUnremovableDirectoryTest) {
    if (geteuid() == 0)
        GTEST_SKIP() << "root can always remove files";

    fixture::temp_dir dir;
    dir.write("result/locked/stale.txt", "from previous run");
    fs::permissions(dir / "result/locked", fs::perms::owner_read | fs::perms::owner_exec);
    defer { fs::permissions(dir / "result/locked", fs::perms::owner_all); };

    EXPECT_THROW(recreate_directory(dir / "result"), fs::filesystem_error);
    EXPECT_TRUE(fs::exists(dir / "result/locked/stale.txt"));
}

TEST(UtilsTest, JsonAccessTest) {
    nlohmann::json j = {{"limits", {{"time", 1}}}, {"args", {"a", 2}}};
    EXPECT_TRUE(nlohmann::exists(j, "limits", "time"));
    EXPECT_FALSE(nlohmann::exists(j, "limits", "memory"));
    EXPECT_EQ(nlohmann::get_value<int>(j, "limits", "time"), 1);
    EXPECT_EQ(nlohmann::get_value_def<int>(j, 5, "limits", "memory"), 5);
    EXPECT_EQ(nlohmann::get_value<string>(j, "args", 0), "a");
    EXPECT_THROW(nlohmann::get_value<string>(j, "limits", "time"), invalid_argument);
    EXPECT_THROW(nlohmann::access(j, "missing"), invalid_argument);
    EXPECT_EQ(nlohmann::to_plain_string(j["args"][1]), "2");
}

TEST(UtilsTest, YamlToJsonTest) {
    auto node = YAML::Load(R"(
a: 1
b: '1'
c: [x, true]
d: ~
e: 1.5
f:
  g: hello world
)");
    nlohmann::json expected = {
        {"a", 1},
        {"b", "1"},
        {"c", {"x", true}},
        {"d", nullptr},
        {"e", 1.5},
        {"f", {{"g", "hello world"}}},
    };
    EXPECT_JSON_EQ(yaml_to_json(node), expected);
}

TEST(UtilsTest, ExceptionTest) {
    command_error error("./main", 2);
    EXPECT_EQ(error.command, "./main");
    EXPECT_EQ(error.exit_code, 2);
    EXPECT_EQ(string(error.what()), "failed to execute: ./main (exit code 2)");

    try {
        throw sandbox_error("isolate --init failed");
    } catch (setup_error &e) {
        EXPECT_EQ(string(e.what()), "isolate --init failed");
    }
}
