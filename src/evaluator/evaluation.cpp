#include "evaluator/evaluation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "evaluator/comparators.hpp"
#include "evaluator/pipeline.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

evaluation::evaluation(const fs::path &task_path, const fs::path &result_path, sandbox &box, const map<string, string> &meta)
    : box(box), task_path(task_path), result_path(result_path), tests(task_path, meta) {
    try {
        recreate_directory(result_path);
    } catch (fs::filesystem_error &e) {
        throw setup_error(fmt::format("unable to create result directory {}: {}", result_path, e.what()));
    }
}

fs::path evaluation::task_file(const string &path) const {
    return tests.task_file(path);
}

evaluation_result evaluation::run() {
    evaluation_result result;
    for (auto &stage : tests.pipeline) {
        LOG(INFO) << "Executing stage " << stage->id;
        elapsed_time timer;
        stage_result executed = stage->run(*this);
        LOG(INFO) << "Stage " << stage->id << " finished in " << timer.duration<chrono::milliseconds>().count() << "ms";
        executed.id = stage->id;
        executed.title = stage->title;
        bool failed = executed.failed;
        result.pipelines.push_back(move(executed));
        if (failed) {
            LOG(INFO) << "Stage " << stage->id << " failed, stopping";
            break;
        }
    }
    result.save(result_path / "result.json");
    return result;
}

test_result evaluation::evaluate(const string &runner, const test &test, const string &executable, const map<string, string> &env, const optional<string> &title) {
    vector<filter_ptr> filters = tests.filters;
    filters.insert(filters.end(), test.filters.begin(), test.filters.end());

    string dirname = test.name;
    replace(dirname.begin(), dirname.end(), '/', '_');
    test_result result(result_path, result_path / runner / dirname, test.name);
    result.title = title ? *title : test.title();

    for (auto &file : test.files)
        if (file.input)
            file.file->save(box.input_path(file.path));

    isolated_run options;
    options.command = {executable};
    options.command.insert(options.command.end(), test.args.begin(), test.args.end());
    options.limits = tests.effective_limits(test);
    options.env = env;
    options.stdout_name = random_token();
    options.stderr_name = random_token();
    options.metadata_file = fs::temp_directory_path() / fmt::format("grader-{}.meta", random_token());
    defer {
        error_code ec;
        fs::remove(options.metadata_file, ec);
        fs::remove(box.system_path(options.stdout_name), ec);
        fs::remove(box.system_path(options.stderr_name), ec);
    };

    if (test.stdin_file)
        options.stdin_file = *result.copy_input_file("stdin", *test.stdin_file).actual;

    int ret = box.run_isolated(options);
    if (ret > 1)
        LOG(WARNING) << "isolate exited with " << ret << " when running test " << test.name;

    // 符号链接等非普通文件视为不存在，避免读取沙箱外的文件
    result.copy_result_file("stdout", box.output_path(options.stdout_name).value_or(fs::path()), test.stdout_file.get(), true);
    auto stderr_path = box.output_path(options.stderr_name);
    if (test.stderr_file || (stderr_path && fs::file_size(*stderr_path) > 0))
        result.copy_result_file("stderr", stderr_path.value_or(fs::path()), test.stderr_file.get());

    for (auto &file : test.files) {
        if (file.path == "stdout" || file.path == "stderr") continue;
        if (file.input)
            result.copy_input_file(file.path, *file.file);
        else
            result.copy_result_file(file.path, box.output_path(file.path).value_or(fs::path()), file.file.get());
    }

    for (auto &file : result.files) {
        if (file.input || !file.expected) continue;
        if (!file.actual) {
            file.error = "file not found";
            result.add_result(false, fmt::format("file {} not found", file.name));
            continue;
        }

        auto it = tests.comparators.find(file.name);
        string type = it == tests.comparators.end() ? "text" : it->second;
        comparison compared = get_comparator(type).compare(*file.expected, *file.actual, filters);

        optional<string> output;
        if (compared.output) output = result.copy_html_result(file.name, *compared.output);
        if (compared.diff) result.copy_diff(file.name, *compared.diff);
        result.add_result(compared.success, fmt::format("file {} doesn't match", file.name), output);
    }

    result.statistics = read_isolate_result(options.metadata_file);
    if (result.statistics.exit_signal == SEGMENTATION_FAULT_SIGNAL)
        result.add_error("Segmentation fault");

    if (test.exit_code) {
        string actual = result.statistics.exit_code ? to_string(*result.statistics.exit_code) : "none";
        result.add_result(result.statistics.exit_code == test.exit_code, fmt::format("invalid exit code {}", actual));
    }

    result.command = shell_join(options.command);
    if (test.stdin_file) {
        fs::path stdin_path = test.stdin_file->path();
        result.command += " < " + shell_quote(stdin_path.empty() ? "stdin" : stdin_path.filename().string());
    }

    if (test.check) {
        try {
            if (auto error = test.check->check(result, *this); error && !error->empty())
                result.add_error(*error);
        } catch (std::exception &e) {
            LOG(ERROR) << "Checker of test " << test.name << " failed: " << e.what();
            result.add_error(fmt::format("checker failed: {}", e.what()));
        }
    }

    DLOG(INFO) << "Test " << test.name << ": " << result.command;
    return result;
}

evaluation_result evaluate(const fs::path &task_path, const fs::path &submission_path, const fs::path &result_path, const map<string, string> &meta) {
    if (!fs::is_directory(submission_path))
        throw setup_error(fmt::format("submission directory {} does not exist", submission_path));

    sandbox box;
    box.initialize();
    evaluation context(task_path, result_path, box, meta);
    box.copy_tree(submission_path);
    LOG(INFO) << "Evaluating " << submission_path << " against " << task_path;
    return context.run();
}

}  // namespace grader
