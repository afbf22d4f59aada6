#include "evaluator/result.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <fstream>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

test_result::test_result(const fs::path &result_root, const fs::path &dir, const string &name)
    : name(name), title(name), result_root(result_root), dir(dir) {
    fs::create_directories(dir);
}

bool test_result::success() const {
    return errors.empty() && all_of(results.begin(), results.end(), [](const assertion &a) { return a.success; });
}

void test_result::add_result(bool passed, const string &message, const optional<string> &output) {
    results.push_back({passed, sanitize_utf8(message), output});
}

void test_result::add_error(const string &message) {
    errors.push_back(sanitize_utf8(message));
}

fs::path test_result::artifact_path(const string &name, const string &kind) const {
    string safe = name;
    replace(safe.begin(), safe.end(), '/', '_');
    return dir / (safe + "." + kind);
}

file_record &test_result::record(const string &name) {
    if (auto existing = find_file(name)) return *existing;
    files.push_back(file_record{name});
    return files.back();
}

file_record *test_result::find_file(const string &name) {
    for (auto &file : files)
        if (file.name == name) return &file;
    return nullptr;
}

file_record *test_result::copy_result_file(const string &name, const fs::path &actual, const file_ref *expected, bool force_save) {
    bool has_actual = !actual.empty() && fs::is_regular_file(fs::symlink_status(actual));
    if (!has_actual && !expected && !force_save) return nullptr;

    auto &file = record(name);
    if (has_actual) {
        file.actual = artifact_path(name, "actual");
        place_file(actual, *file.actual);
    } else if (force_save) {
        file.actual = artifact_path(name, "actual");
        write_file_content(*file.actual, "");
    }

    if (expected) {
        file.expected = artifact_path(name, "expected");
        expected->save(*file.expected);
    }
    return &file;
}

file_record &test_result::copy_input_file(const string &name, const file_ref &input) {
    auto &file = record(name);
    file.input = true;
    file.actual = artifact_path(name, "input");
    input.save(*file.actual);
    return file;
}

void test_result::copy_diff(const string &name, const string &diff) {
    auto &file = record(name);
    file.diff = artifact_path(name, "diff");
    write_file_content(*file.diff, diff);
}

string test_result::copy_html_result(const string &name, const string &html) {
    auto &file = record(name);
    file.html = artifact_path(name, "html");
    write_file_content(*file.html, html);
    return relative(*file.html);
}

string test_result::relative(const fs::path &path) const {
    return fs::relative(path, result_root).string();
}

void to_json(json &j, const assertion &assertion) {
    j = {{"success", assertion.success}, {"message", assertion.message}};
    if (assertion.output) j["output"] = *assertion.output;
}

void to_json(json &j, const test_result &result) {
    j = result.statistics;
    j["name"] = result.name;
    j["title"] = result.title;
    j["success"] = result.success();
    j["command"] = result.command;
    j["results"] = result.results;
    j["errors"] = result.errors;

    json files = json::array();
    for (auto &file : result.files) {
        json f = {{"name", file.name}};
        if (file.input) f["input"] = true;
        if (file.actual) f["actual"] = result.relative(*file.actual);
        if (file.expected) f["expected"] = result.relative(*file.expected);
        if (file.html) f["html"] = result.relative(*file.html);
        if (file.diff) f["diff"] = result.relative(*file.diff);
        if (file.error) f["error"] = *file.error;
        files.push_back(f);
    }
    j["files"] = files;
}

void to_json(json &j, const stage_result &result) {
    j = result.fields.is_object() ? result.fields : json::object();
    j["id"] = result.id;
    j["title"] = result.title;
    j["failed"] = result.failed;
    j["tests"] = result.tests;
}

void to_json(json &j, const evaluation_result &result) {
    j = json::array();
    for (auto &stage : result.pipelines)
        j.push_back(stage);
}

void evaluation_result::save(const fs::path &path) const {
    json j = *this;
    write_file_content(path, j.dump(2, ' ', false, json::error_handler_t::replace));
    LOG(INFO) << "Saved evaluation result to " << path;
}

}  // namespace grader
