#include "evaluator/pipeline.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "evaluator/evaluation.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static map<string, stage_factory> &stage_registry() {
    static map<string, stage_factory> registry = {
        {"compile", [](const json &declaration) { return make_unique<compile_stage>(declaration); }},
        {"run", [](const json &declaration) { return make_unique<command_stage>(declaration); }},
        {"tests", [](const json &declaration) { return make_unique<tests_stage>(declaration); }},
    };
    return registry;
}

void register_stage(const string &type, stage_factory factory) {
    stage_registry()[type] = move(factory);
}

unique_ptr<stage> create_stage(const json &declaration) {
    if (!exists(declaration, "type"))
        throw configuration_error(fmt::format("pipeline stage {} has no type", declaration.dump()));
    string type = to_plain_string(access(declaration, "type"));
    auto it = stage_registry().find(type);
    if (it == stage_registry().end())
        throw configuration_error(fmt::format("unknown pipeline stage {}", type));
    try {
        return it->second(declaration);
    } catch (invalid_argument &e) {
        throw configuration_error(fmt::format("malformed pipeline stage {}: {}", type, e.what()));
    }
}

static vector<string> string_list(const json &declaration, const char *key) {
    vector<string> result;
    if (!exists(declaration, key)) return result;
    const json &list = access(declaration, key);
    if (list.is_array()) {
        for (auto &item : list)
            result.push_back(to_plain_string(item));
    } else {
        result.push_back(to_plain_string(list));
    }
    return result;
}

static void read_common(stage &stage, const json &declaration, const string &id, const string &title) {
    stage.id = exists(declaration, "id") ? to_plain_string(access(declaration, "id")) : id;
    stage.title = exists(declaration, "title") ? to_plain_string(access(declaration, "title")) : title;
}

static json command_fields(const string &command, const command_result &result) {
    return {
        {"command", command},
        {"exit_code", result.exit_code},
        {"stdout", result.out},
        {"stderr", result.err},
    };
}

compile_stage::compile_stage(const json &declaration) {
    read_common(*this, declaration, "gcc", "Compilation");
    flags = string_list(declaration, "flags");
    sources = string_list(declaration, "sources");
}

stage_result compile_stage::run(evaluation &context) {
    compile_result compiled = context.box.compile(flags, sources);
    stage_result result;
    result.fields = command_fields(compiled.command, compiled);
    result.failed = compiled.exit_code != 0;
    if (result.failed)
        LOG(INFO) << "Compilation failed with exit code " << compiled.exit_code;
    return result;
}

command_stage::command_stage(const json &declaration) {
    command = get_value<string>(declaration, "command");
    read_common(*this, declaration, "run", command);
}

stage_result command_stage::run(evaluation &context) {
    command_result executed = context.box.run(command);
    stage_result result;
    result.fields = command_fields(command, executed);
    result.failed = executed.exit_code != 0;
    return result;
}

tests_stage::tests_stage(const json &declaration) {
    read_common(*this, declaration, "tests", "Tests");
    executable = get_value_def<string>(declaration, "./main", "executable");
    fail_on_error = get_value_def<bool>(declaration, false, "fail_on_error");
    if (exists(declaration, "env"))
        for (auto &[key, value] : access(declaration, "env").items())
            env[key] = to_plain_string(value);
}

stage_result tests_stage::run(evaluation &context) {
    stage_result result;
    for (auto &test : context.tests.tests()) {
        test_result tested = context.evaluate(id, *test, executable, env);
        LOG(INFO) << "Test " << test->name << (tested.success() ? " passed" : " failed");
        if (fail_on_error && !tested.success())
            result.failed = true;
        result.tests.push_back(move(tested));
    }
    return result;
}

}  // namespace grader
