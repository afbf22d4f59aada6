#include "sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

vector<string> limit_flags(const map<string, double> &limits) {
    vector<string> flags;
    for (auto &[key, value] : limits)
        if (value != 0)
            flags.push_back(fmt::format("--{}={}", key, value));
    return flags;
}

vector<string> env_flags(const map<string, string> &env) {
    vector<string> flags;
    for (auto &[key, value] : env)
        flags.push_back(fmt::format("-E{}={}", key, value));
    return flags;
}

sandbox::sandbox() : sandbox(BOX_ID) {}

sandbox::sandbox(int box_id) : box_id(box_id) {}

vector<string> sandbox::isolate_command() const {
    vector<string> argv{ISOLATE_PATH.string(), "-b", to_string(box_id)};
    if (USE_CGROUPS) argv.push_back("--cg");
    return argv;
}

void sandbox::initialize() {
    auto cleanup = isolate_command();
    cleanup.push_back("--cleanup");
    process_result result;
    try {
        result = exec_program(cleanup, {});
    } catch (system_error &e) {
        throw sandbox_error(fmt::format("unable to execute {}: {}", ISOLATE_PATH, e.what()));
    }
    if (result.exit_code != 0)
        throw sandbox_error(fmt::format("isolate --cleanup failed with exit code {}: {}", result.exit_code, result.err));

    auto init = isolate_command();
    init.push_back("--init");
    try {
        result = exec_program(init, {});
    } catch (system_error &e) {
        throw sandbox_error(fmt::format("unable to execute {}: {}", ISOLATE_PATH, e.what()));
    }
    if (result.exit_code != 0)
        throw sandbox_error(fmt::format("isolate --init failed with exit code {}: {}", result.exit_code, result.err));

    path = boost::algorithm::trim_copy(result.out);
    if (path.empty() || !fs::is_directory(system_path()))
        throw sandbox_error(fmt::format("isolate --init returned an unusable sandbox path \"{}\"", path));
    LOG(INFO) << "Initialized sandbox " << box_id << " at " << path;
}

const fs::path &sandbox::root() const {
    return path;
}

fs::path sandbox::system_path(const string &relative) const {
    if (relative.empty()) return path / "box";
    return path / "box" / assert_safe_path(relative);
}

fs::path sandbox::input_path(const string &relative) const {
    fs::path dest = system_path();
    fs::path parts = assert_safe_path(relative);
    for (auto it = parts.begin(); it != parts.end(); ++it) {
        if (it->empty() || *it == ".") continue;
        dest /= *it;
        bool last = next(it) == parts.end();

        // symlink_status 不跟随符号链接，符号链接既不是普通文件也不是文件夹
        auto status = fs::symlink_status(dest);
        if (fs::exists(status) && (last ? !fs::is_regular_file(status) : !fs::is_directory(status))) {
            LOG(WARNING) << "Removing " << dest << " left in sandbox";
            fs::remove_all(dest);
            status = fs::symlink_status(dest);
        }
        if (!last && !fs::exists(status))
            fs::create_directory(dest);
    }
    return dest;
}

optional<fs::path> sandbox::output_path(const string &relative) const {
    fs::path file = system_path();
    for (auto &part : fs::path(assert_safe_path(relative))) {
        if (part.empty() || part == ".") continue;
        file /= part;
        if (fs::is_symlink(fs::symlink_status(file))) return nullopt;
    }
    if (!fs::is_regular_file(fs::symlink_status(file))) return nullopt;
    return file;
}

void sandbox::copy(const fs::path &local, const string &box) const {
    fs::copy_file(local, input_path(box), fs::copy_options::overwrite_existing);
}

void sandbox::copy_tree(const fs::path &dir) const {
    fs::copy(dir, system_path(), fs::copy_options::recursive | fs::copy_options::overwrite_existing);
}

ifstream sandbox::open(const string &file) const {
    auto path = output_path(file);
    return path ? ifstream(*path) : ifstream();
}

unique_ptr<temporary_file> sandbox::open_temporary(const string &suffix) const {
    return make_unique<temporary_file>(system_path(), suffix);
}

command_result sandbox::run(const vector<string> &command, map<string, string> env, bool stderr_to_stdout) const {
    if (!env.count("PATH")) env["PATH"] = SANDBOX_PATH_ENV;

    auto argv = isolate_command();
    argv.push_back("-s");
    argv.push_back("--run");
    argv.push_back(fmt::format("--processes={}", SANDBOX_PROCESS_LIMIT));
    for (auto &flag : env_flags(env))
        argv.push_back(flag);
    if (stderr_to_stdout)
        argv.push_back("--stderr-to-stdout");
    argv.push_back("--");
    argv.insert(argv.end(), command.begin(), command.end());

    LOG(INFO) << "executing in isolation: " << shell_join(argv);
    process_options process;
    process.stdin_file = "/dev/null";
    auto result = exec_program(argv, process);
    LOG(INFO) << "exit_code: " << result.exit_code;

    command_result ret;
    ret.exit_code = result.exit_code;
    ret.out = sanitize_utf8(result.out);
    ret.err = sanitize_utf8(result.err);
    return ret;
}

command_result sandbox::run(const string &command, const map<string, string> &env, bool stderr_to_stdout) const {
    return run(shell_split(command), env, stderr_to_stdout);
}

command_result sandbox::run_check(const string &command) const {
    auto result = run(command);
    if (result.exit_code != 0)
        throw command_error(command, result.exit_code);
    return result;
}

int sandbox::run_isolated(const isolated_run &options) const {
    auto argv = isolate_command();
    argv.push_back("-M");
    argv.push_back(options.metadata_file.string());
    for (auto &flag : limit_flags(options.limits))
        argv.push_back(flag);
    argv.push_back("-o");
    argv.push_back(options.stdout_name);
    argv.push_back("-r");
    argv.push_back(options.stderr_name);
    argv.push_back("-s");
    argv.push_back("--run");
    for (auto &flag : env_flags(options.env))
        argv.push_back(flag);
    argv.push_back("--");
    argv.insert(argv.end(), options.command.begin(), options.command.end());

    LOG_IF(INFO, DEBUG) << "executing in isolation: " << shell_join(argv);
    process_options process;
    // 没有标准输入的测试点读取 /dev/null
    process.stdin_file = options.stdin_file.empty() ? "/dev/null" : options.stdin_file;
    auto result = exec_program(argv, process);
    if (!result.err.empty())
        LOG_IF(INFO, DEBUG) << "isolate: " << result.err;
    return result.exit_code;
}

compile_result sandbox::compile(const vector<string> &flags, vector<string> sources) const {
    if (sources.empty()) {
        for (auto &entry : fs::directory_iterator(system_path()))
            if (entry.is_regular_file() && entry.path().extension() == ".c")
                sources.push_back(entry.path().filename().string());
        sort(sources.begin(), sources.end());
    }

    vector<string> command{COMPILER_PATH.string()};
    command.insert(command.end(), sources.begin(), sources.end());
    for (const char *flag : {"-o", "main", "-g", "-lm", "-Wall", "-pedantic"})
        command.push_back(flag);
    command.insert(command.end(), flags.begin(), flags.end());

    compile_result result;
    static_cast<command_result &>(result) = run(command);
    // 截断可能切开多字节字符，需要再次处理非法字节
    result.err = sanitize_utf8(truncate(result.err, COMPILER_STDERR_LIMIT));
    result.command = shell_join(command);
    return result;
}

}  // namespace grader
