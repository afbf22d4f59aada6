#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/program_options/parsers.hpp>
#include <cctype>
#include <cerrno>
#include <system_error>
#include "common/defer.hpp"

namespace grader {
using namespace std;

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

// 读取管道中所有可读的数据，返回管道是否已经关闭
static bool drain(int fd, string &buffer) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        buffer.append(buf, n);
        return false;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return false;
    return true;
}

process_result exec_program(const vector<string> &argv, const process_options &options) {
    if (argv.empty())
        throw invalid_argument("empty command line");

    vector<char *> args;
    for (auto &arg : argv)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    int stdin_fd = -1;
    if (!options.stdin_file.empty()) {
        stdin_fd = open(options.stdin_file.c_str(), O_RDONLY | O_CLOEXEC);
        if (stdin_fd < 0)
            throw system_error(errno, system_category(), "unable to open " + options.stdin_file.string());
    }
    defer { close_fd(stdin_fd); };

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    defer {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
    };
    if (options.capture_output) {
        if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0)
            throw system_error(errno, system_category(), "unable to create pipe");
    }

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            if (stdin_fd >= 0) dup2(stdin_fd, STDIN_FILENO);
            if (options.capture_output) {
                dup2(out_pipe[1], STDOUT_FILENO);
                dup2(err_pipe[1], STDERR_FILENO);
            }
            for (auto &[key, value] : options.env)
                set_env(key, value);
            execvp(args[0], args.data());
            _exit(127);
    }

    process_result result;
    if (options.capture_output) {
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);

        // 同时读取 stdout 和 stderr，避免其中一个管道写满导致子进程阻塞
        bool out_open = true, err_open = true;
        while (out_open || err_open) {
            pollfd fds[2];
            nfds_t nfds = 0;
            if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
            if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
            if (poll(fds, nfds, -1) < 0) {
                if (errno == EINTR) continue;
                throw system_error(errno, system_category(), "poll");
            }
            for (nfds_t i = 0; i < nfds; ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                if (fds[i].fd == out_pipe[0] && drain(out_pipe[0], result.out)) out_open = false;
                if (fds[i].fd == err_pipe[0] && drain(err_pipe[0], result.err)) err_open = false;
            }
        }
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waitpid");
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else
        result.exit_code = -1;
    return result;
}

string shell_quote(const string &arg) {
    if (arg.empty()) return "''";
    bool safe = true;
    for (char c : arg) {
        if (!(isalnum((unsigned char)c) || string("@%+=:,./-_").find(c) != string::npos)) {
            safe = false;
            break;
        }
    }
    if (safe) return arg;

    string quoted = "'";
    for (char c : arg) {
        if (c == '\'')
            quoted += "'\"'\"'";
        else
            quoted += c;
    }
    return quoted + "'";
}

string shell_join(const vector<string> &args) {
    string result;
    for (auto &arg : args) {
        if (!result.empty()) result += ' ';
        result += shell_quote(arg);
    }
    return result;
}

vector<string> shell_split(const string &command) {
    return boost::program_options::split_unix(command);
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace grader
