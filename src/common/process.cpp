#include "common/process.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include "common/utils.hpp"

extern char **environ;

namespace grader {
using namespace std;

namespace {

/**
 * @brief 管道的读端，负责把读到的数据拆分成行
 */
struct line_reader {
    int fd;
    string *output;
    const line_callback *callback;
    string pending;
    bool eof = false;

    void feed(const char *data, size_t len) {
        output->append(data, len);
        pending.append(data, len);
        size_t begin = 0, pos;
        while ((pos = pending.find('\n', begin)) != string::npos) {
            emit(pending.substr(begin, pos - begin));
            begin = pos + 1;
        }
        pending.erase(0, begin);
    }

    void finish() {
        if (!pending.empty()) emit(pending);
        pending.clear();
        eof = true;
        close(fd);
    }

    void emit(const string &line) {
        if (*callback) (*callback)(line);
    }
};

void close_pipe(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

map<string, string> build_environment(const map<string, string> &env, bool inherit_env) {
    map<string, string> result;
    if (inherit_env) {
        for (char **e = environ; e && *e; ++e) {
            string entry(*e);
            size_t eq = entry.find('=');
            if (eq == string::npos) continue;
            result[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    } else {
        result["PATH"] = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    }
    for (auto &[key, value] : env)
        result[key] = value;
    return result;
}

}  // namespace

process_result exec_program(const vector<string> &argv,
                            const map<string, string> &env,
                            bool inherit_env,
                            const line_callback &on_out,
                            const line_callback &on_err) {
    if (argv.empty())
        throw invalid_argument("empty command line");

    // 在 fork 之前准备好 argv 和 envp，子进程中不再分配内存
    vector<char *> args;
    for (auto &arg : argv)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    vector<string> env_entries;
    for (auto &[key, value] : build_environment(env, inherit_env))
        env_entries.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_entries)
        envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    int out_pipe[2], err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) == -1)
        throw system_error(errno, system_category(), "pipe2");
    if (pipe2(err_pipe, O_CLOEXEC) == -1) {
        int saved = errno;
        close_pipe(out_pipe);
        throw system_error(saved, system_category(), "pipe2");
    }

    pid_t pid;
    switch (pid = fork()) {
        case -1: {  // fork 失败
            int saved = errno;
            close_pipe(out_pipe);
            close_pipe(err_pipe);
            throw system_error(saved, system_category(), "fork");
        }
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            execvpe(args[0], args.data(), envp.data());
            _exit(127);
        }
        default:
            break;
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    process_result result;
    line_reader readers[2] = {
        {out_pipe[0], &result.out, &on_out},
        {err_pipe[0], &result.err, &on_err}};

    char buffer[4096];
    while (!readers[0].eof || !readers[1].eof) {
        pollfd fds[2];
        nfds_t nfds = 0;
        line_reader *polled[2];
        for (auto &reader : readers) {
            if (reader.eof) continue;
            fds[nfds] = {reader.fd, POLLIN, 0};
            polled[nfds++] = &reader;
        }
        if (poll(fds, nfds, -1) == -1) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "poll");
        }
        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0)
                polled[i]->feed(buffer, n);
            else if (n == 0 || errno != EINTR)
                polled[i]->finish();
        }
    }

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waitpid");
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    return result;
}

}  // namespace grader
