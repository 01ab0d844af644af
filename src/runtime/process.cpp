#include "runtime/process.hpp"
#include <fcntl.h>
#include <fmt/format.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <mutex>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace arena {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s
const int POLL_INTERVAL_MS = 50;
// 子进程退出后等待后代进程关闭输出管道的最长时间
const int DRAIN_TIMEOUT_MS = 1000;
const size_t BUF_SIZE = 65536;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

[[noreturn]] static void error(int errnum, const string &what) {
    throw internal_error(fmt::format("{}: {}", what, strerror(errnum)));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "fcntl, setting flags");
}

static void terminate_group(pid_t pid) {
    // 先尝试让进程自行退出，再强制杀死
    LOG(INFO) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH) {
        LOG(ERROR) << "unable to send SIGTERM to process group " << pid << ": " << strerror(errno);
    }

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
    }
}

/**
 * @brief 检查子进程是否已经退出，但不回收子进程
 * 子进程变成僵尸进程之前，其 pid 不会被复用，因此可以安全地杀死整个进程组
 */
static bool has_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == EINTR) return false;
        error(errno, "waiting on child");
    }
    return info.si_pid == pid;
}

static void child_fail(int exec_fd) {
    int err = errno;
    if (write(exec_fd, &err, sizeof(err)) < 0) {
        // 父进程会把没有报告错误的 127 视为普通的运行错误
    }
    _exit(127);
}

/**
 * @brief 读取子进程的输出，超过上限的部分读取后丢弃
 * @return false 表示管道已经关闭
 */
static bool pump_pipe(int fd, string &data, size_t limit, bool &truncated) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            size_t to_keep = data.size() < limit ? min(limit - data.size(), (size_t)nread) : 0;
            data.append(buf, to_keep);
            if (to_keep < (size_t)nread) truncated = true;
        } else if (nread == 0) {
            return false;
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            error(errno, "reading child output");
        }
    }
}

process_result run_process(const process_options &options) {
    if (options.argv.empty())
        throw internal_error("Empty command line");

    // 向已经退出的子进程写入标准输入时不能让评测进程被 SIGPIPE 杀死
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int exec_pipefd[2] = {-1, -1};
    defer {
        for (auto &fds : child_pipefd) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        close_fd(exec_pipefd[0]);
        close_fd(exec_pipefd[1]);
    };

    // 管道带有 O_CLOEXEC，并发评测时其他子进程不会继承本次运行的管道
    for (auto &fds : child_pipefd)
        if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipes");
    if (pipe2(exec_pipefd, O_CLOEXEC) != 0) error(errno, "creating pipes");

    // fork 之后子进程中不能分配内存，提前准备好 argv
    vector<string> args = options.argv;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);
    string cwd = options.cwd.string();

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) error(errno, "unable to fork");

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        if (dup2(child_pipefd[STDIN_FILENO][PIPE_OUT], STDIN_FILENO) < 0 ||
            dup2(child_pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(child_pipefd[STDERR_FILENO][PIPE_IN], STDERR_FILENO) < 0)
            child_fail(exec_pipefd[PIPE_IN]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0)
            child_fail(exec_pipefd[PIPE_IN]);

        if (options.before_exec && !options.before_exec())
            child_fail(exec_pipefd[PIPE_IN]);

        execvp(argv[0], argv.data());
        child_fail(exec_pipefd[PIPE_IN]);
    }

    // 父子进程都设置进程组，避免父进程发送信号时子进程还没有调用 setpgid
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "unable to set process group of " << pid << ": " << strerror(errno);

    bool reaped = false;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        }
    };

    close_fd(child_pipefd[STDIN_FILENO][PIPE_OUT]);
    close_fd(child_pipefd[STDOUT_FILENO][PIPE_IN]);
    close_fd(child_pipefd[STDERR_FILENO][PIPE_IN]);
    close_fd(exec_pipefd[PIPE_IN]);

    // exec 成功时管道因为 O_CLOEXEC 被关闭，read 返回 0
    int exec_errno = 0;
    ssize_t nread;
    while ((nread = read(exec_pipefd[PIPE_OUT], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    if (nread == sizeof(exec_errno))
        throw internal_error(fmt::format("Unable to execute {}: {}", options.argv[0], strerror(exec_errno)));
    close_fd(exec_pipefd[PIPE_OUT]);

    int &stdin_fd = child_pipefd[STDIN_FILENO][PIPE_IN];
    int &stdout_fd = child_pipefd[STDOUT_FILENO][PIPE_OUT];
    int &stderr_fd = child_pipefd[STDERR_FILENO][PIPE_OUT];
    set_nonblock(stdin_fd);
    set_nonblock(stdout_fd);
    set_nonblock(stderr_fd);

    process_result result;
    size_t written = 0;
    if (options.stdin_text.empty()) close_fd(stdin_fd);

    bool exited = false;
    long long exit_time_ms = 0;
    while (true) {
        long long elapsed = timer.duration<chrono::milliseconds>().count();
        if (!exited) {
            if (options.time_limit_ms > 0 && elapsed >= options.time_limit_ms) {
                LOG(WARNING) << "timelimit exceeded (wall time " << options.time_limit_ms << "ms): aborting " << options.argv[0];
                result.timed_out = true;
                terminate_group(pid);
            } else if (options.token.cancelled()) {
                LOG(WARNING) << "cancelled: aborting " << options.argv[0];
                result.cancelled = true;
                terminate_group(pid);
            }
        }

        if (!exited && has_exited(pid)) {
            exited = true;
            exit_time_ms = timer.duration<chrono::milliseconds>().count();
            // 杀死进程组中残留的后代进程，否则它们可能一直占用输出管道
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
            close_fd(stdin_fd);
        }

        if (exited) {
            if (stdout_fd < 0 && stderr_fd < 0) break;
            if (timer.duration<chrono::milliseconds>().count() - exit_time_ms > DRAIN_TIMEOUT_MS) {
                LOG(WARNING) << "output pipes of " << options.argv[0] << " are still open after exit, giving up";
                break;
            }
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) fds[nfds++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[nfds++] = {stderr_fd, POLLIN, 0};
        if (stdin_fd >= 0) fds[nfds++] = {stdin_fd, POLLOUT, 0};

        int timeout = POLL_INTERVAL_MS;
        if (!exited && options.time_limit_ms > 0)
            timeout = (int)max(1LL, min((long long)timeout, options.time_limit_ms - elapsed));

        int r = poll(fds, nfds, timeout);
        if (r < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == stdout_fd) {
                if (!pump_pipe(stdout_fd, result.stdout_text, options.max_output_bytes, result.truncated))
                    close_fd(stdout_fd);
            } else if (fds[i].fd == stderr_fd) {
                if (!pump_pipe(stderr_fd, result.stderr_text, options.max_output_bytes, result.truncated))
                    close_fd(stderr_fd);
            } else if (fds[i].fd == stdin_fd) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    close_fd(stdin_fd);
                    continue;
                }
                ssize_t nwritten = write(stdin_fd, options.stdin_text.data() + written, options.stdin_text.size() - written);
                if (nwritten > 0) {
                    written += nwritten;
                } else if (nwritten < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                    // 子进程没有读完输入就关闭了标准输入，不视为错误
                    close_fd(stdin_fd);
                    continue;
                }
                if (written == options.stdin_text.size()) close_fd(stdin_fd);
            }
        }
    }

    int status;
    while (wait4(pid, &status, 0, &result.usage) < 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
    reaped = true;
    result.wall_time_ms = exit_time_ms;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = result.signal + 128;
        if (!result.timed_out && !result.cancelled)
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }

    if (result.truncated)
        LOG(INFO) << "output of " << options.argv[0] << " truncated to " << options.max_output_bytes << " bytes";

    return result;
}

}  // namespace arena
