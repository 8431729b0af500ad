#include "ojcore/common/subprocess.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <system_error>
#include "ojcore/common/defer.hpp"
#include "ojcore/common/utils.hpp"

namespace ojcore {
using namespace std;

const struct timespec pollinterval = {0, 10000000L};  // 10ms

const int BUF_SIZE = 4096;

const int PIPE_OUT = 0;  // 读端
const int PIPE_IN = 1;   // 写端

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

bool process_result::success() const {
    return !timed_out && signal < 0 && exitcode == 0;
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "setting O_NONBLOCK on fd {}", fd);
}

/**
 * @brief 子进程的入口，设置资源限制、重定向管道后调用 execvp
 * 这个函数不会返回。execvp 失败时将 errno 写入 errfd 让父进程得知启动失败。
 */
[[noreturn]] static void exec_child(const process_options &opt, int stdin_fd, int stdout_fd, int stderr_fd, int errfd) {
    // 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
    setpgid(0, 0);

    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!write(errfd, &err, sizeof(err));
        _exit(127);
    }

    if (opt.no_core_dumps) {
        struct rlimit lim = {0, 0};
        setrlimit(RLIMIT_CORE, &lim);
    }
    if (opt.file_limit >= 0) {
        struct rlimit lim = {(rlim_t)opt.file_limit, (rlim_t)opt.file_limit};
        setrlimit(RLIMIT_FSIZE, &lim);
    }

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0) {
        int err = errno;
        (void)!write(errfd, &err, sizeof(err));
        _exit(127);
    }

    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    execvp(args[0], args.data());
    int err = errno;
    (void)!write(errfd, &err, sizeof(err));
    _exit(127);
}

/**
 * @brief 从管道中读出数据，超出 stream_size 的部分会被丢弃
 * @return 是否读到了 EOF
 */
static bool drain(int fd, string &buffer, int64_t stream_size, bool &truncated) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == 0) return true;
        if (nread < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
            error(errno, "reading from child fd {}", fd);
        }
        size_t to_keep = nread;
        if (stream_size >= 0) {
            size_t room = buffer.size() < (size_t)stream_size ? (size_t)stream_size - buffer.size() : 0;
            if (room < to_keep) {
                to_keep = room;
                truncated = true;
            }
        }
        buffer.append(buf, to_keep);
    }
}

process_result run_process(const process_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("empty command");

    DLOG(INFO) << "Running " << boost::algorithm::join(opt.command, " ");

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int errpipe[2] = {-1, -1};
    defer {
        for (auto &p : child_pipefd) {
            close_fd(p[PIPE_OUT]);
            close_fd(p[PIPE_IN]);
        }
        close_fd(errpipe[PIPE_OUT]);
        close_fd(errpipe[PIPE_IN]);
    };

    for (int i = 0; i < 3; ++i)
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    if (pipe2(errpipe, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    // 写 stdin 时子进程可能已经关闭了 stdin，此时屏蔽 SIGPIPE 以免评测系统本身被杀死
    sigset_t pipemask, oldmask;
    sigemptyset(&pipemask);
    sigaddset(&pipemask, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipemask, &oldmask);
    bool broken_pipe = false;
    defer {
        if (broken_pipe) {
            // 消耗掉挂起的 SIGPIPE 再恢复信号屏蔽字
            struct timespec zero = {0, 0};
            while (sigtimedwait(&pipemask, nullptr, &zero) > 0) {}
        }
        pthread_sigmask(SIG_SETMASK, &oldmask, nullptr);
    };

    elapsed_time timer;
    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0:  // 子进程
            exec_child(opt, child_pipefd[0][PIPE_OUT], child_pipefd[1][PIPE_IN], child_pipefd[2][PIPE_IN], errpipe[PIPE_IN]);
        default:
            break;
    }

    // 父进程也设置一次进程组，避免子进程还未调用 setpgid 时我们就需要杀死进程组
    setpgid(child_pid, child_pid);

    int status = 0;
    bool reaped = false;
    defer {
        // 出现异常时也要回收子进程，不留下僵尸进程
        if (reaped) return;
        kill(-child_pid, SIGKILL);
        while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {}
    };

    close_fd(child_pipefd[0][PIPE_OUT]);
    close_fd(child_pipefd[1][PIPE_IN]);
    close_fd(child_pipefd[2][PIPE_IN]);
    close_fd(errpipe[PIPE_IN]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(errpipe[PIPE_OUT], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(exec_errno)) {
        while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {}
        reaped = true;
        error(exec_errno, "unable to start command {}", opt.command[0]);
    }

    int &stdin_fd = child_pipefd[0][PIPE_IN];
    int &stdout_fd = child_pipefd[1][PIPE_OUT];
    int &stderr_fd = child_pipefd[2][PIPE_OUT];
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    process_result result;
    size_t written = 0;
    if (opt.input.empty()) close_fd(stdin_fd);

    auto kill_group = [&]() {
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "Unable to send SIGKILL to process group " << child_pid << ": " << strerror(errno);
    };

    while (true) {
        if (opt.wall_limit && timer.seconds() >= *opt.wall_limit) {
            result.timed_out = true;
            LOG(INFO) << fmt::format("Time limit exceeded (hard wall time {:.3f}s): aborting {}", *opt.wall_limit, opt.command[0]);
            break;
        }

        int pid = waitpid(child_pid, &status, WNOHANG);
        if (pid < 0 && errno != EINTR) error(errno, "waiting on child");
        if (pid == child_pid) {
            reaped = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_fd >= 0) fds[nfds++] = {stdin_fd, POLLOUT, 0};
        if (stdout_fd >= 0) fds[nfds++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[nfds++] = {stderr_fd, POLLIN, 0};

        if (nfds == 0) {
            // 子进程关闭了所有管道但仍在运行，等待其退出
            nanosleep(&pollinterval, nullptr);
            continue;
        }

        int timeout_ms = 100;
        if (opt.wall_limit) {
            double remain = *opt.wall_limit - timer.seconds();
            timeout_ms = max(1, min(timeout_ms, (int)(remain * 1000) + 1));
        }
        int r = poll(fds, nfds, timeout_ms);
        if (r < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == stdin_fd) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    close_fd(stdin_fd);
                    continue;
                }
                ssize_t nwritten = write(stdin_fd, opt.input.data() + written, opt.input.size() - written);
                if (nwritten < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    if (errno == EPIPE) {
                        broken_pipe = true;
                        close_fd(stdin_fd);
                        continue;
                    }
                    error(errno, "writing to child stdin");
                }
                written += nwritten;
                if (written == opt.input.size()) close_fd(stdin_fd);
            } else if (fds[i].fd == stdout_fd) {
                if (drain(stdout_fd, result.stdout_text, opt.stream_size, result.output_truncated)) close_fd(stdout_fd);
            } else if (fds[i].fd == stderr_fd) {
                if (drain(stderr_fd, result.stderr_text, opt.stream_size, result.output_truncated)) close_fd(stderr_fd);
            }
        }
    }

    // 杀死进程组内所有的进程，确保选手程序 fork 出来的子进程不会留驻系统
    kill_group();
    if (!reaped) {
        while (waitpid(child_pid, &status, 0) < 0) {
            if (errno != EINTR) error(errno, "waiting on child");
        }
        reaped = true;
    }
    result.wall_time = timer.seconds();

    // 读出子进程退出前写入管道的剩余数据
    if (!result.timed_out) {
        if (stdout_fd >= 0) drain(stdout_fd, result.stdout_text, opt.stream_size, result.output_truncated);
        if (stderr_fd >= 0) drain(stderr_fd, result.stderr_text, opt.stream_size, result.output_truncated);
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }

    if (result.output_truncated)
        LOG(WARNING) << "Output of " << opt.command[0] << " truncated to " << opt.stream_size << " bytes";

    return result;
}

}  // namespace ojcore
