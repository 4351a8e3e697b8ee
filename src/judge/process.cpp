#include "arbiter/judge/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include "arbiter/common/defer.hpp"
#include "arbiter/common/exceptions.hpp"
#include "arbiter/common/utils.hpp"

namespace arbiter {
using namespace std;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

const size_t BUF_SIZE = 4096;

// 每轮 poll 最多读取多少次，避免疯狂输出的程序让我们错过时间限制
const int MAX_READS_PER_ROUND = 16;

// 子进程状态的检查间隔
const chrono::milliseconds WAIT_INTERVAL(10);

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, Args &&...args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), forward<Args>(args)...));
}

bool execution_outcome::succeeded() const {
    return !timed_out && exit_code && *exit_code == 0 && !signal;
}

namespace {

/**
 * @brief 独占一个文件描述符，析构时关闭
 */
struct file_descriptor {
    int fd = -1;

    file_descriptor() = default;
    explicit file_descriptor(int fd) : fd(fd) {}
    file_descriptor(const file_descriptor &) = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;
    ~file_descriptor() { reset(); }

    bool valid() const { return fd >= 0; }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
};

struct pipe_pair {
    file_descriptor read_end, write_end;

    pipe_pair() {
        int fds[2];
        // O_CLOEXEC 保证其他线程 fork 出来的子进程不会继承这些管道，否则管道的写端
        // 会被无关的进程持有，导致我们一直读不到 EOF
        if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipe");
        read_end.fd = fds[PIPE_READ];
        write_end.fd = fds[PIPE_WRITE];
    }
};

/**
 * @brief 在当前线程屏蔽 SIGPIPE
 * 子进程可能不读取 stdin 就退出，此时写入 stdin 会产生 SIGPIPE，默认行为是杀死评测系统。
 * 这里不修改整个进程的信号处理方式，而是屏蔽当前线程的 SIGPIPE，并在结束时清除挂起的信号
 */
struct sigpipe_guard {
    sigset_t old_mask;

    sigpipe_guard() {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, &old_mask);
    }

    ~sigpipe_guard() {
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE)) {
            sigset_t mask;
            sigemptyset(&mask);
            sigaddset(&mask, SIGPIPE);
            struct timespec zero = {0, 0};
            sigtimedwait(&mask, nullptr, &zero);
        }
        pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

/**
 * @brief 只在 fork 出的子进程中调用，只能使用异步信号安全的函数
 */
[[noreturn]] void exec_child(char **args, const char *cwd, pipe_pair &in, pipe_pair &out, pipe_pair &err, pipe_pair &status) {
    // 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
    setpgid(0, 0);

    // 恢复默认的信号处理方式和信号掩码，否则选手程序会继承评测线程屏蔽的 SIGPIPE
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_DFL;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGPIPE, &sigact, nullptr);
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    int redirects[3][2] = {{in.read_end.fd, STDIN_FILENO},
                           {out.write_end.fd, STDOUT_FILENO},
                           {err.write_end.fd, STDERR_FILENO}};
    int failure = 0;

    if (cwd[0] && chdir(cwd) != 0) failure = errno;

    for (int i = 0; i < 3 && !failure; ++i) {
        auto [from, to] = redirects[i];
        if (from == to) {
            // dup2 不会清除 close-on-exec 标记，需要手动清除
            if (fcntl(to, F_SETFD, 0) != 0) failure = errno;
        } else if (dup2(from, to) < 0) {
            failure = errno;
        }
    }

    if (!failure) {
        execvp(args[0], args);
        failure = errno;
    }

    // 通过 close-on-exec 管道告诉父进程 exec 失败的原因
    ssize_t unused = write(status.write_end.fd, &failure, sizeof(failure));
    (void)unused;
    _exit(127);
}

/**
 * @brief 从管道中读取数据，超出 limit 的部分会被丢弃
 * 读到 EOF 时关闭管道
 */
void pump_pipe(file_descriptor &pipe, string &text, bool &truncated, size_t limit) {
    char buf[BUF_SIZE];
    for (int round = 0; round < MAX_READS_PER_ROUND && pipe.valid(); ++round) {
        ssize_t nread = read(pipe.fd, buf, BUF_SIZE);
        if (nread > 0) {
            size_t room = text.size() < limit ? limit - text.size() : 0;
            size_t keep = min(room, (size_t)nread);
            text.append(buf, keep);
            if (keep < (size_t)nread) truncated = true;
        } else if (nread == 0) {
            // EOF detected
            pipe.reset();
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            error(errno, "reading from child pipe {}", pipe.fd);
        }
    }
}

void feed_pipe(file_descriptor &pipe, const string &input, size_t &written) {
    while (pipe.valid() && written < input.size()) {
        ssize_t nwritten = write(pipe.fd, input.data() + written, input.size() - written);
        if (nwritten >= 0) {
            written += nwritten;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else if (errno == EPIPE) {
            // 子进程已经关闭了 stdin，剩下的数据不再需要
            DLOG(INFO) << "child closed stdin after " << written << " bytes";
            pipe.reset();
        } else {
            error(errno, "writing to child stdin");
        }
    }
    if (written >= input.size()) pipe.reset();
}

void wait_child(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) error(errno, "waiting on child {}", pid);
    }
}

}  // namespace

execution_outcome run_process(const vector<string> &argv, const process_options &options) {
    if (argv.empty()) throw process_error("empty command");

    // fork 之后只能调用异步信号安全的函数，因此需要提前准备好参数
    vector<string> cmd(argv);
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);
    string cwd = options.cwd.string();

    DLOG(INFO) << "Running command: " << boost::algorithm::join(argv, " ") << " in " << cwd;

    sigpipe_guard sigpipe;
    pipe_pair in, out, err, exec_status;

    elapsed_time timer;
    auto deadline = options.timeout.count() > 0
                        ? chrono::steady_clock::now() + options.timeout
                        : chrono::steady_clock::time_point::max();

    pid_t pid = fork();
    if (pid < 0) error(errno, "unable to fork");
    if (pid == 0) exec_child(args.data(), cwd.c_str(), in, out, err, exec_status);

    // 子进程可能还没来得及调用 setpgid，父进程也设置一次，避免 kill(-pid) 失败
    setpgid(pid, pid);

    bool exited = false;
    int status = 0;

    // 父进程出错时杀死并回收子进程，避免留下僵尸进程
    scoped_guard reaper([&] {
        kill(-pid, SIGKILL);
        if (exited) return;
        int wstatus;
        while (waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
    });

    in.read_end.reset();
    out.write_end.reset();
    err.write_end.reset();
    exec_status.write_end.reset();

    {
        int failure = 0;
        ssize_t nread;
        do {
            nread = read(exec_status.read_end.fd, &failure, sizeof(failure));
        } while (nread < 0 && errno == EINTR);
        if (nread == sizeof(failure)) {
            wait_child(pid, status);
            exited = true;
            throw process_error(fmt::format("unable to start command {}: {}", argv[0], strerror(failure)));
        }
    }

    execution_outcome outcome;
    string input = options.input.value_or("");
    size_t written = 0;
    if (input.empty()) {
        in.write_end.reset();
    } else {
        set_nonblocking(in.write_end.fd);
    }
    set_nonblocking(out.read_end.fd);
    set_nonblocking(err.read_end.fd);

    while (true) {
        if (!exited) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                exited = true;
                outcome.wall_time = timer.duration<chrono::milliseconds>();
            } else if (ret < 0 && errno != EINTR) {
                error(errno, "waiting on child {}", pid);
            }
        }

        if (exited && !out.read_end.valid() && !err.read_end.valid()) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            if (!exited) {
                outcome.timed_out = true;
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << argv[0];
            } else {
                // 子进程已经退出，但是它的子孙进程仍然持有管道
                LOG(WARNING) << "descendants of " << argv[0] << " are still holding the output pipes, killing them";
            }
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) error(errno, "sending SIGKILL to command");
            if (!exited) {
                wait_child(pid, status);
                exited = true;
                outcome.wall_time = timer.duration<chrono::milliseconds>();
            }
            pump_pipe(out.read_end, outcome.stdout_text, outcome.stdout_truncated, options.output_limit);
            pump_pipe(err.read_end, outcome.stderr_text, outcome.stderr_truncated, options.output_limit);
            break;
        }

        auto wait = min(chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1), WAIT_INTERVAL);
        struct pollfd fds[3] = {{in.write_end.fd, POLLOUT, 0},
                                {out.read_end.fd, POLLIN, 0},
                                {err.read_end.fd, POLLIN, 0}};
        int r = poll(fds, 3, (int)wait.count());
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
        if (r <= 0) continue;

        if (fds[0].revents) feed_pipe(in.write_end, input, written);
        if (fds[1].revents) pump_pipe(out.read_end, outcome.stdout_text, outcome.stdout_truncated, options.output_limit);
        if (fds[2].revents) pump_pipe(err.read_end, outcome.stderr_text, outcome.stderr_truncated, options.output_limit);
    }

    reaper.dismiss();

    // 杀死进程组内残留的进程，确保子进程退出后不会有进程留驻系统
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH && errno != EPERM)
        LOG(WARNING) << "unable to clean up process group " << pid << ": " << strerror(errno);

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
        if (!outcome.timed_out)
            LOG(INFO) << "Command terminated with signal (" << *outcome.signal << ", " << strsignal(*outcome.signal) << ")";
    }

    if (outcome.stdout_truncated) LOG(INFO) << "child stdout limit reached";
    if (outcome.stderr_truncated) LOG(INFO) << "child stderr limit reached";

    return outcome;
}

}  // namespace arbiter
