#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <chrono>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "limits.hpp"

extern char **environ;

namespace grader {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

// 子进程的状态检查间隔，也是取消请求的最大响应延迟
static const int POLL_INTERVAL_MS = 20;

// 子进程通过错误管道报告的失败步骤
enum child_stage {
    STAGE_SETSID = 1,
    STAGE_UNSHARE,
    STAGE_RLIMIT,
    STAGE_REDIRECT,
    STAGE_CHDIR,
    STAGE_EXEC
};

struct child_error {
    int stage;
    int err;
};

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, const Args &... args) {
    throw system_error(err, system_category(), fmt::vformat(format, fmt::make_format_args(args...)));
}

static const char *stage_name(int stage) {
    switch (stage) {
        case STAGE_SETSID: return "unable to setsid";
        case STAGE_UNSHARE: return "unable to unshare namespaces";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_REDIRECT: return "redirecting child fd";
        case STAGE_CHDIR: return "unable to chdir to workdir";
        case STAGE_EXEC: return "unable to start command";
        default: return "unknown stage";
    }
}

bool runguard_result::crashed() const {
    return signal != -1 && !wall_timeout && !cpu_timeout && !cancelled;
}

/**
 * @brief 子进程的一路输出
 * stdout、stderr 保存到字符串中，事件通道直接交给 event_sink
 */
struct output_channel {
    int fd = -1;
    std::string *data = nullptr;
    int64_t limit = -1;
    size_t data_read = 0;
    size_t data_passed = 0;
    const function<void(const char *, size_t)> *sink = nullptr;
};

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief 读出管道中当前可读的全部数据
 * 管道为非阻塞模式，读到 EAGAIN 即返回，读到 EOF 时关闭管道并将 fd 置为 -1
 */
static void pump_pipe(output_channel &channel) {
    char buf[BUF_SIZE];
    while (channel.fd >= 0) {
        ssize_t nread = read(channel.fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            error(errno, "copying data from fd {}", channel.fd);
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            close_fd(channel.fd);
            return;
        }

        channel.data_read += nread;
        if (channel.sink) {
            (*channel.sink)(buf, nread);
            channel.data_passed += nread;
        } else if (channel.data) {
            /* Throw away data if we're at the output limit, but
               still count how much data we consumed  */
            size_t to_write = nread;
            if (channel.limit >= 0)
                to_write = min(to_write, (size_t)channel.limit - channel.data_passed);
            channel.data->append(buf, to_write);
            channel.data_passed += to_write;
        }
    }
}

static void terminate_group(pid_t child_pid) {
    /* First try to kill graciously, then hard.
       Don't report an already exited process as error. */
    DLOG(INFO) << "sending SIGTERM to process group " << child_pid;
    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH)
        error(errno, "sending SIGTERM to command");

    /* Prefer nanosleep over sleep because of higher resolution and
       it does not interfere with signals. */
    nanosleep(&killdelay, nullptr);

    DLOG(INFO) << "sending SIGKILL to process group " << child_pid;
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
}

static vector<string> build_environment(const runguard_options &opt) {
    vector<string> envs;
    if (opt.preserve_sys_env) {
        for (char **env = environ; env && *env; ++env)
            envs.push_back(*env);
    } else {
        string path = get_env("PATH", "");
        if (!path.empty()) envs.push_back("PATH=" + path);
    }

    for (const string &entry : opt.env) {
        string key = entry.substr(0, entry.find('='));
        for (auto it = envs.begin(); it != envs.end();)
            if (it->compare(0, key.size() + 1, key + "=") == 0)
                it = envs.erase(it);
            else
                ++it;
        envs.push_back(entry);
    }
    return envs;
}

/**
 * @brief fork 之后在子进程中执行，只调用异步信号安全的函数
 */
[[noreturn]] static void run_child(const runguard_options &opt, const resource_limits &limits,
                                   const char *executable, char *const *argv, char *const *envp,
                                   int devnull, int stdout_fd, int stderr_fd, int event_fd, int report_fd) {
    auto fail = [&report_fd](int stage) {
        child_error e{stage, errno};
        ssize_t ignored = write(report_fd, &e, sizeof(e));
        (void)ignored;
        _exit(127);
    };

    // 错误管道挪到高位，避免被下面的重定向覆盖
    report_fd = fcntl(report_fd, F_DUPFD_CLOEXEC, 100);
    if (report_fd < 0) _exit(127);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1) fail(STAGE_SETSID);

    if (opt.unshare_namespaces) {
        int err = unshare_namespaces();
        if (err != 0) {
            errno = err;
            fail(STAGE_UNSHARE);
        }
    }

    int err = set_restrictions(limits);
    if (err != 0) {
        errno = err;
        fail(STAGE_RLIMIT);
    }

    // 将管道连接到 stdin/stdout/stderr。
    if (dup2(devnull, STDIN_FILENO) < 0) fail(STAGE_REDIRECT);
    if (dup2(stdout_fd, STDOUT_FILENO) < 0) fail(STAGE_REDIRECT);
    if (dup2(stderr_fd, STDERR_FILENO) < 0) fail(STAGE_REDIRECT);
    int first_closed = STDERR_FILENO + 1;
    if (event_fd >= 0) {
        if (event_fd == EVENT_CHANNEL_FD) {
            // dup2 到自身不会清除 FD_CLOEXEC
            if (fcntl(EVENT_CHANNEL_FD, F_SETFD, 0) < 0) fail(STAGE_REDIRECT);
        } else if (dup2(event_fd, EVENT_CHANNEL_FD) < 0) {
            fail(STAGE_REDIRECT);
        }
        first_closed = EVENT_CHANNEL_FD + 1;
    }

    // 关闭其他线程可能打开且没有设置 O_CLOEXEC 的文件描述符
    for (int range = 0; range < 2; ++range) {
        unsigned first = range == 0 ? first_closed : report_fd + 1;
        unsigned last = range == 0 ? report_fd - 1 : ~0U;
        if (first > last) continue;
        if (syscall(SYS_close_range, first, last, 0) != 0) {
            unsigned bound = min(last, 1023U);
            for (unsigned fd = first; fd <= bound; ++fd) close(fd);
        }
    }

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
        fail(STAGE_CHDIR);

    execve(executable, argv, envp);
    fail(STAGE_EXEC);
    _exit(127);
}

runguard_result runit(const runguard_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("runguard: command should not be empty");

    filesystem::path executable = find_executable(opt.command[0]);
    if (executable.empty())
        error(ENOENT, "unable to find command {}", opt.command[0]);

    // fork 之后不能再分配内存，所有参数在这里准备好
    vector<string> args = opt.command;
    vector<char *> argv;
    for (string &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    vector<string> envs = build_environment(opt);
    vector<char *> envp;
    for (string &env : envs) envp.push_back(env.data());
    envp.push_back(nullptr);

    resource_limits limits = prepare_restrictions(opt);
    string executable_path = executable.string();

    runguard_result result;
    int devnull = -1;
    int stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, event_pipe[2] = {-1, -1}, report_pipe[2] = {-1, -1};
    pid_t child_pid = -1;
    bool reaped = true;

    defer {
        if (!reaped) {
            // 发生异常时，确保子进程组已经被清理
            kill(-child_pid, SIGKILL);
            kill(child_pid, SIGKILL);
            waitpid(child_pid, nullptr, 0);
        }
        close_fd(devnull);
        for (int *p : {stdout_pipe, stderr_pipe, event_pipe, report_pipe}) {
            close_fd(p[PIPE_IN]);
            close_fd(p[PIPE_OUT]);
        }
    };

    devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) error(errno, "opening /dev/null");

    /* Setup pipes connecting to child stdout/err streams. */
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", STDOUT_FILENO);
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", STDERR_FILENO);
    if (opt.event_sink && pipe2(event_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", EVENT_CHANNEL_FD);
    if (pipe2(report_pipe, O_CLOEXEC) != 0) error(errno, "creating error report pipe");

    switch (child_pid = fork()) {
        case -1:
            throw system_error(errno, system_category(), "unable to fork");
        case 0:  // child process, run the command
            run_child(opt, limits, executable_path.c_str(), argv.data(), envp.data(),
                      devnull, stdout_pipe[PIPE_IN], stderr_pipe[PIPE_IN], event_pipe[PIPE_IN], report_pipe[PIPE_IN]);
        default:
            break;
    }

    // watchdog
    reaped = false;
    elapsed_time timer;

    /* Close unused file descriptors */
    close_fd(devnull);
    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(event_pipe[PIPE_IN]);
    close_fd(report_pipe[PIPE_IN]);

    {
        // execve 成功时管道因为 O_CLOEXEC 被关闭，读到 EOF
        child_error e{0, 0};
        ssize_t nread;
        do {
            nread = read(report_pipe[PIPE_OUT], &e, sizeof(e));
        } while (nread == -1 && errno == EINTR);
        if (nread == (ssize_t)sizeof(e)) {
            waitpid(child_pid, nullptr, 0);
            reaped = true;
            error(e.err, "{} {}", stage_name(e.stage), opt.command[0]);
        }
        close_fd(report_pipe[PIPE_OUT]);
    }

    output_channel channels[3];
    channels[0].fd = stdout_pipe[PIPE_OUT];
    channels[0].data = &result.stdout_data;
    channels[0].limit = opt.stream_size;
    channels[1].fd = stderr_pipe[PIPE_OUT];
    channels[1].data = &result.stderr_data;
    channels[1].limit = opt.stream_size;
    channels[2].fd = event_pipe[PIPE_OUT];
    channels[2].sink = opt.event_sink ? &opt.event_sink : nullptr;
    // 所有权已经转移给 channels
    stdout_pipe[PIPE_OUT] = stderr_pipe[PIPE_OUT] = event_pipe[PIPE_OUT] = -1;

    defer {
        for (auto &channel : channels) close_fd(channel.fd);
    };

    for (auto &channel : channels) {
        if (channel.fd < 0) continue;
        int flags = fcntl(channel.fd, F_GETFL);
        if (flags == -1 || fcntl(channel.fd, F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "fcntl, setting flags");
    }

    if (opt.use_wall_limit)
        DLOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    while (true) {
        struct pollfd fds[3];
        output_channel *polled[3];
        nfds_t nfds = 0;
        for (auto &channel : channels) {
            if (channel.fd < 0) continue;
            fds[nfds].fd = channel.fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            polled[nfds++] = &channel;
        }

        if (nfds > 0) {
            int r = poll(fds, nfds, POLL_INTERVAL_MS);
            if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
            for (nfds_t i = 0; i < nfds; ++i)
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
                    pump_pipe(*polled[i]);
        } else {
            struct timespec interval = {0, POLL_INTERVAL_MS * 1000000L};
            nanosleep(&interval, nullptr);
        }

        pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
        if (pid == -1 && errno != EINTR) error(errno, "waiting on child");
        if (pid == child_pid) {
            reaped = true;
            break;
        }

        bool timeout = opt.use_wall_limit && timer.duration<chrono::duration<double>>().count() > opt.wall_limit.hard;
        bool cancelled = opt.cancel && opt.cancel->is_cancelled();
        if (timeout || cancelled) {
            if (timeout) {
                result.wall_timeout = true;
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << opt.command[0];
            } else {
                result.cancelled = true;
                LOG(WARNING) << "cancellation requested: aborting command " << opt.command[0];
            }

            terminate_group(child_pid);
            while ((pid = wait4(child_pid, &status, 0, &usage)) == -1 && errno == EINTR)
                ;
            if (pid == -1) error(errno, "waiting on child");
            reaped = true;
            break;
        }
    }

    // 杀死进程组内残留的进程，以确保父进程结束后不会有进程驻留
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << child_pid << ": " << strerror(errno);

    // 残留进程已被杀死，管道中剩余的数据可以直接读出
    for (auto &channel : channels) pump_pipe(channel);

    result.wall_time = timer.duration<chrono::duration<double>>().count();
    result.user_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1E-6;
    result.sys_time = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1E-6;
    result.stdout_truncated = channels[0].data_passed < channels[0].data_read;
    result.stderr_truncated = channels[1].data_passed < channels[1].data_read;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (result.signal == SIGXCPU ||
            (opt.use_cpu_limit && result.user_time + result.sys_time >= opt.cpu_limit.hard)) {
            result.cpu_timeout = true;
            LOG(WARNING) << "Time Limit Exceeded (hard cpu limit)";
        } else if (result.crashed()) {
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
        }
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    DLOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}", result.wall_time, result.user_time, result.sys_time);
    return result;
}

}  // namespace grader
