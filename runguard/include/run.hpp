#pragma once

#include <string>
#include "runguard_options.hpp"

namespace grader {

/**
 * @brief 子进程分配到的事件通道文件描述符
 */
constexpr int EVENT_CHANNEL_FD = 3;

struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double sys_time = -1;

    /**
     * @brief 子进程的返回值，被信号终止时为 128 + 信号编号
     */
    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 是否因为超出时钟时间限制被杀死
     */
    bool wall_timeout = false;

    /**
     * @brief 是否因为超出 CPU 时间限制被内核终止（SIGXCPU）
     */
    bool cpu_timeout = false;

    /**
     * @brief 是否因为取消标记被杀死
     */
    bool cancelled = false;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 子进程是否是因为超时或取消以外的原因异常终止
     */
    bool crashed() const;
};

/**
 * @brief 根据传入的设置运行指定的程序，并等待其结束
 * 这个函数可以被多个线程同时调用，不使用任何信号处理函数。
 * 1. 在父进程中准备好 argv、envp、管道（全部带 O_CLOEXEC），fork 之后子进程
 *    只调用异步信号安全的系统调用
 * 2. 子进程
 *    1. 将自己分离到一个独立的会话和进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *    2. 通过 rlimit 限制 CPU 时间、地址空间、文件大小、进程数，禁止 core dump
 *    3. 必要时分离 user、network、IPC、UTS 命名空间
 *    4. 将管道连接到 stdin(/dev/null)、stdout、stderr 以及事件通道，关闭其他所有文件描述符
 *    5. 切换工作目录，使用整理过的环境变量执行命令
 *    任何一步失败，都会通过错误管道把 errno 报告给父进程
 * 3. 父进程轮询管道和子进程状态
 *    1. 超出时钟时间限制或者被取消时，先向进程组发送 SIGTERM，等待片刻后发送 SIGKILL
 *    2. stdout、stderr 超出 stream_size 的部分被丢弃，但仍然会被读出以免子进程阻塞
 * 4. 子进程退出后杀死进程组内残留的进程，确保选手 fork 出来的子进程都不会留驻系统
 * @throw std::system_error 无法创建管道、fork 或启动命令
 */
runguard_result runit(const runguard_options &opt);

}  // namespace grader
