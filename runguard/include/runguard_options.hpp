#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"

namespace grader {

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    /**
     * @brief 子进程的工作目录，为空时继承当前目录
     */
    std::string work_dir;

    /**
     * @brief 子进程所属用户能同时拥有的进程数，0 表示不限制
     */
    size_t nproc = 0;

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // 地址空间上限，单位为字节
    int64_t file_limit = -1;    // 可写文件的大小上限，单位为字节
    int64_t stream_size = -1;   // stdout、stderr 各自最多保留的字节数
    bool no_core_dumps = false;

    /**
     * @brief 是否将子进程分离到新的 user、network、IPC、UTS 命名空间
     * 需要内核允许非特权用户创建 user namespace
     */
    bool unshare_namespaces = false;

    /**
     * @brief 为真时子进程继承当前进程的全部环境变量，否则只保留 PATH
     */
    bool preserve_sys_env = false;
    std::vector<std::string> env;

    std::vector<std::string> command;

    /**
     * @brief 事件通道的接收函数
     * 设置后子进程的 3 号文件描述符会连接到一个管道，子进程写入的数据
     * 原样交给该函数（不保证按行切分）。该函数在 runit 的调用线程中执行。
     */
    std::function<void(const char *data, size_t size)> event_sink;

    /**
     * @brief 取消标记，被取消时子进程组会被杀死
     */
    const cancellation_token *cancel = nullptr;
};

}  // namespace grader
