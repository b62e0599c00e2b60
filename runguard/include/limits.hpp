#pragma once

#include "runguard_options.hpp"

namespace grader {

/**
 * @brief 在 fork 之前预先计算好的资源限制
 * fork 之后的子进程只能调用异步信号安全的函数，因此所有的计算都在父进程中完成
 */
struct resource_limits {
    struct entry {
        int resource;
        unsigned long soft, hard;
    };

    entry entries[8];
    int count = 0;
};

/**
 * @brief 根据设置计算子进程的资源限制
 */
resource_limits prepare_restrictions(const runguard_options &opt);

/**
 * @brief 在子进程中应用资源限制
 * 只调用 setrlimit，可以在 fork 之后安全调用
 * @return 成功返回 0，失败返回 errno
 */
int set_restrictions(const resource_limits &limits);

/**
 * @brief 在子进程中分离命名空间
 * @return 成功返回 0，失败返回 errno
 */
int unshare_namespaces();

}  // namespace grader
