#include "limits.hpp"
#include <errno.h>
#include <math.h>
#include <sched.h>
#include <sys/resource.h>
#include <system_error>

namespace grader {
using namespace std;

static void add_rlimit(resource_limits &limits, int resource, rlim_t cur, rlim_t max) {
    constexpr int capacity = sizeof(limits.entries) / sizeof(limits.entries[0]);
    if (limits.count >= capacity)
        throw length_error("too many resource limits");
    limits.entries[limits.count++] = {resource, cur, max};
}

resource_limits prepare_restrictions(const runguard_options &opt) {
    resource_limits limits;

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        add_rlimit(limits, RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // 没有 cgroup 可用，内存只能通过地址空间来限制
    if (opt.memory_limit > 0) add_rlimit(limits, RLIMIT_AS, opt.memory_limit, opt.memory_limit);

    if (opt.file_limit > 0) add_rlimit(limits, RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.nproc > 0) add_rlimit(limits, RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) add_rlimit(limits, RLIMIT_CORE, 0, 0);

    return limits;
}

int set_restrictions(const resource_limits &limits) {
    for (int i = 0; i < limits.count; ++i) {
        struct rlimit lim;
        lim.rlim_cur = limits.entries[i].soft;
        lim.rlim_max = limits.entries[i].hard;
        if (setrlimit(limits.entries[i].resource, &lim) != 0)
            return errno;
    }
    return 0;
}

int unshare_namespaces() {
    /*
     * CLONE_NEWUSER：非特权用户只有先进入新的 user namespace 才能创建其他命名空间
     * CLONE_NEWNET：隔离网络命名空间，受控程序无法再访问主机网络
     * CLONE_NEWIPC：隔离 IPC 命名空间，受控程序无法与主机程序进行进程间通信
     * CLONE_NEWUTS：隔离 hostname 和 NIS
     */
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS) != 0)
        return errno;
    return 0;
}

}  // namespace grader
