#include "common/worker_pool.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <optional>

namespace grader {
using namespace std;

worker_pool::worker_pool(size_t size, string name) : pool_name(move(name)) {
    if (size == 0) size = max(1u, thread::hardware_concurrency());
    for (size_t i = 0; i < size; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    DLOG(INFO) << "Worker pool " << pool_name << " started with " << size << " workers";
}

worker_pool::~worker_pool() {
    // 关闭之前排队的任务会先被执行完
    tasks.close();
    for (auto &th : workers)
        th.join();
}

size_t worker_pool::size() const {
    return workers.size();
}

const string &worker_pool::name() const {
    return pool_name;
}

void worker_pool::worker_loop(size_t worker_id) {
    while (optional<function<void()>> task = tasks.pop()) {
        try {
            (*task)();
        } catch (std::exception &ex) {
            // packaged_task 会把异常交给 future，这里只会捕获到 promise 本身的错误
            LOG(ERROR) << "Worker " << worker_id << " of pool " << pool_name << " has crashed, "
                       << boost::diagnostic_information(ex);
        }
    }
}

}  // namespace grader
