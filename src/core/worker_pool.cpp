#include "worker_pool.h"

#include <system_error>

namespace pixunscale::core {

std::thread launch_thread(const std::function<void()>& body) {
    return std::thread(body);
}

unsigned int start_workers(
    std::vector<std::thread>& workers,
    unsigned int count,
    const std::function<void()>& body,
    const ThreadLauncher& launch) {
    // Reserved up front so storing a started thread never reallocates.
    workers.reserve(workers.size() + count);
    unsigned int started = 0;
    for (; started < count; ++started) {
        try {
            workers.push_back(launch(body));
        } catch (const std::system_error&) {
            break;
        }
    }
    return started;
}

void join_workers(std::vector<std::thread>& workers) {
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace pixunscale::core
