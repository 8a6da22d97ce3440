#pragma once

#include <functional>
#include <thread>
#include <vector>

namespace pixunscale::core {

using ThreadLauncher = std::function<std::thread(const std::function<void()>&)>;

std::thread launch_thread(const std::function<void()>& body);

// Starts up to `count` threads running `body` and returns how many started.
// Stops at the first thread the system refuses to create; threads already
// running are kept in `workers` and must still be joined.
unsigned int start_workers(
    std::vector<std::thread>& workers,
    unsigned int count,
    const std::function<void()>& body,
    const ThreadLauncher& launch = launch_thread);

void join_workers(std::vector<std::thread>& workers);

} // namespace pixunscale::core
