#include "worker_pool.hpp"

#include <crow/logging.h>

namespace querygate {

WorkerPool::WorkerPool(std::size_t thread_count, std::string name)
    : name(std::move(name)), running(true)
{
    if (thread_count == 0) {
        thread_count = 1;
    }
    threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(&WorkerPool::workerLoop, this);
    }
    CROW_LOG_DEBUG << "Started " << thread_count << " " << this->name << " threads";
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            return false;
        }
        tasks.push_back(std::move(task));
    }
    cv.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running.exchange(false)) {
            return;
        }
    }
    cv.notify_all();
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    CROW_LOG_DEBUG << "Stopped " << name << " threads";
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tasks.size();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return !running || !tasks.empty(); });
            if (tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "Uncaught exception in " << name << " task: " << e.what();
        }
    }
}

} // namespace querygate
