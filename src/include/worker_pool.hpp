#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace querygate {

/**
 * Fixed-size pool of threads running pipeline work off the I/O threads.
 *
 * Sized to the admission capacity, so an admitted request always finds
 * a thread without queueing behind unrelated work for long.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t thread_count, std::string name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False once shutdown has begun
    bool submit(std::function<void()> task);

    // Runs queued tasks to completion, then joins all threads
    void shutdown();

    std::size_t size() const { return threads.size(); }
    std::size_t pending() const;

private:
    void workerLoop();

    std::string name;
    std::vector<std::thread> threads;
    std::deque<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> running;
};

} // namespace querygate
