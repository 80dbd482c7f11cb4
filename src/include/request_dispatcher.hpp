#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <crow/http_response.h>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "admission_controller.hpp"
#include "worker_pool.hpp"

namespace querygate {

/**
 * Runs admitted requests on the worker pool under a deadline.
 *
 * The worker and a deadline timer race to finish each request; whichever
 * gets there first releases the permit and delivers its response, the
 * other side is ignored. Work that overruns the deadline is not cancelled:
 * it runs to completion on its worker and its result is dropped.
 */
class RequestDispatcher {
public:
    using Work = std::function<crow::response()>;
    using ResponseFactory = std::function<crow::response()>;
    using Completion = std::function<void(crow::response&&)>;

    RequestDispatcher(WorkerPool& workers, std::chrono::milliseconds timeout);
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    void dispatch(Permit permit, Work work, ResponseFactory on_timeout, Completion completion);

    void shutdown();

    std::chrono::milliseconds timeout() const { return timeout_; }
    std::size_t lateCompletions() const { return late_completions_; }

private:
    struct Pending {
        std::atomic<bool> done{false};
        Permit permit;
        Completion completion;
        ResponseFactory on_timeout;
    };

    struct Deadline {
        std::chrono::steady_clock::time_point when;
        std::weak_ptr<Pending> pending;

        bool operator>(const Deadline& other) const { return when > other.when; }
    };

    static void finish(Pending& pending, crow::response&& response);
    void timerLoop();

    WorkerPool& workers_;
    std::chrono::milliseconds timeout_;
    std::atomic<std::size_t> late_completions_{0};

    std::priority_queue<Deadline, std::vector<Deadline>, std::greater<Deadline>> deadlines_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_;
    std::thread timer_thread_;
};

} // namespace querygate
