#include "request_dispatcher.hpp"

#include <crow/logging.h>

namespace querygate {

RequestDispatcher::RequestDispatcher(WorkerPool& workers, std::chrono::milliseconds timeout)
    : workers_(workers), timeout_(timeout), running_(true)
{
    timer_thread_ = std::thread(&RequestDispatcher::timerLoop, this);
}

RequestDispatcher::~RequestDispatcher() {
    shutdown();
}

void RequestDispatcher::dispatch(Permit permit, Work work, ResponseFactory on_timeout, Completion completion) {
    auto pending = std::make_shared<Pending>();
    pending->permit = std::move(permit);
    pending->completion = std::move(completion);
    pending->on_timeout = std::move(on_timeout);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadlines_.push(Deadline{std::chrono::steady_clock::now() + timeout_, pending});
    }
    cv_.notify_one();

    bool submitted = workers_.submit([this, pending, work = std::move(work)] {
        crow::response response;
        try {
            response = work();
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "Request pipeline threw: " << e.what();
            response = Error::Internal("An unexpected error occurred", e.what()).toHttpResponse();
        }

        if (pending->done.exchange(true)) {
            ++late_completions_;
            CROW_LOG_WARNING << "Request finished after its " << timeout_.count()
                             << " ms deadline, result discarded";
            return;
        }
        finish(*pending, std::move(response));
    });

    if (!submitted && !pending->done.exchange(true)) {
        auto response = Error::Internal("Server is shutting down").toHttpResponse();
        response.code = 503;
        finish(*pending, std::move(response));
    }
}

void RequestDispatcher::shutdown() {
    if (running_.exchange(false)) {
        cv_.notify_all();
        if (timer_thread_.joinable()) {
            timer_thread_.join();
        }
    }
}

void RequestDispatcher::finish(Pending& pending, crow::response&& response) {
    pending.permit.release();
    if (pending.completion) {
        pending.completion(std::move(response));
    }
}

void RequestDispatcher::timerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (deadlines_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !deadlines_.empty(); });
            continue;
        }

        auto next = deadlines_.top();
        if (std::chrono::steady_clock::now() < next.when) {
            cv_.wait_until(lock, next.when);
            continue;
        }
        deadlines_.pop();

        auto pending = next.pending.lock();
        if (!pending || pending->done.exchange(true)) {
            continue;
        }

        lock.unlock();
        CROW_LOG_WARNING << "Request exceeded its " << timeout_.count() << " ms deadline";
        crow::response response = pending->on_timeout
            ? pending->on_timeout()
            : Error::Timeout(timeout_.count()).toHttpResponse();
        finish(*pending, std::move(response));
        lock.lock();
    }
}

} // namespace querygate
