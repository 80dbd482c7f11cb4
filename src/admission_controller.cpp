#include "admission_controller.hpp"

#include <algorithm>
#include <crow/logging.h>

namespace querygate {

PermitPool::PermitPool(std::size_t capacity)
    : capacity_(capacity), available_(capacity)
{}

bool PermitPool::tryAcquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (available_ > 0 && waiters_.empty()) {
        --available_;
        return true;
    }
    if (timeout.count() <= 0) {
        return false;
    }

    auto waiter = std::make_shared<Waiter>();
    waiters_.push_back(waiter);
    cv_.wait_for(lock, timeout, [&waiter] { return waiter->granted; });

    if (waiter->granted) {
        return true;
    }
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    return false;
}

void PermitPool::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (waiters_.empty()) {
            if (available_ < capacity_) {
                ++available_;
            }
            return;
        }
        waiters_.front()->granted = true;
        waiters_.pop_front();
    }
    cv_.notify_all();
}

std::size_t PermitPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

std::size_t PermitPool::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

Permit::Permit(PermitPool* pool, std::function<void()> on_release)
    : pool_(pool), on_release_(std::move(on_release)), released_(false)
{}

Permit::~Permit() {
    release();
}

Permit::Permit(Permit&& other) noexcept
    : pool_(other.pool_), on_release_(std::move(other.on_release_)), released_(other.released_.exchange(true))
{
    other.pool_ = nullptr;
}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        on_release_ = std::move(other.on_release_);
        released_.store(other.released_.exchange(true));
        other.pool_ = nullptr;
    }
    return *this;
}

bool Permit::release() {
    if (released_.exchange(true)) {
        return false;
    }
    if (pool_) {
        pool_->release();
    }
    if (on_release_) {
        on_release_();
    }
    return true;
}

AdmissionController::AdmissionController(const SecurityConfig& security, const BackpressureConfig& backpressure)
    : security_enabled(security.enabled),
      network_filter(security.allowed_networks),
      authenticator(security),
      acquire_timeout(backpressure.acquire_timeout),
      request_timeout(backpressure.request_timeout),
      retry_after_seconds(backpressure.retry_after_seconds)
{
    if (backpressure.enabled) {
        pool = std::make_unique<PermitPool>(static_cast<std::size_t>(backpressure.max_concurrent_requests));
    }

    CROW_LOG_INFO << "Admission: security " << (security_enabled ? "enabled" : "disabled")
                  << ", concurrency limit "
                  << (pool ? std::to_string(pool->capacity()) : std::string("unbounded"))
                  << ", request timeout " << request_timeout.count() << " ms";
}

Result<Permit> AdmissionController::admit(const GatewayRequest& request) {
    if (security_enabled) {
        const auto address = NetworkFilter::clientAddress(request);
        if (!network_filter.isAllowed(address)) {
            ++rejected_network;
            notifyRejected(ErrorCategory::NetworkDenied);
            CROW_LOG_WARNING << "Rejected " << request.method << " " << request.path
                             << " from disallowed address " << address;
            return Error::NetworkDenied(address);
        }

        if (!authenticator.authenticate(request)) {
            ++rejected_auth;
            notifyRejected(ErrorCategory::AuthFailed);
            CROW_LOG_WARNING << "Rejected " << request.method << " " << request.path
                             << " from " << address << ": invalid or missing API key";
            return Error::AuthFailed("Invalid or missing API key");
        }
    }

    if (pool && !pool->tryAcquire(acquire_timeout)) {
        ++rejected_capacity;
        notifyRejected(ErrorCategory::AdmissionRejected);
        CROW_LOG_WARNING << "Rejected " << request.method << " " << request.path
                         << ": " << pool->capacity() << " requests already in flight";
        return Error::AdmissionRejected(retry_after_seconds);
    }

    ++active;
    ++admitted;
    if (observer.onAdmitted) {
        observer.onAdmitted();
    }

    return Permit(pool.get(), [this] {
        --active;
        if (observer.onReleased) {
            observer.onReleased();
        }
    });
}

bool AdmissionController::checkNetwork(const GatewayRequest& request) const {
    if (!security_enabled) {
        return true;
    }
    return network_filter.isAllowed(NetworkFilter::clientAddress(request));
}

void AdmissionController::recordTimeout() {
    ++timed_out;
    if (observer.onTimeout) {
        observer.onTimeout();
    }
}

void AdmissionController::setObserver(AdmissionObserver observer) {
    this->observer = std::move(observer);
}

AdmissionStats AdmissionController::stats() const {
    AdmissionStats stats;
    stats.active = active.load();
    stats.admitted = admitted.load();
    stats.rejected_capacity = rejected_capacity.load();
    stats.rejected_network = rejected_network.load();
    stats.rejected_auth = rejected_auth.load();
    stats.timed_out = timed_out.load();
    stats.bounded = pool != nullptr;
    stats.capacity = pool ? pool->capacity() : 0;
    return stats;
}

void AdmissionController::notifyRejected(ErrorCategory category) {
    if (observer.onRejected) {
        observer.onRejected(category);
    }
}

} // namespace querygate
