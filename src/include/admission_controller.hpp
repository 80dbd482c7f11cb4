#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "api_key_authenticator.hpp"
#include "config_manager.hpp"
#include "error.hpp"
#include "gateway_request.hpp"
#include "network_filter.hpp"

namespace querygate {

/**
 * Counting semaphore that hands permits to waiters in arrival order.
 *
 * A released permit goes straight to the oldest waiter instead of back to
 * the pool, so a newcomer can never overtake a thread that is already
 * waiting.
 */
class PermitPool {
public:
    explicit PermitPool(std::size_t capacity);

    // Waits up to timeout for a permit; zero means do not wait
    bool tryAcquire(std::chrono::milliseconds timeout);
    void release();

    std::size_t capacity() const { return capacity_; }
    std::size_t available() const;
    std::size_t waiting() const;

private:
    struct Waiter {
        bool granted = false;
    };

    const std::size_t capacity_;
    std::size_t available_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * Scoped hold on one admission permit.
 *
 * Released exactly once: by release(), by destruction, or not at all for a
 * moved-from Permit. Safe to release from a thread other than the acquirer.
 */
class Permit {
public:
    Permit() = default;
    Permit(PermitPool* pool, std::function<void()> on_release);
    ~Permit();

    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    // Returns true only for the call that actually released
    bool release();
    bool isHeld() const { return !released_.load(); }

private:
    PermitPool* pool_ = nullptr;
    std::function<void()> on_release_;
    std::atomic<bool> released_{true};
};

struct AdmissionStats {
    std::size_t active = 0;
    std::size_t admitted = 0;
    std::size_t rejected_capacity = 0;
    std::size_t rejected_network = 0;
    std::size_t rejected_auth = 0;
    std::size_t timed_out = 0;
    std::size_t capacity = 0;
    bool bounded = true;
};

// Hooks for instrumentation; all callbacks are optional
struct AdmissionObserver {
    std::function<void()> onAdmitted;
    std::function<void(ErrorCategory)> onRejected;
    std::function<void()> onReleased;
    std::function<void()> onTimeout;
};

/**
 * Front door for every gateway request.
 *
 * Checks run in order: network allow-list (403), API key (401), then a
 * permit from the pool (429 with Retry-After). The network and key checks
 * apply only when security is enabled; without backpressure the permit
 * pool is unbounded.
 */
class AdmissionController {
public:
    AdmissionController(const SecurityConfig& security, const BackpressureConfig& backpressure);

    Result<Permit> admit(const GatewayRequest& request);

    // Network check only, used by endpoints that skip authentication
    bool checkNetwork(const GatewayRequest& request) const;

    void recordTimeout();
    void setObserver(AdmissionObserver observer);

    AdmissionStats stats() const;
    std::chrono::milliseconds requestTimeout() const { return request_timeout; }

private:
    void notifyRejected(ErrorCategory category);

    bool security_enabled;
    NetworkFilter network_filter;
    ApiKeyAuthenticator authenticator;

    std::unique_ptr<PermitPool> pool;    // null when backpressure is disabled
    std::chrono::milliseconds acquire_timeout;
    std::chrono::milliseconds request_timeout;
    int retry_after_seconds;

    AdmissionObserver observer;

    std::atomic<std::size_t> active{0};
    std::atomic<std::size_t> admitted{0};
    std::atomic<std::size_t> rejected_capacity{0};
    std::atomic<std::size_t> rejected_network{0};
    std::atomic<std::size_t> rejected_auth{0};
    std::atomic<std::size_t> timed_out{0};
};

} // namespace querygate
