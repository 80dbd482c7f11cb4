#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include "admission_controller.hpp"
#include "test_utils.hpp"

using namespace querygate;
using namespace querygate::test;
using namespace std::chrono_literals;

namespace {

SecurityConfig securedConfig() {
    SecurityConfig config;
    config.api_keys = {"secret"};
    config.allowed_networks = {"127.0.0.1"};
    return config;
}

BackpressureConfig bounded(int capacity, std::chrono::milliseconds acquire = 0ms) {
    BackpressureConfig config;
    config.max_concurrent_requests = capacity;
    config.acquire_timeout = acquire;
    config.retry_after_seconds = 7;
    return config;
}

GatewayRequest authorizedRequest() {
    auto request = makeRequest("GET", "/api/users");
    request.headers.emplace("X-API-Key", "secret");
    return request;
}

} // namespace

TEST_CASE("PermitPool: capacity and release", "[admission][pool]") {
    PermitPool pool(2);
    REQUIRE(pool.tryAcquire(0ms));
    REQUIRE(pool.tryAcquire(0ms));
    REQUIRE_FALSE(pool.tryAcquire(0ms));
    REQUIRE(pool.available() == 0);

    pool.release();
    REQUIRE(pool.available() == 1);

    SECTION("Release never exceeds capacity") {
        pool.release();
        pool.release();
        REQUIRE(pool.available() == 2);
    }

    SECTION("Timed wait expires") {
        REQUIRE(pool.tryAcquire(0ms));
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(pool.tryAcquire(30ms));
        REQUIRE(std::chrono::steady_clock::now() - start >= 25ms);
        REQUIRE(pool.waiting() == 0);
    }
}

TEST_CASE("PermitPool: waiters are served in arrival order", "[admission][pool]") {
    PermitPool pool(1);
    REQUIRE(pool.tryAcquire(0ms));

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&, i] {
            if (pool.tryAcquire(5s)) {
                {
                    std::lock_guard<std::mutex> lock(order_mutex);
                    order.push_back(i);
                }
                pool.release();
            }
        });
        // Let each waiter enqueue before the next one starts
        while (pool.waiting() != static_cast<std::size_t>(i + 1)) {
            std::this_thread::sleep_for(1ms);
        }
    }

    SECTION("A newcomer cannot overtake queued waiters") {
        REQUIRE_FALSE(pool.tryAcquire(0ms));
    }

    pool.release();
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(order == std::vector<int>{0, 1, 2});
    REQUIRE(pool.available() == 1);
}

TEST_CASE("Permit releases exactly once", "[admission][permit]") {
    PermitPool pool(1);
    REQUIRE(pool.tryAcquire(0ms));
    int released = 0;

    {
        Permit permit(&pool, [&released] { ++released; });
        REQUIRE(permit.isHeld());

        Permit moved(std::move(permit));
        REQUIRE_FALSE(permit.isHeld());
        REQUIRE(moved.isHeld());

        REQUIRE(moved.release());
        REQUIRE_FALSE(moved.release());
        REQUIRE_FALSE(permit.release());
    }

    REQUIRE(released == 1);
    REQUIRE(pool.available() == 1);
}

TEST_CASE("AdmissionController: check order", "[admission]") {
    AdmissionController controller(securedConfig(), bounded(1));

    SECTION("Disallowed network is rejected before the key is checked") {
        auto request = makeRequest("GET", "/api/users");
        request.remote_address = "203.0.113.5";
        auto result = controller.admit(request);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().category == ErrorCategory::NetworkDenied);
        REQUIRE(result.error().http_status_code == 403);
        REQUIRE(controller.stats().rejected_network == 1);
        REQUIRE(controller.stats().rejected_auth == 0);
    }

    SECTION("Missing key is rejected before capacity is consumed") {
        auto result = controller.admit(makeRequest("GET", "/api/users"));
        REQUIRE_FALSE(result);
        REQUIRE(result.error().category == ErrorCategory::AuthFailed);
        REQUIRE(result.error().http_status_code == 401);
        REQUIRE(controller.admit(authorizedRequest()));
    }

    SECTION("Full pool yields 429 with Retry-After") {
        auto first = controller.admit(authorizedRequest());
        REQUIRE(first);
        REQUIRE(controller.stats().active == 1);

        auto second = controller.admit(authorizedRequest());
        REQUIRE_FALSE(second);
        REQUIRE(second.error().category == ErrorCategory::AdmissionRejected);
        REQUIRE(second.error().retry_after_seconds == 7);
        REQUIRE(controller.stats().rejected_capacity == 1);

        first->release();
        REQUIRE(controller.stats().active == 0);
        REQUIRE(controller.admit(authorizedRequest()));
    }
}

TEST_CASE("AdmissionController: security and backpressure switches", "[admission]") {
    SECTION("Disabled security skips network and key checks") {
        auto security = securedConfig();
        security.enabled = false;
        AdmissionController controller(security, bounded(1));

        auto request = makeRequest("GET", "/api/users");
        request.remote_address = "203.0.113.5";
        REQUIRE(controller.checkNetwork(request));
        REQUIRE(controller.admit(request));
    }

    SECTION("Disabled backpressure is unbounded") {
        auto backpressure = bounded(1);
        backpressure.enabled = false;
        AdmissionController controller(securedConfig(), backpressure);

        std::vector<Permit> permits;
        for (int i = 0; i < 20; ++i) {
            auto result = controller.admit(authorizedRequest());
            REQUIRE(result);
            permits.push_back(std::move(*result));
        }
        REQUIRE_FALSE(controller.stats().bounded);
        REQUIRE(controller.stats().active == 20);
    }
}

TEST_CASE("AdmissionController: observer and timeouts", "[admission]") {
    AdmissionController controller(securedConfig(), bounded(1));

    std::atomic<int> admitted{0};
    std::atomic<int> released{0};
    std::atomic<int> timeouts{0};
    std::vector<ErrorCategory> rejections;

    AdmissionObserver observer;
    observer.onAdmitted = [&] { ++admitted; };
    observer.onReleased = [&] { ++released; };
    observer.onTimeout = [&] { ++timeouts; };
    observer.onRejected = [&](ErrorCategory category) { rejections.push_back(category); };
    controller.setObserver(observer);

    {
        auto permit = controller.admit(authorizedRequest());
        REQUIRE(permit);
        REQUIRE_FALSE(controller.admit(authorizedRequest()));
    }
    REQUIRE_FALSE(controller.admit(makeRequest("GET", "/api/users")));
    controller.recordTimeout();

    REQUIRE(admitted == 1);
    REQUIRE(released == 1);
    REQUIRE(timeouts == 1);
    REQUIRE(controller.stats().timed_out == 1);
    REQUIRE(rejections == std::vector<ErrorCategory>{ErrorCategory::AdmissionRejected, ErrorCategory::AuthFailed});
}
