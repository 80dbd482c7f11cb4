#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace querygate {

/**
 * Polls configuration files for modification and triggers a reload.
 *
 * Every detected change pushes the debounce deadline forward, so a burst
 * of writes produces exactly one callback once the files have been quiet
 * for the debounce interval. Watched directories contribute their *.yaml
 * and *.yml entries; files that appear or vanish count as changes.
 */
class ConfigWatcher {
public:
    using Clock = std::chrono::steady_clock;

    ConfigWatcher(std::vector<std::filesystem::path> watched_paths,
                  std::chrono::milliseconds poll_interval,
                  std::chrono::milliseconds debounce,
                  std::function<void()> on_change);
    ~ConfigWatcher();

    void start();
    void stop();
    bool isRunning() const { return running; }

    // Scan once; fires the callback when a pending change has settled
    bool poll(Clock::time_point now);

    // Record a change observed at the given time
    void notifyChange(Clock::time_point now);

    bool hasPendingChange() const;
    std::size_t reloadCount() const { return reload_count; }

private:
    using Snapshot = std::map<std::filesystem::path, std::filesystem::file_time_type>;

    Snapshot takeSnapshot() const;
    void workerLoop();

    std::vector<std::filesystem::path> watched_paths;
    std::chrono::milliseconds poll_interval;
    std::chrono::milliseconds debounce;
    std::function<void()> on_change;

    Snapshot last_snapshot;
    std::optional<Clock::time_point> deadline;
    mutable std::mutex state_mutex;

    std::atomic<bool> running;
    std::atomic<std::size_t> reload_count{0};
    std::thread worker_thread;
    std::mutex mutex;
    std::condition_variable cv;
};

} // namespace querygate
