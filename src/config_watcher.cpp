#include "config_watcher.hpp"

#include <algorithm>
#include <crow/logging.h>

namespace querygate {

namespace {

bool isYamlFile(const std::filesystem::path& path) {
    auto extension = path.extension().string();
    return extension == ".yaml" || extension == ".yml";
}

} // namespace

ConfigWatcher::ConfigWatcher(std::vector<std::filesystem::path> watched_paths,
                             std::chrono::milliseconds poll_interval,
                             std::chrono::milliseconds debounce,
                             std::function<void()> on_change)
    : watched_paths(std::move(watched_paths)),
      poll_interval(poll_interval),
      debounce(debounce),
      on_change(std::move(on_change)),
      running(false)
{
    last_snapshot = takeSnapshot();
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::start() {
    if (!running.exchange(true)) {
        CROW_LOG_INFO << "Watching " << watched_paths.size() << " configuration locations every "
                      << poll_interval.count() << " ms";
        worker_thread = std::thread(&ConfigWatcher::workerLoop, this);
    }
}

void ConfigWatcher::stop() {
    bool was_running = false;
    {
        // Under the lock so the worker cannot miss the wakeup between its check and wait
        std::lock_guard<std::mutex> lock(mutex);
        was_running = running.exchange(false);
    }
    if (was_running) {
        cv.notify_one();
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
        CROW_LOG_INFO << "Configuration watcher stopped";
    }
}

void ConfigWatcher::notifyChange(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(state_mutex);
    deadline = now + debounce;
}

bool ConfigWatcher::hasPendingChange() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return deadline.has_value();
}

bool ConfigWatcher::poll(Clock::time_point now) {
    auto current = takeSnapshot();
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (current != last_snapshot) {
            last_snapshot = std::move(current);
            changed = true;
        }
    }
    if (changed) {
        CROW_LOG_DEBUG << "Configuration change detected, debouncing for " << debounce.count() << " ms";
        notifyChange(now);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!deadline || now < *deadline) {
            return false;
        }
        deadline.reset();
    }

    ++reload_count;
    CROW_LOG_INFO << "Configuration files changed, reloading";
    try {
        on_change();
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Configuration reload callback failed: " << e.what();
    }
    return true;
}

ConfigWatcher::Snapshot ConfigWatcher::takeSnapshot() const {
    Snapshot snapshot;
    std::error_code ec;

    for (const auto& path : watched_paths) {
        if (std::filesystem::is_directory(path, ec)) {
            for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
                if (entry.is_regular_file(ec) && isYamlFile(entry.path())) {
                    auto mtime = entry.last_write_time(ec);
                    if (!ec) {
                        snapshot[entry.path()] = mtime;
                    }
                }
            }
            continue;
        }

        auto mtime = std::filesystem::last_write_time(path, ec);
        if (!ec) {
            snapshot[path] = mtime;
        }
    }
    return snapshot;
}

void ConfigWatcher::workerLoop() {
    const auto interval = std::min(poll_interval, debounce.count() > 0 ? debounce : poll_interval);

    while (running) {
        poll(Clock::now());

        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, interval, [this] { return !running; });
    }
}

} // namespace querygate
