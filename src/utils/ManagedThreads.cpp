#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ManagedThreads.hpp>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <stop_token>

namespace {

constexpr std::chrono::seconds kShutdownDelay(5);

}  // namespace

void ThreadRunner::run() {
    if (manager == nullptr) {
        LOG(ERROR) << "Runner wasn't created by a ThreadManager";
        return;
    }
    if (threadP.joinable()) {
        LOG(WARNING) << fmt::format("{} is already running", usage);
        return;
    }
    // Counted before the thread exists, so destroy() always waits for it
    manager->threadStarted();
    isRunning = true;
    threadP = std::jthread(&ThreadRunner::threadFunction, this);
}

void ThreadRunner::threadFunction() {
    DLOG(INFO) << fmt::format("{} started", usage);
    {
        std::stop_callback callback(stopToken, [this] { onPreStop(); });
        if (!stopToken.stop_requested()) {
            runFunction(stopToken);
        }
        if (!stopToken.stop_requested()) {
            LOG(WARNING) << fmt::format("{} has stopped before stop request",
                                        usage);
        }
    }
    isRunning = false;
    DLOG(INFO) << fmt::format("{} exited", usage);
    manager->threadExited();
}

void ThreadManager::threadStarted() {
    const std::lock_guard<std::mutex> lock(activeLock);
    ++activeThreads;
}

void ThreadManager::threadExited() {
    const std::lock_guard<std::mutex> lock(activeLock);
    --activeThreads;
    activeCv.notify_all();
}

void ThreadManager::destroy() {
    {
        const std::lock_guard<std::shared_mutex> lock(mControllerLock);
        if (destroyed) {
            return;
        }
        destroyed = true;
    }
    LOG(INFO) << "Requested stop, now waiting...";
    stopSource.request_stop();

    std::unique_lock<std::mutex> lock(activeLock);
    if (!activeCv.wait_for(lock, kShutdownDelay,
                           [this] { return activeThreads == 0; })) {
        LOG(ERROR) << fmt::format(
            "Timed out waiting for {} threads to finish (waited {})",
            activeThreads, kShutdownDelay);
        return;
    }
    LOG(INFO) << "All threads stopped";
}
