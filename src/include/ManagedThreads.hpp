#pragma once

#include <absl/log/log.h>
#include <fmt/format.h>
#include <fruit/macro.h>

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

struct ThreadRunner;

// Owns the long running threads of a process and stops them together.
class ThreadManager {
   public:
    enum class Usage { UPLOAD_SERVER_THREAD, UPLOAD_REAPER_THREAD, MAX };

    INJECT(ThreadManager()) = default;
    ~ThreadManager() { destroy(); }

    /**
     * @brief Constructs a runner for `usage`, without starting it.
     *
     * @return the runner, owned by this manager, or nullptr if `usage` is
     * taken or the manager was already destroyed.
     */
    template <std::derived_from<ThreadRunner> T, typename... Args>
        requires std::is_constructible_v<T, Args...>
    T* create(Usage usage, Args&&... args);

    template <std::derived_from<ThreadRunner> T>
    T* get(Usage usage);

    // Requests every runner to stop and waits for their threads to return.
    // Safe to call more than once.
    void destroy();

   private:
    friend struct ThreadRunner;
    void threadStarted();
    void threadExited();

    // Declared before the runners, which must be joined first
    std::mutex activeLock;
    std::condition_variable activeCv;
    int activeThreads = 0;

    std::shared_mutex mControllerLock;
    std::unordered_map<Usage, std::unique_ptr<ThreadRunner>> kControllers;
    std::stop_source stopSource;
    bool destroyed = false;
};

template <>
struct fmt::formatter<ThreadManager::Usage> : formatter<std::string_view> {
    // parse is inherited from formatter<string_view>.
    auto format(ThreadManager::Usage c,
                format_context& ctx) const -> format_context::iterator {
        string_view name = "unknown";
        switch (c) {
            case ThreadManager::Usage::UPLOAD_SERVER_THREAD:
                name = "UPLOAD_SERVER_THREAD";
                break;
            case ThreadManager::Usage::UPLOAD_REAPER_THREAD:
                name = "UPLOAD_REAPER_THREAD";
                break;
            default:
                LOG(ERROR) << "Unknown usage: " << static_cast<int>(c);
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

// A long running job on its own thread, stopped through its manager.
struct ThreadRunner {
    ThreadRunner() = default;
    virtual ~ThreadRunner() = default;

    ThreadRunner(const ThreadRunner&) = delete;
    ThreadRunner& operator=(const ThreadRunner&) = delete;

    // Starts runFunction() on a new thread.
    void run();

    [[nodiscard]] bool running() const noexcept { return isRunning; }

   protected:
    // The main thread function. Expected to return once `token` is stopped.
    virtual void runFunction(const std::stop_token& token) = 0;

    // Called from the stopping thread to wake runFunction() up.
    virtual void onPreStop() {}

   private:
    friend class ThreadManager;
    void threadFunction();

    ThreadManager* manager = nullptr;
    ThreadManager::Usage usage = ThreadManager::Usage::MAX;
    std::stop_token stopToken;
    std::jthread threadP;
    std::atomic_bool isRunning = false;
};

template <std::derived_from<ThreadRunner> T, typename... Args>
    requires std::is_constructible_v<T, Args...>
T* ThreadManager::create(Usage usage, Args&&... args) {
    std::lock_guard<std::shared_mutex> lock(mControllerLock);
    if (destroyed) {
        LOG(ERROR) << fmt::format("MGR: Not starting {}, already destroyed",
                                  usage);
        return nullptr;
    }
    if (kControllers.contains(usage)) {
        LOG(ERROR) << fmt::format("MGR: {} has already started", usage);
        return nullptr;
    }

    LOG(INFO) << fmt::format("MGR: Starting {}...", usage);
    auto newIt = std::make_unique<T>(std::forward<Args>(args)...);
    T* result = newIt.get();
    ThreadRunner& runner = *newIt;
    runner.manager = this;
    runner.usage = usage;
    runner.stopToken = stopSource.get_token();
    kControllers[usage] = std::move(newIt);
    return result;
}

template <std::derived_from<ThreadRunner> T>
T* ThreadManager::get(Usage usage) {
    std::shared_lock<std::shared_mutex> lock(mControllerLock);
    auto it = kControllers.find(usage);
    if (it == kControllers.end()) {
        DLOG(INFO) << fmt::format("MGR: {} is not created", usage);
        return nullptr;
    }
    auto* runner = dynamic_cast<T*>(it->second.get());
    if (runner == nullptr) {
        LOG(ERROR) << fmt::format("MGR: {} holds a different runner type",
                                  usage);
    }
    return runner;
}
