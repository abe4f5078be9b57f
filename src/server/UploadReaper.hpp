#pragma once

#include <ManagedThreads.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "ChunkStorage.hpp"
#include "MetadataStore.hpp"

namespace ChunkXfer::Server {

// Expires uploads that outlived their lease, along with their chunks.
class UploadReaper : public ThreadRunner {
   public:
    struct Result {
        size_t expiredUploads;
        size_t removedFiles;
    };

    UploadReaper(MetadataStore* store, const ChunkStorage* storage,
                 std::chrono::seconds lease, std::chrono::seconds interval)
        : store_(store),
          storage_(storage),
          lease_(lease),
          interval_(interval) {}
    ~UploadReaper() override = default;

    // One pass over the store and the chunk directory.
    Result sweep(MetadataStore::Clock::time_point now);

   protected:
    void runFunction(const std::stop_token& token) override;
    void onPreStop() override;

   private:
    MetadataStore* store_;
    const ChunkStorage* storage_;
    std::chrono::seconds lease_;
    std::chrono::seconds interval_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace ChunkXfer::Server
