#pragma once

#include <absl/log/log_entry.h>
#include <absl/log/log_sink.h>

#include <StructF.hpp>
#include <filesystem>
#include <mutex>

// Appends formatted log lines to a file.
struct LogFileSink : public absl::LogSink {
    LogFileSink() = default;
    ~LogFileSink() override = default;

    F::Result open(const std::filesystem::path& filename) {
        std::lock_guard<std::mutex> lock(mutex);
        return file.open(filename, F::Mode::Append);
    }

    void Send(const absl::LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex);
        // Never log from here, it would recurse into this sink
        (void)file.puts(entry.text_with_prefix_and_newline());
    }

    void Flush() override {
        std::lock_guard<std::mutex> lock(mutex);
        (void)file.flush();
    }

   private:
    std::mutex mutex;
    F file;
};
