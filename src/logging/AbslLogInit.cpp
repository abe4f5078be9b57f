#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/log/log_sink_registry.h>

#include <AbslLogInit.hpp>
#include <LogSinks.hpp>
#include <optional>

static std::optional<LogFileSink> sink;

void ChunkXfer_AbslLogInit() {
    absl::InitializeLog();
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
}

bool ChunkXfer_AbslLogToFile(const std::filesystem::path& filename) {
    ChunkXfer_AbslLogDeInit();
    sink.emplace();
    if (!sink->open(filename)) {
        sink.reset();
        LOG(ERROR) << "Couldn't open log file " << filename;
        return false;
    }
    absl::AddLogSink(&*sink);
    LOG(INFO) << "File " << filename << " added as logsink";
    return true;
}

void ChunkXfer_AbslLogDeInit() {
    if (!sink) {
        return;
    }
    absl::RemoveLogSink(&*sink);
    sink.reset();
}
