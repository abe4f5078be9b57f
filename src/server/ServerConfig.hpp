#pragma once

#include <absl/status/statusor.h>

#include <ConfigManager.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "ChunkPlanner.hpp"

namespace ChunkXfer::Server {

// Typed view of the upload server's configuration.
struct ServerConfig {
    std::string listenAddress = "0.0.0.0";
    int port = 8080;
    std::filesystem::path chunkDir = ".";
    std::filesystem::path outputDir = ".";
    std::filesystem::path ledgerFile = "fileInfoDB.json";
    ChunkBounds chunkBounds{.min = 100 * 1024, .max = 4 * 1024 * 1024};
    std::chrono::seconds uploadLease{24 * 60 * 60};
    std::chrono::seconds reaperInterval{5 * 60};
    std::chrono::seconds requestTimeout{60};
    std::optional<std::filesystem::path> logFile;

    /**
     * @brief Reads every server setting, falling back to the defaults above.
     *
     * @return InvalidArgument naming the first setting that doesn't parse or
     * is out of range.
     */
    static absl::StatusOr<ServerConfig> fromConfigManager(
        ConfigManager* manager);
};

}  // namespace ChunkXfer::Server
