#include "ServerConfig.hpp"

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <fmt/format.h>

#include <TryParseStr.hpp>
#include <limits>

namespace ChunkXfer::Server {

namespace {

using Configs = ConfigManager::Configs;

// Leaves *out alone if the setting is absent.
template <typename T>
absl::Status readNumber(ConfigManager* manager, Configs config, T min, T max,
                        T* out) {
    const auto value = manager->get(config);
    if (!value) {
        return absl::OkStatus();
    }
    T parsed{};
    if (!try_parse(*value, &parsed) || parsed < min || parsed > max) {
        return absl::InvalidArgumentError(
            fmt::format("{}: '{}' is not a number in [{}, {}]",
                        ConfigManager::nameOf(config), *value, min, max));
    }
    *out = parsed;
    return absl::OkStatus();
}

absl::Status readSeconds(ConfigManager* manager, Configs config,
                         std::chrono::seconds* out) {
    auto count = static_cast<int64_t>(out->count());
    auto status = readNumber<int64_t>(manager, config, 1,
                                      std::numeric_limits<int32_t>::max(),
                                      &count);
    *out = std::chrono::seconds(count);
    return status;
}

}  // namespace

absl::StatusOr<ServerConfig> ServerConfig::fromConfigManager(
    ConfigManager* manager) {
    ServerConfig config;

    if (auto value = manager->get(Configs::LISTEN_ADDRESS); value) {
        config.listenAddress = *value;
    }
    if (auto value = manager->get(Configs::CHUNK_DIR); value) {
        config.chunkDir = *value;
    }
    if (auto value = manager->get(Configs::OUTPUT_DIR); value) {
        config.outputDir = *value;
    }
    if (auto value = manager->get(Configs::LEDGER_FILE); value) {
        config.ledgerFile = *value;
    }
    if (auto value = manager->get(Configs::LOG_FILE); value) {
        config.logFile = *value;
    }

    for (const auto& status : {
             readNumber<int>(manager, Configs::PORT, 0, 65535, &config.port),
             readNumber<FileSize>(manager, Configs::MIN_CHUNK_SIZE, 1,
                                  std::numeric_limits<uint32_t>::max(),
                                  &config.chunkBounds.min),
             readNumber<FileSize>(manager, Configs::MAX_CHUNK_SIZE, 1,
                                  std::numeric_limits<uint32_t>::max(),
                                  &config.chunkBounds.max),
             readSeconds(manager, Configs::UPLOAD_LEASE, &config.uploadLease),
             readSeconds(manager, Configs::REAPER_INTERVAL,
                         &config.reaperInterval),
             readSeconds(manager, Configs::REQUEST_TIMEOUT,
                         &config.requestTimeout),
         }) {
        if (!status.ok()) {
            return status;
        }
    }

    if (config.chunkBounds.min > config.chunkBounds.max) {
        return absl::InvalidArgumentError(
            fmt::format("MIN_CHUNK_SIZE ({}) exceeds MAX_CHUNK_SIZE ({})",
                        config.chunkBounds.min, config.chunkBounds.max));
    }
    if (config.listenAddress.empty()) {
        return absl::InvalidArgumentError("LISTEN_ADDRESS is empty");
    }
    return config;
}

}  // namespace ChunkXfer::Server
