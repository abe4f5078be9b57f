#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "CommandLine.hpp"

// Server settings, looked up in the command line, then the environment
// (CHUNKXFER_<NAME>), then chunkxfer.ini in the working or home directory.
class ConfigManager {
   public:
    enum class Configs {
        LISTEN_ADDRESS,
        PORT,
        CHUNK_DIR,
        OUTPUT_DIR,
        LEDGER_FILE,
        MIN_CHUNK_SIZE,
        MAX_CHUNK_SIZE,
        UPLOAD_LEASE,
        REAPER_INTERVAL,
        REQUEST_TIMEOUT,
        LOG_FILE,
        HELP,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);

    // Environment variables are looked up as kEnvPrefix + name
    static constexpr std::string_view kEnvPrefix = "CHUNKXFER_";
    static constexpr std::string_view kConfigFile = "chunkxfer.ini";

    /**
     * @brief Value of a setting from the first backend that has it.
     *
     * Flags such as HELP yield an empty string when present.
     */
    std::optional<std::string> get(Configs config);

    // Prints the accepted command line options.
    static void serializeHelpToOStream(std::ostream& out);

    explicit ConfigManager(CommandLine line);

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';
        enum class Kind { Value, Flag };

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        Kind kind;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::LISTEN_ADDRESS,
            "LISTEN_ADDRESS",
            "Address to bind the upload server to",
            'a',
            Entry::Kind::Value,
        },
        {
            Configs::PORT,
            "PORT",
            "Port to bind the upload server to (0 picks a free port)",
            'p',
            Entry::Kind::Value,
        },
        {
            Configs::CHUNK_DIR,
            "CHUNK_DIR",
            "Directory holding received chunks until reassembly",
            Entry::ALIAS_NONE,
            Entry::Kind::Value,
        },
        {
            Configs::OUTPUT_DIR,
            "OUTPUT_DIR",
            "Directory receiving reassembled files",
            'o',
            Entry::Kind::Value,
        },
        {
            Configs::LEDGER_FILE,
            "LEDGER_FILE",
            "JSON ledger of completed uploads",
            Entry::ALIAS_NONE,
            Entry::Kind::Value,
        },
        {
            Configs::MIN_CHUNK_SIZE,
            "MIN_CHUNK_SIZE",
            "Lower bound of the chunk size in bytes",
            Entry::ALIAS_NONE,
            Entry::Kind::Value,
        },
        {
            Configs::MAX_CHUNK_SIZE,
            "MAX_CHUNK_SIZE",
            "Upper bound of the chunk size in bytes",
            Entry::ALIAS_NONE,
            Entry::Kind::Value,
        },
        {
            Configs::UPLOAD_LEASE,
            "UPLOAD_LEASE",
            "Seconds an upload may stay incomplete before it is reaped",
            Entry::ALIAS_NONE,
            Entry::Kind::Value,
        },
        {
            Configs::REAPER_INTERVAL,
            "REAPER_INTERVAL",
            "Seconds between two reaper sweeps",
            Entry::ALIAS_NONE,
            Entry::Kind::Value,
        },
        {
            Configs::REQUEST_TIMEOUT,
            "REQUEST_TIMEOUT",
            "Socket read/write timeout in seconds",
            Entry::ALIAS_NONE,
            Entry::Kind::Value,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "Log file path",
            'f',
            Entry::Kind::Value,
        },
        {
            Configs::HELP,
            "HELP",
            "Display help information",
            'h',
            Entry::Kind::Flag,
        },
    };

    [[nodiscard]] static constexpr std::string_view nameOf(Configs config) {
        return kConfigMap[static_cast<size_t>(config)].name;
    }

    // One source of settings. Backends that fail to load are dropped.
    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const std::string_view name) = 0;

        // Used for logging, "Cmdline", "Env" or "File".
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

   private:
    // In query order
    std::vector<std::unique_ptr<Backend>> backends;
};

static_assert(
    [] {
        for (size_t i = 0; i < ConfigManager::CONFIG_MAX; ++i) {
            if (ConfigManager::kConfigMap[i].config !=
                static_cast<ConfigManager::Configs>(i)) {
                return false;
            }
        }
        return true;
    }(),
    "kConfigMap must list every config once, in enum order");
