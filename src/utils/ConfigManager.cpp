#include <absl/log/log.h>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace {

using Entry = ConfigManager::Entry;

// "NAME" or "NAME,a", the spelling boost expects for --NAME and -a.
std::string optionSpelling(const Entry& entry) {
    if (entry.alias == Entry::ALIAS_NONE) {
        return std::string(entry.name);
    }
    return fmt::format("{},{}", entry.name, entry.alias);
}

// Settings that carry a value, accepted on the command line and in the file.
const po::options_description& valueOptions() {
    static const po::options_description desc = [] {
        po::options_description options("ChunkXfer Configs");
        for (const auto& entry : ConfigManager::kConfigMap) {
            if (entry.kind == Entry::Kind::Value) {
                options.add_options()(optionSpelling(entry).c_str(),
                                      po::value<std::string>(),
                                      entry.description.data());
            }
        }
        return options;
    }();
    return desc;
}

po::options_description commandLineOptions() {
    po::options_description options(valueOptions());
    for (const auto& entry : ConfigManager::kConfigMap) {
        if (entry.kind == Entry::Kind::Flag) {
            options.add_options()(optionSpelling(entry).c_str(),
                                  entry.description.data());
        }
    }
    return options;
}

// Base of the backends boost parses into a variables_map.
struct VariablesMapBackend : ConfigManager::Backend {
    std::optional<std::string> get(const std::string_view name) override {
        const auto it = vm.find(std::string(name));
        if (it == vm.end()) {
            return std::nullopt;
        }
        // Flags are stored without a value
        if (it->second.empty()) {
            return std::string();
        }
        return it->second.as<std::string>();
    }

   protected:
    po::variables_map vm;
};

struct CommandLineBackend : VariablesMapBackend {
    explicit CommandLineBackend(CommandLine line) : line(std::move(line)) {}

    bool load() override {
        // `chunkxfer_server 0.0.0.0 8080` works like the flag form
        po::positional_options_description positional;
        positional.add(ConfigManager::nameOf(ConfigManager::Configs::LISTEN_ADDRESS).data(), 1)
            .add(ConfigManager::nameOf(ConfigManager::Configs::PORT).data(), 1);
        try {
            po::store(po::command_line_parser(line.argc(), line.argv())
                          .options(commandLineOptions())
                          .positional(positional)
                          .run(),
                      vm);
        } catch (const po::error& e) {
            LOG(ERROR) << "Cannot parse the command line: " << e.what();
            return false;
        }
        po::notify(vm);
        DLOG(INFO) << "Command line set " << vm.size() << " options";
        return true;
    }

    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

   private:
    CommandLine line;
};

struct EnvBackend : ConfigManager::Backend {
    std::optional<std::string> get(const std::string_view name) override {
        const auto variable =
            fmt::format("{}{}", ConfigManager::kEnvPrefix, name);
        if (const char* value = std::getenv(variable.c_str());
            value != nullptr) {
            return value;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

struct FileBackend : VariablesMapBackend {
    bool load() override {
        std::vector<std::filesystem::path> candidates{
            ConfigManager::kConfigFile};
        if (const char* home = std::getenv("HOME"); home != nullptr) {
            candidates.emplace_back(std::filesystem::path(home) /
                                    ConfigManager::kConfigFile);
        }

        for (const auto& candidate : candidates) {
            std::ifstream stream(candidate);
            if (!stream) {
                continue;
            }
            try {
                po::store(po::parse_config_file(stream, valueOptions()), vm);
            } catch (const po::error& e) {
                LOG(ERROR) << "Cannot parse " << candidate << ": " << e.what();
                return false;
            }
            po::notify(vm);
            LOG(INFO) << "Loaded " << vm.size() << " settings from "
                      << candidate;
            return true;
        }
        DLOG(INFO) << "No " << ConfigManager::kConfigFile << " found";
        return false;
    }

    [[nodiscard]] std::string_view name() const override { return "File"; }
};

}  // namespace

ConfigManager::ConfigManager(CommandLine line) {
    std::unique_ptr<Backend> candidates[] = {
        std::make_unique<CommandLineBackend>(std::move(line)),
        std::make_unique<EnvBackend>(),
        std::make_unique<FileBackend>(),
    };
    for (auto& backend : candidates) {
        if (backend->load()) {
            backends.emplace_back(std::move(backend));
        }
    }
    DLOG(INFO) << "Loaded " << backends.size() << " config sources";
}

std::optional<std::string> ConfigManager::get(Configs config) {
    const auto name = nameOf(config);
    for (const auto& backend : backends) {
        if (auto value = backend->get(name); value) {
            DLOG(INFO) << fmt::format("{} taken from the {} backend", name,
                                      backend->name());
            return value;
        }
    }
    return std::nullopt;
}

void ConfigManager::serializeHelpToOStream(std::ostream& out) {
    out << commandLineOptions() << std::endl;
}
