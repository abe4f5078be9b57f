#include <absl/log/log.h>
#include <fmt/format.h>
#include <fruit/fruit.h>
#include <pthread.h>

#include <AbslLogInit.hpp>
#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "ServerComponent.hpp"

using ChunkXfer::Server::ServerConfig;
using ChunkXfer::Server::UploadReaper;
using ChunkXfer::Server::UploadServer;
using ChunkXfer::Server::WrapPtr;

namespace {

bool createDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        LOG(ERROR) << "Cannot create " << path << ": " << ec.message();
        return false;
    }
    return true;
}

}  // namespace

int app_main(int argc, char** argv) {
    ConfigManager manager{CommandLine{argc, argv}};

    if (manager.get(ConfigManager::Configs::HELP)) {
        std::cout << "Usage: " << argv[0] << " [LISTEN_ADDRESS] [PORT] [options]"
                  << std::endl;
        ConfigManager::serializeHelpToOStream(std::cout);
        return EXIT_SUCCESS;
    }

    auto config = ServerConfig::fromConfigManager(&manager);
    if (!config.ok()) {
        LOG(ERROR) << "Invalid configuration: " << config.status().message();
        return EXIT_FAILURE;
    }
    if (config->logFile && !ChunkXfer_AbslLogToFile(*config->logFile)) {
        return EXIT_FAILURE;
    }
    if (!createDirectory(config->chunkDir) ||
        !createDirectory(config->outputDir)) {
        return EXIT_FAILURE;
    }

    // Block termination signals before any thread starts, so they all
    // inherit the mask and only sigwait() below sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    fruit::Injector<ThreadManager, ChunkXfer::Server::MetadataStore,
                    ChunkXfer::Server::CompletionLedger,
                    ChunkXfer::Server::ReassemblyService,
                    WrapPtr<UploadServer>, WrapPtr<UploadReaper>>
        injector(ChunkXfer::Server::getUploadServerComponent, &*config);

    auto threadManager = injector.get<ThreadManager*>();
    auto server = injector.get<WrapPtr<UploadServer>>();
    auto reaper = injector.get<WrapPtr<UploadReaper>>();
    if (!server || !reaper || server->bindToPort() < 0) {
        threadManager->destroy();
        return EXIT_FAILURE;
    }
    server->run();
    reaper->run();

    LOG(INFO) << fmt::format(
        "Serving uploads on {}:{}, chunks in {}, output in {}, ledger {}",
        config->listenAddress, server->port(), config->chunkDir.string(),
        config->outputDir.string(), config->ledgerFile.string());

    int signal = 0;
    if (sigwait(&signals, &signal) != 0) {
        PLOG(ERROR) << "sigwait failed";
    } else {
        LOG(INFO) << "Received signal " << signal << ", shutting down";
    }
    threadManager->destroy();
    return EXIT_SUCCESS;
}
