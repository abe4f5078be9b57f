#include "ServerComponent.hpp"

#include <Random.hpp>

#include "ChunkPlanner.hpp"
#include "ChunkReceiver.hpp"
#include "ChunkStorage.hpp"
#include "ReassemblyService.hpp"
#include "RegistrationService.hpp"

namespace ChunkXfer::Server {

namespace {

fruit::Component<fruit::Required<ServerConfig>, RandomBase, ChunkPlanner,
                 MetadataStore, RegistrationService>
getRegistrationComponent() {
    return fruit::createComponent()
        .bind<RandomBase, Random>()
        .bind<MetadataStore, InMemoryMetadataStore>()
        .registerProvider([](RandomBase* random, ServerConfig* config) {
            return ChunkPlanner(random, config->chunkBounds);
        })
        .registerProvider([](MetadataStore* store, RandomBase* random,
                             ChunkPlanner* planner) {
            return RegistrationService(store, random, planner);
        });
}

fruit::Component<fruit::Required<ServerConfig, MetadataStore>, ChunkStorage,
                 ChunkReceiver, CompletionLedger, ReassemblyService>
getStorageComponent() {
    return fruit::createComponent()
        .registerProvider([](ServerConfig* config) {
            return ChunkStorage(config->chunkDir);
        })
        .registerProvider(
            [](ChunkStorage* storage) { return ChunkReceiver(storage); })
        .registerProvider([](ServerConfig* config) {
            return new CompletionLedger(config->ledgerFile);
        })
        .registerProvider([](MetadataStore* store, ChunkStorage* storage,
                             CompletionLedger* ledger, ServerConfig* config) {
            return ReassemblyService(store, storage, ledger,
                                     config->outputDir);
        });
}

fruit::Component<fruit::Required<ThreadManager, ServerConfig,
                                 RegistrationService, ChunkReceiver,
                                 ReassemblyService, MetadataStore,
                                 ChunkStorage>,
                 WrapPtr<UploadServer>, WrapPtr<UploadReaper>>
getThreadsComponent() {
    return fruit::createComponent()
        .registerProvider(
            [](ThreadManager* threadManager, ServerConfig* config,
               RegistrationService* registration, ChunkReceiver* receiver,
               ReassemblyService* reassembly) -> WrapPtr<UploadServer> {
                return threadManager->create<UploadServer>(
                    ThreadManager::Usage::UPLOAD_SERVER_THREAD,
                    UploadServerBase::Listen{
                        .address = config->listenAddress,
                        .port = config->port,
                        .timeout = config->requestTimeout,
                    },
                    registration, receiver, reassembly);
            })
        .registerProvider([](ThreadManager* threadManager,
                             ServerConfig* config, MetadataStore* store,
                             ChunkStorage* storage) -> WrapPtr<UploadReaper> {
            return threadManager->create<UploadReaper>(
                ThreadManager::Usage::UPLOAD_REAPER_THREAD, store, storage,
                config->uploadLease, config->reaperInterval);
        });
}

}  // namespace

UploadServerComponent getUploadServerComponent(ServerConfig* config) {
    return fruit::createComponent()
        .install(getRegistrationComponent)
        .install(getStorageComponent)
        .install(getThreadsComponent)
        .bindInstance(*config);
}

}  // namespace ChunkXfer::Server
