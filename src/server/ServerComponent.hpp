#pragma once

#include <fruit/fruit.h>

#include <ManagedThreads.hpp>

#include "CompletionLedger.hpp"
#include "MetadataStore.hpp"
#include "ServerConfig.hpp"
#include "UploadReaper.hpp"
#include "UploadServer.hpp"

namespace ChunkXfer::Server {

// Non-owning handle to an object whose lifetime is managed elsewhere.
template <typename T>
class WrapPtr {
    T* ptr;

   public:
    WrapPtr(T* ptr) : ptr(ptr) {}

    T* pointer() const { return ptr; }
    T* operator->() { return pointer(); }
    operator bool() const { return pointer() != nullptr; }
};

using UploadServerComponent =
    fruit::Component<ThreadManager, MetadataStore, CompletionLedger,
                     ReassemblyService, WrapPtr<UploadServer>,
                     WrapPtr<UploadReaper>>;

/**
 * @brief Wires the upload server from its configuration.
 *
 * The server and reaper threads are owned by the ThreadManager. Call
 * ThreadManager::destroy() before the injector goes away, they use the
 * other objects of the graph.
 *
 * @param config must outlive the injector
 */
UploadServerComponent getUploadServerComponent(ServerConfig* config);

}  // namespace ChunkXfer::Server
