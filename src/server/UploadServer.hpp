#pragma once

// clang-format off
#include <climits>
#include <httplib.h>
// clang-format on

#include <absl/status/status.h>

#include <ManagedThreads.hpp>
#include <atomic>
#include <chrono>
#include <string>

#include "ChunkReceiver.hpp"
#include "ReassemblyService.hpp"
#include "RegistrationService.hpp"

namespace ChunkXfer::Server {

// HTTP front of the upload protocol.
class UploadServerBase {
   public:
    struct Listen {
        std::string address;
        // 0 lets the kernel pick one, see bindToPort()
        int port;
        std::chrono::seconds timeout;
    };

    UploadServerBase(Listen listen, RegistrationService* registration,
                     const ChunkReceiver* receiver,
                     ReassemblyService* reassembly);

    /**
     * @brief Binds the listening socket without accepting connections yet.
     *
     * @return the bound port, or -1 on failure.
     */
    int bindToPort();

    // Serves requests until stopServer(). Binds first if needed.
    bool startServer();
    void stopServer();

    // Blocks until startServer() accepts connections.
    void waitUntilReady() const { svr.wait_until_ready(); }

    // True while the listen loop accepts connections.
    [[nodiscard]] bool listening() const { return svr.is_running(); }

    [[nodiscard]] int port() const { return boundPort; }

    static void loggerFn(const httplib::Request &req,
                         const httplib::Response &res);

    // Sends a status back as a plain text body.
    static void reply(httplib::Response &res, const absl::Status &status);

    struct Callbacks {
        void handleRegister(const httplib::Request &req,
                            httplib::Response &res) const;
        void handleUploadChunk(const httplib::Request &req,
                               httplib::Response &res,
                               const httplib::ContentReader &reader) const;
        void handleComplete(const httplib::Request &req,
                            httplib::Response &res) const;
        static void handleWrongMethod(const httplib::Request &req,
                                      httplib::Response &res);
        explicit Callbacks(UploadServerBase *server) : server(server) {}

       private:
        UploadServerBase *server;
    } callback;

   private:
    void installRoutes();

    Listen listen;
    int boundPort = -1;
    httplib::Server svr;
    RegistrationService *registration;
    const ChunkReceiver *receiver;
    ReassemblyService *reassembly;
};

class UploadServer : public ThreadRunner, public UploadServerBase {
   public:
    using UploadServerBase::UploadServerBase;
    ~UploadServer() override = default;

   protected:
    void runFunction(const std::stop_token &token) override;
    void onPreStop() override;

   private:
    // Set while runFunction() may still enter or sit in the listen loop
    std::atomic_bool serving = false;
};

}  // namespace ChunkXfer::Server
