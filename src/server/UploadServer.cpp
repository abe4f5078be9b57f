#include "UploadServer.hpp"

#include <absl/log/log.h>
#include <fmt/format.h>

#include <api/DataStructures.hpp>
#include <api/HttpStatus.hpp>
#include <api/Routes.hpp>
#include <iomanip>
#include <mutex>
#include <thread>
#include <utility>

namespace ChunkXfer::Server {

namespace {
constexpr std::chrono::milliseconds kStopPollInterval(1);
}  // namespace

UploadServerBase::UploadServerBase(Listen listen,
                                   RegistrationService *registration,
                                   const ChunkReceiver *receiver,
                                   ReassemblyService *reassembly)
    : callback(this),
      listen(std::move(listen)),
      registration(registration),
      receiver(receiver),
      reassembly(reassembly) {
    installRoutes();
}

void UploadServerBase::loggerFn(const httplib::Request &req,
                                const httplib::Response &res) {
    LOG(INFO) << fmt::format("{} {} from {}:{} -> {}", req.method, req.path,
                             req.remote_addr, req.remote_port, res.status);
}

void UploadServerBase::reply(httplib::Response &res,
                             const absl::Status &status) {
    res.status = toHttpStatus(status);
    if (!status.ok()) {
        res.set_content(std::string(status.message()),
                        Routes::kTextContentType.data());
    }
}

void UploadServerBase::installRoutes() {
    const std::string registerNode(Routes::kRegisterNode);
    const std::string uploadPattern(Routes::kUploadChunkPattern);
    const std::string completePattern(Routes::kCompletePattern);

    svr.Post(registerNode,
             [this](const httplib::Request &req, httplib::Response &res) {
                 callback.handleRegister(req, res);
             });
    svr.Post(uploadPattern,
             [this](const httplib::Request &req, httplib::Response &res,
                    const httplib::ContentReader &reader) {
                 callback.handleUploadChunk(req, res, reader);
             });
    svr.Get(completePattern,
            [this](const httplib::Request &req, httplib::Response &res) {
                callback.handleComplete(req, res);
            });

    for (const auto &node : {registerNode, uploadPattern}) {
        svr.Get(node, Callbacks::handleWrongMethod);
        svr.Put(node, Callbacks::handleWrongMethod);
        svr.Delete(node, Callbacks::handleWrongMethod);
        svr.Patch(node, Callbacks::handleWrongMethod);
    }

    svr.set_read_timeout(listen.timeout.count(), 0);
    svr.set_write_timeout(listen.timeout.count(), 0);
    svr.set_logger(UploadServerBase::loggerFn);
}

int UploadServerBase::bindToPort() {
    if (boundPort > 0) {
        return boundPort;
    }
    if (listen.port == 0) {
        boundPort = svr.bind_to_any_port(listen.address);
    } else if (svr.bind_to_port(listen.address, listen.port)) {
        boundPort = listen.port;
    } else {
        boundPort = -1;
    }
    if (boundPort < 0) {
        LOG(ERROR) << fmt::format("Failed to bind {}:{}", listen.address,
                                  listen.port);
    } else {
        LOG(INFO) << fmt::format("Upload server bound to {}:{}",
                                 listen.address, boundPort);
    }
    return boundPort;
}

bool UploadServerBase::startServer() {
    if (bindToPort() < 0) {
        return false;
    }
    return svr.listen_after_bind();
}

void UploadServerBase::stopServer() { svr.stop(); }

void UploadServerBase::Callbacks::handleRegister(const httplib::Request &req,
                                                 httplib::Response &res) const {
    auto info = FileInfo::fromJson(req.body);
    if (!info.ok()) {
        LOG(WARNING) << "Invalid registration: " << info.status().message();
        reply(res, info.status());
        return;
    }
    auto metadata = server->registration->registerFile(*info);
    if (!metadata.ok()) {
        reply(res, metadata.status());
        return;
    }
    res.status = httplib::StatusCode::OK_200;
    res.set_content(toCompactString(metadata->toJson()),
                    Routes::kJsonContentType.data());
}

void UploadServerBase::Callbacks::handleUploadChunk(
    const httplib::Request &req, httplib::Response &res,
    const httplib::ContentReader &reader) const {
    bool consumed = false;
    const auto status = server->receiver->receive(
        req.matches[1].str(), req.matches[2].str(),
        req.get_header_value(Routes::kChunkHashHeader.data()),
        [&reader, &consumed](const ContentSink &sink) {
            consumed = true;
            return reader(sink);
        });
    if (!consumed) {
        // Drain the body so the connection stays usable
        (void)reader([](const char * /*data*/, size_t /*length*/) {
            return true;
        });
    }
    if (!status.ok()) {
        LOG(WARNING) << fmt::format("Chunk {} of {} failed: {}",
                                    req.matches[2].str(), req.matches[1].str(),
                                    status.message());
    }
    reply(res, status);
}

void UploadServerBase::Callbacks::handleComplete(const httplib::Request &req,
                                                 httplib::Response &res) const {
    const auto id = req.matches[1].str();
    if (!ChunkReceiver::isValidId(id)) {
        reply(res, absl::InvalidArgumentError(
                       fmt::format("Invalid upload id '{}'", id)));
        return;
    }
    reply(res, server->reassembly->complete(id).status());
}

void UploadServerBase::Callbacks::handleWrongMethod(
    const httplib::Request &req, httplib::Response &res) {
    res.status = httplib::StatusCode::MethodNotAllowed_405;
    res.set_content(fmt::format("{} is not allowed on {}", req.method,
                                req.path),
                    Routes::kTextContentType.data());
}

void UploadServer::runFunction(const std::stop_token &token) {
    serving = true;
    // A stop that came before this point found serving unset
    if (token.stop_requested()) {
        serving = false;
        return;
    }
    if (!startServer()) {
        LOG(ERROR) << "Upload server exited with an error";
    }
    serving = false;
}

void UploadServer::onPreStop() {
    // httplib ignores stop() until its listen loop is up
    while (serving) {
        if (listening()) {
            stopServer();
            return;
        }
        std::this_thread::sleep_for(kStopPollInterval);
    }
}

}  // namespace ChunkXfer::Server
