#include <absl/log/log.h>

#include <TryParseStr.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "ChunkedUploader.hpp"
#include "UploadEndpoint.hpp"

namespace {

constexpr std::chrono::seconds kTimeout(60);

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <file_path> <server_ip> <server_port>"
              << std::endl;
}

}  // namespace

int app_main(int argc, char** argv) {
    if (argc != 4) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }
    const std::filesystem::path filePath = argv[1];
    const std::string host = argv[2];
    int port = 0;
    if (!try_parse(argv[3], &port) || port <= 0 || port > 65535) {
        LOG(ERROR) << "Invalid port: " << argv[3];
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    ChunkXfer::Client::HttpUploadEndpoint endpoint(host, port, kTimeout);
    ChunkXfer::Client::ChunkedUploader uploader(&endpoint);
    auto result = uploader.upload(filePath);
    if (!result.ok()) {
        LOG(ERROR) << "Upload of " << filePath
                   << " failed: " << result.status();
        return EXIT_FAILURE;
    }
    std::cout << "Uploaded " << filePath.string() << " as " << result->id
              << std::endl;
    return EXIT_SUCCESS;
}
