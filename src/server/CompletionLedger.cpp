#include "CompletionLedger.hpp"

#include <absl/log/log.h>
#include <fmt/format.h>
#include <json/reader.h>
#include <json/writer.h>

#include <StructF.hpp>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace ChunkXfer::Server {

absl::StatusOr<Json::Value> CompletionLedger::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return Json::Value(Json::arrayValue);
    }
    std::ifstream stream(path_);
    if (!stream) {
        return absl::InternalError(
            fmt::format("Cannot read ledger {}", path_.string()));
    }
    std::stringstream content;
    content << stream.rdbuf();
    const auto text = content.str();
    // An empty file is what a crash before the first write leaves behind
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Json::Value(Json::arrayValue);
    }

    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(text, root)) {
        LOG(ERROR) << "Ledger " << path_ << " is corrupt: "
                   << reader.getFormattedErrorMessages();
        return absl::DataLossError(
            fmt::format("Ledger {} is corrupt", path_.string()));
    }
    if (!root.isArray()) {
        return absl::DataLossError(
            fmt::format("Ledger {} is not a JSON array", path_.string()));
    }
    return root;
}

absl::Status CompletionLedger::append(const CompletionRecord& record) {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto root = load();
    if (!root.ok()) {
        return root.status();
    }
    root->append(record.toJson());

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const auto text = Json::writeString(builder, *root) + "\n";

    auto tmpPath = path_;
    tmpPath += ".tmp";
    {
        F file;
        if (!file.open(tmpPath, F::Mode::Write) || !file.puts(text) ||
            !file.sync() || !file.close()) {
            std::error_code ec;
            std::filesystem::remove(tmpPath, ec);
            return absl::InternalError(
                fmt::format("Cannot write ledger {}", tmpPath.string()));
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmpPath, path_, ec);
    if (ec) {
        LOG(ERROR) << "Failed to replace ledger " << path_ << ": "
                   << ec.message();
        return absl::InternalError(
            fmt::format("Cannot replace ledger {}", path_.string()));
    }
    LOG(INFO) << fmt::format("Ledger {} now holds {} entries", path_.string(),
                             root->size());
    return absl::OkStatus();
}

absl::StatusOr<std::vector<CompletionRecord>> CompletionLedger::readAll()
    const {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto root = load();
    if (!root.ok()) {
        return root.status();
    }
    std::vector<CompletionRecord> records;
    records.reserve(root->size());
    for (const auto& node : *root) {
        auto record = CompletionRecord::fromJson(node);
        if (!record.ok()) {
            return absl::DataLossError(fmt::format(
                "Bad ledger entry in {}: {}", path_.string(),
                record.status().message()));
        }
        records.emplace_back(std::move(*record));
    }
    return records;
}

}  // namespace ChunkXfer::Server
