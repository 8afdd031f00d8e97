#include "usync/config/config.hpp"
#include "usync/core/logging.hpp"
#include "usync/sync/service.hpp"
#include "usync/transfer/transport.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json report_to_json(const usync::transfer::RunReport& report) {
    json j;
    j["session_id"] = report.session_id;
    j["outcome"] = usync::transfer::to_string(report.outcome);
    j["completed"] = report.completed;
    j["total"] = report.total;
    j["remaining"] = report.remaining;
    j["failures"] = json::array();
    for (const auto& failure : report.failures) {
        j["failures"].push_back({{"file_path", failure.file_path},
                                 {"segment_index", failure.segment_index},
                                 {"reason", failure.reason}});
    }
    return j;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-c config.json] <folder> <destination>\n";
}

} // namespace

// Publishes a folder over an in-process transport and downloads it again.
int main(int argc, char* argv[]) {
    std::string config_path;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 2;
    }

    usync::config::SyncConfig config;
    if (!config_path.empty()) {
        auto loaded = usync::config::load_config(config_path);
        if (loaded.is_error()) {
            std::cerr << usync::to_string(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (auto logging = usync::logging::configure(config.log_level); logging.is_error()) {
        std::cerr << usync::to_string(logging.error()) << "\n";
        return 1;
    }

    const fs::path source = fs::absolute(positional[0]);
    const fs::path destination = fs::absolute(positional[1]);
    spdlog::info("Effective config: {}", usync::config::to_json(config).dump());

    usync::transfer::MemoryTransport transport;
    auto created = usync::sync::SyncService::create(config, transport, destination.parent_path() / ".usync-staging");
    if (created.is_error()) {
        spdlog::error("Cannot start: {}", usync::to_string(created.error()));
        return 1;
    }
    auto& service = *created.value();

    const std::string folder_id = source.filename().string();
    if (auto folder = service.add_folder(folder_id, folder_id, source.string()); folder.is_error()) {
        spdlog::error("{}", usync::to_string(folder.error()));
        return 1;
    }
    auto indexed = service.index(folder_id);
    if (indexed.is_error()) {
        spdlog::error("Indexing failed: {}", usync::to_string(indexed.error()));
        return 1;
    }

    auto uploaded = service.upload(folder_id);
    if (uploaded.is_error()) {
        spdlog::error("Upload failed: {}", usync::to_string(uploaded.error()));
        return 1;
    }
    std::cout << report_to_json(uploaded.value()).dump(2) << "\n";
    if (uploaded.value().outcome != usync::transfer::RunOutcome::Succeeded) {
        return 1;
    }

    auto share = service.share(folder_id, usync::metadata::ShareType::Private, json{{"source", source.string()}});
    if (share.is_error()) {
        spdlog::error("Publishing failed: {}", usync::to_string(share.error()));
        return 1;
    }
    spdlog::info("Share token {}", share.value().token);

    auto downloaded = service.download(share.value().token, destination);
    if (downloaded.is_error()) {
        spdlog::error("Download failed: {}", usync::to_string(downloaded.error()));
        return 1;
    }
    std::cout << report_to_json(downloaded.value()).dump(2) << "\n";

    const auto& stats = service.stats();
    spdlog::info("{} packs ({} bytes) posted, {} segments downloaded", stats.packs_posted.load(),
                 stats.bytes_posted.load(), stats.segments_downloaded.load());
    return downloaded.value().outcome == usync::transfer::RunOutcome::Succeeded ? 0 : 1;
}
