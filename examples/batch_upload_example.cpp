/**
 * @file batch_upload_example.cpp
 * @brief Upload every file of a directory into one container
 *
 * Usage:
 *   batch_upload_example <directory> <connection-string> <container> [prefix]
 *
 * All transfers share one engine, one worker pool and one pacer; each file
 * becomes blob "<prefix><relative path>". Existing blobs are left alone.
 */

#include <kcenon/blob_upload/blob_upload.h>

#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace kcenon::blob_upload;

namespace {

struct pending_upload {
    std::filesystem::path source;
    std::shared_ptr<transfer_manager> manager;
};

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0]
                  << " <directory> <connection-string> <container> [prefix]\n";
        return 1;
    }

    std::filesystem::path root = argv[1];
    std::string connection_string = argv[2];
    std::string container = argv[3];
    std::string prefix = argc > 4 ? argv[4] : "";

    auto config = engine_config::from_environment();
    if (!config) {
        std::cerr << "Invalid engine settings: " << config.error().message << "\n";
        return 1;
    }

    auto http_client = make_cloud_http_client();
    auto pool = adapters::chunk_pool_factory::create(config.value().worker_count,
                                                     config.value().queue_capacity);
    upload_engine engine(config.value(),
                         std::make_shared<pacer>(config.value().bytes_per_second));

    std::vector<pending_upload> uploads;
    std::error_code ec;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        auto relative = std::filesystem::relative(entry.path(), root).generic_string();
        auto dest_config = azure_destination_config::from_connection_string(
            connection_string, container, prefix + relative);
        if (!dest_config) {
            std::cerr << relative << ": " << dest_config.error().message << "\n";
            continue;
        }
        auto destination = azure_blob_destination::create(dest_config.value(), http_client);
        if (!destination) {
            std::cerr << relative << ": " << destination.error().message << "\n";
            continue;
        }

        transfer_info info;
        info.source = entry.path();
        info.source_size = entry.file_size();
        info.destination = destination.value()->name();

        auto manager = std::make_shared<transfer_manager>(info, pool);
        auto started = engine.start(manager, destination.value());
        if (!started) {
            std::cerr << relative << ": " << started.error().message << "\n";
        }
        uploads.push_back({entry.path(), manager});
    }
    if (ec) {
        std::cerr << "Cannot list " << root << ": " << ec.message() << "\n";
    }

    std::map<transfer_status, int> totals;
    for (auto& upload : uploads) {
        auto status = upload.manager->wait();
        ++totals[status];
        std::cout << to_string(status) << "  " << upload.source.string() << "\n";
    }
    pool->shutdown();

    std::cout << "\n" << uploads.size() << " files:";
    for (const auto& [status, count] : totals) {
        std::cout << " " << to_string(status) << "=" << count;
    }
    std::cout << "\n";

    bool all_succeeded = totals.size() == 1 && totals.count(transfer_status::success) == 1;
    return uploads.empty() || all_succeeded ? 0 : 3;
}
