/**
 * @file upload_example.cpp
 * @brief Upload one file to an Azure blob and report progress
 *
 * Usage:
 *   upload_example <file> <blob-url-with-sas> [options]
 *
 * Options:
 *   --block-size <bytes>   chunk size (default: engine setting)
 *   --force                overwrite an existing blob
 *   --tier <name>          Hot, Cool, Archive, or P4 ... P80 for page blobs
 *   --page-blob            upload as a page blob regardless of extension
 *   --md5                  store Content-MD5
 *
 * Engine settings come from BLOB_UPLOAD_* environment variables.
 */

#include <kcenon/blob_upload/blob_upload.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace kcenon::blob_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_tiers(const std::string& name, blob_tiers& tiers) -> bool {
    static const std::pair<const char*, block_blob_tier> block[] = {
        {"Hot", block_blob_tier::hot},
        {"Cool", block_blob_tier::cool},
        {"Archive", block_blob_tier::archive},
    };
    for (const auto& [label, tier] : block) {
        if (name == label) {
            tiers.block = tier;
            return true;
        }
    }

    static const std::pair<const char*, page_blob_tier> page[] = {
        {"P4", page_blob_tier::p4},   {"P6", page_blob_tier::p6},
        {"P10", page_blob_tier::p10}, {"P15", page_blob_tier::p15},
        {"P20", page_blob_tier::p20}, {"P30", page_blob_tier::p30},
        {"P40", page_blob_tier::p40}, {"P50", page_blob_tier::p50},
        {"P60", page_blob_tier::p60}, {"P70", page_blob_tier::p70},
        {"P80", page_blob_tier::p80},
    };
    for (const auto& [label, tier] : page) {
        if (name == label) {
            tiers.page = tier;
            return true;
        }
    }
    return false;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <file> <blob-url-with-sas> [--block-size N] [--force] [--tier NAME]"
                 " [--page-blob] [--md5]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::filesystem::path source = argv[1];
    std::string url = argv[2];

    std::error_code ec;
    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        std::cerr << "Cannot read " << source << ": " << ec.message() << "\n";
        return 1;
    }

    transfer_info info;
    info.source = source;
    info.source_size = size;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--force") {
            info.force_write = true;
        } else if (arg == "--page-blob") {
            info.blob_type = blob_type_hint::page_blob;
        } else if (arg == "--md5") {
            info.put_md5 = true;
        } else if (arg == "--block-size" && i + 1 < argc) {
            info.block_size = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--tier" && i + 1 < argc) {
            if (!parse_tiers(argv[++i], info.tiers)) {
                std::cerr << "Unknown tier: " << argv[i] << "\n";
                return 1;
            }
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = engine_config::from_environment();
    if (!config) {
        std::cerr << "Invalid engine settings: " << config.error().message << "\n";
        return 1;
    }

    auto dest_config = azure_destination_config::from_url(url);
    if (!dest_config) {
        std::cerr << "Invalid destination: " << dest_config.error().message << "\n";
        return 1;
    }

    auto http_client = make_cloud_http_client(dest_config.value().timeout);
    if (!http_client->is_available()) {
        std::cerr << "Built without an HTTP transport; rebuild with network_system\n";
        return 1;
    }

    auto destination = azure_blob_destination::create(dest_config.value(), http_client);
    if (!destination) {
        std::cerr << "Cannot use destination: " << destination.error().message << "\n";
        return 1;
    }
    info.destination = destination.value()->name();

    auto pool = adapters::chunk_pool_factory::create(config.value().worker_count,
                                                     config.value().queue_capacity);
    auto limiter = std::make_shared<pacer>(config.value().bytes_per_second);
    upload_engine engine(config.value(), limiter);

    auto manager = std::make_shared<transfer_manager>(info, pool);

    std::cout << "Uploading " << source.filename().string() << " (" << format_bytes(size)
              << ") to " << info.destination << "\n";

    auto start_time = std::chrono::steady_clock::now();
    auto started = engine.start(manager, destination.value());
    if (!started) {
        std::cerr << "Upload aborted: " << started.error().message << "\n";
        manager->wait();
        pool->shutdown();
        return 2;
    }

    while (!manager->wait_for(std::chrono::milliseconds(500))) {
        auto done = manager->bytes_done();
        std::cout << "\r  " << format_bytes(done) << " / " << format_bytes(size) << "  ("
                  << manager->chunks_done() << "/" << manager->number_of_chunks()
                  << " chunks)" << std::flush;
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time);
    pool->shutdown();

    auto status = manager->status();
    std::cout << "\nFinished: " << to_string(status) << " in " << std::fixed
              << std::setprecision(1) << elapsed.count() << " s\n";

    return status == transfer_status::success ? 0 : 3;
}
