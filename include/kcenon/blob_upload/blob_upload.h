/**
 * @file blob_upload.h
 * @brief Main header for the blob_upload library
 * @version 0.1.0
 *
 * Include this header to access the chunked upload engine, the Azure
 * destination and the worker pool adapters.
 *
 * @code
 * #include <kcenon/blob_upload/blob_upload.h>
 *
 * using namespace kcenon::blob_upload;
 *
 * auto config = engine_config::from_environment().value();
 * auto pool = adapters::chunk_pool_factory::create(config.worker_count,
 *                                                  config.queue_capacity);
 * upload_engine engine(config, std::make_shared<pacer>(config.bytes_per_second));
 *
 * auto manager = std::make_shared<transfer_manager>(info, pool);
 * auto started = engine.start(manager, destination);
 * auto status = manager->wait();
 * @endcode
 */

#ifndef KCENON_BLOB_UPLOAD_BLOB_UPLOAD_H
#define KCENON_BLOB_UPLOAD_BLOB_UPLOAD_H

#include <cstdint>
#include <string>

// Core
#include "kcenon/blob_upload/core/types.h"
#include "kcenon/blob_upload/core/engine_config.h"
#include "kcenon/blob_upload/core/logging.h"
#include "kcenon/blob_upload/core/pacer.h"
#include "kcenon/blob_upload/core/source_mapping.h"

// Destination
#include "kcenon/blob_upload/cloud/azure_blob_destination.h"
#include "kcenon/blob_upload/cloud/cloud_http_client.h"

// Transfer
#include "kcenon/blob_upload/transfer/transfer_manager.h"
#include "kcenon/blob_upload/transfer/upload_engine.h"

// Adapters
#include "kcenon/blob_upload/adapters/thread_pool_adapter.h"

namespace kcenon::blob_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_BLOB_UPLOAD_H
