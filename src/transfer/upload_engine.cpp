/**
 * @file upload_engine.cpp
 * @brief Entry point that plans a transfer and schedules its chunks
 * @version 0.1.0
 */

#include "kcenon/blob_upload/transfer/upload_engine.h"

#include <string>

namespace kcenon::blob_upload {

upload_engine::upload_engine(engine_config config,
                             std::shared_ptr<pacer> limiter,
                             source_opener opener)
    : config_(config),
      planner_(config),
      limiter_(std::move(limiter)),
      opener_(std::move(opener)) {
    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(config_.min_log_level);
    logger.set_output_format(config_.json_log_output ? log_output_format::json
                                                     : log_output_format::text);
}

void upload_engine::finish_early(transfer_manager_interface& manager,
                                 transfer_status status,
                                 const error& cause) {
    manager.set_status(status);
    if (status != transfer_status::cancelled) {
        manager.log_upload_error(cause.message, cause.status_code);
    }
    manager.add_bytes_done(manager.info().source_size);
    manager.report_transfer_done();
}

auto upload_engine::start(std::shared_ptr<transfer_manager_interface> manager,
                          std::shared_ptr<blob_destination> destination) -> result<void> {
    if (!manager || !destination) {
        return unexpected{error{error_code::invalid_configuration,
                                "upload needs a transfer manager and a destination"}};
    }

    const auto& info = manager->info();
    const uint64_t source_size = info.source_size;

    transfer_log_context ctx;
    ctx.source = info.source.string();
    ctx.destination = info.destination;
    ctx.source_size = source_size;

    if (manager->was_cancelled()) {
        finish_early(*manager, transfer_status::cancelled,
                     error{error_code::transfer_cancelled});
        return {};
    }

    if (!info.force_write) {
        auto existing = destination->get_properties(manager->context());
        if (existing) {
            BU_LOG_INFO_CTX(log_category::engine,
                            "destination exists and overwrite is off", ctx);
            manager->set_status(transfer_status::blob_already_exists);
            manager->add_bytes_done(source_size);
            manager->report_transfer_done();
            return {};
        }
        if (!existing.error().is_not_found()) {
            finish_early(*manager, transfer_status::failed,
                         error{existing.error().code,
                               "checking destination: " + existing.error().message,
                               existing.error().status_code});
            return {};
        }
    }

    uint64_t chunk_size = info.block_size != 0 ? info.block_size : config_.block_size;
    bool sparse = is_sparse_eligible(info.source.filename().string(), source_size,
                                     info.blob_type, planner_.page_unit());

    auto planned = planner_.plan(source_size, chunk_size, sparse);
    if (!planned) {
        finish_early(*manager, transfer_status::failed, planned.error());
        return {};
    }
    auto plan = std::move(planned.value());

    auto consistent = chunk_planner::validate(plan);
    if (!consistent) {
        ctx.error_message = consistent.error().message;
        BU_LOG_FATAL_CTX(log_category::engine, "chunk plan is inconsistent", ctx);
        finish_early(*manager, transfer_status::failed, consistent.error());
        return unexpected{error{error_code::internal_consistency,
                                consistent.error().message}};
    }

    std::shared_ptr<source_mapping> mapping;
    if (source_size > 0) {
        auto opened = opener_(info.source, source_size);
        if (!opened) {
            finish_early(*manager, transfer_status::failed, opened.error());
            return {};
        }
        mapping = std::move(opened.value());
    }

    upload_session session;
    session.manager = manager;
    session.destination = std::move(destination);
    session.limiter = limiter_;
    session.properties = manager->destination_headers_and_metadata(mapping.get());
    session.mapping = std::move(mapping);
    session.plan = std::move(plan);

    auto strategy = make_upload_strategy(std::move(session));
    const auto& scheduled_plan = strategy->session().plan;

    ctx.total_chunks = scheduled_plan.chunk_count;
    BU_LOG_INFO_CTX(log_category::engine,
                    "starting " + std::string(to_string(scheduled_plan.kind)) + " upload", ctx);

    auto prepared = strategy->prepare();
    if (!prepared) {
        strategy->abort(transfer_status::failed, prepared.error());
        return {};
    }

    if (!strategy->counts_chunks()) {
        chunk_descriptor whole = scheduled_plan.chunks.front();
        manager->schedule_chunk([strategy, whole] { strategy->run_chunk(whole); });
        return {};
    }

    manager->set_number_of_chunks(scheduled_plan.chunk_count);

    uint32_t scheduled = 0;
    for (const auto& chunk : scheduled_plan.chunks) {
        manager->schedule_chunk([strategy, chunk] { strategy->run_chunk(chunk); });
        ++scheduled;
    }

    if (scheduled != scheduled_plan.chunk_count) {
        // Unreachable after validate(); the epilogue can never run.
        ctx.error_message = "scheduled " + std::to_string(scheduled) + " of " +
                            std::to_string(scheduled_plan.chunk_count) + " chunks";
        BU_LOG_FATAL_CTX(log_category::engine, "chunk schedule is inconsistent", ctx);
        return unexpected{error{error_code::internal_consistency, *ctx.error_message}};
    }

    return {};
}

}  // namespace kcenon::blob_upload
