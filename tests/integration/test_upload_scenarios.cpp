/**
 * @file test_upload_scenarios.cpp
 * @brief End-to-end upload scenarios against an in-memory destination
 */

#include "test_fixtures.h"

#include <kcenon/blob_upload/cloud/cloud_utils.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_upload::test {

class UploadScenarioTest : public UploadScenarioFixture {
protected:
    auto staged_sizes() const -> std::vector<std::size_t> {
        std::vector<std::size_t> sizes;
        for (const auto& block : destination_->staged()) {
            sizes.push_back(block.data.size());
        }
        return sizes;
    }

    static auto remote_failure(int status) -> error {
        return error{error_code_from_status(status), "injected failure", status};
    }

    /// Every transfer ends with exactly one done report.
    void expect_done_once() const {
        ASSERT_NE(manager_, nullptr);
        EXPECT_EQ(manager_->done_count(), 1u);
    }
};

// ============================================================================
// Whole-object uploads
// ============================================================================

TEST_F(UploadScenarioTest, EmptySourceUploadsEmptyBlob) {
    auto path = create_test_file("empty.bin", 0);
    auto manager = run(make_info(path));

    ASSERT_TRUE(start_result_.has_value());
    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->calls("upload"), 1);
    EXPECT_EQ(destination_->calls("stage_block"), 0);
    EXPECT_EQ(destination_->calls("commit_block_list"), 0);
    EXPECT_TRUE(destination_->committed().empty());
    EXPECT_TRUE(destination_->exists());

    EXPECT_EQ(opener_.opened(), 0);
    EXPECT_EQ(opener_.releases(), 0);
    EXPECT_EQ(manager->bytes_done(), 0u);
    expect_done_once();
}

TEST_F(UploadScenarioTest, SmallSourceUsesSingleUpload) {
    auto path = create_test_file("notes.txt", 1000);
    auto manager = run(make_info(path));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->calls("upload"), 1);
    EXPECT_EQ(destination_->calls("stage_block"), 0);
    EXPECT_EQ(destination_->committed(), read_file(path));
    EXPECT_EQ(destination_->headers().content_type, "text/plain");

    EXPECT_EQ(opener_.opened(), 1);
    EXPECT_EQ(opener_.releases(), 1);
    EXPECT_EQ(manager->bytes_done(), 1000u);
    expect_done_once();
}

TEST_F(UploadScenarioTest, SourceEqualToChunkSizeIsOneObject) {
    auto path = create_test_file("exact.bin", 4 * MB);
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->calls("upload"), 1);
    EXPECT_EQ(destination_->calls("stage_block"), 0);
}

TEST_F(UploadScenarioTest, ContentMd5StoredWhenRequested) {
    auto path = create_test_file("report.pdf", 4096);
    auto info = make_info(path);
    info.put_md5 = true;
    info.metadata = {{"origin", "nightly"}};
    auto manager = run(info);

    ASSERT_EQ(manager->status(), transfer_status::success);
    auto content = read_file(path);
    auto expected = cloud_utils::base64_encode(
        cloud_utils::md5(std::as_bytes(std::span<const uint8_t>(content))));
    EXPECT_EQ(destination_->headers().content_md5, expected);
    EXPECT_EQ(destination_->headers().content_type, "application/pdf");
    EXPECT_EQ(destination_->metadata().at("origin"), "nightly");
}

TEST_F(UploadScenarioTest, WholeObjectFailureLeavesNothingToDelete) {
    auto path = create_test_file("small.bin", 2048);
    destination_->fail_operation("upload", remote_failure(500));
    auto manager = run(make_info(path));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->calls("delete_blob"), 0);
    EXPECT_EQ(opener_.releases(), 1);
    EXPECT_EQ(manager->bytes_done(), 2048u);
    expect_done_once();
}

TEST_F(UploadScenarioTest, WholeObjectTierFailureDeletesBlob) {
    auto path = create_test_file("small.bin", 2048);
    auto info = make_info(path);
    info.tiers.block = block_blob_tier::archive;
    destination_->fail_operation("set_tier", remote_failure(400));
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::tier_set_failure);
    EXPECT_EQ(destination_->calls("upload"), 1);
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    EXPECT_FALSE(destination_->exists());
    expect_done_once();
}

// ============================================================================
// Block-list uploads
// ============================================================================

TEST_F(UploadScenarioTest, TenMegabytesInFourMegabyteBlocks) {
    auto path = create_test_file("archive.bin", 10 * MB);
    auto manager = run(make_info(path, 4 * MB));

    ASSERT_TRUE(start_result_.has_value());
    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(manager->number_of_chunks(), 3u);
    EXPECT_EQ(destination_->calls("stage_block"), 3);
    EXPECT_EQ(destination_->calls("commit_block_list"), 1);
    EXPECT_EQ(destination_->calls("upload"), 0);
    EXPECT_EQ(destination_->calls("delete_blob"), 0);

    auto sizes = staged_sizes();
    std::sort(sizes.begin(), sizes.end(), std::greater<>());
    EXPECT_EQ(sizes, (std::vector<std::size_t>{4 * MB, 4 * MB, 2 * MB}));

    EXPECT_EQ(destination_->committed_ids().size(), 3u);
    EXPECT_EQ(destination_->committed(), read_file(path));

    EXPECT_EQ(opener_.releases(), 1);
    EXPECT_EQ(manager->bytes_done(), 10 * MB);
    expect_done_once();
}

TEST_F(UploadScenarioTest, EngineDefaultBlockSizeUsedWhenUnset) {
    config_.block_size = 1 * MB;
    auto path = create_test_file("data.bin", 3 * MB + 1);
    auto manager = run(make_info(path, 0));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->calls("stage_block"), 4);
    EXPECT_EQ(destination_->committed(), read_file(path));
}

TEST_F(UploadScenarioTest, FailingChunkCancelsTransfer) {
    auto path = create_test_file("archive.bin", 10 * MB);
    destination_->fail_write_call(2, remote_failure(500));
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_TRUE(manager->was_cancelled());
    EXPECT_EQ(manager->chunks_done(), 3u);
    EXPECT_EQ(destination_->calls("commit_block_list"), 0);

    // Nothing was committed, so the cleanup delete answers 404.
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    EXPECT_FALSE(destination_->exists());

    EXPECT_EQ(opener_.releases(), 1);
    EXPECT_EQ(manager->bytes_done(), 10 * MB);
    expect_done_once();
}

TEST_F(UploadScenarioTest, CommitFailureFailsAndCleansUp) {
    auto path = create_test_file("archive.bin", 10 * MB);
    destination_->fail_operation("commit_block_list", remote_failure(503));
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->calls("stage_block"), 3);
    EXPECT_EQ(destination_->calls("commit_block_list"), 1);
    EXPECT_EQ(destination_->calls("set_tier"), 0);
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    EXPECT_EQ(opener_.releases(), 1);
    expect_done_once();
}

TEST_F(UploadScenarioTest, BlockTierAppliedAfterCommit) {
    auto path = create_test_file("archive.bin", 10 * MB);
    auto info = make_info(path, 4 * MB);
    info.tiers.block = block_blob_tier::cool;
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->tier(), "Cool");
    EXPECT_EQ(destination_->calls("delete_blob"), 0);
}

TEST_F(UploadScenarioTest, TierFailureRemovesCommittedBlob) {
    auto path = create_test_file("archive.bin", 10 * MB);
    auto info = make_info(path, 4 * MB);
    info.tiers.block = block_blob_tier::hot;
    destination_->fail_operation("set_tier", remote_failure(409));
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::tier_set_failure);
    EXPECT_EQ(destination_->calls("commit_block_list"), 1);
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    EXPECT_FALSE(destination_->exists());
    EXPECT_EQ(opener_.releases(), 1);
    expect_done_once();
}

TEST_F(UploadScenarioTest, CleanupDeleteFailureIsNotFatal) {
    auto path = create_test_file("archive.bin", 10 * MB);
    destination_->fail_write_call(1, remote_failure(500));
    destination_->fail_operation("delete_blob", remote_failure(503));
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    expect_done_once();
}

TEST_F(UploadScenarioTest, TooManyBlocksRejectedBeforeAnyWrite) {
    config_.max_block_count = 2;
    auto path = create_test_file("archive.bin", 10 * MB);
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->write_calls(), 0);
    EXPECT_EQ(opener_.opened(), 0);
    EXPECT_EQ(manager->bytes_done(), 10 * MB);
    expect_done_once();
}

TEST_F(UploadScenarioTest, OversizedBlockRejected) {
    config_.max_block_size = 1 * MB;
    auto path = create_test_file("archive.bin", 3 * MB);
    auto manager = run(make_info(path, 2 * MB));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->write_calls(), 0);
    expect_done_once();
}

// ============================================================================
// Page-range uploads
// ============================================================================

TEST_F(UploadScenarioTest, SparseUploadSkipsZeroRanges) {
    auto path = create_sparse_file("disk.vhd", 8 * MB, {{4 * MB, 4 * MB}});
    auto manager = run(make_info(path, 4 * MB));

    ASSERT_TRUE(start_result_.has_value());
    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->calls("create_page_blob"), 1);
    EXPECT_EQ(destination_->page_blob_size(), 8 * MB);
    EXPECT_EQ(destination_->calls("commit_block_list"), 0);
    EXPECT_EQ(destination_->calls("stage_block"), 0);

    auto pages = destination_->pages();
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].offset, 0u);
    EXPECT_EQ(pages[0].data.size(), 4 * MB);

    EXPECT_EQ(destination_->page_content(), read_file(path));
    EXPECT_EQ(opener_.releases(), 1);
    EXPECT_EQ(manager->bytes_done(), 8 * MB);
    expect_done_once();
}

TEST_F(UploadScenarioTest, PageChunksClampedToPageLimit) {
    config_.page_chunk_max = 1 * MB;
    auto path = create_sparse_file("disk.vhd", 4 * MB, {{1 * MB, 1 * MB}});
    auto manager = run(make_info(path, 4 * MB - 1));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(manager->number_of_chunks(), 4u);
    EXPECT_EQ(destination_->calls("upload_pages"), 3);
    for (const auto& page : destination_->pages()) {
        EXPECT_EQ(page.offset % 512, 0u);
        EXPECT_EQ(page.data.size(), 1 * MB);
    }
    EXPECT_EQ(destination_->page_content(), read_file(path));
}

TEST_F(UploadScenarioTest, SingleNonZeroByteIsWritten) {
    auto path = create_sparse_file("disk.vhd", 2 * MB, {{0, 2 * MB - 1}});
    auto manager = run(make_info(path, 1 * MB));

    EXPECT_EQ(manager->status(), transfer_status::success);
    auto pages = destination_->pages();
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].offset, 1 * MB);
}

TEST_F(UploadScenarioTest, PageTierAppliedAtCreation) {
    auto path = create_test_file("disk.vhd", 2 * MB);
    auto info = make_info(path, 1 * MB);
    info.tiers.page = page_blob_tier::p10;
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->tier(), "P10");
    EXPECT_EQ(destination_->calls("upload_pages"), 2);
}

TEST_F(UploadScenarioTest, PageTierFailureEndsTransfer) {
    auto path = create_test_file("disk.vhd", 2 * MB);
    auto info = make_info(path, 1 * MB);
    info.tiers.page = page_blob_tier::p80;
    destination_->fail_operation("set_tier", remote_failure(400));
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::tier_set_failure);
    EXPECT_EQ(destination_->calls("create_page_blob"), 1);
    EXPECT_EQ(destination_->calls("upload_pages"), 0);
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    EXPECT_FALSE(destination_->exists());
    EXPECT_EQ(opener_.releases(), 1);
    EXPECT_EQ(manager->bytes_done(), 2 * MB);
    expect_done_once();
}

TEST_F(UploadScenarioTest, PageCreateFailureSkipsCleanup) {
    auto path = create_test_file("disk.vhd", 2 * MB);
    destination_->fail_operation("create_page_blob", remote_failure(403));
    auto manager = run(make_info(path, 1 * MB));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->calls("upload_pages"), 0);
    EXPECT_EQ(destination_->calls("delete_blob"), 0);
    EXPECT_EQ(opener_.releases(), 1);
    expect_done_once();
}

TEST_F(UploadScenarioTest, FailingPageWriteDeletesCreatedBlob) {
    auto path = create_test_file("disk.vhd", 3 * MB);
    destination_->fail_write_call(2, remote_failure(500));
    auto manager = run(make_info(path, 1 * MB));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    EXPECT_FALSE(destination_->exists());
    EXPECT_EQ(opener_.releases(), 1);
    expect_done_once();
}

TEST_F(UploadScenarioTest, HintsOverrideExtension) {
    auto path = create_test_file("image.raw", 2 * MB);
    auto info = make_info(path, 1 * MB);
    info.blob_type = blob_type_hint::page_blob;
    run(info);
    EXPECT_EQ(destination_->calls("create_page_blob"), 1);

    destination_ = std::make_shared<fake_blob_destination>();
    auto vhd = create_test_file("disk.vhd", 2 * MB);
    auto block_info = make_info(vhd, 1 * MB);
    block_info.blob_type = blob_type_hint::block_blob;
    run(block_info);
    EXPECT_EQ(destination_->calls("create_page_blob"), 0);
    EXPECT_EQ(destination_->calls("stage_block"), 2);
}

TEST_F(UploadScenarioTest, UnalignedVhdFallsBackToBlocks) {
    auto path = create_test_file("disk.vhd", 2 * MB + 100);
    auto manager = run(make_info(path, 1 * MB));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->calls("create_page_blob"), 0);
    EXPECT_EQ(destination_->calls("stage_block"), 3);
}

// ============================================================================
// Prologue outcomes
// ============================================================================

TEST_F(UploadScenarioTest, ExistingBlobIsNotOverwritten) {
    destination_->set_exists(true);
    auto path = create_test_file("archive.bin", 10 * MB);
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::blob_already_exists);
    EXPECT_EQ(destination_->write_calls(), 0);
    EXPECT_EQ(destination_->calls("delete_blob"), 0);
    EXPECT_EQ(manager->bytes_done(), 10 * MB);
    EXPECT_EQ(opener_.opened(), 0);
    expect_done_once();
}

TEST_F(UploadScenarioTest, ForceWriteSkipsExistenceCheck) {
    destination_->set_exists(true);
    auto path = create_test_file("archive.bin", 1024);
    auto info = make_info(path);
    info.force_write = true;
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->calls("get_properties"), 0);
    EXPECT_EQ(destination_->committed(), read_file(path));
}

TEST_F(UploadScenarioTest, ExistenceCheckErrorFails) {
    destination_->fail_properties(remote_failure(403));
    auto path = create_test_file("archive.bin", 1024);
    auto manager = run(make_info(path));

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->write_calls(), 0);
    EXPECT_EQ(manager->bytes_done(), 1024u);
    expect_done_once();
}

TEST_F(UploadScenarioTest, MissingSourceFails) {
    auto info = make_info(test_dir_ / "gone.bin");
    info.source_size = 4096;
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(opener_.opened(), 1);
    EXPECT_EQ(opener_.releases(), 0);
    EXPECT_EQ(destination_->write_calls(), 0);
    EXPECT_EQ(manager->bytes_done(), 4096u);
    expect_done_once();
}

TEST_F(UploadScenarioTest, SourceChangedSizeFails) {
    auto path = create_test_file("archive.bin", 1024);
    auto info = make_info(path);
    info.source_size = 2048;
    auto manager = run(info);

    EXPECT_EQ(manager->status(), transfer_status::failed);
    EXPECT_EQ(destination_->write_calls(), 0);
    expect_done_once();
}

TEST_F(UploadScenarioTest, MissingCollaboratorsRejected) {
    upload_engine engine(config_);
    auto path = create_test_file("archive.bin", 16);
    auto manager = std::make_shared<transfer_manager>(make_info(path), nullptr);

    auto no_destination = engine.start(manager, nullptr);
    ASSERT_FALSE(no_destination.has_value());
    EXPECT_EQ(no_destination.error().code, error_code::invalid_configuration);

    auto no_manager = engine.start(nullptr, destination_);
    ASSERT_FALSE(no_manager.has_value());
    EXPECT_EQ(no_manager.error().code, error_code::invalid_configuration);
    EXPECT_FALSE(manager->is_done());
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(UploadScenarioTest, CancelledBeforeStart) {
    auto path = create_test_file("archive.bin", 10 * MB);
    auto manager = std::make_shared<transfer_manager>(make_info(path, 4 * MB), nullptr);
    manager->cancel();

    upload_engine engine(config_, nullptr, opener_.opener());
    ASSERT_TRUE(engine.start(manager, destination_).has_value());

    EXPECT_EQ(manager->status(), transfer_status::cancelled);
    EXPECT_EQ(manager->done_count(), 1u);
    EXPECT_EQ(manager->bytes_done(), 10 * MB);
    EXPECT_EQ(destination_->calls("get_properties"), 0);
    EXPECT_EQ(destination_->write_calls(), 0);
    EXPECT_EQ(opener_.opened(), 0);
}

TEST_F(UploadScenarioTest, CancelledDuringBlockUpload) {
    auto path = create_test_file("archive.bin", 10 * MB);
    destination_->set_write_hook([this](uint64_t call) {
        if (call == 2) {
            manager_->cancel();
        }
    });
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::cancelled);
    EXPECT_EQ(destination_->calls("commit_block_list"), 0);
    EXPECT_EQ(destination_->staged().size(), 1u);
    EXPECT_EQ(destination_->calls("delete_blob"), 1);
    EXPECT_EQ(opener_.releases(), 1);
    EXPECT_EQ(manager->bytes_done(), 10 * MB);
    expect_done_once();
}

// ============================================================================
// Pacing
// ============================================================================

TEST_F(UploadScenarioTest, PacedUploadKeepsContent) {
    limiter_ = std::make_shared<pacer>(64 * MB);
    auto path = create_test_file("archive.bin", 3 * MB);
    auto manager = run(make_info(path, 1 * MB));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(destination_->committed(), read_file(path));
}

// ============================================================================
// Logging
// ============================================================================

class UploadLoggingTest : public UploadScenarioTest {
protected:
    struct record {
        log_level level;
        std::string message;
        std::optional<int> status_code;
        std::optional<std::string> detail;
    };

    void SetUp() override {
        UploadScenarioTest::SetUp();
        get_logger().set_callback([this](log_level level, std::string_view,
                                         std::string_view message,
                                         const transfer_log_context* ctx) {
            std::lock_guard lock(records_mutex_);
            records_.push_back({level, std::string(message),
                                ctx ? ctx->status_code : std::nullopt,
                                ctx ? ctx->error_message : std::nullopt});
        });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().set_output_format(log_output_format::text);
        UploadScenarioTest::TearDown();
    }

    auto count_below(log_level level) -> std::size_t {
        std::lock_guard lock(records_mutex_);
        return static_cast<std::size_t>(
            std::count_if(records_.begin(), records_.end(), [level](const record& r) {
                return static_cast<int>(r.level) < static_cast<int>(level);
            }));
    }

    auto records() -> std::vector<record> {
        std::lock_guard lock(records_mutex_);
        return records_;
    }

    std::mutex records_mutex_;
    std::vector<record> records_;
};

/// Cancels the transfer, then reports a server error for the same write.
class cancel_then_fail_destination : public fake_blob_destination {
public:
    explicit cancel_then_fail_destination(std::function<void()> cancel)
        : cancel_(std::move(cancel)) {}

    auto stage_block(const std::string&, body_stream&, const cancellation_token&)
        -> result<void> override {
        cancel_();
        return unexpected{error{error_code::remote_error, "server busy", 500}};
    }

private:
    std::function<void()> cancel_;
};

TEST_F(UploadLoggingTest, EngineAppliesLevelFromEnvironment) {
    setenv("BLOB_UPLOAD_LOG_LEVEL", "error", 1);
    auto loaded = engine_config::from_environment();
    unsetenv("BLOB_UPLOAD_LOG_LEVEL");
    ASSERT_TRUE(loaded.has_value());
    config_ = loaded.value();

    auto path = create_test_file("archive.bin", 10 * MB);
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(get_logger().get_level(), log_level::error);
    EXPECT_EQ(count_below(log_level::error), 0u);
}

TEST_F(UploadLoggingTest, DefaultLevelKeepsInfoRecords) {
    get_logger().set_level(log_level::error);
    auto path = create_test_file("archive.bin", 10 * MB);
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::success);
    EXPECT_EQ(get_logger().get_level(), log_level::info);
    EXPECT_GT(count_below(log_level::warn), 0u);
}

TEST_F(UploadLoggingTest, EngineAppliesJsonOutput) {
    config_.json_log_output = true;
    upload_engine engine(config_, nullptr, opener_.opener());
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);
}

TEST_F(UploadLoggingTest, RemoteErrorAfterCancellationIsLogged) {
    destination_ = std::make_shared<cancel_then_fail_destination>([this] { manager_->cancel(); });
    auto path = create_test_file("archive.bin", 10 * MB);
    auto manager = run(make_info(path, 4 * MB));

    EXPECT_EQ(manager->status(), transfer_status::cancelled);
    expect_done_once();

    auto logged = records();
    auto it = std::find_if(logged.begin(), logged.end(), [](const record& r) {
        return r.level == log_level::error && r.status_code == 500;
    });
    ASSERT_NE(it, logged.end());
    ASSERT_TRUE(it->detail.has_value());
    EXPECT_NE(it->detail->find("server busy"), std::string::npos);
}

}  // namespace kcenon::blob_upload::test
