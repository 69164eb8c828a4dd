/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_BLOB_UPLOAD_TEST_FIXTURES_H
#define KCENON_BLOB_UPLOAD_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/blob_upload/blob_upload.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace kcenon::blob_upload::test {

/**
 * @brief blob_destination keeping everything in memory
 *
 * Records every call, stores staged blocks and written pages, and fails
 * calls on request. Safe for concurrent workers.
 */
class fake_blob_destination : public blob_destination {
public:
    struct staged_block {
        std::string id;
        std::vector<uint8_t> data;
    };

    struct page_write {
        uint64_t offset = 0;
        std::vector<uint8_t> data;
    };

    /// Called before a stage_block or upload_pages call is answered
    using write_hook = std::function<void(uint64_t call_number)>;

    auto name() const -> std::string override { return "fake://container/blob"; }

    auto get_properties(const cancellation_token& token) -> result<blob_properties> override {
        std::lock_guard lock(mutex_);
        ++calls_["get_properties"];
        if (token.is_cancelled()) {
            return unexpected{error{error_code::transfer_cancelled}};
        }
        if (properties_error_) {
            return unexpected{*properties_error_};
        }
        if (!exists_) {
            return unexpected{error{error_code::blob_not_found, "blob not found", 404}};
        }
        blob_properties props;
        props.content_length = committed_.size();
        props.blob_type = "BlockBlob";
        return props;
    }

    auto create_page_blob(uint64_t size,
                          const blob_http_headers& headers,
                          const blob_metadata& metadata,
                          const cancellation_token& token) -> result<void> override {
        std::lock_guard lock(mutex_);
        ++calls_["create_page_blob"];
        if (auto failure = injected("create_page_blob", token)) {
            return unexpected{*failure};
        }
        page_blob_size_ = size;
        headers_ = headers;
        metadata_ = metadata;
        exists_ = true;
        return {};
    }

    auto stage_block(const std::string& block_id,
                     body_stream& body,
                     const cancellation_token& token) -> result<void> override {
        auto call = next_write_call();
        auto data = read_all(body);
        if (!data) {
            return unexpected{data.error()};
        }

        std::lock_guard lock(mutex_);
        ++calls_["stage_block"];
        if (auto failure = injected("stage_block", token, call)) {
            return unexpected{*failure};
        }
        staged_.push_back({block_id, std::move(data.value())});
        return {};
    }

    auto upload_pages(uint64_t offset,
                      body_stream& body,
                      const cancellation_token& token) -> result<void> override {
        auto call = next_write_call();
        auto data = read_all(body);
        if (!data) {
            return unexpected{data.error()};
        }

        std::lock_guard lock(mutex_);
        ++calls_["upload_pages"];
        if (auto failure = injected("upload_pages", token, call)) {
            return unexpected{*failure};
        }
        pages_.push_back({offset, std::move(data.value())});
        return {};
    }

    auto commit_block_list(const std::vector<std::string>& block_ids,
                           const blob_http_headers& headers,
                           const blob_metadata& metadata,
                           const cancellation_token& token) -> result<void> override {
        std::lock_guard lock(mutex_);
        ++calls_["commit_block_list"];
        if (auto failure = injected("commit_block_list", token)) {
            return unexpected{*failure};
        }
        committed_ids_ = block_ids;
        committed_.clear();
        for (const auto& id : block_ids) {
            auto it = std::find_if(staged_.begin(), staged_.end(),
                                   [&id](const staged_block& b) { return b.id == id; });
            if (it == staged_.end()) {
                return unexpected{error{error_code::remote_error, "InvalidBlockList", 400}};
            }
            committed_.insert(committed_.end(), it->data.begin(), it->data.end());
        }
        headers_ = headers;
        metadata_ = metadata;
        exists_ = true;
        return {};
    }

    auto upload(body_stream& body,
                const blob_http_headers& headers,
                const blob_metadata& metadata,
                const cancellation_token& token) -> result<void> override {
        auto data = read_all(body);
        if (!data) {
            return unexpected{data.error()};
        }

        std::lock_guard lock(mutex_);
        ++calls_["upload"];
        if (auto failure = injected("upload", token)) {
            return unexpected{*failure};
        }
        committed_ = std::move(data.value());
        headers_ = headers;
        metadata_ = metadata;
        exists_ = true;
        return {};
    }

    auto set_tier(std::string_view tier, const cancellation_token& token)
        -> result<void> override {
        std::lock_guard lock(mutex_);
        ++calls_["set_tier"];
        if (auto failure = injected("set_tier", token)) {
            return unexpected{*failure};
        }
        tier_ = std::string(tier);
        return {};
    }

    auto delete_blob(const cancellation_token& token) -> result<void> override {
        std::lock_guard lock(mutex_);
        ++calls_["delete_blob"];
        if (auto failure = injected("delete_blob", token)) {
            return unexpected{*failure};
        }
        if (!exists_ || delete_not_found_) {
            return unexpected{error{error_code::blob_not_found, "blob not found", 404}};
        }
        exists_ = false;
        committed_.clear();
        return {};
    }

    // ========================================================================
    // Injection
    // ========================================================================

    void set_exists(bool exists) {
        std::lock_guard lock(mutex_);
        exists_ = exists;
    }

    void fail_properties(error cause) {
        std::lock_guard lock(mutex_);
        properties_error_ = std::move(cause);
    }

    /**
     * @brief Fail every call of an operation
     */
    void fail_operation(const std::string& op, error cause) {
        std::lock_guard lock(mutex_);
        failures_[op] = std::move(cause);
    }

    /**
     * @brief Fail the n-th (1-based) block or page write only
     */
    void fail_write_call(uint64_t call_number, error cause) {
        std::lock_guard lock(mutex_);
        write_failures_[call_number] = std::move(cause);
    }

    /**
     * @brief Answer deletes with 404 even when the blob exists
     */
    void set_delete_not_found(bool value) {
        std::lock_guard lock(mutex_);
        delete_not_found_ = value;
    }

    void set_write_hook(write_hook hook) {
        std::lock_guard lock(mutex_);
        write_hook_ = std::move(hook);
    }

    // ========================================================================
    // Observation
    // ========================================================================

    auto calls(const std::string& op) const -> int {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(op);
        return it == calls_.end() ? 0 : it->second;
    }

    /**
     * @brief Calls that write data or create the blob
     */
    auto write_calls() const -> int {
        return calls("create_page_blob") + calls("stage_block") + calls("upload_pages") +
               calls("commit_block_list") + calls("upload");
    }

    auto staged() const -> std::vector<staged_block> {
        std::lock_guard lock(mutex_);
        return staged_;
    }

    auto pages() const -> std::vector<page_write> {
        std::lock_guard lock(mutex_);
        return pages_;
    }

    auto committed() const -> std::vector<uint8_t> {
        std::lock_guard lock(mutex_);
        return committed_;
    }

    auto committed_ids() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return committed_ids_;
    }

    auto exists() const -> bool {
        std::lock_guard lock(mutex_);
        return exists_;
    }

    auto page_blob_size() const -> uint64_t {
        std::lock_guard lock(mutex_);
        return page_blob_size_;
    }

    auto tier() const -> std::string {
        std::lock_guard lock(mutex_);
        return tier_;
    }

    auto headers() const -> blob_http_headers {
        std::lock_guard lock(mutex_);
        return headers_;
    }

    auto metadata() const -> blob_metadata {
        std::lock_guard lock(mutex_);
        return metadata_;
    }

    /**
     * @brief Page blob content rebuilt from the written ranges
     */
    auto page_content() const -> std::vector<uint8_t> {
        std::lock_guard lock(mutex_);
        std::vector<uint8_t> content(static_cast<std::size_t>(page_blob_size_), 0);
        for (const auto& page : pages_) {
            std::copy(page.data.begin(), page.data.end(),
                      content.begin() + static_cast<std::ptrdiff_t>(page.offset));
        }
        return content;
    }

private:
    auto next_write_call() -> uint64_t {
        auto call = write_counter_.fetch_add(1) + 1;
        write_hook hook;
        {
            std::lock_guard lock(mutex_);
            hook = write_hook_;
        }
        if (hook) {
            hook(call);
        }
        return call;
    }

    auto injected(const std::string& op,
                  const cancellation_token& token,
                  uint64_t write_call = 0) -> std::optional<error> {
        if (token.is_cancelled()) {
            return error{error_code::transfer_cancelled, op + " skipped"};
        }
        if (auto it = failures_.find(op); it != failures_.end()) {
            return it->second;
        }
        if (auto it = write_failures_.find(write_call); write_call != 0 && it != write_failures_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::map<std::string, int> calls_;
    std::map<std::string, error> failures_;
    std::map<uint64_t, error> write_failures_;
    std::optional<error> properties_error_;
    std::atomic<uint64_t> write_counter_{0};
    write_hook write_hook_;

    bool exists_ = false;
    bool delete_not_found_ = false;
    uint64_t page_blob_size_ = 0;
    std::string tier_;
    blob_http_headers headers_;
    blob_metadata metadata_;
    std::vector<staged_block> staged_;
    std::vector<page_write> pages_;
    std::vector<uint8_t> committed_;
    std::vector<std::string> committed_ids_;
};

/**
 * @brief Source opener counting how often mappings are opened and released
 */
class counting_opener {
public:
    auto opener() -> source_opener {
        return [this](const std::filesystem::path& path, uint64_t size)
                   -> result<std::shared_ptr<source_mapping>> {
            opened_.fetch_add(1);
            auto mapped = open_mapped_file(path, size);
            if (!mapped) {
                return unexpected{mapped.error()};
            }
            return std::shared_ptr<source_mapping>(
                std::make_shared<counted_mapping>(std::move(mapped.value()), releases_));
        };
    }

    auto opened() const -> int { return opened_.load(); }
    auto releases() const -> int { return releases_.load(); }

private:
    class counted_mapping : public source_mapping {
    public:
        counted_mapping(std::shared_ptr<source_mapping> inner, std::atomic<int>& releases)
            : inner_(std::move(inner)), releases_(releases) {}

        auto bytes() const noexcept -> std::span<const std::byte> override {
            return inner_->bytes();
        }
        void release() noexcept override {
            releases_.fetch_add(1);
            inner_->release();
        }
        auto is_released() const noexcept -> bool override { return inner_->is_released(); }

    private:
        std::shared_ptr<source_mapping> inner_;
        std::atomic<int>& releases_;
    };

    std::atomic<int> opened_{0};
    std::atomic<int> releases_{0};
};

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("blob_upload_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(1, 255);

        std::vector<char> buffer(size);
        for (auto& byte : buffer) {
            byte = static_cast<char>(dis(gen));
        }
        file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        return path;
    }

    /**
     * @brief File whose listed [offset, offset + length) ranges are zero
     */
    auto create_sparse_file(const std::string& name,
                            std::size_t size,
                            const std::vector<std::pair<std::size_t, std::size_t>>& zero_ranges)
        -> std::filesystem::path {
        auto path = create_test_file(name, size);
        auto content = read_file(path);
        for (const auto& [offset, length] : zero_ranges) {
            std::fill_n(content.begin() + static_cast<std::ptrdiff_t>(offset), length, 0);
        }
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<uint8_t> {
        std::ifstream file(path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                    std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Wires an engine, a fake destination and a manager for one transfer
 */
class UploadScenarioFixture : public TempDirectoryFixture {
protected:
    static constexpr uint64_t MB = 1024 * 1024;

    void SetUp() override {
        TempDirectoryFixture::SetUp();
        destination_ = std::make_shared<fake_blob_destination>();
    }

    auto make_info(const std::filesystem::path& source, uint64_t block_size = 4 * MB)
        -> transfer_info {
        transfer_info info;
        info.source = source;
        info.destination = destination_->name();
        info.source_size = std::filesystem::exists(source)
                               ? static_cast<uint64_t>(std::filesystem::file_size(source))
                               : 0;
        info.block_size = block_size;
        return info;
    }

    /**
     * @brief Start a transfer and wait for it to finish
     */
    auto run(const transfer_info& info,
             std::shared_ptr<adapters::chunk_pool_interface> pool = nullptr)
        -> std::shared_ptr<transfer_manager> {
        manager_ = std::make_shared<transfer_manager>(info, std::move(pool));
        upload_engine engine(config_, limiter_, opener_.opener());
        start_result_ = engine.start(manager_, destination_);
        EXPECT_TRUE(manager_->wait_for(std::chrono::seconds(30)));
        return manager_;
    }

    engine_config config_;
    std::shared_ptr<pacer> limiter_;
    counting_opener opener_;
    std::shared_ptr<fake_blob_destination> destination_;
    std::shared_ptr<transfer_manager> manager_;
    result<void> start_result_;
};

}  // namespace kcenon::blob_upload::test

#endif  // KCENON_BLOB_UPLOAD_TEST_FIXTURES_H
