/**
 * @file source_mapping.h
 * @brief Read-only memory mapping of a transfer's source file
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_SOURCE_MAPPING_H
#define KCENON_BLOB_UPLOAD_CORE_SOURCE_MAPPING_H

#include <kcenon/blob_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>

namespace kcenon::blob_upload {

/**
 * @brief Source bytes shared read-only by the chunk workers of a transfer
 *
 * Workers only read through bytes()/slice(). The worker that runs the
 * epilogue is the only caller of release().
 */
class source_mapping {
public:
    virtual ~source_mapping() = default;

    /**
     * @brief The whole mapped range; empty once released
     */
    [[nodiscard]] virtual auto bytes() const noexcept -> std::span<const std::byte> = 0;

    /**
     * @brief Unmap the source. Later calls do nothing.
     */
    virtual void release() noexcept = 0;

    [[nodiscard]] virtual auto is_released() const noexcept -> bool = 0;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return bytes().size(); }

    /**
     * @brief Sub-range [offset, offset + length) of the source
     */
    [[nodiscard]] auto slice(uint64_t offset, uint64_t length) const
        -> result<std::span<const std::byte>>;
};

/**
 * @brief mmap(2)-backed source mapping
 */
class mapped_file : public source_mapping {
public:
    /**
     * @brief Open and map a file read-only
     * @param path Source file
     * @param expected_size Size recorded for the transfer; the file must
     *                      still have exactly this size
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path, uint64_t expected_size)
        -> result<std::unique_ptr<mapped_file>>;

    ~mapped_file() override;

    mapped_file(const mapped_file&) = delete;
    auto operator=(const mapped_file&) -> mapped_file& = delete;

    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte> override;
    void release() noexcept override;
    [[nodiscard]] auto is_released() const noexcept -> bool override;

private:
    mapped_file(void* addr, std::size_t length) noexcept;

    void* addr_ = nullptr;
    std::size_t length_ = 0;
};

/**
 * @brief Factory used by the engine to map a source
 *
 * Replaceable so callers can wrap or instrument the mapping.
 */
using source_opener = std::function<result<std::shared_ptr<source_mapping>>(
    const std::filesystem::path& path, uint64_t size)>;

/**
 * @brief Default opener backed by mapped_file
 */
[[nodiscard]] auto open_mapped_file(const std::filesystem::path& path, uint64_t size)
    -> result<std::shared_ptr<source_mapping>>;

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_SOURCE_MAPPING_H
