/**
 * @file block_id_table.h
 * @brief Block identifiers of one transfer, one slot per chunk index
 */

#ifndef KCENON_BLOB_UPLOAD_CORE_BLOCK_ID_TABLE_H
#define KCENON_BLOB_UPLOAD_CORE_BLOCK_ID_TABLE_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::blob_upload {

/**
 * @brief Pre-sized table of block identifiers
 *
 * The table is partitioned by chunk index: slot i is written only by the
 * worker handling chunk i, and the table is read only by the epilogue
 * runner after the completion coordinator reported the last chunk. The
 * acquire/release ordering of that counter publishes every slot to the
 * reader, so the table itself carries no lock.
 */
class block_id_table {
public:
    explicit block_id_table(uint32_t size) : ids_(size) {}

    /**
     * @brief Record the identifier for one chunk index
     */
    void set(uint32_t index, std::string id) { ids_.at(index) = std::move(id); }

    [[nodiscard]] auto get(uint32_t index) const -> const std::string& { return ids_.at(index); }

    [[nodiscard]] auto size() const noexcept -> uint32_t {
        return static_cast<uint32_t>(ids_.size());
    }

    /**
     * @brief Identifiers in chunk order, as committed in the block list
     */
    [[nodiscard]] auto ids() const noexcept -> const std::vector<std::string>& { return ids_; }

    /**
     * @brief Whether every slot holds an identifier
     */
    [[nodiscard]] auto is_complete() const noexcept -> bool {
        for (const auto& id : ids_) {
            if (id.empty()) {
                return false;
            }
        }
        return true;
    }

private:
    std::vector<std::string> ids_;
};

}  // namespace kcenon::blob_upload

#endif  // KCENON_BLOB_UPLOAD_CORE_BLOCK_ID_TABLE_H
