/**
 * @file zero_scan.cpp
 * @brief Word-stride zero detection
 */

#include <kcenon/blob_upload/core/zero_scan.h>

#include <cstdint>
#include <cstring>

namespace kcenon::blob_upload {

auto is_all_zero(std::span<const std::byte> data) noexcept -> bool {
    constexpr std::size_t word_size = sizeof(uint64_t);
    constexpr std::size_t words_per_step = 4;

    const std::byte* ptr = data.data();
    std::size_t remaining = data.size();

    // memcpy keeps the loads legal for unaligned mappings; compilers turn
    // it into plain word loads.
    while (remaining >= word_size * words_per_step) {
        uint64_t words[words_per_step];
        std::memcpy(words, ptr, sizeof(words));
        if ((words[0] | words[1] | words[2] | words[3]) != 0) {
            return false;
        }
        ptr += sizeof(words);
        remaining -= sizeof(words);
    }

    while (remaining >= word_size) {
        uint64_t word;
        std::memcpy(&word, ptr, word_size);
        if (word != 0) {
            return false;
        }
        ptr += word_size;
        remaining -= word_size;
    }

    for (std::size_t i = 0; i < remaining; ++i) {
        if (ptr[i] != std::byte{0}) {
            return false;
        }
    }

    return true;
}

}  // namespace kcenon::blob_upload
