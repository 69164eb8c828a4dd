/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_BLOB_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_BLOB_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kcenon::blob_upload::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate disk-image-like data
     * @param size Size in bytes
     * @param zero_ratio Fraction of 64 KB regions left all zero (0.0 - 1.0)
     * @param seed Random seed (0 for random)
     */
    static auto generate_sparse_data(std::size_t size, double zero_ratio, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t page = 512;
constexpr std::size_t default_block = 8 * MB;
}  // namespace sizes

}  // namespace kcenon::blob_upload::benchmark

#endif  // KCENON_BLOB_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
