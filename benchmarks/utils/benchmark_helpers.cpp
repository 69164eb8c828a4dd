/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <random>

namespace kcenon::blob_upload::benchmark {

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_sparse_data(std::size_t size, double zero_ratio, uint32_t seed)
    -> std::vector<std::byte> {
    constexpr std::size_t region = 64 * sizes::KB;

    auto data = generate_random_data(size, seed);
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed + 1);
    std::bernoulli_distribution zero(std::clamp(zero_ratio, 0.0, 1.0));

    for (std::size_t offset = 0; offset < size; offset += region) {
        if (zero(gen)) {
            auto end = std::min(size, offset + region);
            std::fill(data.begin() + static_cast<std::ptrdiff_t>(offset),
                      data.begin() + static_cast<std::ptrdiff_t>(end), std::byte{0});
        }
    }
    return data;
}

}  // namespace kcenon::blob_upload::benchmark
