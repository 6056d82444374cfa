#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "types/result.hpp"

namespace regionbridge {

/// @brief Split a sequence into consecutive groups of at most chunk_size elements
/// @tparam T Element type (copied into the groups)
/// @param items Input sequence
/// @param chunk_size Maximum group size
/// @return Result containing ceil(n / chunk_size) groups
/// @retval InvalidArgument chunk_size <= 0
/// @note Relative order is preserved within and across groups; only the last
///       group may be smaller
template <typename T>
[[nodiscard]] Result<std::vector<std::vector<T>>> partition(
    std::span<const T> items,
    int chunk_size) {

    if (chunk_size <= 0) {
        return Err(Error::Code::InvalidArgument,
                   "Chunk size must be positive, got " + std::to_string(chunk_size));
    }

    const auto size = static_cast<std::size_t>(chunk_size);
    std::vector<std::vector<T>> chunks;
    chunks.reserve((items.size() + size - 1) / size);

    for (std::size_t start = 0; start < items.size(); start += size) {
        std::size_t end = std::min(start + size, items.size());
        chunks.emplace_back(items.begin() + static_cast<std::ptrdiff_t>(start),
                            items.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return Ok(std::move(chunks));
}

template <typename T>
[[nodiscard]] Result<std::vector<std::vector<T>>> partition(
    const std::vector<T>& items,
    int chunk_size) {
    return partition(std::span<const T>(items), chunk_size);
}

} // namespace regionbridge
