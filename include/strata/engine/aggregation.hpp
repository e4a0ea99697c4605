#pragma once

#include <strata/engine/aggregator.hpp>
#include <strata/engine/typed_vec.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace strata::engine {

/// Partition of rows by composite key.
struct Grouping {
    /// Group id of every row, in row order.
    std::vector<std::uint32_t> ids;
    /// Largest group id; 0 when there are no groups.
    std::size_t max_index = 0;
    /// Distinct key values, one per group, in first-seen order.
    TypedVec groups;

    [[nodiscard]] auto group_count() const noexcept -> std::size_t { return groups.len(); }
};

/// Assign a group id to every row; rows share an id iff their keys are equal.
[[nodiscard]] auto grouping(const TypedVec& keys) -> std::expected<Grouping, std::string>;

/// Reduce `input` (one value per grouped row) to one value per group.
///
/// Count counts contributing rows. Sum adds values with two's-complement
/// wrap-around on overflow; encoded input is summed as codes, so callers only
/// pass codes from summation-preserving codecs.
[[nodiscard]] auto aggregate(const TypedVec& input, const Grouping& grouping,
                             Aggregator aggregator) -> std::expected<TypedVec, std::string>;

}  // namespace strata::engine
