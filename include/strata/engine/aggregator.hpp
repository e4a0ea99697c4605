#pragma once

#include <cstdint>
#include <string_view>

namespace strata::engine {

/// Reduction applied to the rows of one group.
enum class Aggregator : std::uint8_t {
    Count,
    Sum,
};

[[nodiscard]] constexpr auto to_string(Aggregator agg) noexcept -> std::string_view {
    switch (agg) {
        case Aggregator::Count:
            return "count";
        case Aggregator::Sum:
            return "sum";
    }
    return "?";
}

}  // namespace strata::engine
