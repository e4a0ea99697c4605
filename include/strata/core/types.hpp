#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace strata {

/// Logical value domain of a column or expression.
enum class BasicType : std::uint8_t {
    Integer,
    String,
    Boolean,
};

/// Physical representation of a buffer.
enum class EncodingType : std::uint8_t {
    U8,
    U16,
    U32,
    I64,
    Str,
    Bool,
};

using IntVec = std::vector<std::int64_t>;
/// String values borrowed from column storage.
using StrVec = std::vector<std::string_view>;
/// One byte per row, 0 or 1.
using BoolVec = std::vector<std::uint8_t>;

/// Encoded code buffer in one of the supported widths.
using CodeVec =
    std::variant<std::vector<std::uint8_t>, std::vector<std::uint16_t>, std::vector<std::uint32_t>>;

/// Output of decoding a code buffer.
using Decoded = std::variant<IntVec, StrVec>;

/// A literal value as written in a query.
using ScalarValue = std::variant<std::int64_t, std::string, bool>;

/// Inclusive (min, max) range of integer values.
using Range = std::pair<std::int64_t, std::int64_t>;

/// Code widths a codec may use.
template <typename T>
concept CodeWidth = std::same_as<T, std::uint8_t> || std::same_as<T, std::uint16_t> ||
                    std::same_as<T, std::uint32_t>;

template <CodeWidth T>
[[nodiscard]] constexpr auto encoding_type_of() noexcept -> EncodingType {
    if constexpr (std::same_as<T, std::uint8_t>) {
        return EncodingType::U8;
    } else if constexpr (std::same_as<T, std::uint16_t>) {
        return EncodingType::U16;
    } else {
        return EncodingType::U32;
    }
}

[[nodiscard]] auto to_string(BasicType type) -> std::string_view;
[[nodiscard]] auto to_string(EncodingType type) -> std::string_view;
[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

}  // namespace strata
