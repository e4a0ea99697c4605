#include <strata/core/types.hpp>

#include <fmt/core.h>

namespace strata {

auto to_string(BasicType type) -> std::string_view {
    switch (type) {
        case BasicType::Integer:
            return "Integer";
        case BasicType::String:
            return "String";
        case BasicType::Boolean:
            return "Boolean";
    }
    return "?";
}

auto to_string(EncodingType type) -> std::string_view {
    switch (type) {
        case EncodingType::U8:
            return "U8";
        case EncodingType::U16:
            return "U16";
        case EncodingType::U32:
            return "U32";
        case EncodingType::I64:
            return "I64";
        case EncodingType::Str:
            return "Str";
        case EncodingType::Bool:
            return "Bool";
    }
    return "?";
}

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

}  // namespace strata
