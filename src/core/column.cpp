#include <strata/core/column.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace strata {

// Explicit instantiations for every supported code width.
template class IntegerOffsetCodec<std::uint8_t>;
template class IntegerOffsetCodec<std::uint16_t>;
template class IntegerOffsetCodec<std::uint32_t>;
template class DictionaryCodec<std::uint8_t>;
template class DictionaryCodec<std::uint16_t>;
template class DictionaryCodec<std::uint32_t>;

namespace {

// max - min without signed overflow; requires min <= max.
auto span_of(std::int64_t min, std::int64_t max) -> std::uint64_t {
    return static_cast<std::uint64_t>(max) - static_cast<std::uint64_t>(min);
}

template <CodeWidth T>
auto encode_offset(const IntVec& values, std::int64_t offset) -> std::vector<T> {
    std::vector<T> codes;
    codes.resize(values.size());
    const auto base = static_cast<std::uint64_t>(offset);
    for (std::size_t i = 0; i < values.size(); ++i) {
        codes[i] = static_cast<T>(static_cast<std::uint64_t>(values[i]) - base);
    }
    return codes;
}

template <CodeWidth T>
auto encode_integer_column(std::string name, const IntVec& values, std::int64_t min,
                           std::int64_t max) -> Column {
    auto codec = std::make_shared<const IntegerOffsetCodec<T>>(min);
    spdlog::debug("column '{}': {} rows encoded as {} with {}", name, values.size(),
                  to_string(codec->encoding_type()), codec->describe());
    return Column::encoded(std::move(name), CodeVec{encode_offset<T>(values, min)},
                           std::move(codec), Range{0, static_cast<std::int64_t>(span_of(min, max))});
}

template <CodeWidth T>
auto encode_dictionary_column(std::string name, const std::vector<std::string>& values,
                              std::vector<std::string> dict) -> Column {
    std::vector<T> codes;
    codes.reserve(values.size());
    for (const auto& value : values) {
        auto it = std::lower_bound(dict.begin(), dict.end(), value);
        codes.push_back(static_cast<T>(it - dict.begin()));
    }
    std::optional<Range> range;
    if (!dict.empty()) {
        range = Range{0, static_cast<std::int64_t>(dict.size() - 1)};
    }
    auto codec = std::make_shared<const DictionaryCodec<T>>(std::move(dict));
    spdlog::debug("column '{}': {} rows encoded as {} with {}", name, values.size(),
                  to_string(codec->encoding_type()), codec->describe());
    return Column::encoded(std::move(name), CodeVec{std::move(codes)}, std::move(codec), range);
}

}  // namespace

auto Column::plain(std::string name, IntVec values, std::optional<Range> range) -> Column {
    return Column{std::move(name), Data{std::move(values)}, nullptr, range};
}

auto Column::plain_strings(std::string name, std::vector<std::string> values) -> Column {
    return Column{std::move(name), Data{std::move(values)}, nullptr, std::nullopt};
}

auto Column::encoded(std::string name, CodeVec codes, CodecPtr codec, std::optional<Range> range)
    -> Column {
    if (codec == nullptr) {
        throw std::invalid_argument("encoded column '" + name + "' requires a codec");
    }
    if (range.has_value()) {
        const auto [lo, hi] = *range;
        std::visit(
            [&](const auto& data) {
                for (auto code : data) {
                    const auto c = static_cast<std::int64_t>(code);
                    if (c < lo || c > hi) {
                        throw std::invalid_argument(fmt::format(
                            "encoded column '{}': code {} outside [{}, {}]", name, c, lo, hi));
                    }
                }
            },
            codes);
    }
    return Column{std::move(name), Data{std::move(codes)}, std::move(codec), range};
}

auto Column::from_ints(std::string name, IntVec values, std::int64_t min, std::int64_t max)
    -> Column {
    if (min > max) {
        throw std::invalid_argument(
            fmt::format("column '{}': min {} is greater than max {}", name, min, max));
    }
    for (auto v : values) {
        if (v < min || v > max) {
            throw std::invalid_argument(
                fmt::format("column '{}': value {} outside [{}, {}]", name, v, min, max));
        }
    }
    const std::uint64_t span = span_of(min, max);
    if (span <= std::numeric_limits<std::uint8_t>::max()) {
        return encode_integer_column<std::uint8_t>(std::move(name), values, min, max);
    }
    if (span <= std::numeric_limits<std::uint16_t>::max()) {
        return encode_integer_column<std::uint16_t>(std::move(name), values, min, max);
    }
    if (span <= std::numeric_limits<std::uint32_t>::max()) {
        return encode_integer_column<std::uint32_t>(std::move(name), values, min, max);
    }
    spdlog::debug("column '{}': span {} too wide for offset encoding, stored plain", name, span);
    values.shrink_to_fit();
    return plain(std::move(name), std::move(values), Range{min, max});
}

auto Column::from_ints(std::string name, IntVec values) -> Column {
    if (values.empty()) {
        return from_ints(std::move(name), std::move(values), 0, 0);
    }
    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    const std::int64_t min = *lo;
    const std::int64_t max = *hi;
    return from_ints(std::move(name), std::move(values), min, max);
}

auto Column::from_strings(std::string name, const std::vector<std::string>& values) -> Column {
    std::vector<std::string> dict(values.begin(), values.end());
    std::sort(dict.begin(), dict.end());
    dict.erase(std::unique(dict.begin(), dict.end()), dict.end());
    const std::size_t max_code = dict.empty() ? 0 : dict.size() - 1;
    if (max_code <= std::numeric_limits<std::uint8_t>::max()) {
        return encode_dictionary_column<std::uint8_t>(std::move(name), values, std::move(dict));
    }
    if (max_code <= std::numeric_limits<std::uint16_t>::max()) {
        return encode_dictionary_column<std::uint16_t>(std::move(name), values, std::move(dict));
    }
    if (max_code <= std::numeric_limits<std::uint32_t>::max()) {
        return encode_dictionary_column<std::uint32_t>(std::move(name), values, std::move(dict));
    }
    spdlog::debug("column '{}': {} distinct strings, stored plain", name, dict.size());
    return plain_strings(std::move(name), values);
}

auto Column::len() const noexcept -> std::size_t {
    return std::visit(
        [](const auto& d) -> std::size_t {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, CodeVec>) {
                return std::visit([](const auto& codes) { return codes.size(); }, d);
            } else {
                return d.size();
            }
        },
        data_);
}

auto Column::logical_range() const -> std::optional<Range> {
    if (!range_.has_value()) {
        return std::nullopt;
    }
    if (codec_ == nullptr) {
        return range_;
    }
    return codec_->decode_range(*range_);
}

auto Column::basic_type() const noexcept -> BasicType {
    if (codec_ != nullptr) {
        return codec_->decoded_type();
    }
    return std::holds_alternative<IntVec>(data_) ? BasicType::Integer : BasicType::String;
}

auto Column::encoding_type() const noexcept -> EncodingType {
    if (codec_ != nullptr) {
        return codec_->encoding_type();
    }
    return std::holds_alternative<IntVec>(data_) ? EncodingType::I64 : EncodingType::Str;
}

auto Column::heap_size() const noexcept -> std::size_t {
    std::size_t bytes = std::visit(
        [](const auto& d) -> std::size_t {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, CodeVec>) {
                return std::visit(
                    [](const auto& codes) {
                        return codes.capacity() * sizeof(typename std::decay_t<
                                                         decltype(codes)>::value_type);
                    },
                    d);
            } else if constexpr (std::is_same_v<D, IntVec>) {
                return d.capacity() * sizeof(std::int64_t);
            } else {
                std::size_t total = d.capacity() * sizeof(std::string);
                for (const auto& s : d) {
                    total += s.capacity();
                }
                return total;
            }
        },
        data_);
    if (codec_ != nullptr) {
        bytes += codec_->heap_size();
    }
    return bytes;
}

}  // namespace strata
