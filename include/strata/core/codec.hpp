#pragma once

#include <strata/core/types.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

/// Maps an encoded physical representation to its logical value domain.
///
/// A codec is attached to exactly one encoded column and never changes after
/// the column is built. Besides converting between domains it advertises the
/// algebraic properties the query planner relies on to skip decoding:
///
///  - order-preserving: comparing codes orders rows like comparing values.
///  - summation-preserving: the sum of codes equals the sum of values.
///  - positive-integer: every code is a non-negative integer.
///
/// Decoding is one virtual call per buffer; implementations loop over a
/// statically typed code vector.
class Codec {
   public:
    virtual ~Codec() = default;

    Codec() = default;
    Codec(const Codec&) = delete;
    auto operator=(const Codec&) -> Codec& = delete;

    /// Decode a whole code buffer into logical values.
    [[nodiscard]] virtual auto decode(const CodeVec& codes) const -> Decoded = 0;

    /// Translate a query literal into the encoded domain.
    /// Values the encoding cannot represent are rejected, never wrapped.
    [[nodiscard]] virtual auto encode_literal(const ScalarValue& value) const
        -> std::expected<std::uint64_t, std::string> = 0;

    [[nodiscard]] virtual auto is_order_preserving() const noexcept -> bool = 0;
    [[nodiscard]] virtual auto is_summation_preserving() const noexcept -> bool = 0;
    [[nodiscard]] virtual auto is_positive_integer() const noexcept -> bool = 0;

    [[nodiscard]] virtual auto decoded_type() const noexcept -> BasicType = 0;
    [[nodiscard]] virtual auto encoding_type() const noexcept -> EncodingType = 0;

    /// Translate a range of codes into the logical domain.
    /// Returns nullopt when the logical domain has no integer range.
    [[nodiscard]] virtual auto decode_range(Range encoded) const -> std::optional<Range> = 0;

    [[nodiscard]] virtual auto describe() const -> std::string = 0;

    /// Bytes owned on the heap by the codec itself.
    [[nodiscard]] virtual auto heap_size() const noexcept -> std::size_t = 0;
};

using CodecPtr = std::shared_ptr<const Codec>;

/// Stores `value - offset` in an unsigned integer of width T.
template <CodeWidth T>
class IntegerOffsetCodec final : public Codec {
   public:
    explicit IntegerOffsetCodec(std::int64_t offset) : offset_(offset) {}

    [[nodiscard]] auto offset() const noexcept -> std::int64_t { return offset_; }

    [[nodiscard]] auto decode(const CodeVec& codes) const -> Decoded override {
        const auto* data = std::get_if<std::vector<T>>(&codes);
        if (data == nullptr) {
            throw std::logic_error("IntegerOffsetCodec: code width mismatch");
        }
        IntVec result;
        result.resize(data->size());
        const T* src = data->data();
        std::int64_t* dst = result.data();
        const std::int64_t off = offset_;
        for (std::size_t i = 0; i < result.size(); ++i) {
            dst[i] = static_cast<std::int64_t>(src[i]) + off;
        }
        return result;
    }

    [[nodiscard]] auto encode_literal(const ScalarValue& value) const
        -> std::expected<std::uint64_t, std::string> override {
        const auto* v = std::get_if<std::int64_t>(&value);
        if (v == nullptr) {
            return std::unexpected(
                fmt::format("{} cannot encode non-integer literal {}", describe(),
                            format_scalar(value)));
        }
        std::int64_t shifted = 0;
        if (__builtin_sub_overflow(*v, offset_, &shifted) || shifted < 0 ||
            static_cast<std::uint64_t>(shifted) > std::numeric_limits<T>::max()) {
            return std::unexpected(fmt::format("literal {} is outside the encoded range of {}",
                                               *v, describe()));
        }
        return static_cast<std::uint64_t>(shifted);
    }

    [[nodiscard]] auto is_order_preserving() const noexcept -> bool override { return true; }
    [[nodiscard]] auto is_summation_preserving() const noexcept -> bool override {
        return offset_ == 0;
    }
    [[nodiscard]] auto is_positive_integer() const noexcept -> bool override { return true; }

    [[nodiscard]] auto decoded_type() const noexcept -> BasicType override {
        return BasicType::Integer;
    }
    [[nodiscard]] auto encoding_type() const noexcept -> EncodingType override {
        return encoding_type_of<T>();
    }

    [[nodiscard]] auto decode_range(Range encoded) const -> std::optional<Range> override {
        Range out;
        if (__builtin_add_overflow(encoded.first, offset_, &out.first) ||
            __builtin_add_overflow(encoded.second, offset_, &out.second)) {
            return std::nullopt;
        }
        return out;
    }

    [[nodiscard]] auto describe() const -> std::string override {
        return fmt::format("Subtract({})", offset_);
    }

    [[nodiscard]] auto heap_size() const noexcept -> std::size_t override { return 0; }

   private:
    std::int64_t offset_;
};

/// Stores each string as its position in a sorted, deduplicated dictionary.
///
/// Because the dictionary is sorted, codes compare like the strings they
/// stand for.
template <CodeWidth T>
class DictionaryCodec final : public Codec {
   public:
    /// `dictionary` must be sorted ascending and free of duplicates.
    explicit DictionaryCodec(std::vector<std::string> dictionary)
        : dict_(std::make_shared<const std::vector<std::string>>(std::move(dictionary))) {}

    [[nodiscard]] auto dictionary() const noexcept -> const std::vector<std::string>& {
        return *dict_;
    }

    [[nodiscard]] auto decode(const CodeVec& codes) const -> Decoded override {
        const auto* data = std::get_if<std::vector<T>>(&codes);
        if (data == nullptr) {
            throw std::logic_error("DictionaryCodec: code width mismatch");
        }
        const auto& dict = *dict_;
        StrVec result;
        result.reserve(data->size());
        for (T code : *data) {
            result.emplace_back(dict[code]);
        }
        return result;
    }

    [[nodiscard]] auto encode_literal(const ScalarValue& value) const
        -> std::expected<std::uint64_t, std::string> override {
        const auto* s = std::get_if<std::string>(&value);
        if (s == nullptr) {
            return std::unexpected(fmt::format("{} cannot encode non-string literal {}",
                                               describe(), format_scalar(value)));
        }
        auto it = std::lower_bound(dict_->begin(), dict_->end(), *s);
        if (it == dict_->end() || *it != *s) {
            return std::unexpected(fmt::format("'{}' is not in {}", *s, describe()));
        }
        return static_cast<std::uint64_t>(it - dict_->begin());
    }

    [[nodiscard]] auto is_order_preserving() const noexcept -> bool override { return true; }
    [[nodiscard]] auto is_summation_preserving() const noexcept -> bool override {
        return false;
    }
    [[nodiscard]] auto is_positive_integer() const noexcept -> bool override { return true; }

    [[nodiscard]] auto decoded_type() const noexcept -> BasicType override {
        return BasicType::String;
    }
    [[nodiscard]] auto encoding_type() const noexcept -> EncodingType override {
        return encoding_type_of<T>();
    }

    [[nodiscard]] auto decode_range(Range /*encoded*/) const -> std::optional<Range> override {
        return std::nullopt;
    }

    [[nodiscard]] auto describe() const -> std::string override {
        return fmt::format("Dictionary({} entries)", dict_->size());
    }

    [[nodiscard]] auto heap_size() const noexcept -> std::size_t override {
        // Approximate: counts small-string buffers as if they were heap allocated.
        std::size_t bytes = dict_->capacity() * sizeof(std::string);
        for (const auto& entry : *dict_) {
            bytes += entry.capacity();
        }
        return bytes;
    }

   private:
    std::shared_ptr<const std::vector<std::string>> dict_;
};

}  // namespace strata
