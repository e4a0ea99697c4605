#pragma once

#include <strata/core/codec.hpp>
#include <strata/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

/// A named, immutable column of one batch.
///
/// Holds either plain logical values or an encoded code buffer together with
/// the codec that decodes it. The encoding is chosen once, when the column is
/// built, from the value range known at that time; queries only read it.
class Column {
   public:
    using Data = std::variant<IntVec, std::vector<std::string>, CodeVec>;

    /// Plain 64-bit integer storage without a codec.
    [[nodiscard]] static auto plain(std::string name, IntVec values, std::optional<Range> range)
        -> Column;

    /// Plain string storage without a codec.
    [[nodiscard]] static auto plain_strings(std::string name, std::vector<std::string> values)
        -> Column;

    /// Encoded storage. `range` is the range of the stored codes.
    [[nodiscard]] static auto encoded(std::string name, CodeVec codes, CodecPtr codec,
                                      std::optional<Range> range) -> Column;

    /// Integer column with adaptive width.
    ///
    /// Stores `value - min` in the narrowest of 8, 16 or 32 bits that holds
    /// `max - min`, or keeps plain 64-bit values when the span is wider.
    /// Throws std::invalid_argument if a value lies outside [min, max].
    [[nodiscard]] static auto from_ints(std::string name, IntVec values, std::int64_t min,
                                        std::int64_t max) -> Column;

    /// Same as above with min and max computed from the values.
    [[nodiscard]] static auto from_ints(std::string name, IntVec values) -> Column;

    /// Dictionary-encoded string column; the dictionary is sorted.
    [[nodiscard]] static auto from_strings(std::string name,
                                           const std::vector<std::string>& values) -> Column;

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto len() const noexcept -> std::size_t;
    [[nodiscard]] auto data() const noexcept -> const Data& { return data_; }

    /// Codec of an encoded column, null for plain storage.
    [[nodiscard]] auto codec() const noexcept -> const CodecPtr& { return codec_; }
    [[nodiscard]] auto is_encoded() const noexcept -> bool { return codec_ != nullptr; }

    /// Range of the stored representation (codes for encoded columns).
    [[nodiscard]] auto range() const noexcept -> const std::optional<Range>& { return range_; }

    /// Range of the logical values, derived without touching the data.
    [[nodiscard]] auto logical_range() const -> std::optional<Range>;

    [[nodiscard]] auto basic_type() const noexcept -> BasicType;
    [[nodiscard]] auto encoding_type() const noexcept -> EncodingType;

    /// Bytes owned on the heap by the column buffers and its codec.
    [[nodiscard]] auto heap_size() const noexcept -> std::size_t;

   private:
    Column(std::string name, Data data, CodecPtr codec, std::optional<Range> range)
        : name_(std::move(name)),
          data_(std::move(data)),
          codec_(std::move(codec)),
          range_(range) {}

    std::string name_;
    Data data_;
    CodecPtr codec_;
    std::optional<Range> range_;
};

}  // namespace strata
