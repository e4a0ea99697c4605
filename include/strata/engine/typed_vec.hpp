#pragma once

#include <strata/core/codec.hpp>
#include <strata/core/types.hpp>
#include <strata/engine/filter.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace strata::engine {

/// Codes read from an encoded column, still in the encoded domain.
struct EncodedVec {
    CodeVec codes;
    CodecPtr codec;
};

/// Bit layout of a composite grouping key packed into 64 bits.
///
/// Components are listed in key order; the first occupies the most
/// significant bits, so comparing packed keys orders rows by the first
/// component, then the second, and so on.
struct KeyLayout {
    struct Component {
        unsigned shift = 0;
        unsigned bits = 0;
        EncodingType code_type = EncodingType::U8;
        CodecPtr codec;
    };
    std::vector<Component> components;
};

struct PackedKeys {
    std::vector<std::uint64_t> keys;
    std::shared_ptr<const KeyLayout> layout;
};

/// One decoded value inside a composite key row. Booleans are stored as 0/1.
using Datum = std::variant<std::int64_t, std::string_view>;
using KeyRow = std::vector<Datum>;

/// Composite key as decoded rows, used when the key cannot be packed.
struct KeyRows {
    std::vector<KeyRow> rows;
    std::vector<BasicType> types;
};

/// A literal repeated `len` times.
struct Constant {
    ScalarValue value;
    std::size_t len = 0;
};

/// Result of executing a query plan: a columnar buffer tagged with its
/// physical representation.
///
/// String values are views. They point into column storage (plain string
/// columns), into a codec's dictionary, or into storage anchored by this
/// value itself (broadcast string literals); the latter two stay alive as
/// long as the TypedVec or any vector derived from it.
class TypedVec {
   public:
    using Data = std::variant<BoolVec, IntVec, StrVec, EncodedVec, PackedKeys, KeyRows, Constant>;

    TypedVec() = default;
    explicit TypedVec(Data data, std::shared_ptr<const void> anchor = nullptr)
        : data_(std::move(data)), anchor_(std::move(anchor)) {}

    [[nodiscard]] auto data() const noexcept -> const Data& { return data_; }
    [[nodiscard]] auto data() noexcept -> Data& { return data_; }
    [[nodiscard]] auto anchor() const noexcept -> const std::shared_ptr<const void>& {
        return anchor_;
    }

    [[nodiscard]] auto len() const noexcept -> std::size_t;
    [[nodiscard]] auto is_encoded() const noexcept -> bool;
    [[nodiscard]] auto is_constant() const noexcept -> bool {
        return std::holds_alternative<Constant>(data_);
    }
    [[nodiscard]] auto is_composite() const noexcept -> bool {
        return std::holds_alternative<PackedKeys>(data_) ||
               std::holds_alternative<KeyRows>(data_);
    }

    /// Codec of encoded data, null otherwise.
    [[nodiscard]] auto codec() const noexcept -> const Codec*;

    /// Logical type of the values this vector decodes to. Composite keys
    /// report Integer.
    [[nodiscard]] auto basic_type() const noexcept -> BasicType;

    /// Logical representation: codes are decoded, constants broadcast.
    /// Composite keys have no single-column form; use decode_columns.
    [[nodiscard]] auto decode() const -> TypedVec;

    /// One decoded column per key component (or just decode() for plain data).
    [[nodiscard]] auto decode_columns() const -> std::vector<TypedVec>;

    /// A value that sorts like the decoded one. Encoded data is returned as-is
    /// when its codec is order-preserving; callers decode after sorting.
    [[nodiscard]] auto order_preserving() && -> TypedVec;

    /// Stable sort of row positions by this vector's values.
    void sort_indices_asc(RowIndices& indices) const;
    void sort_indices_desc(RowIndices& indices) const;

    /// Rows at `indices`, in that order, without decoding.
    [[nodiscard]] auto gather(const RowIndices& indices) const -> TypedVec;

    /// Rows at `indices`, in that order, decoded.
    [[nodiscard]] auto index_decode(const RowIndices& indices) const -> TypedVec;

    /// Rows at `indices` decoded into one column per key component.
    [[nodiscard]] auto index_decode_columns(const RowIndices& indices) const
        -> std::vector<TypedVec>;

    [[nodiscard]] auto describe() const -> std::string;

   private:
    Data data_;
    std::shared_ptr<const void> anchor_;
};

}  // namespace strata::engine
