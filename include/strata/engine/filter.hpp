#pragma once

#include <strata/core/types.hpp>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace strata::engine {

using RowIndices = std::vector<std::size_t>;

/// Row restriction threaded through every plan compiled for one query.
///
/// Either no restriction, a per-row boolean mask, or an explicit ordered list
/// of row positions. The buffers are shared and immutable, so copying a
/// Filter is O(1).
class Filter {
   public:
    enum class Kind : std::uint8_t {
        None,
        BitVec,
        Indices,
    };

    Filter() = default;

    [[nodiscard]] static auto none() -> Filter { return Filter{}; }
    [[nodiscard]] static auto bit_vec(std::shared_ptr<const BoolVec> mask) -> Filter;
    [[nodiscard]] static auto bit_vec(BoolVec mask) -> Filter;
    [[nodiscard]] static auto indices(std::shared_ptr<const RowIndices> rows) -> Filter;
    [[nodiscard]] static auto indices(RowIndices rows) -> Filter;

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(state_.index()); }
    [[nodiscard]] auto is_none() const noexcept -> bool { return kind() == Kind::None; }

    /// Mask of a BitVec filter, null otherwise.
    [[nodiscard]] auto mask() const noexcept -> const BoolVec*;
    /// Positions of an Indices filter, null otherwise.
    [[nodiscard]] auto rows() const noexcept -> const RowIndices*;

    /// Number of rows that pass out of `len` input rows.
    [[nodiscard]] auto selected_count(std::size_t len) const -> std::size_t;

    /// Copy the rows of `values` that pass, in filter order.
    template <typename T>
    [[nodiscard]] auto apply(const std::vector<T>& values) const -> std::vector<T> {
        if (const auto* m = mask()) {
            if (m->size() != values.size()) {
                throw std::logic_error("filter: mask length does not match column length");
            }
            std::vector<T> out;
            out.reserve(selected_count(values.size()));
            const std::uint8_t* mp = m->data();
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (mp[i]) {
                    out.push_back(values[i]);
                }
            }
            return out;
        }
        if (const auto* r = rows()) {
            std::vector<T> out;
            out.reserve(r->size());
            for (std::size_t idx : *r) {
                out.push_back(values[idx]);
            }
            return out;
        }
        return values;
    }

    [[nodiscard]] auto describe() const -> std::string;

   private:
    std::variant<std::monostate, std::shared_ptr<const BoolVec>,
                 std::shared_ptr<const RowIndices>>
        state_;
};

/// The restriction a filter predicate can produce: every row, or a mask.
///
/// ORDER BY only accepts this narrower type, so sorting never has to deal
/// with a filter that is already an explicit position list.
class MaskFilter {
   public:
    MaskFilter() = default;
    explicit MaskFilter(BoolVec mask) : mask_(std::make_shared<const BoolVec>(std::move(mask))) {}

    [[nodiscard]] auto is_none() const noexcept -> bool { return mask_ == nullptr; }
    [[nodiscard]] auto mask() const noexcept -> const BoolVec* { return mask_.get(); }

    /// Positions of the rows that pass, ascending, out of `len` rows.
    [[nodiscard]] auto candidate_rows(std::size_t len) const -> RowIndices;

    /// Same restriction as a Filter; shares the mask buffer.
    [[nodiscard]] auto to_filter() const -> Filter;

   private:
    std::shared_ptr<const BoolVec> mask_;
};

}  // namespace strata::engine
