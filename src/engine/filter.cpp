#include <strata/engine/filter.hpp>

#include <fmt/core.h>

#include <numeric>

namespace strata::engine {

auto Filter::bit_vec(std::shared_ptr<const BoolVec> mask) -> Filter {
    Filter f;
    f.state_ = std::move(mask);
    return f;
}

auto Filter::bit_vec(BoolVec mask) -> Filter {
    return bit_vec(std::make_shared<const BoolVec>(std::move(mask)));
}

auto Filter::indices(std::shared_ptr<const RowIndices> rows) -> Filter {
    Filter f;
    f.state_ = std::move(rows);
    return f;
}

auto Filter::indices(RowIndices rows) -> Filter {
    return indices(std::make_shared<const RowIndices>(std::move(rows)));
}

auto Filter::mask() const noexcept -> const BoolVec* {
    if (const auto* m = std::get_if<std::shared_ptr<const BoolVec>>(&state_)) {
        return m->get();
    }
    return nullptr;
}

auto Filter::rows() const noexcept -> const RowIndices* {
    if (const auto* r = std::get_if<std::shared_ptr<const RowIndices>>(&state_)) {
        return r->get();
    }
    return nullptr;
}

auto Filter::selected_count(std::size_t len) const -> std::size_t {
    if (const auto* m = mask()) {
        std::size_t n = 0;
        for (auto v : *m) {
            n += v;
        }
        return n;
    }
    if (const auto* r = rows()) {
        return r->size();
    }
    return len;
}

auto Filter::describe() const -> std::string {
    switch (kind()) {
        case Kind::None:
            return "None";
        case Kind::BitVec:
            return fmt::format("BitVec({} of {})", selected_count(0), mask()->size());
        case Kind::Indices:
            return fmt::format("Indices({})", rows()->size());
    }
    return "?";
}

auto MaskFilter::candidate_rows(std::size_t len) const -> RowIndices {
    RowIndices rows;
    if (mask_ == nullptr) {
        rows.resize(len);
        std::iota(rows.begin(), rows.end(), std::size_t{0});
        return rows;
    }
    const auto& m = *mask_;
    for (std::size_t i = 0; i < m.size(); ++i) {
        if (m[i]) {
            rows.push_back(i);
        }
    }
    return rows;
}

auto MaskFilter::to_filter() const -> Filter {
    if (mask_ == nullptr) {
        return Filter::none();
    }
    return Filter::bit_vec(mask_);
}

}  // namespace strata::engine
