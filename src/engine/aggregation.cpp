#include <strata/engine/aggregation.hpp>

#include <fmt/core.h>
#include <robin_hood.h>

#include <limits>

namespace strata::engine {

namespace {

constexpr std::uint32_t kNoGroup = std::numeric_limits<std::uint32_t>::max();

struct Assignment {
    std::vector<std::uint32_t> ids;
    RowIndices first_rows;
};

// Direct-indexed slots for small code domains (u8/u16 codes, booleans).
template <typename T>
auto group_dense(const std::vector<T>& values) -> Assignment {
    std::vector<std::uint32_t> slot(std::size_t{std::numeric_limits<T>::max()} + 1, kNoGroup);
    Assignment out;
    out.ids.resize(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto& gid = slot[values[i]];
        if (gid == kNoGroup) {
            gid = static_cast<std::uint32_t>(out.first_rows.size());
            out.first_rows.push_back(i);
        }
        out.ids[i] = gid;
    }
    return out;
}

template <typename T, typename Hash = robin_hood::hash<T>>
auto group_hashed(const std::vector<T>& values) -> Assignment {
    robin_hood::unordered_flat_map<T, std::uint32_t, Hash> key_to_gid;
    Assignment out;
    out.ids.resize(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto [it, inserted] =
            key_to_gid.try_emplace(values[i], static_cast<std::uint32_t>(out.first_rows.size()));
        if (inserted) {
            out.first_rows.push_back(i);
        }
        out.ids[i] = it->second;
    }
    return out;
}

struct KeyRowHash {
    auto operator()(const KeyRow& row) const -> std::size_t {
        std::size_t seed = 0;
        for (const auto& value : row) {
            std::size_t h = std::visit(
                [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); }, value);
            seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

auto assign_groups(const TypedVec& keys) -> std::expected<Assignment, std::string> {
    return std::visit(
        [&](const auto& d) -> std::expected<Assignment, std::string> {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, EncodedVec>) {
                return std::visit(
                    [](const auto& codes) -> Assignment {
                        using T = typename std::decay_t<decltype(codes)>::value_type;
                        if constexpr (sizeof(T) <= 2) {
                            return group_dense(codes);
                        } else {
                            return group_hashed(codes);
                        }
                    },
                    d.codes);
            } else if constexpr (std::is_same_v<D, BoolVec>) {
                return group_dense(d);
            } else if constexpr (std::is_same_v<D, IntVec> || std::is_same_v<D, StrVec>) {
                return group_hashed(d);
            } else if constexpr (std::is_same_v<D, PackedKeys>) {
                return group_hashed(d.keys);
            } else if constexpr (std::is_same_v<D, KeyRows>) {
                return group_hashed<KeyRow, KeyRowHash>(d.rows);
            } else {
                // Constant key: every row lands in group 0.
                Assignment out;
                out.ids.assign(d.len, 0);
                if (d.len > 0) {
                    out.first_rows.push_back(0);
                }
                return out;
            }
        },
        keys.data());
}

auto count_groups(const Grouping& grouping) -> IntVec {
    IntVec counts(grouping.group_count(), 0);
    for (auto gid : grouping.ids) {
        ++counts[gid];
    }
    return counts;
}

// Sums in unsigned arithmetic, which wraps instead of overflowing.
template <typename T>
auto sum_groups(const std::vector<T>& values, const Grouping& grouping) -> IntVec {
    std::vector<std::uint64_t> sums(grouping.group_count(), 0);
    const std::uint32_t* ids = grouping.ids.data();
    for (std::size_t i = 0; i < values.size(); ++i) {
        sums[ids[i]] += static_cast<std::uint64_t>(values[i]);
    }
    IntVec out(sums.size());
    for (std::size_t g = 0; g < sums.size(); ++g) {
        out[g] = static_cast<std::int64_t>(sums[g]);
    }
    return out;
}

}  // namespace

auto grouping(const TypedVec& keys) -> std::expected<Grouping, std::string> {
    if (keys.len() >= kNoGroup) {
        return std::unexpected(
            fmt::format("grouping: {} rows exceed the group id range", keys.len()));
    }
    auto assignment = assign_groups(keys);
    if (!assignment) {
        return std::unexpected(assignment.error());
    }
    Grouping out;
    out.ids = std::move(assignment->ids);
    out.max_index = assignment->first_rows.empty() ? 0 : assignment->first_rows.size() - 1;
    out.groups = keys.gather(assignment->first_rows);
    return out;
}

auto aggregate(const TypedVec& input, const Grouping& grouping, Aggregator aggregator)
    -> std::expected<TypedVec, std::string> {
    if (input.len() != grouping.ids.size()) {
        return std::unexpected(fmt::format("{}: input has {} rows but grouping has {}",
                                           to_string(aggregator), input.len(),
                                           grouping.ids.size()));
    }
    if (aggregator == Aggregator::Count) {
        return TypedVec{TypedVec::Data{count_groups(grouping)}};
    }
    return std::visit(
        [&](const auto& d) -> std::expected<TypedVec, std::string> {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, IntVec> || std::is_same_v<D, BoolVec>) {
                return TypedVec{TypedVec::Data{sum_groups(d, grouping)}};
            } else if constexpr (std::is_same_v<D, EncodedVec>) {
                if (!d.codec->is_summation_preserving()) {
                    return std::unexpected(
                        fmt::format("sum: codes of {} are not summation-preserving",
                                    d.codec->describe()));
                }
                return std::visit(
                    [&](const auto& codes) {
                        return TypedVec{TypedVec::Data{sum_groups(codes, grouping)}};
                    },
                    d.codes);
            } else if constexpr (std::is_same_v<D, Constant>) {
                const auto* v = std::get_if<std::int64_t>(&d.value);
                if (v == nullptr) {
                    return std::unexpected("sum: constant " + format_scalar(d.value) +
                                           " is not an integer");
                }
                IntVec out = count_groups(grouping);
                for (auto& x : out) {
                    x = static_cast<std::int64_t>(static_cast<std::uint64_t>(x) *
                                                  static_cast<std::uint64_t>(*v));
                }
                return TypedVec{TypedVec::Data{std::move(out)}};
            } else {
                return std::unexpected(
                    fmt::format("sum: cannot add values of {}", input.describe()));
            }
        },
        input.data());
}

}  // namespace strata::engine
