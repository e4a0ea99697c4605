#include <strata/engine/query.hpp>

#include <strata/engine/aggregation.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <numeric>

namespace strata::engine {

namespace {

// Evaluate the WHERE expression over every row.
auto derive_filter(const ir::Expr& expr, const ColumnMap& columns, const PlanOptions& options,
                   QueryStats& stats) -> std::expected<MaskFilter, std::string> {
    stats.start();
    auto plan = QueryPlan::compile(expr, columns, Filter::none(), options);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    auto compiled = prepare(std::move(*plan));
    stats.record("compile_filter");

    stats.start();
    auto result = compiled.execute();
    stats.record("filter");
    if (!result) {
        return std::unexpected(result.error());
    }
    if (auto* mask = std::get_if<BoolVec>(&result->data())) {
        return MaskFilter{std::move(*mask)};
    }
    if (const auto* c = std::get_if<Constant>(&result->data())) {
        if (const auto* b = std::get_if<bool>(&c->value)) {
            return *b ? MaskFilter{} : MaskFilter{BoolVec(c->len, 0)};
        }
        if (std::holds_alternative<std::int64_t>(c->value)) {
            return MaskFilter{};
        }
    }
    return std::unexpected(fmt::format("filter expression must be boolean, got {}",
                                       result->describe()));
}

// Positions of the first `limit + offset` rows in ORDER BY order.
auto sort_rows(const Query& query, std::size_t index, const MaskFilter& mask,
               const ColumnMap& columns, const PlanOptions& options, QueryStats& stats)
    -> std::expected<Filter, std::string> {
    // The key is read over all rows so candidate positions index it directly.
    stats.start();
    auto plan = QueryPlan::compile_grouping_key({query.select[index]}, columns, Filter::none(),
                                                options);
    if (!plan) {
        return std::unexpected(plan.error());
    }
    auto compiled = prepare(std::move(*plan));
    auto key = compiled.execute();
    if (!key) {
        return std::unexpected(key.error());
    }
    TypedVec sort_column = std::move(*key).order_preserving();
    RowIndices rows = mask.candidate_rows(sort_column.len());
    if (query.order_desc) {
        sort_column.sort_indices_desc(rows);
    } else {
        sort_column.sort_indices_asc(rows);
    }
    const std::uint64_t keep =
        query.limit.limit > std::numeric_limits<std::uint64_t>::max() - query.limit.offset
            ? std::numeric_limits<std::uint64_t>::max()
            : query.limit.limit + query.limit.offset;
    if (keep < rows.size()) {
        rows.resize(static_cast<std::size_t>(keep));
    }
    stats.record("sort");
    return Filter::indices(std::move(rows));
}

}  // namespace

auto Query::run(const ColumnMap& columns, QueryStats& stats, const PlanOptions& options) const
    -> std::expected<BatchResult, std::string> {
    auto mask = derive_filter(*filter, columns, options, stats);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    Filter active = mask->to_filter();

    if (order_by_index.has_value()) {
        if (*order_by_index >= select.size()) {
            return std::unexpected(fmt::format("order by index {} out of range for {} selects",
                                               *order_by_index, select.size()));
        }
        auto sorted = sort_rows(*this, *order_by_index, *mask, columns, options, stats);
        if (!sorted) {
            return std::unexpected(sorted.error());
        }
        active = std::move(*sorted);
    }

    BatchResult result;
    result.sort_by = order_by_index;
    result.select.reserve(select.size());
    for (const auto& expr : select) {
        stats.start();
        auto plan = QueryPlan::compile(*expr, columns, active, options);
        if (!plan) {
            return std::unexpected(plan.error());
        }
        auto compiled = prepare(std::move(*plan));
        stats.record("compile_select");

        stats.start();
        auto values = compiled.execute();
        if (!values) {
            return std::unexpected(values.error());
        }
        result.select.push_back(values->decode());
        stats.record("select");
    }
    return result;
}

auto Query::run_aggregate(const ColumnMap& columns, QueryStats& stats,
                          const PlanOptions& options) const
    -> std::expected<BatchResult, std::string> {
    auto mask = derive_filter(*filter, columns, options, stats);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    const Filter active = mask->to_filter();

    stats.start();
    auto key_plan = QueryPlan::compile_grouping_key(select, columns, active, options);
    if (!key_plan) {
        return std::unexpected(key_plan.error());
    }
    auto compiled_key = prepare(std::move(*key_plan));
    stats.record("compile_grouping_key");

    stats.start();
    auto keys = compiled_key.execute();
    if (!keys) {
        return std::unexpected(keys.error());
    }
    auto groups = grouping(*keys);
    if (!groups) {
        return std::unexpected(groups.error());
    }
    TypedVec sort_view = TypedVec{groups->groups}.order_preserving();
    RowIndices order(sort_view.len());
    std::iota(order.begin(), order.end(), std::size_t{0});
    sort_view.sort_indices_asc(order);
    stats.record("grouping");
    spdlog::debug("{} rows in {} groups", groups->ids.size(), groups->group_count());

    BatchResult result;
    result.select.reserve(aggregate.size());
    result.aggregators.reserve(aggregate.size());
    for (const auto& [aggregator, expr] : aggregate) {
        stats.start();
        auto plan = QueryPlan::compile_aggregate(*expr, columns, active, aggregator, options);
        if (!plan) {
            return std::unexpected(plan.error());
        }
        auto compiled = prepare_aggregation(std::move(*plan), *groups, aggregator);
        stats.record("compile_aggregate");

        stats.start();
        auto values = compiled.execute();
        if (!values) {
            return std::unexpected(values.error());
        }
        result.select.push_back(values->index_decode(order));
        result.aggregators.push_back(aggregator);
        stats.record("aggregate");
    }
    result.group_by = sort_view.index_decode_columns(order);
    return result;
}

auto Query::explain(const ColumnMap& columns, const PlanOptions& options) const
    -> std::expected<std::string, std::string> {
    const Filter none = Filter::none();
    std::string out;

    auto filter_plan = QueryPlan::compile(*filter, columns, none, options);
    if (!filter_plan) {
        return std::unexpected(filter_plan.error());
    }
    out += fmt::format("filter: {}\n", filter_plan->describe());

    const auto names = result_column_names();
    if (aggregate.empty()) {
        for (std::size_t i = 0; i < select.size(); ++i) {
            auto plan = QueryPlan::compile(*select[i], columns, none, options);
            if (!plan) {
                return std::unexpected(plan.error());
            }
            out += fmt::format("{}: {}\n", names[i], plan->describe());
        }
        if (order_by_index.has_value()) {
            out += fmt::format("order by: {} {}\n", *order_by_index,
                               order_desc ? "desc" : "asc");
        }
        out += fmt::format("limit: {} offset {}", limit.limit, limit.offset);
        return out;
    }

    auto key_plan = QueryPlan::compile_grouping_key(select, columns, none, options);
    if (!key_plan) {
        return std::unexpected(key_plan.error());
    }
    out += fmt::format("group by: {}", key_plan->describe());
    for (std::size_t i = 0; i < aggregate.size(); ++i) {
        const auto& [aggregator, expr] = aggregate[i];
        auto plan = QueryPlan::compile_aggregate(*expr, columns, none, aggregator, options);
        if (!plan) {
            return std::unexpected(plan.error());
        }
        out += fmt::format("\n{}: {}", names[select.size() + i], plan->describe());
    }
    return out;
}

auto Query::is_select_star() const -> bool {
    if (select.size() != 1) {
        return false;
    }
    const std::string* name = ir::col_name_of(*select.front());
    return name != nullptr && *name == "*";
}

auto Query::result_column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(select.size() + aggregate.size());
    std::size_t anon_columns = 0;
    for (const auto& expr : select) {
        if (const std::string* name = ir::col_name_of(*expr)) {
            names.push_back(*name);
        } else {
            names.push_back(fmt::format("col_{}", anon_columns++));
        }
    }
    std::size_t anon_aggregates = 0;
    for (const auto& entry : aggregate) {
        names.push_back(fmt::format("{}_{}", to_string(entry.first), anon_aggregates++));
    }
    return names;
}

auto Query::find_referenced_cols() const -> std::unordered_set<std::string> {
    std::unordered_set<std::string> names;
    for (const auto& expr : select) {
        ir::add_colnames(*expr, names);
    }
    ir::add_colnames(*filter, names);
    for (const auto& entry : aggregate) {
        ir::add_colnames(*entry.second, names);
    }
    return names;
}

}  // namespace strata::engine
