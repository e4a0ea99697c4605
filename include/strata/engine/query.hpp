#pragma once

#include <strata/engine/aggregator.hpp>
#include <strata/engine/filter.hpp>
#include <strata/engine/query_plan.hpp>
#include <strata/engine/query_stats.hpp>
#include <strata/engine/typed_vec.hpp>
#include <strata/ir/expr.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace strata::engine {

/// Output of one query over one batch of columns.
///
/// String values borrow from the columns the query ran on and stay valid as
/// long as those columns do.
struct BatchResult {
    /// Decoded GROUP BY columns, one per select expression, sorted ascending
    /// by key. Empty for the flat path.
    std::optional<std::vector<TypedVec>> group_by;
    /// Index into `select` the rows are ordered by.
    std::optional<std::size_t> sort_by;
    /// Decoded select results (flat path) or aggregate results, one per
    /// aggregate, in group order (aggregate path).
    std::vector<TypedVec> select;
    std::vector<Aggregator> aggregators;
    std::size_t level = 0;
    std::size_t batch_count = 1;
};

using AggregateExpr = std::pair<Aggregator, ir::ExprPtr>;

/// A parsed SELECT over one table.
struct Query {
    std::vector<ir::ExprPtr> select;
    std::string table;
    /// The parser supplies `true` when there is no WHERE clause.
    ir::ExprPtr filter = ir::bool_lit(true);
    std::vector<AggregateExpr> aggregate;
    std::optional<std::string> order_by;
    bool order_desc = false;
    ir::LimitClause limit;
    std::optional<std::size_t> order_by_index;

    /// Flat projection: filter, optional ORDER BY with LIMIT, then selects.
    [[nodiscard]] auto run(const ColumnMap& columns, QueryStats& stats,
                           const PlanOptions& options = {}) const
        -> std::expected<BatchResult, std::string>;

    /// Grouped aggregation; the select list is the GROUP BY list.
    [[nodiscard]] auto run_aggregate(const ColumnMap& columns, QueryStats& stats,
                                     const PlanOptions& options = {}) const
        -> std::expected<BatchResult, std::string>;

    /// Compiled plans as text, one line per expression. Plans are shown
    /// without the row restriction, which only exists after the filter ran.
    [[nodiscard]] auto explain(const ColumnMap& columns, const PlanOptions& options = {}) const
        -> std::expected<std::string, std::string>;

    [[nodiscard]] auto is_select_star() const -> bool;
    [[nodiscard]] auto result_column_names() const -> std::vector<std::string>;
    [[nodiscard]] auto find_referenced_cols() const -> std::unordered_set<std::string>;
};

}  // namespace strata::engine
