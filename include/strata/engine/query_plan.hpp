#pragma once

#include <strata/core/column.hpp>
#include <strata/engine/aggregation.hpp>
#include <strata/engine/aggregator.hpp>
#include <strata/engine/filter.hpp>
#include <strata/engine/typed_vec.hpp>
#include <strata/ir/expr.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strata::engine {

/// Columns of one batch by name. Borrowed for the duration of a query.
using ColumnMap = std::unordered_map<std::string, const Column*>;

/// Planner switches. Disabling a pushdown never changes query results.
struct PlanOptions {
    /// Run comparisons, sums, counts and grouping on codes when the codec allows it.
    bool encoded_pushdown = true;
    /// Pack several encoded grouping keys into one 64-bit key.
    bool pack_grouping_keys = true;
};

struct PlanNode;
using PlanPtr = std::shared_ptr<const PlanNode>;

namespace plan {

/// Read the rows of a column that pass `filter`, keeping codes encoded.
struct ReadColumn {
    const Column* column = nullptr;
    Filter filter;
};

/// Decode the output of `input` into logical values.
struct Decode {
    PlanPtr input;
};

/// Literal repeated once per row that passes the filter.
struct Literal {
    ScalarValue value;
    std::size_t len = 0;
};

/// Comparison of encoded codes against a literal already in the encoded domain.
struct CompareEncoded {
    ir::Func2Type op = ir::Func2Type::Equals;
    PlanPtr input;
    std::uint64_t code = 0;
};

/// Arithmetic, comparison or logic on decoded values.
struct Binary {
    ir::Func2Type op = ir::Func2Type::Add;
    PlanPtr lhs;
    PlanPtr rhs;
};

struct Unary {
    ir::Func1Type op = ir::Func1Type::Not;
    PlanPtr input;
};

/// Encoded grouping keys packed into one 64-bit value per row.
struct PackKeys {
    std::vector<PlanPtr> inputs;
    std::shared_ptr<const KeyLayout> layout;
};

/// Decoded grouping keys combined into one row per input row.
struct KeyTuple {
    std::vector<PlanPtr> inputs;
    std::vector<BasicType> types;
    std::size_t len = 0;
};

}  // namespace plan

struct PlanNode {
    std::variant<plan::ReadColumn, plan::Decode, plan::Literal, plan::CompareEncoded,
                 plan::Binary, plan::Unary, plan::PackKeys, plan::KeyTuple>
        node;
    /// Logical type of the node's values.
    BasicType type = BasicType::Integer;
};

/// An executable operator tree compiled from expressions and a Filter.
class QueryPlan {
   public:
    /// Compile one expression.
    [[nodiscard]] static auto compile(const ir::Expr& expr, const ColumnMap& columns,
                                      const Filter& filter, const PlanOptions& options = {})
        -> std::expected<QueryPlan, std::string>;

    /// Compile several expressions into one composite, sortable grouping key.
    [[nodiscard]] static auto compile_grouping_key(const std::vector<ir::ExprPtr>& exprs,
                                                   const ColumnMap& columns,
                                                   const Filter& filter,
                                                   const PlanOptions& options = {})
        -> std::expected<QueryPlan, std::string>;

    /// Compile the input of an aggregation; decoding is skipped where
    /// `aggregator` gives the same result on codes.
    [[nodiscard]] static auto compile_aggregate(const ir::Expr& expr, const ColumnMap& columns,
                                                const Filter& filter, Aggregator aggregator,
                                                const PlanOptions& options = {})
        -> std::expected<QueryPlan, std::string>;

    [[nodiscard]] auto root() const noexcept -> const PlanNode& { return *root_; }
    [[nodiscard]] auto type() const noexcept -> BasicType { return root_->type; }
    [[nodiscard]] auto describe() const -> std::string;

   private:
    explicit QueryPlan(PlanPtr root) : root_(std::move(root)) {}

    PlanPtr root_;
};

/// A plan ready to run. Executes exactly once.
class CompiledPlan {
   public:
    explicit CompiledPlan(QueryPlan plan) : plan_(std::move(plan)) {}

    [[nodiscard]] auto execute() -> std::expected<TypedVec, std::string>;

   private:
    QueryPlan plan_;
    bool executed_ = false;
};

/// An aggregation over a compiled input plan. Executes exactly once.
/// The grouping is borrowed and must outlive execution.
class CompiledAggregation {
   public:
    CompiledAggregation(QueryPlan plan, const Grouping& grouping, Aggregator aggregator)
        : input_(std::move(plan)), grouping_(&grouping), aggregator_(aggregator) {}

    [[nodiscard]] auto execute() -> std::expected<TypedVec, std::string>;

   private:
    CompiledPlan input_;
    const Grouping* grouping_;
    Aggregator aggregator_;
};

[[nodiscard]] auto prepare(QueryPlan plan) -> CompiledPlan;

[[nodiscard]] auto prepare_aggregation(QueryPlan plan, const Grouping& grouping,
                                       Aggregator aggregator) -> CompiledAggregation;

}  // namespace strata::engine
