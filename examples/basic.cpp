#include <strata/strata.hpp>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

using namespace strata;
using ir::Func2Type;

void print_column(std::string_view name, const engine::TypedVec& values) {
    std::visit(
        [&](const auto& d) {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, IntVec> || std::is_same_v<D, StrVec>) {
                fmt::print("  {:<8} [{}]\n", name, fmt::join(d, ", "));
            } else {
                fmt::print("  {:<8} {}\n", name, values.describe());
            }
        },
        values.data());
}

}  // namespace

auto main() -> int {
    spdlog::set_level(spdlog::level::debug);

    // Build a small batch of trades
    auto symbol = Column::from_strings("symbol", {"AAPL", "MSFT", "AAPL", "GOOG", "MSFT", "AAPL"});
    auto qty = Column::from_ints("qty", {100, 250, 75, 10, 400, 50});
    auto price = Column::from_ints("price", {18950, 41020, 18990, 17205, 40880, 19010});

    fmt::print("=== Columns ===\n");
    for (const Column* column : {&symbol, &qty, &price}) {
        fmt::print("{}: {} rows, {} {}, {} bytes\n", column->name(), column->len(),
                   to_string(column->encoding_type()), column->codec()->describe(),
                   column->heap_size());
    }

    engine::ColumnMap columns{{"symbol", &symbol}, {"qty", &qty}, {"price", &price}};

    // SELECT symbol, qty WHERE qty > 60 ORDER BY qty DESC LIMIT 3
    fmt::print("\n=== Projection ===\n");
    engine::Query projection;
    projection.select = {ir::col("symbol"), ir::col("qty")};
    projection.filter = ir::func2(Func2Type::GT, ir::col("qty"), ir::int_lit(60));
    projection.order_by = "qty";
    projection.order_by_index = 1;
    projection.order_desc = true;
    projection.limit = ir::LimitClause{.limit = 3, .offset = 0};

    engine::QueryStats stats;
    auto flat = projection.run(columns, stats);
    if (!flat) {
        fmt::print("error: {}\n", flat.error());
        return 1;
    }
    auto names = projection.result_column_names();
    for (std::size_t i = 0; i < flat->select.size(); ++i) {
        print_column(names[i], flat->select[i]);
    }

    // SELECT symbol, count(qty), sum(qty) GROUP BY symbol
    fmt::print("\n=== Aggregation ===\n");
    engine::Query grouped;
    grouped.select = {ir::col("symbol")};
    grouped.aggregate = {{engine::Aggregator::Count, ir::col("qty")},
                         {engine::Aggregator::Sum, ir::col("qty")}};

    if (auto plan = grouped.explain(columns)) {
        fmt::print("{}\n", *plan);
    }
    auto result = grouped.run_aggregate(columns, stats);
    if (!result) {
        fmt::print("error: {}\n", result.error());
        return 1;
    }
    names = grouped.result_column_names();
    print_column(names[0], result->group_by->front());
    for (std::size_t i = 0; i < result->select.size(); ++i) {
        print_column(names[1 + i], result->select[i]);
    }

    fmt::print("\n{}\n", stats.summary());
    stats.log_summary();
    return 0;
}
