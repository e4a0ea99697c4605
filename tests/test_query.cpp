#include <strata/core/column.hpp>
#include <strata/engine/query.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>

namespace {

using namespace strata;
using namespace strata::engine;
using ir::Func2Type;

auto require_result(std::expected<BatchResult, std::string> result) -> BatchResult {
    if (!result) {
        FAIL(result.error());
    }
    return std::move(result.value());
}

auto ints_of(const TypedVec& v) -> IntVec {
    return std::get<IntVec>(v.data());
}

auto strings_of(const TypedVec& v) -> std::vector<std::string> {
    const auto& views = std::get<StrVec>(v.data());
    return {views.begin(), views.end()};
}

}  // namespace

TEST_CASE("Projection with a filter", "[engine][query]") {
    auto age = Column::from_ints("age", {10, 20, 30, 40});
    ColumnMap columns{{"age", &age}};

    Query query;
    query.select = {ir::col("age")};
    query.filter = ir::func2(Func2Type::GT, ir::col("age"), ir::int_lit(15));

    QueryStats stats;
    auto result = require_result(query.run(columns, stats));
    REQUIRE(result.select.size() == 1);
    REQUIRE(ints_of(result.select[0]) == IntVec{20, 30, 40});
    REQUIRE_FALSE(result.group_by.has_value());
    REQUIRE_FALSE(result.sort_by.has_value());
    REQUIRE(result.aggregators.empty());
    REQUIRE(result.level == 0);
    REQUIRE(result.batch_count == 1);
    REQUIRE(stats.elapsed("compile_filter").has_value());
    REQUIRE(stats.elapsed("select").has_value());
}

TEST_CASE("Order by with limit", "[engine][query]") {
    auto age = Column::from_ints("age", {10, 20, 30, 40});
    ColumnMap columns{{"age", &age}};

    Query query;
    query.select = {ir::col("age")};
    query.order_by = "age";
    query.order_by_index = 0;
    query.order_desc = true;
    query.limit = ir::LimitClause{.limit = 2, .offset = 0};

    QueryStats stats;
    auto result = require_result(query.run(columns, stats));
    REQUIRE(ints_of(result.select[0]) == IntVec{40, 30});
    REQUIRE(result.sort_by == std::optional<std::size_t>{0});
}

TEST_CASE("Order by applies to every select and respects the filter", "[engine][query]") {
    auto age = Column::from_ints("age", {50, 20, 30, 20, 70});
    auto name = Column::from_strings("name", {"e", "b", "c", "d", "a"});
    ColumnMap columns{{"age", &age}, {"name", &name}};

    Query query;
    query.select = {ir::col("name"), ir::col("age")};
    query.filter = ir::func2(Func2Type::LT, ir::col("age"), ir::int_lit(60));
    query.order_by_index = 1;
    query.limit = ir::LimitClause{.limit = 2, .offset = 1};

    QueryStats stats;
    auto result = require_result(query.run(columns, stats));
    // limit + offset rows are kept; the caller skips the offset.
    REQUIRE(ints_of(result.select[1]) == IntVec{20, 20, 30});
    REQUIRE(strings_of(result.select[0]) == std::vector<std::string>{"b", "d", "c"});
}

TEST_CASE("Order by a computed expression", "[engine][query]") {
    auto x = Column::plain("x", {3, -1, 2}, std::nullopt);
    ColumnMap columns{{"x", &x}};

    Query query;
    query.select = {ir::func2(Func2Type::Multiply, ir::col("x"), ir::int_lit(-1))};
    query.order_by_index = 0;

    QueryStats stats;
    auto result = require_result(query.run(columns, stats));
    REQUIRE(ints_of(result.select[0]) == IntVec{-3, -2, 1});
}

TEST_CASE("Grouped aggregation", "[engine][query]") {
    auto region = Column::from_strings("region", {"x", "y", "x"});
    auto v = Column::from_ints("v", {1, 2, 3});
    ColumnMap columns{{"region", &region}, {"v", &v}};

    Query query;
    query.select = {ir::col("region")};
    query.aggregate = {{Aggregator::Sum, ir::col("v")}};

    QueryStats stats;
    auto result = require_result(query.run_aggregate(columns, stats));
    REQUIRE(result.group_by.has_value());
    REQUIRE(result.group_by->size() == 1);
    REQUIRE(strings_of(result.group_by->front()) == std::vector<std::string>{"x", "y"});
    REQUIRE(ints_of(result.select[0]) == IntVec{4, 2});
    REQUIRE(result.aggregators == std::vector<Aggregator>{Aggregator::Sum});
    REQUIRE_FALSE(result.sort_by.has_value());
}

TEST_CASE("Grouped aggregation sorts groups and keeps aggregates aligned", "[engine][query]") {
    auto city = Column::from_strings("city", {"oslo", "bern", "oslo", "lima", "bern", "oslo"});
    auto year = Column::from_ints("year", {2021, 2020, 2020, 2021, 2020, 2021});
    auto amount = Column::plain("amount", {5, 1, 2, 8, 4, 10}, std::nullopt);
    ColumnMap columns{{"city", &city}, {"year", &year}, {"amount", &amount}};

    Query query;
    query.select = {ir::col("city"), ir::col("year")};
    query.aggregate = {{Aggregator::Count, ir::col("amount")},
                       {Aggregator::Sum, ir::col("amount")}};

    for (bool pack : {true, false}) {
        INFO("pack_grouping_keys = " << pack);
        QueryStats stats;
        auto result = require_result(
            query.run_aggregate(columns, stats, PlanOptions{.pack_grouping_keys = pack}));

        REQUIRE(result.group_by->size() == 2);
        REQUIRE(strings_of((*result.group_by)[0]) ==
                std::vector<std::string>{"bern", "lima", "oslo", "oslo"});
        REQUIRE(ints_of((*result.group_by)[1]) == IntVec{2020, 2021, 2020, 2021});
        REQUIRE(ints_of(result.select[0]) == IntVec{2, 1, 1, 2});
        REQUIRE(ints_of(result.select[1]) == IntVec{5, 8, 2, 15});
    }
}

TEST_CASE("Grouping on a column built from explicit codes", "[engine][query]") {
    auto codec = std::make_shared<const IntegerOffsetCodec<std::uint8_t>>(0);
    auto x = Column::encoded("x", std::vector<std::uint8_t>{0, 5, 1}, codec, Range{0, 5});
    auto y = Column::from_ints("y", {1, 0, 0});
    ColumnMap columns{{"x", &x}, {"y", &y}};

    Query query;
    query.select = {ir::col("x"), ir::col("y")};
    query.aggregate = {{Aggregator::Count, ir::int_lit(1)}};

    for (bool pack : {true, false}) {
        INFO("pack_grouping_keys = " << pack);
        QueryStats stats;
        auto result = require_result(
            query.run_aggregate(columns, stats, PlanOptions{.pack_grouping_keys = pack}));
        REQUIRE(ints_of((*result.group_by)[0]) == IntVec{0, 1, 5});
        REQUIRE(ints_of((*result.group_by)[1]) == IntVec{1, 0, 0});
        REQUIRE(ints_of(result.select[0]) == IntVec{1, 1, 1});
    }
}

TEST_CASE("Grouped aggregation under a filter", "[engine][query]") {
    auto k = Column::from_ints("k", {3, 1, 3, 2, 1});
    auto v = Column::from_ints("v", {10, 20, 30, 40, 50}, 0, 50);
    ColumnMap columns{{"k", &k}, {"v", &v}};

    Query query;
    query.select = {ir::col("k")};
    query.filter = ir::func2(Func2Type::NotEquals, ir::col("k"), ir::int_lit(2));
    query.aggregate = {{Aggregator::Sum, ir::col("v")}, {Aggregator::Count, ir::int_lit(1)}};

    QueryStats stats;
    auto result = require_result(query.run_aggregate(columns, stats));
    REQUIRE(ints_of(result.group_by->front()) == IntVec{1, 3});
    REQUIRE(ints_of(result.select[0]) == IntVec{70, 40});
    REQUIRE(ints_of(result.select[1]) == IntVec{2, 2});
}

TEST_CASE("Aggregation without group by", "[engine][query]") {
    auto v = Column::from_ints("v", {4, 5, 6});
    ColumnMap columns{{"v", &v}};

    Query query;
    query.aggregate = {{Aggregator::Sum, ir::col("v")}, {Aggregator::Count, ir::col("v")}};

    QueryStats stats;
    auto result = require_result(query.run_aggregate(columns, stats));
    REQUIRE(result.group_by->empty());
    REQUIRE(ints_of(result.select[0]) == IntVec{15});
    REQUIRE(ints_of(result.select[1]) == IntVec{3});
}

TEST_CASE("Constant filters", "[engine][query]") {
    auto a = Column::from_ints("a", {1, 2, 3});
    ColumnMap columns{{"a", &a}};
    Query query;
    query.select = {ir::col("a")};
    QueryStats stats;

    SECTION("true keeps every row") {
        query.filter = ir::bool_lit(true);
        REQUIRE(ints_of(require_result(query.run(columns, stats)).select[0]) == IntVec{1, 2, 3});
    }

    SECTION("an integer keeps every row") {
        query.filter = ir::int_lit(1);
        REQUIRE(ints_of(require_result(query.run(columns, stats)).select[0]) == IntVec{1, 2, 3});
    }

    SECTION("false keeps no rows") {
        query.filter = ir::bool_lit(false);
        REQUIRE(ints_of(require_result(query.run(columns, stats)).select[0]).empty());
    }
}

TEST_CASE("Query errors", "[engine][query]") {
    auto a = Column::from_ints("a", {1, 2, 3});
    auto s = Column::from_strings("s", {"p", "q", "r"});
    ColumnMap columns{{"a", &a}, {"s", &s}};
    QueryStats stats;

    SECTION("non-boolean filter") {
        Query query;
        query.select = {ir::col("a")};
        query.filter = ir::col("a");
        auto result = query.run(columns, stats);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("filter expression must be boolean") != std::string::npos);
    }

    SECTION("unknown select column") {
        Query query;
        query.select = {ir::col("missing")};
        auto result = query.run(columns, stats);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("unknown column 'missing'") != std::string::npos);
    }

    SECTION("adding strings") {
        Query query;
        query.select = {ir::func2(Func2Type::Add, ir::col("s"), ir::col("a"))};
        REQUIRE_FALSE(query.run(columns, stats).has_value());
    }

    SECTION("summing strings") {
        Query query;
        query.select = {ir::col("a")};
        query.aggregate = {{Aggregator::Sum, ir::col("s")}};
        REQUIRE_FALSE(query.run_aggregate(columns, stats).has_value());
    }

    SECTION("order by index past the select list") {
        Query query;
        query.select = {ir::col("a")};
        query.order_by_index = 3;
        REQUIRE_FALSE(query.run(columns, stats).has_value());
    }
}

TEST_CASE("Query metadata", "[engine][query]") {
    Query query;
    query.select = {ir::col("a"), ir::func2(Func2Type::Add, ir::col("b"), ir::int_lit(1)),
                    ir::col("c"), ir::int_lit(5)};
    query.filter = ir::func2(Func2Type::GT, ir::col("d"), ir::int_lit(0));
    query.aggregate = {{Aggregator::Count, ir::col("e")}, {Aggregator::Sum, ir::col("a")}};

    SECTION("result column names use separate anonymous counters") {
        REQUIRE(query.result_column_names() ==
                std::vector<std::string>{"a", "col_0", "c", "col_1", "count_0", "sum_1"});
    }

    SECTION("aggregates share one anonymous counter") {
        Query named;
        named.select = {ir::col("a"), ir::func2(Func2Type::Add, ir::col("a"), ir::col("b")),
                        ir::col("b")};
        named.aggregate = {{Aggregator::Count, ir::col("x")}, {Aggregator::Sum, ir::col("y")}};
        REQUIRE(named.result_column_names() ==
                std::vector<std::string>{"a", "col_0", "b", "count_0", "sum_1"});
    }

    SECTION("referenced columns") {
        REQUIRE(query.find_referenced_cols() ==
                std::unordered_set<std::string>{"a", "b", "c", "d", "e"});
    }

    SECTION("select star") {
        REQUIRE_FALSE(query.is_select_star());
        Query star;
        star.select = {ir::col("*")};
        REQUIRE(star.is_select_star());
        star.select.push_back(ir::col("a"));
        REQUIRE_FALSE(star.is_select_star());
    }
}

TEST_CASE("Explain renders compiled plans", "[engine][query]") {
    auto age = Column::from_ints("age", {10, 20, 30});
    auto name = Column::from_strings("name", {"a", "b", "a"});
    ColumnMap columns{{"age", &age}, {"name", &name}};

    Query query;
    query.select = {ir::col("name")};
    query.filter = ir::func2(Func2Type::GT, ir::col("age"), ir::int_lit(15));
    query.aggregate = {{Aggregator::Sum, ir::col("age")}};

    auto text = query.explain(columns);
    REQUIRE(text.has_value());
    REQUIRE(text->find("filter: CompareEncoded") != std::string::npos);
    REQUIRE(text->find("group by: Read(name") != std::string::npos);
    REQUIRE(text->find("sum_0: Decode(Read(age") != std::string::npos);
}
