#include <strata/engine/aggregation.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

namespace {

using namespace strata;
using namespace strata::engine;

auto ints(IntVec values) -> TypedVec {
    return TypedVec{TypedVec::Data{std::move(values)}};
}

auto require_grouping(const TypedVec& keys) -> Grouping {
    auto result = grouping(keys);
    REQUIRE(result.has_value());
    return std::move(result.value());
}

}  // namespace

TEST_CASE("grouping assigns ids in first-seen order", "[engine][aggregation]") {
    auto g = require_grouping(ints({7, 3, 7, 9, 3}));

    REQUIRE(g.ids == std::vector<std::uint32_t>{0, 1, 0, 2, 1});
    REQUIRE(g.max_index == 2);
    REQUIRE(g.group_count() == 3);
    REQUIRE(std::get<IntVec>(g.groups.data()) == IntVec{7, 3, 9});
}

TEST_CASE("rows share a group id exactly when their keys are equal", "[engine][aggregation]") {
    IntVec keys{5, 1, 5, 2, 1, 1, 8, 2};
    auto g = require_grouping(ints(keys));
    for (std::size_t i = 0; i < keys.size(); ++i) {
        for (std::size_t j = 0; j < keys.size(); ++j) {
            REQUIRE((g.ids[i] == g.ids[j]) == (keys[i] == keys[j]));
        }
    }
}

TEST_CASE("grouping on small codes uses the code values", "[engine][aggregation]") {
    auto codec = std::make_shared<const IntegerOffsetCodec<std::uint16_t>>(1000);
    TypedVec keys{TypedVec::Data{EncodedVec{CodeVec{std::vector<std::uint16_t>{4, 4, 65535}}, codec}}};
    auto g = require_grouping(keys);

    REQUIRE(g.ids == std::vector<std::uint32_t>{0, 0, 1});
    REQUIRE(g.groups.is_encoded());
    REQUIRE(std::get<IntVec>(g.groups.decode().data()) == IntVec{1004, 66535});
}

TEST_CASE("grouping on strings and booleans", "[engine][aggregation]") {
    auto strings = require_grouping(TypedVec{TypedVec::Data{StrVec{"b", "a", "b"}}});
    REQUIRE(strings.ids == std::vector<std::uint32_t>{0, 1, 0});

    auto bools = require_grouping(TypedVec{TypedVec::Data{BoolVec{1, 1, 0}}});
    REQUIRE(bools.ids == std::vector<std::uint32_t>{0, 0, 1});
}

TEST_CASE("grouping a constant key", "[engine][aggregation]") {
    auto g = require_grouping(TypedVec{TypedVec::Data{Constant{std::int64_t{1}, 4}}});
    REQUIRE(g.ids == std::vector<std::uint32_t>{0, 0, 0, 0});
    REQUIRE(g.group_count() == 1);
}

TEST_CASE("grouping no rows", "[engine][aggregation]") {
    auto g = require_grouping(ints({}));
    REQUIRE(g.group_count() == 0);
    REQUIRE(g.max_index == 0);
}

TEST_CASE("count and sum per group", "[engine][aggregation]") {
    auto g = require_grouping(ints({1, 2, 1, 1}));
    auto input = ints({10, 20, 30, 40});

    auto counts = aggregate(input, g, Aggregator::Count);
    REQUIRE(counts.has_value());
    REQUIRE(std::get<IntVec>(counts->data()) == IntVec{3, 1});

    auto sums = aggregate(input, g, Aggregator::Sum);
    REQUIRE(sums.has_value());
    REQUIRE(std::get<IntVec>(sums->data()) == IntVec{80, 20});
}

TEST_CASE("sum of offset-0 codes equals the sum of decoded values", "[engine][aggregation]") {
    auto g = require_grouping(ints({0, 0, 1}));
    auto codec = std::make_shared<const IntegerOffsetCodec<std::uint8_t>>(0);
    TypedVec codes{TypedVec::Data{EncodedVec{CodeVec{std::vector<std::uint8_t>{200, 100, 7}}, codec}}};

    auto on_codes = aggregate(codes, g, Aggregator::Sum);
    auto on_values = aggregate(codes.decode(), g, Aggregator::Sum);
    REQUIRE(on_codes.has_value());
    REQUIRE(on_values.has_value());
    REQUIRE(std::get<IntVec>(on_codes->data()) == std::get<IntVec>(on_values->data()));
    REQUIRE(std::get<IntVec>(on_codes->data()) == IntVec{300, 7});
}

TEST_CASE("sum refuses codes of a shifted codec", "[engine][aggregation]") {
    auto g = require_grouping(ints({0}));
    auto codec = std::make_shared<const IntegerOffsetCodec<std::uint8_t>>(5);
    TypedVec codes{TypedVec::Data{EncodedVec{CodeVec{std::vector<std::uint8_t>{1}}, codec}}};

    auto result = aggregate(codes, g, Aggregator::Sum);
    REQUIRE_FALSE(result.has_value());
}

TEST_CASE("sum of a constant multiplies the counts", "[engine][aggregation]") {
    auto g = require_grouping(ints({4, 4, 5}));
    auto result = aggregate(TypedVec{TypedVec::Data{Constant{std::int64_t{3}, 3}}}, g,
                            Aggregator::Sum);
    REQUIRE(result.has_value());
    REQUIRE(std::get<IntVec>(result->data()) == IntVec{6, 3});
}

TEST_CASE("sum wraps on overflow", "[engine][aggregation]") {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    auto g = require_grouping(ints({0, 0}));
    auto result = aggregate(ints({max, 1}), g, Aggregator::Sum);
    REQUIRE(result.has_value());
    REQUIRE(std::get<IntVec>(result->data()) ==
            IntVec{std::numeric_limits<std::int64_t>::min()});
}

TEST_CASE("aggregate errors", "[engine][aggregation]") {
    auto g = require_grouping(ints({0, 1}));

    SECTION("input length differs from the grouping") {
        REQUIRE_FALSE(aggregate(ints({1}), g, Aggregator::Count).has_value());
    }

    SECTION("sum of strings") {
        auto result = aggregate(TypedVec{TypedVec::Data{StrVec{"a", "b"}}}, g, Aggregator::Sum);
        REQUIRE_FALSE(result.has_value());
    }
}
