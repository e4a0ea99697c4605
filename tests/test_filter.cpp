#include <strata/engine/filter.hpp>

#include <catch2/catch_test_macros.hpp>

namespace {

using namespace strata;
using namespace strata::engine;

}  // namespace

TEST_CASE("Filter::none keeps every row", "[engine][filter]") {
    auto filter = Filter::none();
    IntVec values{4, 5, 6};

    REQUIRE(filter.is_none());
    REQUIRE(filter.apply(values) == values);
    REQUIRE(filter.selected_count(3) == 3);
    REQUIRE(filter.describe() == "None");
}

TEST_CASE("Filter::bit_vec keeps flagged rows in order", "[engine][filter]") {
    auto filter = Filter::bit_vec(BoolVec{1, 0, 1, 1, 0});
    IntVec values{10, 20, 30, 40, 50};

    REQUIRE(filter.kind() == Filter::Kind::BitVec);
    REQUIRE(filter.apply(values) == IntVec{10, 30, 40});
    REQUIRE(filter.selected_count(5) == 3);
    REQUIRE(filter.describe() == "BitVec(3 of 5)");
}

TEST_CASE("Filter::bit_vec rejects a mask of the wrong length", "[engine][filter]") {
    auto filter = Filter::bit_vec(BoolVec{1, 0});
    IntVec values{1, 2, 3};

    REQUIRE_THROWS_AS(filter.apply(values), std::logic_error);
}

TEST_CASE("Filter::indices gathers in the given order", "[engine][filter]") {
    auto filter = Filter::indices(RowIndices{3, 0, 3});
    std::vector<std::uint8_t> codes{7, 8, 9, 10};

    REQUIRE(filter.kind() == Filter::Kind::Indices);
    REQUIRE(filter.apply(codes) == std::vector<std::uint8_t>{10, 7, 10});
    REQUIRE(filter.selected_count(4) == 3);
    REQUIRE(filter.describe() == "Indices(3)");
}

TEST_CASE("Applying a filter twice to the same data gives the same rows", "[engine][filter]") {
    auto filter = Filter::bit_vec(BoolVec{0, 1, 1, 0});
    IntVec values{1, 2, 3, 4};

    REQUIRE(filter.apply(values) == filter.apply(values));
}

TEST_CASE("Filter copies share their buffer", "[engine][filter]") {
    auto filter = Filter::indices(RowIndices{1, 2});
    Filter copy = filter;

    REQUIRE(copy.rows() == filter.rows());
}

TEST_CASE("MaskFilter candidate rows", "[engine][filter]") {
    SECTION("no mask yields every position") {
        MaskFilter mask;
        REQUIRE(mask.is_none());
        REQUIRE(mask.candidate_rows(4) == RowIndices{0, 1, 2, 3});
        REQUIRE(mask.to_filter().is_none());
    }

    SECTION("a mask yields the passing positions") {
        MaskFilter mask{BoolVec{0, 1, 0, 1, 1}};
        REQUIRE(mask.candidate_rows(5) == RowIndices{1, 3, 4});

        auto filter = mask.to_filter();
        REQUIRE(filter.kind() == Filter::Kind::BitVec);
        REQUIRE(filter.mask() == mask.mask());
    }
}
