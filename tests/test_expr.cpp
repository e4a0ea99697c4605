#include <strata/ir/expr.hpp>

#include <catch2/catch_test_macros.hpp>

namespace {

using namespace strata;
using namespace strata::ir;

}  // namespace

TEST_CASE("Expression builders", "[ir][expr]") {
    auto e = func2(Func2Type::Add, col("a"), int_lit(3));

    const auto* f = std::get_if<Func2>(&e->node);
    REQUIRE(f != nullptr);
    REQUIRE(f->op == Func2Type::Add);
    REQUIRE(*col_name_of(*f->lhs) == "a");
    REQUIRE(col_name_of(*f->rhs) == nullptr);
    REQUIRE(to_string(*e) == "(a + 3)");
}

TEST_CASE("Expression rendering", "[ir][expr]") {
    auto e = func2(Func2Type::And, func1(Func1Type::Not, col("flag")),
                   func2(Func2Type::Equals, col("name"), str_lit("x")));
    REQUIRE(to_string(*e) == "(NOT flag AND (name = \"x\"))");
    REQUIRE(to_string(*func1(Func1Type::Negate, int_lit(4))) == "-4");
    REQUIRE(to_string(*bool_lit(true)) == "true");
}

TEST_CASE("add_colnames collects every referenced column once", "[ir][expr]") {
    auto e = func2(Func2Type::Or, func2(Func2Type::LT, col("a"), col("b")),
                   func2(Func2Type::GT, col("a"), int_lit(1)));
    std::unordered_set<std::string> names;
    add_colnames(*e, names);
    REQUIRE(names == std::unordered_set<std::string>{"a", "b"});
}

TEST_CASE("Comparison helpers", "[ir][expr]") {
    REQUIRE(is_comparison(Func2Type::LTE));
    REQUIRE_FALSE(is_comparison(Func2Type::And));
    REQUIRE(flip_comparison(Func2Type::LT) == Func2Type::GT);
    REQUIRE(flip_comparison(Func2Type::GTE) == Func2Type::LTE);
    REQUIRE(flip_comparison(Func2Type::Equals) == Func2Type::Equals);
    REQUIRE(flip_comparison(Func2Type::NotEquals) == Func2Type::NotEquals);
}
