#pragma once

#include <strata/core/types.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace strata::ir {

/// Expression trees are produced by the parser and only read afterwards.
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// Reference to a column by name.
struct ColName {
    std::string name;
};

/// Literal value.
struct Const {
    ScalarValue value;
};

enum class Func1Type : std::uint8_t {
    Negate,
    Not,
};

enum class Func2Type : std::uint8_t {
    Add,
    Subtract,
    Multiply,
    Divide,
    Equals,
    NotEquals,
    LT,
    LTE,
    GT,
    GTE,
    And,
    Or,
};

struct Func1 {
    Func1Type op = Func1Type::Not;
    ExprPtr arg;
};

struct Func2 {
    Func2Type op = Func2Type::Add;
    ExprPtr lhs;
    ExprPtr rhs;
};

struct Expr {
    std::variant<ColName, Const, Func1, Func2> node;
};

/// LIMIT/OFFSET of a query.
struct LimitClause {
    std::uint64_t limit = 100;
    std::uint64_t offset = 0;
};

// ─── Builders ─────────────────────────────────────────────────────────────────

[[nodiscard]] auto col(std::string name) -> ExprPtr;
[[nodiscard]] auto int_lit(std::int64_t v) -> ExprPtr;
[[nodiscard]] auto str_lit(std::string v) -> ExprPtr;
[[nodiscard]] auto bool_lit(bool v) -> ExprPtr;
[[nodiscard]] auto func1(Func1Type op, ExprPtr arg) -> ExprPtr;
[[nodiscard]] auto func2(Func2Type op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr;

// ─── Inspection ───────────────────────────────────────────────────────────────

/// Name of the referenced column if `expr` is a plain column reference.
[[nodiscard]] auto col_name_of(const Expr& expr) -> const std::string*;

/// Add the name of every column referenced anywhere in `expr`.
void add_colnames(const Expr& expr, std::unordered_set<std::string>& out);

[[nodiscard]] auto is_comparison(Func2Type op) noexcept -> bool;

/// Swap operands of a comparison: `a < b` becomes `b > a`.
[[nodiscard]] auto flip_comparison(Func2Type op) noexcept -> Func2Type;

[[nodiscard]] auto to_string(Func1Type op) -> std::string_view;
[[nodiscard]] auto to_string(Func2Type op) -> std::string_view;
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

}  // namespace strata::ir
