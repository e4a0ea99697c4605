#include <strata/ir/expr.hpp>

#include <fmt/core.h>

namespace strata::ir {

auto col(std::string name) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{ColName{std::move(name)}});
}

auto int_lit(std::int64_t v) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{Const{ScalarValue{v}}});
}

auto str_lit(std::string v) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{Const{ScalarValue{std::move(v)}}});
}

auto bool_lit(bool v) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{Const{ScalarValue{v}}});
}

auto func1(Func1Type op, ExprPtr arg) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{Func1{op, std::move(arg)}});
}

auto func2(Func2Type op, ExprPtr lhs, ExprPtr rhs) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{Func2{op, std::move(lhs), std::move(rhs)}});
}

auto col_name_of(const Expr& expr) -> const std::string* {
    if (const auto* c = std::get_if<ColName>(&expr.node)) {
        return &c->name;
    }
    return nullptr;
}

void add_colnames(const Expr& expr, std::unordered_set<std::string>& out) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColName>) {
                out.insert(node.name);
            } else if constexpr (std::is_same_v<T, Func1>) {
                add_colnames(*node.arg, out);
            } else if constexpr (std::is_same_v<T, Func2>) {
                add_colnames(*node.lhs, out);
                add_colnames(*node.rhs, out);
            }
        },
        expr.node);
}

auto is_comparison(Func2Type op) noexcept -> bool {
    switch (op) {
        case Func2Type::Equals:
        case Func2Type::NotEquals:
        case Func2Type::LT:
        case Func2Type::LTE:
        case Func2Type::GT:
        case Func2Type::GTE:
            return true;
        default:
            return false;
    }
}

auto flip_comparison(Func2Type op) noexcept -> Func2Type {
    switch (op) {
        case Func2Type::LT:
            return Func2Type::GT;
        case Func2Type::LTE:
            return Func2Type::GTE;
        case Func2Type::GT:
            return Func2Type::LT;
        case Func2Type::GTE:
            return Func2Type::LTE;
        default:
            return op;  // Equals, NotEquals are symmetric
    }
}

auto to_string(Func1Type op) -> std::string_view {
    switch (op) {
        case Func1Type::Negate:
            return "-";
        case Func1Type::Not:
            return "NOT ";
    }
    return "?";
}

auto to_string(Func2Type op) -> std::string_view {
    switch (op) {
        case Func2Type::Add:
            return "+";
        case Func2Type::Subtract:
            return "-";
        case Func2Type::Multiply:
            return "*";
        case Func2Type::Divide:
            return "/";
        case Func2Type::Equals:
            return "=";
        case Func2Type::NotEquals:
            return "<>";
        case Func2Type::LT:
            return "<";
        case Func2Type::LTE:
            return "<=";
        case Func2Type::GT:
            return ">";
        case Func2Type::GTE:
            return ">=";
        case Func2Type::And:
            return "AND";
        case Func2Type::Or:
            return "OR";
    }
    return "?";
}

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColName>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, Const>) {
                return format_scalar(node.value);
            } else if constexpr (std::is_same_v<T, Func1>) {
                return fmt::format("{}{}", to_string(node.op), to_string(*node.arg));
            } else {
                return fmt::format("({} {} {})", to_string(*node.lhs), to_string(node.op),
                                   to_string(*node.rhs));
            }
        },
        expr.node);
}

}  // namespace strata::ir
