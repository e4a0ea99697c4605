#include <strata/engine/query_plan.hpp>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <bit>
#include <limits>

namespace strata::engine {

namespace {

using ir::Func1Type;
using ir::Func2Type;

// What the consumer of a column read can accept instead of decoded values.
enum class Want : std::uint8_t {
    Decoded,
    OrderPreserving,      // codes that sort like the values (grouping keys)
    SummationPreserving,  // codes that sum like the values (Sum)
    Any,                  // values are never inspected (Count)
};

struct Context {
    const ColumnMap& columns;
    const Filter& filter;
    const PlanOptions& options;
    std::size_t batch_len = 0;
};

template <typename N>
auto make_node(N node, BasicType type) -> PlanPtr {
    return std::make_shared<const PlanNode>(PlanNode{std::move(node), type});
}

auto batch_len_of(const ColumnMap& columns) -> std::size_t {
    std::size_t len = 0;
    for (const auto& [name, column] : columns) {
        if (column != nullptr) {
            len = std::max(len, column->len());
        }
    }
    return len;
}

auto format_columns(const ColumnMap& columns) -> std::string {
    if (columns.empty()) {
        return "<none>";
    }
    std::vector<std::string_view> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.emplace_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return fmt::format("{}", fmt::join(names, ", "));
}

auto type_of(const ScalarValue& value) -> BasicType {
    if (std::holds_alternative<std::string>(value)) {
        return BasicType::String;
    }
    if (std::holds_alternative<bool>(value)) {
        return BasicType::Boolean;
    }
    return BasicType::Integer;
}

auto find_column(const std::string& name, const Context& ctx)
    -> std::expected<const Column*, std::string> {
    auto it = ctx.columns.find(name);
    if (it == ctx.columns.end() || it->second == nullptr) {
        return std::unexpected("unknown column '" + name +
                               "' (available: " + format_columns(ctx.columns) + ")");
    }
    const Column* column = it->second;
    if (const auto* mask = ctx.filter.mask(); mask != nullptr && mask->size() != column->len()) {
        return std::unexpected(fmt::format("filter covers {} rows but column '{}' has {}",
                                           mask->size(), name, column->len()));
    }
    if (const auto* rows = ctx.filter.rows(); rows != nullptr && !rows->empty()) {
        if (*std::max_element(rows->begin(), rows->end()) >= column->len()) {
            return std::unexpected(
                fmt::format("filter selects rows past the end of column '{}'", name));
        }
    }
    return column;
}

auto codes_allowed(const Codec& codec, Want want, const PlanOptions& options) -> bool {
    if (!options.encoded_pushdown) {
        return false;
    }
    switch (want) {
        case Want::Decoded:
            return false;
        case Want::OrderPreserving:
            return codec.is_order_preserving() && codec.is_positive_integer();
        case Want::SummationPreserving:
            return codec.is_summation_preserving();
        case Want::Any:
            return true;
    }
    return false;
}

auto compile_column(const Column& column, Want want, const Context& ctx) -> PlanPtr {
    auto read = make_node(plan::ReadColumn{&column, ctx.filter}, column.basic_type());
    if (!column.is_encoded() || codes_allowed(*column.codec(), want, ctx.options)) {
        return read;
    }
    return make_node(plan::Decode{std::move(read)}, column.basic_type());
}

auto compile_expr(const ir::Expr& expr, const Context& ctx, Want want)
    -> std::expected<PlanPtr, std::string>;

// `col <op> literal` on codes. Returns null when the rewrite does not apply.
auto try_encoded_comparison(const ir::Func2& f, const Context& ctx)
    -> std::expected<PlanPtr, std::string> {
    if (!ctx.options.encoded_pushdown) {
        return nullptr;
    }
    const std::string* name = ir::col_name_of(*f.lhs);
    const auto* lit = std::get_if<ir::Const>(&f.rhs->node);
    Func2Type op = f.op;
    if (name == nullptr || lit == nullptr) {
        name = ir::col_name_of(*f.rhs);
        lit = std::get_if<ir::Const>(&f.lhs->node);
        op = ir::flip_comparison(f.op);
    }
    if (name == nullptr || lit == nullptr) {
        return nullptr;
    }
    auto column = find_column(*name, ctx);
    if (!column) {
        return std::unexpected(column.error());
    }
    const Codec* codec = (*column)->codec().get();
    if (codec == nullptr) {
        return nullptr;
    }
    const bool equality = op == Func2Type::Equals || op == Func2Type::NotEquals;
    if (!equality && !codec->is_order_preserving()) {
        return nullptr;
    }
    auto code = codec->encode_literal(lit->value);
    if (!code) {
        spdlog::debug("column '{}': {}; comparing decoded values", *name, code.error());
        return nullptr;
    }
    auto read = make_node(plan::ReadColumn{*column, ctx.filter}, (*column)->basic_type());
    return make_node(plan::CompareEncoded{op, std::move(read), *code}, BasicType::Boolean);
}

auto compile_func2(const ir::Func2& f, const Context& ctx) -> std::expected<PlanPtr, std::string> {
    if (ir::is_comparison(f.op)) {
        auto pushed = try_encoded_comparison(f, ctx);
        if (!pushed) {
            return std::unexpected(pushed.error());
        }
        if (*pushed != nullptr) {
            return *pushed;
        }
    }
    auto lhs = compile_expr(*f.lhs, ctx, Want::Decoded);
    if (!lhs) {
        return std::unexpected(lhs.error());
    }
    auto rhs = compile_expr(*f.rhs, ctx, Want::Decoded);
    if (!rhs) {
        return std::unexpected(rhs.error());
    }
    const BasicType lt = (*lhs)->type;
    const BasicType rt = (*rhs)->type;
    BasicType out = BasicType::Boolean;
    switch (f.op) {
        case Func2Type::Add:
        case Func2Type::Subtract:
        case Func2Type::Multiply:
        case Func2Type::Divide:
            if (lt != BasicType::Integer || rt != BasicType::Integer) {
                return std::unexpected(fmt::format("operator {} requires integers, got {} and {}",
                                                   ir::to_string(f.op), to_string(lt),
                                                   to_string(rt)));
            }
            out = BasicType::Integer;
            break;
        case Func2Type::And:
        case Func2Type::Or:
            if (lt != BasicType::Boolean || rt != BasicType::Boolean) {
                return std::unexpected(fmt::format("operator {} requires booleans, got {} and {}",
                                                   ir::to_string(f.op), to_string(lt),
                                                   to_string(rt)));
            }
            break;
        default:
            if (lt != rt) {
                return std::unexpected(fmt::format("cannot compare {} with {}", to_string(lt),
                                                   to_string(rt)));
            }
            break;
    }
    return make_node(plan::Binary{f.op, std::move(*lhs), std::move(*rhs)}, out);
}

auto compile_expr(const ir::Expr& expr, const Context& ctx, Want want)
    -> std::expected<PlanPtr, std::string> {
    return std::visit(
        [&](const auto& node) -> std::expected<PlanPtr, std::string> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::ColName>) {
                auto column = find_column(node.name, ctx);
                if (!column) {
                    return std::unexpected(column.error());
                }
                return compile_column(**column, want, ctx);
            } else if constexpr (std::is_same_v<T, ir::Const>) {
                return make_node(plan::Literal{node.value, ctx.filter.selected_count(ctx.batch_len)},
                                 type_of(node.value));
            } else if constexpr (std::is_same_v<T, ir::Func1>) {
                auto arg = compile_expr(*node.arg, ctx, Want::Decoded);
                if (!arg) {
                    return std::unexpected(arg.error());
                }
                const BasicType expected_type =
                    node.op == Func1Type::Negate ? BasicType::Integer : BasicType::Boolean;
                if ((*arg)->type != expected_type) {
                    return std::unexpected(fmt::format("{} requires {}, got {}",
                                                       node.op == Func1Type::Negate ? "negation"
                                                                                    : "NOT",
                                                       to_string(expected_type),
                                                       to_string((*arg)->type)));
                }
                return make_node(plan::Unary{node.op, std::move(*arg)}, expected_type);
            } else {
                return compile_func2(node, ctx);
            }
        },
        expr.node);
}

// Several encoded columns whose codes fit side by side into 64 bits.
auto try_pack_keys(const std::vector<ir::ExprPtr>& exprs, const Context& ctx)
    -> std::expected<PlanPtr, std::string> {
    if (exprs.size() < 2 || !ctx.options.encoded_pushdown || !ctx.options.pack_grouping_keys) {
        return nullptr;
    }
    std::vector<const Column*> columns;
    std::vector<unsigned> widths;
    unsigned total_bits = 0;
    for (const auto& expr : exprs) {
        const std::string* name = ir::col_name_of(*expr);
        if (name == nullptr) {
            return nullptr;
        }
        auto column = find_column(*name, ctx);
        if (!column) {
            return std::unexpected(column.error());
        }
        const Codec* codec = (*column)->codec().get();
        const auto& range = (*column)->range();
        if (codec == nullptr || !codec->is_order_preserving() || !codec->is_positive_integer() ||
            !range.has_value() || range->second < 0) {
            return nullptr;
        }
        const unsigned bits =
            std::max(1U, static_cast<unsigned>(std::bit_width(
                             static_cast<std::uint64_t>(range->second))));
        total_bits += bits;
        if (total_bits > 64) {
            return nullptr;
        }
        columns.push_back(*column);
        widths.push_back(bits);
    }

    auto layout = std::make_shared<KeyLayout>();
    std::vector<PlanPtr> inputs;
    unsigned shift = total_bits;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        shift -= widths[i];
        layout->components.push_back(KeyLayout::Component{
            .shift = shift,
            .bits = widths[i],
            .code_type = columns[i]->codec()->encoding_type(),
            .codec = columns[i]->codec(),
        });
        inputs.push_back(
            make_node(plan::ReadColumn{columns[i], ctx.filter}, columns[i]->basic_type()));
    }
    return make_node(plan::PackKeys{std::move(inputs), std::move(layout)}, BasicType::Integer);
}

// ─── Execution ────────────────────────────────────────────────────────────────

auto read_strings(const std::vector<std::string>& values, const Filter& filter) -> StrVec {
    StrVec out;
    if (const auto* mask = filter.mask()) {
        for (std::size_t i = 0; i < values.size(); ++i) {
            if ((*mask)[i]) {
                out.emplace_back(values[i]);
            }
        }
    } else if (const auto* rows = filter.rows()) {
        out.reserve(rows->size());
        for (std::size_t idx : *rows) {
            out.emplace_back(values[idx]);
        }
    } else {
        out.assign(values.begin(), values.end());
    }
    return out;
}

auto read_column(const plan::ReadColumn& read) -> TypedVec {
    const Column& column = *read.column;
    return std::visit(
        [&](const auto& d) -> TypedVec {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, IntVec>) {
                return TypedVec{TypedVec::Data{read.filter.apply(d)}};
            } else if constexpr (std::is_same_v<D, CodeVec>) {
                CodeVec codes = std::visit(
                    [&](const auto& c) { return CodeVec{read.filter.apply(c)}; }, d);
                return TypedVec{TypedVec::Data{EncodedVec{std::move(codes), column.codec()}}};
            } else {
                return TypedVec{TypedVec::Data{read_strings(d, read.filter)}};
            }
        },
        column.data());
}

// Element-wise comparison between a vector and a scalar hoisted out of the loop.
template <typename T>
auto compare_scalar_into(Func2Type op, const std::vector<T>& values, T rv) -> BoolVec {
    const std::size_t n = values.size();
    BoolVec mask(n);
    const T* cp = values.data();
    std::uint8_t* mp = mask.data();
    switch (op) {
        case Func2Type::Equals:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = cp[i] == rv;
            break;
        case Func2Type::NotEquals:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = cp[i] != rv;
            break;
        case Func2Type::LT:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = cp[i] < rv;
            break;
        case Func2Type::LTE:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = cp[i] <= rv;
            break;
        case Func2Type::GT:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = cp[i] > rv;
            break;
        case Func2Type::GTE:
            for (std::size_t i = 0; i < n; ++i)
                mp[i] = cp[i] >= rv;
            break;
        default:
            throw std::logic_error("compare_scalar_into: not a comparison");
    }
    return mask;
}

auto execute_compare_encoded(const plan::CompareEncoded& cmp, const TypedVec& input)
    -> std::expected<TypedVec, std::string> {
    const auto* encoded = std::get_if<EncodedVec>(&input.data());
    if (encoded == nullptr) {
        return std::unexpected("CompareEncoded: input is " + input.describe());
    }
    BoolVec mask = std::visit(
        [&](const auto& codes) {
            using T = typename std::decay_t<decltype(codes)>::value_type;
            return compare_scalar_into<T>(cmp.op, codes, static_cast<T>(cmp.code));
        },
        encoded->codes);
    return TypedVec{TypedVec::Data{std::move(mask)}};
}

/// Either a vector or a scalar broadcast over every row.
template <typename T>
struct Operand {
    const std::vector<T>* vec = nullptr;
    T scalar{};
    std::size_t len = 0;

    [[nodiscard]] auto is_scalar() const noexcept -> bool { return vec == nullptr; }
    [[nodiscard]] auto operator[](std::size_t i) const -> T {
        return vec != nullptr ? (*vec)[i] : scalar;
    }
};

template <typename T>
auto operand_of(const TypedVec& v) -> std::expected<Operand<T>, std::string> {
    using Vec = std::vector<T>;
    if (const auto* vec = std::get_if<Vec>(&v.data())) {
        return Operand<T>{vec, T{}, vec->size()};
    }
    if (const auto* c = std::get_if<Constant>(&v.data())) {
        if constexpr (std::is_same_v<T, std::string_view>) {
            if (const auto* s = std::get_if<std::string>(&c->value)) {
                return Operand<T>{nullptr, std::string_view{*s}, c->len};
            }
        } else if constexpr (std::is_same_v<T, std::uint8_t>) {
            if (const auto* b = std::get_if<bool>(&c->value)) {
                return Operand<T>{nullptr, static_cast<std::uint8_t>(*b ? 1 : 0), c->len};
            }
        } else {
            if (const auto* i = std::get_if<std::int64_t>(&c->value)) {
                return Operand<T>{nullptr, *i, c->len};
            }
        }
    }
    return std::unexpected("unexpected operand " + v.describe());
}

template <typename Out>
auto scalar_of(Out v) -> ScalarValue {
    if constexpr (std::is_same_v<Out, std::uint8_t>) {
        return ScalarValue{v != 0};
    } else {
        return ScalarValue{static_cast<std::int64_t>(v)};
    }
}

template <typename Out, typename T, typename F>
auto zip_operands(const Operand<T>& l, const Operand<T>& r, F f)
    -> std::expected<TypedVec, std::string> {
    if (l.is_scalar() && r.is_scalar()) {
        return TypedVec{TypedVec::Data{Constant{scalar_of<Out>(f(l.scalar, r.scalar)),
                                                std::max(l.len, r.len)}}};
    }
    if (!l.is_scalar() && !r.is_scalar() && l.len != r.len) {
        return std::unexpected(fmt::format("operands have {} and {} rows", l.len, r.len));
    }
    const std::size_t n = l.is_scalar() ? r.len : l.len;
    std::vector<Out> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = f(l[i], r[i]);
    }
    return TypedVec{TypedVec::Data{std::move(out)}};
}

template <typename T>
auto compare_operands(Func2Type op, const Operand<T>& l, const Operand<T>& r)
    -> std::expected<TypedVec, std::string> {
    if (!l.is_scalar() && r.is_scalar()) {
        return TypedVec{TypedVec::Data{compare_scalar_into<T>(op, *l.vec, r.scalar)}};
    }
    if (l.is_scalar() && !r.is_scalar()) {
        return TypedVec{
            TypedVec::Data{compare_scalar_into<T>(ir::flip_comparison(op), *r.vec, l.scalar)}};
    }
    switch (op) {
        case Func2Type::Equals:
            return zip_operands<std::uint8_t>(l, r, [](T a, T b) -> std::uint8_t { return a == b; });
        case Func2Type::NotEquals:
            return zip_operands<std::uint8_t>(l, r, [](T a, T b) -> std::uint8_t { return a != b; });
        case Func2Type::LT:
            return zip_operands<std::uint8_t>(l, r, [](T a, T b) -> std::uint8_t { return a < b; });
        case Func2Type::LTE:
            return zip_operands<std::uint8_t>(l, r, [](T a, T b) -> std::uint8_t { return a <= b; });
        case Func2Type::GT:
            return zip_operands<std::uint8_t>(l, r, [](T a, T b) -> std::uint8_t { return a > b; });
        case Func2Type::GTE:
            return zip_operands<std::uint8_t>(l, r, [](T a, T b) -> std::uint8_t { return a >= b; });
        default:
            return std::unexpected(fmt::format("{} is not a comparison", ir::to_string(op)));
    }
}

// Integer arithmetic wraps on overflow; division by zero yields 0.
auto arithmetic(Func2Type op, const Operand<std::int64_t>& l, const Operand<std::int64_t>& r)
    -> std::expected<TypedVec, std::string> {
    using I = std::int64_t;
    using U = std::uint64_t;
    switch (op) {
        case Func2Type::Add:
            return zip_operands<I>(l, r, [](I a, I b) { return static_cast<I>(U(a) + U(b)); });
        case Func2Type::Subtract:
            return zip_operands<I>(l, r, [](I a, I b) { return static_cast<I>(U(a) - U(b)); });
        case Func2Type::Multiply:
            return zip_operands<I>(l, r, [](I a, I b) { return static_cast<I>(U(a) * U(b)); });
        case Func2Type::Divide:
            return zip_operands<I>(l, r, [](I a, I b) -> I {
                if (b == 0) {
                    return 0;
                }
                if (a == std::numeric_limits<I>::min() && b == -1) {
                    return a;
                }
                return a / b;
            });
        default:
            return std::unexpected(fmt::format("{} is not arithmetic", ir::to_string(op)));
    }
}

auto execute_binary(const plan::Binary& bin, const TypedVec& lhs, const TypedVec& rhs,
                    BasicType operand_type) -> std::expected<TypedVec, std::string> {
    switch (bin.op) {
        case Func2Type::Add:
        case Func2Type::Subtract:
        case Func2Type::Multiply:
        case Func2Type::Divide: {
            auto l = operand_of<std::int64_t>(lhs);
            auto r = operand_of<std::int64_t>(rhs);
            if (!l || !r) {
                return std::unexpected(!l ? l.error() : r.error());
            }
            return arithmetic(bin.op, *l, *r);
        }
        case Func2Type::And:
        case Func2Type::Or: {
            auto l = operand_of<std::uint8_t>(lhs);
            auto r = operand_of<std::uint8_t>(rhs);
            if (!l || !r) {
                return std::unexpected(!l ? l.error() : r.error());
            }
            if (bin.op == Func2Type::And) {
                return zip_operands<std::uint8_t>(
                    *l, *r, [](std::uint8_t a, std::uint8_t b) -> std::uint8_t { return a & b; });
            }
            return zip_operands<std::uint8_t>(
                *l, *r, [](std::uint8_t a, std::uint8_t b) -> std::uint8_t { return a | b; });
        }
        default:
            break;
    }
    switch (operand_type) {
        case BasicType::Integer: {
            auto l = operand_of<std::int64_t>(lhs);
            auto r = operand_of<std::int64_t>(rhs);
            if (!l || !r) {
                return std::unexpected(!l ? l.error() : r.error());
            }
            return compare_operands(bin.op, *l, *r);
        }
        case BasicType::String: {
            auto l = operand_of<std::string_view>(lhs);
            auto r = operand_of<std::string_view>(rhs);
            if (!l || !r) {
                return std::unexpected(!l ? l.error() : r.error());
            }
            return compare_operands(bin.op, *l, *r);
        }
        case BasicType::Boolean: {
            auto l = operand_of<std::uint8_t>(lhs);
            auto r = operand_of<std::uint8_t>(rhs);
            if (!l || !r) {
                return std::unexpected(!l ? l.error() : r.error());
            }
            return compare_operands(bin.op, *l, *r);
        }
    }
    return std::unexpected("unsupported operand type");
}

auto execute_unary(const plan::Unary& un, const TypedVec& input)
    -> std::expected<TypedVec, std::string> {
    if (un.op == Func1Type::Negate) {
        auto v = operand_of<std::int64_t>(input);
        if (!v) {
            return std::unexpected(v.error());
        }
        if (v->is_scalar()) {
            const auto neg = static_cast<std::int64_t>(0 - static_cast<std::uint64_t>(v->scalar));
            return TypedVec{TypedVec::Data{Constant{neg, v->len}}};
        }
        IntVec out(v->len);
        for (std::size_t i = 0; i < v->len; ++i) {
            out[i] = static_cast<std::int64_t>(0 - static_cast<std::uint64_t>((*v)[i]));
        }
        return TypedVec{TypedVec::Data{std::move(out)}};
    }
    auto v = operand_of<std::uint8_t>(input);
    if (!v) {
        return std::unexpected(v.error());
    }
    if (v->is_scalar()) {
        return TypedVec{TypedVec::Data{Constant{v->scalar == 0, v->len}}};
    }
    BoolVec out(v->len);
    for (std::size_t i = 0; i < v->len; ++i) {
        out[i] = (*v)[i] ^ 1;
    }
    return TypedVec{TypedVec::Data{std::move(out)}};
}

auto execute_node(const PlanNode& node) -> std::expected<TypedVec, std::string>;

auto execute_pack_keys(const plan::PackKeys& pack) -> std::expected<TypedVec, std::string> {
    std::vector<std::uint64_t> keys;
    for (std::size_t c = 0; c < pack.inputs.size(); ++c) {
        auto input = execute_node(*pack.inputs[c]);
        if (!input) {
            return std::unexpected(input.error());
        }
        const auto* encoded = std::get_if<EncodedVec>(&input->data());
        if (encoded == nullptr) {
            return std::unexpected("PackKeys: input is " + input->describe());
        }
        if (c == 0) {
            keys.assign(input->len(), 0);
        } else if (input->len() != keys.size()) {
            return std::unexpected("PackKeys: inputs differ in length");
        }
        const unsigned shift = pack.layout->components[c].shift;
        std::visit(
            [&](const auto& codes) {
                for (std::size_t i = 0; i < codes.size(); ++i) {
                    keys[i] |= static_cast<std::uint64_t>(codes[i]) << shift;
                }
            },
            encoded->codes);
    }
    return TypedVec{TypedVec::Data{PackedKeys{std::move(keys), pack.layout}}};
}

auto execute_key_tuple(const plan::KeyTuple& tuple) -> std::expected<TypedVec, std::string> {
    std::vector<TypedVec> inputs;
    std::vector<std::shared_ptr<const void>> anchors;
    std::size_t len = tuple.len;
    for (const auto& plan : tuple.inputs) {
        auto input = execute_node(*plan);
        if (!input) {
            return std::unexpected(input.error());
        }
        TypedVec decoded = input->decode();
        if (inputs.empty()) {
            len = decoded.len();
        } else if (decoded.len() != len) {
            return std::unexpected("KeyTuple: inputs differ in length");
        }
        if (decoded.anchor() != nullptr) {
            anchors.push_back(decoded.anchor());
        }
        inputs.push_back(std::move(decoded));
    }
    std::vector<KeyRow> rows(len);
    for (auto& row : rows) {
        row.reserve(inputs.size());
    }
    for (const auto& input : inputs) {
        std::visit(
            [&](const auto& d) {
                using D = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<D, IntVec> || std::is_same_v<D, BoolVec>) {
                    for (std::size_t i = 0; i < len; ++i) {
                        rows[i].emplace_back(static_cast<std::int64_t>(d[i]));
                    }
                } else if constexpr (std::is_same_v<D, StrVec>) {
                    for (std::size_t i = 0; i < len; ++i) {
                        rows[i].emplace_back(d[i]);
                    }
                } else {
                    throw std::logic_error("KeyTuple: input was not decoded");
                }
            },
            input.data());
    }
    std::shared_ptr<const void> anchor;
    if (!anchors.empty()) {
        anchor = std::make_shared<const std::vector<std::shared_ptr<const void>>>(
            std::move(anchors));
    }
    return TypedVec{TypedVec::Data{KeyRows{std::move(rows), tuple.types}}, std::move(anchor)};
}

auto execute_node(const PlanNode& node) -> std::expected<TypedVec, std::string> {
    return std::visit(
        [&](const auto& n) -> std::expected<TypedVec, std::string> {
            using N = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<N, plan::ReadColumn>) {
                return read_column(n);
            } else if constexpr (std::is_same_v<N, plan::Decode>) {
                auto input = execute_node(*n.input);
                if (!input) {
                    return std::unexpected(input.error());
                }
                return input->decode();
            } else if constexpr (std::is_same_v<N, plan::Literal>) {
                return TypedVec{TypedVec::Data{Constant{n.value, n.len}}};
            } else if constexpr (std::is_same_v<N, plan::CompareEncoded>) {
                auto input = execute_node(*n.input);
                if (!input) {
                    return std::unexpected(input.error());
                }
                return execute_compare_encoded(n, *input);
            } else if constexpr (std::is_same_v<N, plan::Binary>) {
                auto lhs = execute_node(*n.lhs);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                auto rhs = execute_node(*n.rhs);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                return execute_binary(n, *lhs, *rhs, n.lhs->type);
            } else if constexpr (std::is_same_v<N, plan::Unary>) {
                auto input = execute_node(*n.input);
                if (!input) {
                    return std::unexpected(input.error());
                }
                return execute_unary(n, *input);
            } else if constexpr (std::is_same_v<N, plan::PackKeys>) {
                return execute_pack_keys(n);
            } else {
                return execute_key_tuple(n);
            }
        },
        node.node);
}

auto describe_node(const PlanNode& node) -> std::string {
    return std::visit(
        [](const auto& n) -> std::string {
            using N = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<N, plan::ReadColumn>) {
                const Column& column = *n.column;
                if (column.is_encoded()) {
                    return fmt::format("Read({}: {} {}, {})", column.name(),
                                       to_string(column.encoding_type()),
                                       column.codec()->describe(), n.filter.describe());
                }
                return fmt::format("Read({}: {}, {})", column.name(),
                                   to_string(column.encoding_type()), n.filter.describe());
            } else if constexpr (std::is_same_v<N, plan::Decode>) {
                return fmt::format("Decode({})", describe_node(*n.input));
            } else if constexpr (std::is_same_v<N, plan::Literal>) {
                return fmt::format("Literal({})", format_scalar(n.value));
            } else if constexpr (std::is_same_v<N, plan::CompareEncoded>) {
                return fmt::format("CompareEncoded({} {} #{})", describe_node(*n.input),
                                   ir::to_string(n.op), n.code);
            } else if constexpr (std::is_same_v<N, plan::Binary>) {
                return fmt::format("({} {} {})", describe_node(*n.lhs), ir::to_string(n.op),
                                   describe_node(*n.rhs));
            } else if constexpr (std::is_same_v<N, plan::Unary>) {
                return fmt::format("{}{}", ir::to_string(n.op), describe_node(*n.input));
            } else if constexpr (std::is_same_v<N, plan::PackKeys>) {
                std::vector<std::string> parts;
                for (const auto& input : n.inputs) {
                    parts.push_back(describe_node(*input));
                }
                return fmt::format("PackKeys([{}])", fmt::join(parts, ", "));
            } else {
                std::vector<std::string> parts;
                for (const auto& input : n.inputs) {
                    parts.push_back(describe_node(*input));
                }
                return fmt::format("KeyTuple([{}])", fmt::join(parts, ", "));
            }
        },
        node.node);
}

}  // namespace

auto QueryPlan::compile(const ir::Expr& expr, const ColumnMap& columns, const Filter& filter,
                        const PlanOptions& options) -> std::expected<QueryPlan, std::string> {
    Context ctx{columns, filter, options, batch_len_of(columns)};
    auto root = compile_expr(expr, ctx, Want::Decoded);
    if (!root) {
        return std::unexpected(root.error());
    }
    QueryPlan plan{std::move(*root)};
    spdlog::debug("plan {} -> {}", ir::to_string(expr), plan.describe());
    return plan;
}

auto QueryPlan::compile_grouping_key(const std::vector<ir::ExprPtr>& exprs,
                                     const ColumnMap& columns, const Filter& filter,
                                     const PlanOptions& options)
    -> std::expected<QueryPlan, std::string> {
    Context ctx{columns, filter, options, batch_len_of(columns)};
    if (exprs.size() == 1) {
        auto root = compile_expr(*exprs.front(), ctx, Want::OrderPreserving);
        if (!root) {
            return std::unexpected(root.error());
        }
        QueryPlan plan{std::move(*root)};
        spdlog::debug("grouping key -> {}", plan.describe());
        return plan;
    }
    auto packed = try_pack_keys(exprs, ctx);
    if (!packed) {
        return std::unexpected(packed.error());
    }
    if (*packed != nullptr) {
        QueryPlan plan{std::move(*packed)};
        spdlog::debug("grouping key -> {}", plan.describe());
        return plan;
    }
    plan::KeyTuple tuple;
    tuple.len = filter.selected_count(ctx.batch_len);
    for (const auto& expr : exprs) {
        auto input = compile_expr(*expr, ctx, Want::Decoded);
        if (!input) {
            return std::unexpected(input.error());
        }
        tuple.types.push_back((*input)->type);
        tuple.inputs.push_back(std::move(*input));
    }
    QueryPlan plan{make_node(std::move(tuple), BasicType::Integer)};
    spdlog::debug("grouping key -> {}", plan.describe());
    return plan;
}

auto QueryPlan::compile_aggregate(const ir::Expr& expr, const ColumnMap& columns,
                                  const Filter& filter, Aggregator aggregator,
                                  const PlanOptions& options)
    -> std::expected<QueryPlan, std::string> {
    Context ctx{columns, filter, options, batch_len_of(columns)};
    const Want want = aggregator == Aggregator::Count ? Want::Any : Want::SummationPreserving;
    auto root = compile_expr(expr, ctx, want);
    if (!root) {
        return std::unexpected(root.error());
    }
    if (aggregator == Aggregator::Sum && (*root)->type == BasicType::String) {
        return std::unexpected("sum: cannot add strings in " + ir::to_string(expr));
    }
    QueryPlan plan{std::move(*root)};
    spdlog::debug("{} {} -> {}", to_string(aggregator), ir::to_string(expr), plan.describe());
    return plan;
}

auto QueryPlan::describe() const -> std::string {
    return describe_node(*root_);
}

auto CompiledPlan::execute() -> std::expected<TypedVec, std::string> {
    if (executed_) {
        return std::unexpected("compiled plan can only be executed once");
    }
    executed_ = true;
    return execute_node(plan_.root());
}

auto CompiledAggregation::execute() -> std::expected<TypedVec, std::string> {
    auto input = input_.execute();
    if (!input) {
        return std::unexpected(input.error());
    }
    return aggregate(*input, *grouping_, aggregator_);
}

auto prepare(QueryPlan plan) -> CompiledPlan {
    return CompiledPlan{std::move(plan)};
}

auto prepare_aggregation(QueryPlan plan, const Grouping& grouping, Aggregator aggregator)
    -> CompiledAggregation {
    return CompiledAggregation{std::move(plan), grouping, aggregator};
}

}  // namespace strata::engine
