#include <strata/engine/typed_vec.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace strata::engine {

namespace {

auto code_len(const CodeVec& codes) -> std::size_t {
    return std::visit([](const auto& c) { return c.size(); }, codes);
}

template <typename T>
auto gather_vec(const std::vector<T>& values, const RowIndices& indices) -> std::vector<T> {
    std::vector<T> out;
    out.resize(indices.size());
    for (std::size_t j = 0; j < indices.size(); ++j) {
        out[j] = values[indices[j]];
    }
    return out;
}

// Stable, so equal keys keep the relative order they have in `indices`.
template <typename T>
void stable_sort_by(const std::vector<T>& values, RowIndices& indices, bool descending) {
    if (descending) {
        std::stable_sort(indices.begin(), indices.end(),
                         [&](std::size_t a, std::size_t b) { return values[b] < values[a]; });
    } else {
        std::stable_sort(indices.begin(), indices.end(),
                         [&](std::size_t a, std::size_t b) { return values[a] < values[b]; });
    }
}

auto narrow_codes(const std::vector<std::uint64_t>& codes, EncodingType type) -> CodeVec {
    auto narrow = [&]<typename T>() -> CodeVec {
        std::vector<T> out;
        out.resize(codes.size());
        for (std::size_t i = 0; i < codes.size(); ++i) {
            out[i] = static_cast<T>(codes[i]);
        }
        return CodeVec{std::move(out)};
    };
    switch (type) {
        case EncodingType::U8:
            return narrow.template operator()<std::uint8_t>();
        case EncodingType::U16:
            return narrow.template operator()<std::uint16_t>();
        case EncodingType::U32:
            return narrow.template operator()<std::uint32_t>();
        default:
            throw std::logic_error("packed key component with non-code encoding");
    }
}

auto from_decoded(Decoded decoded, std::shared_ptr<const void> anchor) -> TypedVec {
    return std::visit(
        [&](auto&& values) { return TypedVec{TypedVec::Data{std::move(values)}, anchor}; },
        std::move(decoded));
}

auto broadcast(const Constant& c) -> TypedVec {
    return std::visit(
        [&](const auto& v) -> TypedVec {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                auto text = std::make_shared<const std::string>(v);
                StrVec out(c.len, std::string_view{*text});
                return TypedVec{TypedVec::Data{std::move(out)}, std::move(text)};
            } else if constexpr (std::is_same_v<T, bool>) {
                return TypedVec{TypedVec::Data{BoolVec(c.len, v ? 1 : 0)}};
            } else {
                return TypedVec{TypedVec::Data{IntVec(c.len, v)}};
            }
        },
        c.value);
}

auto unpack_component(const PackedKeys& packed, const KeyLayout::Component& component)
    -> TypedVec {
    const std::uint64_t mask = component.bits >= 64 ? std::numeric_limits<std::uint64_t>::max()
                                                    : (std::uint64_t{1} << component.bits) - 1;
    std::vector<std::uint64_t> codes;
    codes.resize(packed.keys.size());
    for (std::size_t i = 0; i < codes.size(); ++i) {
        codes[i] = (packed.keys[i] >> component.shift) & mask;
    }
    return from_decoded(component.codec->decode(narrow_codes(codes, component.code_type)),
                        component.codec);
}

auto split_key_rows(const KeyRows& key_rows, std::size_t column,
                    const std::shared_ptr<const void>& anchor) -> TypedVec {
    const std::size_t n = key_rows.rows.size();
    switch (key_rows.types[column]) {
        case BasicType::String: {
            StrVec out;
            out.reserve(n);
            for (const auto& row : key_rows.rows) {
                out.push_back(std::get<std::string_view>(row[column]));
            }
            return TypedVec{TypedVec::Data{std::move(out)}, anchor};
        }
        case BasicType::Boolean: {
            BoolVec out;
            out.reserve(n);
            for (const auto& row : key_rows.rows) {
                out.push_back(static_cast<std::uint8_t>(std::get<std::int64_t>(row[column])));
            }
            return TypedVec{TypedVec::Data{std::move(out)}};
        }
        case BasicType::Integer:
            break;
    }
    IntVec out;
    out.reserve(n);
    for (const auto& row : key_rows.rows) {
        out.push_back(std::get<std::int64_t>(row[column]));
    }
    return TypedVec{TypedVec::Data{std::move(out)}};
}

}  // namespace

auto TypedVec::len() const noexcept -> std::size_t {
    return std::visit(
        [](const auto& d) -> std::size_t {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, EncodedVec>) {
                return code_len(d.codes);
            } else if constexpr (std::is_same_v<D, PackedKeys>) {
                return d.keys.size();
            } else if constexpr (std::is_same_v<D, KeyRows>) {
                return d.rows.size();
            } else if constexpr (std::is_same_v<D, Constant>) {
                return d.len;
            } else {
                return d.size();
            }
        },
        data_);
}

auto TypedVec::is_encoded() const noexcept -> bool {
    return std::holds_alternative<EncodedVec>(data_);
}

auto TypedVec::codec() const noexcept -> const Codec* {
    if (const auto* e = std::get_if<EncodedVec>(&data_)) {
        return e->codec.get();
    }
    return nullptr;
}

auto TypedVec::basic_type() const noexcept -> BasicType {
    return std::visit(
        [](const auto& d) -> BasicType {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, BoolVec>) {
                return BasicType::Boolean;
            } else if constexpr (std::is_same_v<D, StrVec>) {
                return BasicType::String;
            } else if constexpr (std::is_same_v<D, EncodedVec>) {
                return d.codec->decoded_type();
            } else if constexpr (std::is_same_v<D, Constant>) {
                if (std::holds_alternative<std::string>(d.value)) {
                    return BasicType::String;
                }
                if (std::holds_alternative<bool>(d.value)) {
                    return BasicType::Boolean;
                }
                return BasicType::Integer;
            } else {
                return BasicType::Integer;
            }
        },
        data_);
}

auto TypedVec::decode() const -> TypedVec {
    return std::visit(
        [&](const auto& d) -> TypedVec {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, EncodedVec>) {
                return from_decoded(d.codec->decode(d.codes), d.codec);
            } else if constexpr (std::is_same_v<D, Constant>) {
                return broadcast(d);
            } else if constexpr (std::is_same_v<D, PackedKeys> || std::is_same_v<D, KeyRows>) {
                throw std::logic_error("decode: composite key has no single-column form");
            } else {
                return *this;
            }
        },
        data_);
}

auto TypedVec::decode_columns() const -> std::vector<TypedVec> {
    std::vector<TypedVec> columns;
    if (const auto* packed = std::get_if<PackedKeys>(&data_)) {
        for (const auto& component : packed->layout->components) {
            columns.push_back(unpack_component(*packed, component));
        }
        return columns;
    }
    if (const auto* key_rows = std::get_if<KeyRows>(&data_)) {
        for (std::size_t c = 0; c < key_rows->types.size(); ++c) {
            columns.push_back(split_key_rows(*key_rows, c, anchor_));
        }
        return columns;
    }
    columns.push_back(decode());
    return columns;
}

auto TypedVec::order_preserving() && -> TypedVec {
    if (const auto* e = std::get_if<EncodedVec>(&data_)) {
        if (!e->codec->is_order_preserving()) {
            return decode();
        }
    }
    return std::move(*this);
}

void TypedVec::sort_indices_asc(RowIndices& indices) const {
    if (const auto* e = std::get_if<EncodedVec>(&data_);
        e != nullptr && !e->codec->is_order_preserving()) {
        decode().sort_indices_asc(indices);
        return;
    }
    std::visit(
        [&](const auto& d) {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, EncodedVec>) {
                std::visit([&](const auto& codes) { stable_sort_by(codes, indices, false); },
                           d.codes);
            } else if constexpr (std::is_same_v<D, PackedKeys>) {
                stable_sort_by(d.keys, indices, false);
            } else if constexpr (std::is_same_v<D, KeyRows>) {
                stable_sort_by(d.rows, indices, false);
            } else if constexpr (std::is_same_v<D, Constant>) {
                // All rows compare equal.
            } else {
                stable_sort_by(d, indices, false);
            }
        },
        data_);
}

void TypedVec::sort_indices_desc(RowIndices& indices) const {
    if (const auto* e = std::get_if<EncodedVec>(&data_);
        e != nullptr && !e->codec->is_order_preserving()) {
        decode().sort_indices_desc(indices);
        return;
    }
    std::visit(
        [&](const auto& d) {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, EncodedVec>) {
                std::visit([&](const auto& codes) { stable_sort_by(codes, indices, true); },
                           d.codes);
            } else if constexpr (std::is_same_v<D, PackedKeys>) {
                stable_sort_by(d.keys, indices, true);
            } else if constexpr (std::is_same_v<D, KeyRows>) {
                stable_sort_by(d.rows, indices, true);
            } else if constexpr (std::is_same_v<D, Constant>) {
                // All rows compare equal.
            } else {
                stable_sort_by(d, indices, true);
            }
        },
        data_);
}

auto TypedVec::gather(const RowIndices& indices) const -> TypedVec {
    Data out = std::visit(
        [&](const auto& d) -> Data {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, EncodedVec>) {
                CodeVec codes =
                    std::visit([&](const auto& c) { return CodeVec{gather_vec(c, indices)}; },
                               d.codes);
                return EncodedVec{std::move(codes), d.codec};
            } else if constexpr (std::is_same_v<D, PackedKeys>) {
                return PackedKeys{gather_vec(d.keys, indices), d.layout};
            } else if constexpr (std::is_same_v<D, KeyRows>) {
                return KeyRows{gather_vec(d.rows, indices), d.types};
            } else if constexpr (std::is_same_v<D, Constant>) {
                return Constant{d.value, indices.size()};
            } else {
                return gather_vec(d, indices);
            }
        },
        data_);
    return TypedVec{std::move(out), anchor_};
}

auto TypedVec::index_decode(const RowIndices& indices) const -> TypedVec {
    return gather(indices).decode();
}

auto TypedVec::index_decode_columns(const RowIndices& indices) const -> std::vector<TypedVec> {
    return gather(indices).decode_columns();
}

auto TypedVec::describe() const -> std::string {
    return std::visit(
        [&](const auto& d) -> std::string {
            using D = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<D, BoolVec>) {
                return fmt::format("BoolVec[{}]", d.size());
            } else if constexpr (std::is_same_v<D, IntVec>) {
                return fmt::format("IntVec[{}]", d.size());
            } else if constexpr (std::is_same_v<D, StrVec>) {
                return fmt::format("StrVec[{}]", d.size());
            } else if constexpr (std::is_same_v<D, EncodedVec>) {
                return fmt::format("Encoded<{}>[{}] {}", to_string(d.codec->encoding_type()),
                                   code_len(d.codes), d.codec->describe());
            } else if constexpr (std::is_same_v<D, PackedKeys>) {
                return fmt::format("PackedKeys[{}] x{}", d.keys.size(),
                                   d.layout->components.size());
            } else if constexpr (std::is_same_v<D, KeyRows>) {
                return fmt::format("KeyRows[{}] x{}", d.rows.size(), d.types.size());
            } else {
                return fmt::format("Constant({})[{}]", format_scalar(d.value), d.len);
            }
        },
        data_);
}

}  // namespace strata::engine
