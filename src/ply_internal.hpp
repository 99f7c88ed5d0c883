#pragma once

#include "plyr/ply.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace plyr::internal {

constexpr std::size_t table_width(ScalarType t) {
    for (const auto& info : kScalarTypes) {
        if (info.type == t) return info.width;
    }
    return 0;
}

// Compile-time pairing of a scalar type tag with its C++ representation.
// `width` comes from kScalarTypes and must agree with the C++ type.
template <ScalarType S, typename T>
struct ScalarTag {
    using type = T;
    static constexpr ScalarType kind = S;
    static constexpr std::size_t width = table_width(S);
    static_assert(width == sizeof(T), "kScalarTypes width disagrees with the C++ representation");
};

// Calls f(ScalarTag<t, T>{}) with the C++ type that represents scalar type `t`.
template <typename F>
auto with_scalar_type(ScalarType t, F&& f) {
    switch (t) {
        case ScalarType::Char: return std::forward<F>(f)(ScalarTag<ScalarType::Char, std::int8_t>{});
        case ScalarType::UChar: return std::forward<F>(f)(ScalarTag<ScalarType::UChar, std::uint8_t>{});
        case ScalarType::Short: return std::forward<F>(f)(ScalarTag<ScalarType::Short, std::int16_t>{});
        case ScalarType::UShort: return std::forward<F>(f)(ScalarTag<ScalarType::UShort, std::uint16_t>{});
        case ScalarType::Int: return std::forward<F>(f)(ScalarTag<ScalarType::Int, std::int32_t>{});
        case ScalarType::UInt: return std::forward<F>(f)(ScalarTag<ScalarType::UInt, std::uint32_t>{});
        case ScalarType::Float: return std::forward<F>(f)(ScalarTag<ScalarType::Float, float>{});
        case ScalarType::Double: return std::forward<F>(f)(ScalarTag<ScalarType::Double, double>{});
    }
    throw PlyError(ErrorKind::InvalidInput, "unknown scalar type tag");
}

// Element count of a list, or nullopt when the decoded count is negative or fractional.
inline std::optional<std::uint64_t> list_count(const ScalarValue& v) {
    return std::visit([](auto x) -> std::optional<std::uint64_t> {
        using T = decltype(x);
        if constexpr (std::is_floating_point_v<T>) {
            if (!(x >= T(0)) || std::floor(x) != x || x >= T(18446744073709551615.0)) return std::nullopt;
            return static_cast<std::uint64_t>(x);
        } else {
            if constexpr (std::is_signed_v<T>) {
                if (x < 0) return std::nullopt;
            }
            return static_cast<std::uint64_t>(x);
        }
    }, v);
}

} // namespace plyr::internal
