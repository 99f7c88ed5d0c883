#pragma once

#include "plyr/decoder.hpp"
#include "plyr/ply.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace plyr::easy {

// ------------------------------
// Reading decoded values
// ------------------------------

inline double as_double(const ScalarValue& v) {
    return std::visit([](auto x) { return static_cast<double>(x); }, v);
}

inline std::int64_t as_int64(const ScalarValue& v) {
    return std::visit([](auto x) { return static_cast<std::int64_t>(x); }, v);
}

inline std::size_t list_size(const ListValue& v) {
    return std::visit([](const auto& xs) { return xs.size(); }, v);
}

inline std::vector<double> as_doubles(const ListValue& v) {
    return std::visit([](const auto& xs) {
        return std::vector<double>(xs.begin(), xs.end());
    }, v);
}

inline std::vector<std::int64_t> as_int64s(const ListValue& v) {
    return std::visit([](const auto& xs) {
        std::vector<std::int64_t> out;
        out.reserve(xs.size());
        for (auto x : xs) out.push_back(static_cast<std::int64_t>(x));
        return out;
    }, v);
}

// ------------------------------
// Building binary payloads
// ------------------------------

namespace detail {
inline bool is_little_endian() {
    const std::uint16_t x = 1;
    return *reinterpret_cast<const std::uint8_t*>(&x) == 1;
}

inline void bswap_inplace(std::uint8_t* buf, std::size_t elem_size, std::size_t n_elems) {
    if (!buf || elem_size <= 1 || n_elems == 0) return;
    for (std::size_t i = 0; i < n_elems; ++i) {
        std::uint8_t* p = buf + i * elem_size;
        for (std::size_t a = 0, b = elem_size - 1; a < b; ++a, --b) {
            std::uint8_t t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
}
} // namespace detail

// Append `v` to `out` with the byte order of a binary PLY payload.
template <typename T>
inline void append(std::string& out, T v, ByteOrder order) {
    static_assert(std::is_arithmetic_v<T>, "append requires an arithmetic type");
    std::uint8_t b[sizeof(T)];
    std::memcpy(b, &v, sizeof(T));
    const bool want_little = (order == ByteOrder::LittleEndian);
    if (want_little != detail::is_little_endian()) {
        detail::bswap_inplace(b, sizeof(T), 1);
    }
    out.append(reinterpret_cast<const char*>(b), sizeof(T));
}

template <typename T>
inline std::string pack(const std::vector<T>& v, ByteOrder order) {
    std::string out;
    out.reserve(sizeof(T) * v.size());
    for (const T& x : v) append(out, x, order);
    return out;
}

} // namespace plyr::easy
