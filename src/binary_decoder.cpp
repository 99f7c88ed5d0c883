#include "plyr/decoder.hpp"
#include "ply_internal.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <type_traits>
#include <vector>

namespace plyr::detail {

namespace {

template <std::size_t N> struct UnsignedOfSize;
template <> struct UnsignedOfSize<1> { using type = std::uint8_t; };
template <> struct UnsignedOfSize<2> { using type = std::uint16_t; };
template <> struct UnsignedOfSize<4> { using type = std::uint32_t; };
template <> struct UnsignedOfSize<8> { using type = std::uint64_t; };

// Read the table width of `Tag` in byte order `Order` and reinterpret the bytes
// as the tag's C++ type.
template <ByteOrder Order, typename Tag>
typename Tag::type read_scalar(std::istream& is, const ElementDef& element, const PropertyDef& p) {
    using T = typename Tag::type;
    using U = typename UnsignedOfSize<Tag::width>::type;

    std::array<unsigned char, Tag::width> b{};
    is.read(reinterpret_cast<char*>(b.data()), static_cast<std::streamsize>(b.size()));
    if (is.bad()) throw PlyError(ErrorKind::Io, "read from stream failed");
    if (is.gcount() != static_cast<std::streamsize>(b.size())) {
        throw PlyError(ErrorKind::UnexpectedEof,
                       "unexpected end of stream reading property '" + p.name +
                       "' of element '" + element.name + "'");
    }

    U u = 0;
    for (std::size_t i = 0; i < b.size(); ++i) {
        const std::size_t shift = (Order == ByteOrder::BigEndian) ? (b.size() - 1 - i) * 8 : i * 8;
        u = static_cast<U>(u | (static_cast<U>(b[i]) << shift));
    }

    T out;
    std::memcpy(&out, &u, sizeof(T));
    return out;
}

template <ByteOrder Order>
ScalarValue read_scalar_value(std::istream& is, const ElementDef& element, const PropertyDef& p, ScalarType t) {
    return internal::with_scalar_type(t, [&](auto tag) -> ScalarValue {
        return ScalarValue{read_scalar<Order, decltype(tag)>(is, element, p)};
    });
}

template <ByteOrder Order>
void decode_record(std::istream& is, const ElementDef& element, PropertyAccess& out) {
    for (const auto& kv : element.properties) {
        const PropertyDef& p = kv.second;

        if (const auto* st = std::get_if<ScalarType>(&p.type)) {
            out.set_scalar(p.name, read_scalar_value<Order>(is, element, p, *st));
            continue;
        }

        const auto& lt = std::get<ListType>(p.type);
        const auto n = internal::list_count(read_scalar_value<Order>(is, element, p, lt.index_type));
        if (!n) {
            throw PlyError(ErrorKind::MalformedRecord,
                           "element '" + element.name + "', property '" + p.name +
                           "': list length is not a non-negative integer");
        }

        ListValue values = internal::with_scalar_type(lt.value_type, [&](auto tag) -> ListValue {
            using T = typename decltype(tag)::type;
            std::vector<T> v;
            v.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(*n, kMaxReserveListValues)));
            for (std::uint64_t i = 0; i < *n; ++i) {
                v.push_back(read_scalar<Order, decltype(tag)>(is, element, p));
            }
            return ListValue{std::move(v)};
        });
        out.set_list(p.name, std::move(values));
    }
}

} // namespace

void read_binary_record(std::istream& is, const ElementDef& element, ByteOrder order, PropertyAccess& out) {
    switch (order) {
        case ByteOrder::BigEndian:
            decode_record<ByteOrder::BigEndian>(is, element, out);
            return;
        case ByteOrder::LittleEndian:
            decode_record<ByteOrder::LittleEndian>(is, element, out);
            return;
    }
}

} // namespace plyr::detail
