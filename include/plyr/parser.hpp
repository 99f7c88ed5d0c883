#pragma once

#include "plyr/decoder.hpp"
#include "plyr/grammar.hpp"
#include "plyr/ply.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace plyr {

/// Reads PLY streams into `Ply<E>`. `E` is any default-constructible type that
/// implements PropertyAccess; DefaultElement is the schema-agnostic choice.
///
/// A parser only holds its options, so one instance can be shared by callers
/// decoding independent streams.
template <typename E>
class Parser {
    static_assert(std::is_base_of_v<PropertyAccess, E>, "element type must implement plyr::PropertyAccess");
    static_assert(std::is_default_constructible_v<E>, "element type must be default-constructible");

public:
    explicit Parser(ReadOptions opts = ReadOptions{}) : opts_(opts) {}

    const ReadOptions& options() const noexcept { return opts_; }

    Ply<E> read_ply(std::istream& is) const {
        detail::LocationTracker location;
        Ply<E> ply;
        ply.header = detail::read_header(is, location);
        ply.payload = read_payload_impl(is, location, ply.header);
        return ply;
    }

    Ply<E> read_ply(const std::filesystem::path& file) const {
        auto is = detail::open_input(file, opts_);
        return read_ply(*is);
    }

    Header read_header(std::istream& is) const {
        detail::LocationTracker location;
        return detail::read_header(is, location);
    }

    Header read_header(const std::filesystem::path& file) const {
        auto is = detail::open_input(file, opts_);
        return read_header(*is);
    }

    /// Classify a single header line; failures carry the offending text.
    Line read_header_line(std::string_view s) const {
        try {
            return grammar::line(s);
        } catch (const PlyError& e) {
            throw PlyError(ErrorKind::InvalidInput, "couldn't parse line: " + e.cause(),
                           std::nullopt, std::string(grammar::trim_line(s)));
        }
    }

    /// Decode every element of `header` from `is`, which must be positioned at
    /// the first payload byte. ASCII line numbers in errors count from the
    /// start of the payload.
    Payload<E> read_payload(std::istream& is, const Header& header) const {
        detail::LocationTracker location;
        location.next_line();
        return read_payload_impl(is, location, header);
    }

    /// Decode the `element.count` records of one element, for callers that
    /// walk the payload themselves.
    std::vector<E> read_payload_for_element(std::istream& is, const ElementDef& element, Encoding encoding) const {
        detail::LocationTracker location;
        location.next_line();
        return read_records(is, location, element, encoding);
    }

    E read_ascii_element(std::string_view line, const ElementDef& element) const {
        detail::LocationTracker location;
        location.next_line();
        E e{};
        detail::read_ascii_record(line, element, opts_, location, e);
        return e;
    }

    E read_big_endian_element(std::istream& is, const ElementDef& element) const {
        E e{};
        detail::read_binary_record(is, element, ByteOrder::BigEndian, e);
        return e;
    }

    E read_little_endian_element(std::istream& is, const ElementDef& element) const {
        E e{};
        detail::read_binary_record(is, element, ByteOrder::LittleEndian, e);
        return e;
    }

private:
    Payload<E> read_payload_impl(std::istream& is, detail::LocationTracker& location, const Header& header) const {
        Payload<E> payload;
        for (const auto& kv : header.elements) {
            payload.insert(kv.first, read_records(is, location, kv.second, header.encoding));
        }
        return payload;
    }

    std::vector<E> read_records(
        std::istream& is,
        detail::LocationTracker& location,
        const ElementDef& element,
        Encoding encoding
    ) const {
        // Binary records without properties take no bytes, so the stream cannot bound the count.
        if (encoding != Encoding::Ascii && element.properties.empty() && element.count > kMaxEmptyRecords) {
            throw PlyError(ErrorKind::MalformedRecord,
                           "element '" + element.name + "' declares " + std::to_string(element.count) +
                           " records but no properties");
        }

        std::vector<E> out;
        out.reserve(static_cast<std::size_t>(
            std::min<std::uint64_t>(element.count, kMaxReserveRecords)));

        std::string line;
        for (std::uint64_t i = 0; i < element.count; ++i) {
            E e{};
            switch (encoding) {
                case Encoding::Ascii:
                    if (!detail::read_line(is, line, location.ending)) {
                        throw PlyError(ErrorKind::UnexpectedEof,
                                       "stream ended " + progress(i, element),
                                       location.line_index, std::string{});
                    }
                    detail::read_ascii_record(line, element, opts_, location, e);
                    location.next_line();
                    break;
                case Encoding::BinaryBigEndian:
                    read_binary(is, element, ByteOrder::BigEndian, i, e);
                    break;
                case Encoding::BinaryLittleEndian:
                    read_binary(is, element, ByteOrder::LittleEndian, i, e);
                    break;
            }
            out.push_back(std::move(e));
        }
        return out;
    }

    static std::string progress(std::uint64_t done, const ElementDef& element) {
        return "after " + std::to_string(done) + " of " + std::to_string(element.count) +
               " '" + element.name + "' records";
    }

    // Short reads are reported with the index of the record being decoded.
    static void read_binary(std::istream& is, const ElementDef& element, ByteOrder order, std::uint64_t i, E& e) {
        try {
            detail::read_binary_record(is, element, order, e);
        } catch (const PlyError& err) {
            if (err.kind() != ErrorKind::UnexpectedEof) throw;
            throw PlyError(ErrorKind::UnexpectedEof, err.cause() + " " + progress(i, element));
        }
    }

    ReadOptions opts_;
};

} // namespace plyr
