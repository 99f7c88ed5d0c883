#pragma once

#include "plyr/ply.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace plyr {

enum class ByteOrder {
    BigEndian,
    LittleEndian,
};

// Records are never pre-allocated past these counts, whatever the header declares.
inline constexpr std::size_t kMaxReserveRecords = 1u << 16;
inline constexpr std::size_t kMaxReserveListValues = 1u << 10;
// Largest count accepted for a binary element that declares no properties.
inline constexpr std::uint64_t kMaxEmptyRecords = 1u << 20;

namespace detail {

enum class LineEnding {
    Detect, // LF, CRLF or a bare CR; a CR peeks for a following LF
    Lf,
    CrLf,
    Cr,     // never looks past the CR
};

// Current 1-based line of the stream; 0 before the first line is read.
// `ending` is fixed by the header's first line.
struct LocationTracker {
    std::size_t line_index{0};
    LineEnding ending{LineEnding::Detect};

    void next_line() noexcept { ++line_index; }
};

/// Read one line, terminator included. Returns false only when the stream is
/// already at its end; a failing stream is ErrorKind::Io.
bool read_line(std::istream& is, std::string& out, LineEnding ending = LineEnding::Detect);

// Terminator style of a line returned by read_line; Detect when it has none.
LineEnding line_ending_of(std::string_view line);

/// Header state machine. Leaves `is` at the first payload byte and `location`
/// on the first payload line.
Header read_header(std::istream& is, LocationTracker& location);

/// Decode one ASCII record line into `out`. `location` only annotates errors.
void read_ascii_record(
    std::string_view line,
    const ElementDef& element,
    const ReadOptions& opts,
    const LocationTracker& location,
    PropertyAccess& out
);

/// Decode one binary record from `is` with the given byte order.
void read_binary_record(
    std::istream& is,
    const ElementDef& element,
    ByteOrder order,
    PropertyAccess& out
);

/// Open `file` for decoding. With `opts.decompress` set, gzip input is inflated
/// into memory; anything else streams straight from disk.
std::unique_ptr<std::istream> open_input(const std::filesystem::path& file, const ReadOptions& opts);

} // namespace detail

} // namespace plyr
