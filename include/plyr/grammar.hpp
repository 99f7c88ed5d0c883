#pragma once

#include "plyr/ply.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace plyr {

// ------------------------------
// Header line tokens
// ------------------------------

struct MagicNumber {
    bool operator==(const MagicNumber&) const = default;
};

struct FormatLine {
    Encoding encoding{Encoding::Ascii};
    Version version{};

    bool operator==(const FormatLine&) const = default;
};

struct Comment {
    std::string text{};

    bool operator==(const Comment&) const = default;
};

struct ObjInfo {
    std::string text{};

    bool operator==(const ObjInfo&) const = default;
};

struct EndHeader {
    bool operator==(const EndHeader&) const = default;
};

using Line = std::variant<MagicNumber, FormatLine, Comment, ObjInfo, ElementDef, PropertyDef, EndHeader>;

// Short human-readable rendering used in diagnostics, e.g. "element 'vertex' (8)".
std::string describe(const Line& l);

// Stateless classifier for single header lines. Each production accepts one line
// with an optional trailing terminator (LF, CR or CRLF) and trailing blanks, and
// throws PlyError(ErrorKind::InvalidInput) when the line does not match.
namespace grammar {

MagicNumber magic_number(std::string_view s);
FormatLine format(std::string_view s);
std::string comment(std::string_view s);
std::string obj_info(std::string_view s);
ElementDef element(std::string_view s);
PropertyDef property(std::string_view s);
EndHeader end_header(std::string_view s);

// Dispatches on the leading keyword.
Line line(std::string_view s);

// Whitespace-separated tokens of one ASCII payload line.
std::vector<std::string_view> data_line(std::string_view s);

// Strips one trailing line terminator and any trailing spaces or tabs.
std::string_view trim_line(std::string_view s);

} // namespace grammar

} // namespace plyr
