#include "plyr/grammar.hpp"

#include <charconv>
#include <cstdint>
#include <system_error>

namespace plyr {

static bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

static std::vector<std::string_view> split_blanks(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t pos = 0;
    while (pos < s.size()) {
        while (pos < s.size() && is_blank(s[pos])) ++pos;
        std::size_t start = pos;
        while (pos < s.size() && !is_blank(s[pos])) ++pos;
        if (pos > start) out.push_back(s.substr(start, pos - start));
    }
    return out;
}

[[noreturn]] static void syntax_error(const std::string& msg) {
    throw PlyError(ErrorKind::InvalidInput, msg);
}

// Trim and reject lines that still carry a line break inside them.
static std::string_view single_line(std::string_view s) {
    std::string_view t = grammar::trim_line(s);
    if (t.find_first_of("\r\n") != std::string_view::npos) {
        syntax_error("line break inside a header line");
    }
    return t;
}

template <typename T>
static bool parse_unsigned(std::string_view s, T& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
    return ec == std::errc() && ptr == s.data() + s.size();
}

// "comment", "comment ", "comment  free text"; returns the text after the keyword.
static std::string keyword_with_text(std::string_view s, std::string_view keyword) {
    std::string_view t = single_line(s);
    if (t.substr(0, keyword.size()) != keyword) {
        syntax_error("expected '" + std::string(keyword) + "'");
    }
    std::string_view rest = t.substr(keyword.size());
    if (!rest.empty() && !is_blank(rest.front())) {
        syntax_error("expected '" + std::string(keyword) + "' followed by whitespace");
    }
    std::size_t first = 0;
    while (first < rest.size() && is_blank(rest[first])) ++first;
    return std::string(rest.substr(first));
}

static ScalarType scalar_type_token(std::string_view tok) {
    auto t = scalar_type_from_string(tok);
    if (!t) syntax_error("unknown scalar type '" + std::string(tok) + "'");
    return *t;
}

std::string describe(const Line& l) {
    if (std::holds_alternative<MagicNumber>(l)) return "magic number";
    if (std::holds_alternative<EndHeader>(l)) return "end_header";
    if (const auto* f = std::get_if<FormatLine>(&l)) {
        return "format " + to_string(f->encoding) + " " +
               std::to_string(f->version.major) + "." + std::to_string(f->version.minor);
    }
    if (const auto* c = std::get_if<Comment>(&l)) return "comment '" + c->text + "'";
    if (const auto* o = std::get_if<ObjInfo>(&l)) return "obj_info '" + o->text + "'";
    if (const auto* e = std::get_if<ElementDef>(&l)) {
        return "element '" + e->name + "' (" + std::to_string(e->count) + ")";
    }
    const auto& p = std::get<PropertyDef>(l);
    return "property '" + p.name + "' (" + to_string(p.type) + ")";
}

namespace grammar {

std::string_view trim_line(std::string_view s) {
    if (s.size() >= 2 && s.substr(s.size() - 2) == "\r\n") {
        s.remove_suffix(2);
    } else if (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
    return s;
}

MagicNumber magic_number(std::string_view s) {
    if (single_line(s) != "ply") syntax_error("expected magic number 'ply'");
    return MagicNumber{};
}

FormatLine format(std::string_view s) {
    auto tokens = split_blanks(single_line(s));
    if (tokens.size() != 3 || tokens[0] != "format") {
        syntax_error("expected 'format <encoding> <major>.<minor>'");
    }

    FormatLine f;
    if (tokens[1] == "ascii") f.encoding = Encoding::Ascii;
    else if (tokens[1] == "binary_big_endian") f.encoding = Encoding::BinaryBigEndian;
    else if (tokens[1] == "binary_little_endian") f.encoding = Encoding::BinaryLittleEndian;
    else syntax_error("unknown encoding '" + std::string(tokens[1]) + "'");

    std::string_view ver = tokens[2];
    auto dot = ver.find('.');
    if (dot == std::string_view::npos ||
        !parse_unsigned(ver.substr(0, dot), f.version.major) ||
        !parse_unsigned(ver.substr(dot + 1), f.version.minor)) {
        syntax_error("invalid version '" + std::string(ver) + "'");
    }
    return f;
}

std::string comment(std::string_view s) {
    return keyword_with_text(s, "comment");
}

std::string obj_info(std::string_view s) {
    return keyword_with_text(s, "obj_info");
}

ElementDef element(std::string_view s) {
    auto tokens = split_blanks(single_line(s));
    if (tokens.size() != 3 || tokens[0] != "element") {
        syntax_error("expected 'element <name> <count>'");
    }
    ElementDef e;
    e.name = std::string(tokens[1]);
    if (!parse_unsigned(tokens[2], e.count)) {
        syntax_error("invalid element count '" + std::string(tokens[2]) + "'");
    }
    return e;
}

PropertyDef property(std::string_view s) {
    auto tokens = split_blanks(single_line(s));
    if (tokens.empty() || tokens[0] != "property") {
        syntax_error("expected 'property'");
    }
    PropertyDef p;
    if (tokens.size() == 5 && tokens[1] == "list") {
        p.type = ListType{scalar_type_token(tokens[2]), scalar_type_token(tokens[3])};
        p.name = std::string(tokens[4]);
        return p;
    }
    if (tokens.size() == 3) {
        p.type = scalar_type_token(tokens[1]);
        p.name = std::string(tokens[2]);
        return p;
    }
    syntax_error("expected 'property <type> <name>' or 'property list <index-type> <value-type> <name>'");
}

EndHeader end_header(std::string_view s) {
    if (single_line(s) != "end_header") syntax_error("expected 'end_header'");
    return EndHeader{};
}

Line line(std::string_view s) {
    auto tokens = split_blanks(single_line(s));
    if (tokens.empty()) syntax_error("empty header line");

    const std::string_view kw = tokens[0];
    if (kw == "ply") return magic_number(s);
    if (kw == "format") return format(s);
    if (kw == "comment") return Comment{comment(s)};
    if (kw == "obj_info") return ObjInfo{obj_info(s)};
    if (kw == "element") return element(s);
    if (kw == "property") return property(s);
    if (kw == "end_header") return end_header(s);
    syntax_error("unknown keyword '" + std::string(kw) + "'");
}

std::vector<std::string_view> data_line(std::string_view s) {
    return split_blanks(trim_line(s));
}

} // namespace grammar

} // namespace plyr
