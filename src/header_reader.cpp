#include "plyr/decoder.hpp"
#include "plyr/grammar.hpp"

#include <istream>
#include <optional>
#include <sstream>

namespace plyr::detail {

bool read_line(std::istream& is, std::string& out, LineEnding ending) {
    out.clear();
    char c = 0;
    while (is.get(c)) {
        out.push_back(c);
        if (c == '\n' && ending != LineEnding::Cr) return true;
        if (c == '\r') {
            if (ending == LineEnding::Cr) return true;
            if (ending == LineEnding::Lf) continue;
            if (is.peek() == '\n') {
                is.get(c);
                out.push_back(c);
                return true;
            }
            if (ending == LineEnding::Detect) return true;
        }
    }
    if (is.bad()) throw PlyError(ErrorKind::Io, "read from stream failed");
    return !out.empty();
}

LineEnding line_ending_of(std::string_view line) {
    if (line.size() >= 2 && line.substr(line.size() - 2) == "\r\n") return LineEnding::CrLf;
    if (!line.empty() && line.back() == '\n') return LineEnding::Lf;
    if (!line.empty() && line.back() == '\r') return LineEnding::Cr;
    return LineEnding::Detect;
}

static std::string describe_format(const FormatLine& f) {
    std::ostringstream oss;
    oss << "Encoding: " << to_string(f.encoding)
        << ", Version: " << f.version.major << '.' << f.version.minor;
    return oss.str();
}

Header read_header(std::istream& is, LocationTracker& location) {
    std::string line_str;

    location.next_line();
    if (!read_line(is, line_str)) {
        throw PlyError(ErrorKind::UnexpectedEof, "empty stream, expected magic number 'ply'",
                       location.line_index, std::string{});
    }
    location.ending = line_ending_of(line_str);
    {
        const std::string text(grammar::trim_line(line_str));
        Line first;
        try {
            first = grammar::line(line_str);
        } catch (const PlyError& e) {
            throw PlyError(ErrorKind::InvalidHeader, "expected magic number 'ply': " + e.cause(),
                           location.line_index, text);
        }
        if (!std::holds_alternative<MagicNumber>(first)) {
            throw PlyError(ErrorKind::InvalidHeader,
                           "expected magic number 'ply', but saw " + describe(first),
                           location.line_index, text);
        }
    }

    Header h;
    std::optional<FormatLine> form_ver;
    // Index into h.elements of the element that receives property lines.
    std::optional<std::size_t> current_element;

    for (;;) {
        location.next_line();
        if (!read_line(is, line_str, location.ending)) {
            throw PlyError(ErrorKind::UnexpectedEof, "stream ended before 'end_header'",
                           location.line_index, std::string{});
        }
        const std::string text(grammar::trim_line(line_str));

        Line line;
        try {
            line = grammar::line(line_str);
        } catch (const PlyError& e) {
            throw PlyError(ErrorKind::InvalidInput, "couldn't parse line: " + e.cause(),
                           location.line_index, text);
        }

        if (std::holds_alternative<MagicNumber>(line)) {
            throw PlyError(ErrorKind::InvalidHeader, "unexpected repeated magic number 'ply'",
                           location.line_index, text);
        }

        if (auto* f = std::get_if<FormatLine>(&line)) {
            if (!form_ver) {
                form_ver = *f;
            } else if (!(*form_ver == *f)) {
                throw PlyError(ErrorKind::InvalidHeader,
                               "found contradicting format definition:\n\t" + describe_format(*f) +
                               "\nprevious definition:\n\t" + describe_format(*form_ver),
                               location.line_index, text);
            }
            continue;
        }

        if (auto* o = std::get_if<ObjInfo>(&line)) {
            h.obj_infos.push_back(std::move(o->text));
            continue;
        }

        if (auto* c = std::get_if<Comment>(&line)) {
            h.comments.push_back(std::move(c->text));
            continue;
        }

        if (auto* e = std::get_if<ElementDef>(&line)) {
            std::string name = e->name;
            if (!h.elements.insert(name, std::move(*e))) {
                throw PlyError(ErrorKind::DuplicateElement,
                               "element '" + name + "' is already defined",
                               location.line_index, text);
            }
            current_element = h.elements.size() - 1;
            continue;
        }

        if (auto* p = std::get_if<PropertyDef>(&line)) {
            if (!current_element) {
                throw PlyError(ErrorKind::PropertyBeforeElement,
                               "property '" + p->name + "' (" + to_string(p->type) + ") found without preceding element",
                               location.line_index, text);
            }
            ElementDef& owner = h.elements.value_at(*current_element);
            std::string name = p->name;
            if (!owner.properties.insert(name, std::move(*p))) {
                throw PlyError(ErrorKind::DuplicateProperty,
                               "property '" + name + "' is already defined on element '" + owner.name + "'",
                               location.line_index, text);
            }
            continue;
        }

        // end_header: the payload starts on the next line.
        location.next_line();
        break;
    }

    if (!form_ver) {
        throw PlyError(ErrorKind::MissingFormat, "no format line found");
    }
    h.encoding = form_ver->encoding;
    h.version = form_ver->version;
    return h;
}

} // namespace plyr::detail
