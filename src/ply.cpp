#include "plyr/ply.hpp"
#include "plyr/decoder.hpp"

#include <locale>
#include <ostream>
#include <sstream>

namespace plyr {

static std::string render_message(const std::string& cause, const std::optional<std::size_t>& line, const std::string& text) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    if (line) oss << "Line " << *line << ": ";
    oss << cause;
    if (!text.empty()) oss << "\n\tString: '" << text << "'";
    return oss.str();
}

PlyError::PlyError(ErrorKind k, const std::string& cause)
    : std::runtime_error(cause), kind_(k), line_(), text_(), cause_(cause) {}

PlyError::PlyError(ErrorKind k, const std::string& cause, std::optional<std::size_t> line, std::string text)
    : std::runtime_error(render_message(cause, line, text)),
      kind_(k),
      line_(line),
      text_(std::move(text)),
      cause_(cause) {}

ErrorKind PlyError::kind() const noexcept { return kind_; }

std::optional<std::size_t> PlyError::line() const noexcept { return line_; }

const std::string& PlyError::text() const noexcept { return text_; }

const std::string& PlyError::cause() const noexcept { return cause_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "Io";
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::InvalidHeader: return "InvalidHeader";
        case ErrorKind::DuplicateElement: return "DuplicateElement";
        case ErrorKind::DuplicateProperty: return "DuplicateProperty";
        case ErrorKind::PropertyBeforeElement: return "PropertyBeforeElement";
        case ErrorKind::MissingFormat: return "MissingFormat";
        case ErrorKind::MalformedRecord: return "MalformedRecord";
        case ErrorKind::UnexpectedEof: return "UnexpectedEof";
        case ErrorKind::ZlibError: return "ZlibError";
        case ErrorKind::NotFound: return "NotFound";
    }
    return "unknown";
}

// ------------------------------
// Type model helpers
// ------------------------------

std::string to_string(Encoding e) {
    switch (e) {
        case Encoding::Ascii: return "ascii";
        case Encoding::BinaryBigEndian: return "binary_big_endian";
        case Encoding::BinaryLittleEndian: return "binary_little_endian";
    }
    return "unknown";
}

const ScalarTypeInfo& scalar_type_info(ScalarType t) {
    for (const auto& info : kScalarTypes) {
        if (info.type == t) return info;
    }
    throw PlyError(ErrorKind::InvalidInput, "unknown scalar type tag");
}

std::string to_string(ScalarType t) {
    return std::string(scalar_type_info(t).name);
}

std::size_t byte_width(ScalarType t) {
    return scalar_type_info(t).width;
}

std::optional<ScalarType> scalar_type_from_string(std::string_view s) {
    for (const auto& info : kScalarTypes) {
        if (s == info.name || s == info.alias) return info.type;
    }
    return std::nullopt;
}

std::string to_string(const PropertyType& t) {
    if (std::holds_alternative<ListType>(t)) {
        const auto& l = std::get<ListType>(t);
        return "list " + to_string(l.index_type) + " " + to_string(l.value_type);
    }
    return to_string(std::get<ScalarType>(t));
}

// ------------------------------
// DefaultElement
// ------------------------------

void DefaultElement::set_scalar(const std::string& name, ScalarValue value) {
    props_[name] = Property{std::move(value)};
}

void DefaultElement::set_list(const std::string& name, ListValue value) {
    props_[name] = Property{std::move(value)};
}

bool DefaultElement::contains(const std::string& name) const {
    return props_.count(name) != 0;
}

const ScalarValue& DefaultElement::scalar(const std::string& name) const {
    auto it = props_.find(name);
    if (it == props_.end()) throw PlyError(ErrorKind::NotFound, "property not found: '" + name + "'");
    if (!std::holds_alternative<ScalarValue>(it->second)) {
        throw PlyError(ErrorKind::NotFound, "property '" + name + "' is a list, not a scalar");
    }
    return std::get<ScalarValue>(it->second);
}

const ListValue& DefaultElement::list(const std::string& name) const {
    auto it = props_.find(name);
    if (it == props_.end()) throw PlyError(ErrorKind::NotFound, "property not found: '" + name + "'");
    if (!std::holds_alternative<ListValue>(it->second)) {
        throw PlyError(ErrorKind::NotFound, "property '" + name + "' is a scalar, not a list");
    }
    return std::get<ListValue>(it->second);
}

const DefaultElement::Map& DefaultElement::properties() const noexcept {
    return props_;
}

// ------------------------------
// Header serialization
// ------------------------------

void write_header(std::ostream& os, const Header& h) {
    os << "ply\n";
    os << "format " << to_string(h.encoding) << ' ' << h.version.major << '.' << h.version.minor << '\n';
    for (const auto& c : h.comments) {
        os << "comment";
        if (!c.empty()) os << ' ' << c;
        os << '\n';
    }
    for (const auto& o : h.obj_infos) {
        os << "obj_info";
        if (!o.empty()) os << ' ' << o;
        os << '\n';
    }
    for (const auto& ekv : h.elements) {
        const ElementDef& e = ekv.second;
        os << "element " << e.name << ' ' << e.count << '\n';
        for (const auto& pkv : e.properties) {
            os << "property " << to_string(pkv.second.type) << ' ' << pkv.second.name << '\n';
        }
    }
    os << "end_header\n";
}

std::string to_string(const Header& h) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    write_header(oss, h);
    return oss.str();
}

// ------------------------------
// API implementations
// ------------------------------

Header read_header_only(const std::filesystem::path& file, const ReadOptions& opts) {
    auto is = detail::open_input(file, opts);
    detail::LocationTracker location;
    return detail::read_header(*is, location);
}

} // namespace plyr
