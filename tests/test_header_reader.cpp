#include "plyr/parser.hpp"

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

static plyr::Header parse(const std::string& txt) {
    std::istringstream is(txt);
    return plyr::Parser<plyr::DefaultElement>().read_header(is);
}

// Runs fn and returns the PlyError it throws; fails the test when nothing is thrown.
static plyr::PlyError error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const plyr::PlyError& e) {
        return e;
    }
    throw std::runtime_error("expected a PlyError");
}

static void minimal_and_full_headers() {
    plyr::Header h = parse("ply\nformat ascii 1.0\nend_header\n");
    CHECK(h.encoding == plyr::Encoding::Ascii);
    CHECK((h.version == plyr::Version{1, 0}));
    CHECK(h.elements.empty());

    h = parse(
        "ply\n"
        "format binary_little_endian 1.0\n"
        "comment made by hand\n"
        "obj_info scanner 7\n"
        "element vertex 8\n"
        "property float x\n"
        "property float y\n"
        "comment in between\n"
        "element face 6\n"
        "property list uchar int vertex_index\n"
        "end_header\n");
    CHECK(h.encoding == plyr::Encoding::BinaryLittleEndian);
    CHECK(h.comments.size() == 2);
    CHECK(h.comments[0] == "made by hand");
    CHECK(h.comments[1] == "in between");
    CHECK(h.obj_infos.size() == 1);
    CHECK(h.obj_infos[0] == "scanner 7");

    CHECK(h.elements.size() == 2);
    auto it = h.elements.begin();
    CHECK(it->first == "vertex");
    CHECK(it->second.count == 8);
    CHECK(it->second.properties.size() == 2);
    CHECK(it->second.properties.begin()->first == "x");
    ++it;
    CHECK(it->first == "face");
    const plyr::PropertyDef& vi = h.elements.at("face").properties.at("vertex_index");
    CHECK((std::get<plyr::ListType>(vi.type) == plyr::ListType{plyr::ScalarType::UChar, plyr::ScalarType::Int}));
}

static void crlf_header_and_stream_position() {
    std::istringstream is("ply\r\nformat ascii 1.0\r\nelement point 1\r\nproperty int x\r\nend_header\r\n42\r\n");
    plyr::detail::LocationTracker location;
    plyr::Header h = plyr::detail::read_header(is, location);
    CHECK(h.elements.at("point").count == 1);
    // Five header lines; the payload starts on line six.
    CHECK(location.line_index == 6);
    std::string rest;
    std::getline(is, rest);
    CHECK(rest == "42\r");
}

static void format_lines() {
    plyr::Header h = parse("ply\nformat ascii 1.0\nformat ascii 1.0\nend_header\n");
    CHECK(h.encoding == plyr::Encoding::Ascii);

    auto e = error_of([] { (void)parse("ply\nformat ascii 1.0\nformat binary_big_endian 1.0\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::InvalidHeader);
    CHECK(e.line() == 3u);
    CHECK(e.text() == "format binary_big_endian 1.0");

    e = error_of([] { (void)parse("ply\nformat ascii 1.0\nformat ascii 1.1\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::InvalidHeader);

    e = error_of([] { (void)parse("ply\ncomment no format\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::MissingFormat);
}

static void magic_number_rules() {
    auto e = error_of([] { (void)parse("format ascii 1.0\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::InvalidHeader);
    CHECK(e.line() == 1u);
    CHECK(e.text() == "format ascii 1.0");

    e = error_of([] { (void)parse("plyx\nformat ascii 1.0\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::InvalidHeader);

    e = error_of([] { (void)parse("ply\nformat ascii 1.0\nply\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::InvalidHeader);
    CHECK(e.line() == 3u);
}

static void element_and_property_rules() {
    auto e = error_of([] { (void)parse("ply\nformat ascii 1.0\nproperty float x\nelement vertex 1\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::PropertyBeforeElement);
    CHECK(e.line() == 3u);
    CHECK(e.cause().find("'x'") != std::string::npos);

    e = error_of([] { (void)parse("ply\nformat ascii 1.0\nelement vertex 1\nelement vertex 2\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::DuplicateElement);
    CHECK(e.line() == 4u);

    e = error_of([] {
        (void)parse("ply\nformat ascii 1.0\nelement vertex 1\nproperty float x\nproperty int x\nend_header\n");
    });
    CHECK(e.kind() == plyr::ErrorKind::DuplicateProperty);
    CHECK(e.line() == 5u);

    // The same property name on different elements is fine; properties go to the latest element.
    plyr::Header h = parse(
        "ply\nformat ascii 1.0\n"
        "element a 1\nproperty float x\n"
        "element b 1\nproperty float x\nproperty float y\n"
        "end_header\n");
    CHECK(h.elements.at("a").properties.size() == 1);
    CHECK(h.elements.at("b").properties.size() == 2);
}

static void malformed_and_truncated() {
    auto e = error_of([] { (void)parse("ply\nformat ascii 1.0\nelement vertex eight\nend_header\n"); });
    CHECK(e.kind() == plyr::ErrorKind::InvalidInput);
    CHECK(e.line() == 3u);
    CHECK(e.text() == "element vertex eight");
    CHECK(std::string(e.what()).find("Line 3:") == 0);

    e = error_of([] { (void)parse("ply\nformat ascii 1.0\nelement vertex 1\n"); });
    CHECK(e.kind() == plyr::ErrorKind::UnexpectedEof);

    e = error_of([] { (void)parse(""); });
    CHECK(e.kind() == plyr::ErrorKind::UnexpectedEof);
}

static void header_line_passthrough() {
    plyr::Parser<plyr::DefaultElement> p;
    CHECK(std::holds_alternative<plyr::MagicNumber>(p.read_header_line("ply\r\n")));
    auto e = error_of([&] { (void)p.read_header_line("plyhi\n"); });
    CHECK(e.kind() == plyr::ErrorKind::InvalidInput);
    CHECK(e.text() == "plyhi");
}

static void round_trip() {
    const std::string txt =
        "ply\n"
        "format binary_big_endian 1.0\n"
        "comment first\n"
        "comment\n"
        "obj_info info\n"
        "element vertex 3\n"
        "property float32 x\n"
        "property uchar red\n"
        "element face 1\n"
        "property list uint8 int32 vertex_indices\n"
        "end_header\n";
    plyr::Header h = parse(txt);
    const std::string canonical = plyr::to_string(h);
    CHECK(canonical.find("property float x\n") != std::string::npos);
    CHECK(canonical.find("property list uchar int vertex_indices\n") != std::string::npos);
    CHECK(parse(canonical) == h);
}

int main() {
    try {
        minimal_and_full_headers();
        crlf_header_and_stream_position();
        format_lines();
        magic_number_rules();
        element_and_property_rules();
        malformed_and_truncated();
        header_line_passthrough();
        round_trip();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
