#include "plyr/grammar.hpp"

#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

static bool rejects(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const plyr::PlyError& e) {
        return e.kind() == plyr::ErrorKind::InvalidInput;
    }
    return false;
}

static void magic_number() {
    namespace g = plyr::grammar;
    (void)g::magic_number("ply");
    CHECK(rejects([] { (void)g::magic_number("py"); }));
    CHECK(rejects([] { (void)g::magic_number("plyhi"); }));
    CHECK(rejects([] { (void)g::magic_number("hiply"); }));

    // Every line terminator and trailing blanks.
    CHECK(std::holds_alternative<plyr::MagicNumber>(g::line("ply")));
    CHECK(std::holds_alternative<plyr::MagicNumber>(g::line("ply \n")));
    CHECK(std::holds_alternative<plyr::MagicNumber>(g::line("ply \r")));
    CHECK(std::holds_alternative<plyr::MagicNumber>(g::line("ply \r\n")));
    CHECK(std::holds_alternative<plyr::MagicNumber>(g::line("ply\t\t\n")));
    CHECK(rejects([] { (void)g::line("py"); }));
    CHECK(rejects([] { (void)g::line("plyhi"); }));
    CHECK(rejects([] { (void)g::line("hiply"); }));
    CHECK(rejects([] { (void)g::line("PLY"); }));
}

static void format_lines() {
    namespace g = plyr::grammar;
    auto f = g::format("format ascii 1.0");
    CHECK(f.encoding == plyr::Encoding::Ascii);
    CHECK((f.version == plyr::Version{1, 0}));

    f = g::format("format binary_big_endian 2.1");
    CHECK(f.encoding == plyr::Encoding::BinaryBigEndian);
    CHECK((f.version == plyr::Version{2, 1}));

    f = g::format("format binary_little_endian 1.0\r\n");
    CHECK(f.encoding == plyr::Encoding::BinaryLittleEndian);

    CHECK(rejects([] { (void)g::format("format asciii 1.0"); }));
    CHECK(rejects([] { (void)g::format("format ascii -1.0"); }));
    CHECK(rejects([] { (void)g::format("format ascii 1"); }));
    CHECK(rejects([] { (void)g::format("format ascii 1.0 extra"); }));
    CHECK(rejects([] { (void)g::format("format ascii"); }));
}

static void comments_and_obj_info() {
    namespace g = plyr::grammar;
    CHECK(g::comment("comment hi") == "hi");
    CHECK(g::comment("comment   hi, I'm a comment!") == "hi, I'm a comment!");
    CHECK(g::comment("comment ").empty());
    CHECK(g::comment("comment").empty());
    CHECK(rejects([] { (void)g::comment("commentt"); }));
    CHECK(rejects([] { (void)g::comment("comment hi\na comment"); }));
    CHECK(rejects([] { (void)g::comment("comment hi\r\na comment"); }));

    CHECK(g::obj_info("obj_info Hi, I can help.") == "Hi, I can help.");

    auto l = g::line("comment a very nice comment \r\n");
    CHECK(std::holds_alternative<plyr::Comment>(l));
    CHECK(std::get<plyr::Comment>(l).text == "a very nice comment");

    l = g::line("obj_info vertex_count 8");
    CHECK(std::holds_alternative<plyr::ObjInfo>(l));
    CHECK(std::get<plyr::ObjInfo>(l).text == "vertex_count 8");
}

static void elements_and_properties() {
    namespace g = plyr::grammar;
    auto e = g::element("element vertex 8");
    CHECK(e.name == "vertex");
    CHECK(e.count == 8);
    CHECK(e.properties.empty());
    CHECK(rejects([] { (void)g::element("element 8 vertex"); }));
    CHECK(rejects([] { (void)g::element("element vertex -1"); }));
    CHECK(rejects([] { (void)g::element("element vertex"); }));

    auto p = g::property("property char c");
    CHECK(p.name == "c");
    CHECK(std::get<plyr::ScalarType>(p.type) == plyr::ScalarType::Char);

    p = g::property("property float64 weight");
    CHECK(std::get<plyr::ScalarType>(p.type) == plyr::ScalarType::Double);

    p = g::property("property list uchar int c");
    CHECK(p.name == "c");
    CHECK((std::get<plyr::ListType>(p.type) == plyr::ListType{plyr::ScalarType::UChar, plyr::ScalarType::Int}));

    p = g::property("property list uint8 uint32 vertex_indices");
    CHECK((std::get<plyr::ListType>(p.type) == plyr::ListType{plyr::ScalarType::UChar, plyr::ScalarType::UInt}));

    CHECK(rejects([] { (void)g::property("property real x"); }));
    CHECK(rejects([] { (void)g::property("property Float x"); }));
    CHECK(rejects([] { (void)g::property("property list uchar x"); }));
    CHECK(rejects([] { (void)g::property("property float"); }));
}

static void whole_lines() {
    namespace g = plyr::grammar;
    CHECK(std::holds_alternative<plyr::FormatLine>(g::line("format ascii 1.0 ")));
    CHECK(std::holds_alternative<plyr::ElementDef>(g::line("element vertex 8 ")));
    CHECK(std::holds_alternative<plyr::PropertyDef>(g::line("property float x ")));
    CHECK(std::holds_alternative<plyr::ElementDef>(g::line("element face 6 ")));
    CHECK(std::holds_alternative<plyr::PropertyDef>(g::line("property list uchar int vertex_index ")));
    CHECK(std::holds_alternative<plyr::EndHeader>(g::line("end_header ")));
    CHECK(std::holds_alternative<plyr::EndHeader>(g::line("end_header\r\n")));

    CHECK(rejects([] { (void)g::line(""); }));
    CHECK(rejects([] { (void)g::line("\n"); }));
    CHECK(rejects([] { (void)g::line("vertex 1 2 3"); }));

    CHECK(plyr::describe(g::line("element vertex 8")) == "element 'vertex' (8)");
    CHECK(plyr::describe(g::line("property list uchar int vertex_index")) ==
          "property 'vertex_index' (list uchar int)");
}

static void data_lines() {
    namespace g = plyr::grammar;
    auto t = g::data_line("-7 +5.21 \r\n");
    CHECK(t.size() == 2);
    CHECK(t[0] == "-7");
    CHECK(t[1] == "+5.21");

    t = g::data_line("  3\t0  1 2");
    CHECK((t == std::vector<std::string_view>{"3", "0", "1", "2"}));

    CHECK(g::data_line("\n").empty());
}

static void scalar_table() {
    CHECK(plyr::byte_width(plyr::ScalarType::Char) == 1);
    CHECK(plyr::byte_width(plyr::ScalarType::UShort) == 2);
    CHECK(plyr::byte_width(plyr::ScalarType::Float) == 4);
    CHECK(plyr::byte_width(plyr::ScalarType::Double) == 8);
    for (const auto& info : plyr::kScalarTypes) {
        CHECK(plyr::scalar_type_from_string(info.name) == info.type);
        CHECK(plyr::scalar_type_from_string(info.alias) == info.type);
        CHECK(plyr::to_string(info.type) == info.name);
    }
    CHECK(!plyr::scalar_type_from_string("int64"));
}

int main() {
    try {
        magic_number();
        format_lines();
        comments_and_obj_info();
        elements_and_properties();
        whole_lines();
        data_lines();
        scalar_table();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
