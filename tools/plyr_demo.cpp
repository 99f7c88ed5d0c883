#include "plyr/parser.hpp"
#include "plyr/ply_easy.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>


// A mesh vertex with a fixed layout. Properties the file declares but the
// struct does not know about are ignored.
struct Vertex : plyr::PropertyAccess {
    std::array<float, 3> pos{};
    std::array<std::uint8_t, 3> rgb{};

    void set_scalar(const std::string& name, plyr::ScalarValue value) override {
        const double v = plyr::easy::as_double(value);
        if (name == "x") pos[0] = static_cast<float>(v);
        else if (name == "y") pos[1] = static_cast<float>(v);
        else if (name == "z") pos[2] = static_cast<float>(v);
        else if (name == "red") rgb[0] = static_cast<std::uint8_t>(v);
        else if (name == "green") rgb[1] = static_cast<std::uint8_t>(v);
        else if (name == "blue") rgb[2] = static_cast<std::uint8_t>(v);
    }

    void set_list(const std::string&, plyr::ListValue) override {}
};

struct Face : plyr::PropertyAccess {
    std::vector<std::int64_t> indices;

    void set_scalar(const std::string&, plyr::ScalarValue) override {}

    void set_list(const std::string& name, plyr::ListValue value) override {
        if (name == "vertex_indices") indices = plyr::easy::as_int64s(value);
    }
};

static std::string make_file() {
    using plyr::ByteOrder;
    namespace easy = plyr::easy;

    std::string out =
        "ply\n"
        "format binary_big_endian 1.0\n"
        "comment plyr demo tetrahedron\n"
        "element vertex 4\n"
        "property float x\n"
        "property float y\n"
        "property float z\n"
        "property uchar red\n"
        "property uchar green\n"
        "property uchar blue\n"
        "element face 4\n"
        "property list uchar int vertex_indices\n"
        "end_header\n";

    const float pos[4][3] = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}, {0, 0, 1}};
    for (std::size_t i = 0; i < 4; ++i) {
        out += easy::pack(std::vector<float>(pos[i], pos[i] + 3), ByteOrder::BigEndian);
        out += easy::pack(std::vector<std::uint8_t>{static_cast<std::uint8_t>(60 * i), 128, 255}, ByteOrder::BigEndian);
    }

    const std::int32_t faces[4][3] = {{0, 2, 1}, {0, 1, 3}, {0, 3, 2}, {1, 2, 3}};
    for (const auto& f : faces) {
        easy::append<std::uint8_t>(out, 3, ByteOrder::BigEndian);
        out += easy::pack(std::vector<std::int32_t>(f, f + 3), ByteOrder::BigEndian);
    }
    return out;
}

int main() {
    try {
        const std::string file = make_file();

        // Header and per-element decoding with different representations.
        std::istringstream is(file);
        const plyr::Parser<Vertex> vertex_parser;
        const plyr::Header hdr = vertex_parser.read_header(is);
        std::cout << "Header:\n" << plyr::to_string(hdr);

        const auto vertices = vertex_parser.read_payload_for_element(is, hdr.elements.at("vertex"), hdr.encoding);
        const auto faces = plyr::Parser<Face>().read_payload_for_element(is, hdr.elements.at("face"), hdr.encoding);

        for (std::size_t i = 0; i < vertices.size(); ++i) {
            const Vertex& v = vertices[i];
            std::cout << "vertex " << i << ": (" << v.pos[0] << ", " << v.pos[1] << ", " << v.pos[2] << ")"
                      << " rgb=" << int(v.rgb[0]) << "," << int(v.rgb[1]) << "," << int(v.rgb[2]) << "\n";
        }
        for (std::size_t i = 0; i < faces.size(); ++i) {
            std::cout << "face " << i << ":";
            for (auto idx : faces[i].indices) std::cout << " " << idx;
            std::cout << "\n";
        }

        // The same bytes through the schema-agnostic representation.
        std::istringstream again(file);
        auto ply = plyr::Parser<plyr::DefaultElement>().read_ply(again);
        std::cout << "Default representation: " << ply.payload.at("vertex").size() << " vertices, "
                  << ply.payload.at("face").size() << " faces\n";

        std::cout << "OK\n";
        return 0;

    } catch (const plyr::PlyError& e) {
        std::cerr << "PLY error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
