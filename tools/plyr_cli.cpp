
#include "plyr/parser.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <locale>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static void usage() {
    std::cerr <<
        "plyr - PLY header and payload inspector\n"
        "\n"
        "Usage:\n"
        "  plyr header <FILE> [--raw] [--no-gzip] [--no-color]\n"
        "  plyr tree   <FILE> [--element <E>] [--details] [--no-gzip] [--no-color]\n"
        "  plyr show   <FILE> [<ELEMENT>] [--max-elems N] [--no-gzip] [--no-color]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string element;
    bool raw{false};
    bool details{false};
    bool no_color{false};
    bool no_gzip{false};
    std::size_t max_elems{20};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional element for show
    if (a.cmd == "show" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.element = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--raw") a.raw = true;
        else if (opt == "--details") a.details = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--no-gzip") a.no_gzip = true;
        else if (opt == "--element" && i < argc) a.element = argv[i++];
        else if (opt == "--max-elems" && i < argc) a.max_elems = static_cast<std::size_t>(std::stoull(argv[i++]));
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "header" && a.cmd != "tree" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// Byte size of one binary record, or nullopt when a list makes it variable.
static std::optional<std::size_t> fixed_record_size(const plyr::ElementDef& e) {
    std::size_t n = 0;
    for (const auto& kv : e.properties) {
        const auto* st = std::get_if<plyr::ScalarType>(&kv.second.type);
        if (!st) return std::nullopt;
        n += plyr::byte_width(*st);
    }
    return n;
}

static std::string fmt_width(const plyr::PropertyType& t) {
    if (const auto* st = std::get_if<plyr::ScalarType>(&t)) {
        return std::to_string(plyr::byte_width(*st)) + "B";
    }
    const auto& l = std::get<plyr::ListType>(t);
    return std::to_string(plyr::byte_width(l.index_type)) + "B + n*" +
           std::to_string(plyr::byte_width(l.value_type)) + "B";
}

// ----------------- Value formatting -----------------

static std::string fmt_scalar(const plyr::ScalarValue& v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    std::visit([&](auto x) {
        using T = decltype(x);
        if constexpr (sizeof(T) == 1) oss << static_cast<int>(x);
        else oss << x;
    }, v);
    return oss.str();
}

static std::string fmt_list(const plyr::ListValue& v, std::size_t max_elems) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    std::visit([&](const auto& xs) {
        using T = typename std::decay_t<decltype(xs)>::value_type;
        oss << '[';
        const std::size_t show = std::min(max_elems, xs.size());
        for (std::size_t i = 0; i < show; ++i) {
            if (i) oss << ' ';
            if constexpr (sizeof(T) == 1) oss << static_cast<int>(xs[i]);
            else oss << xs[i];
        }
        if (show < xs.size()) oss << " ... (" << xs.size() << ")";
        oss << ']';
    }, v);
    return oss.str();
}

static std::string fmt_property(const plyr::DefaultElement& rec, const plyr::PropertyDef& p, std::size_t max_elems) {
    if (std::holds_alternative<plyr::ListType>(p.type)) return fmt_list(rec.list(p.name), max_elems);
    return fmt_scalar(rec.scalar(p.name));
}

// ----------------- Tree printer -----------------

static void print_element(const plyr::ElementDef& e, const Ansi& ansi, bool details) {
    std::cout << ansi.magenta() << e.name << "/" << ansi.reset()
              << " " << ansi.gray() << "[" << e.count << "]" << ansi.reset();
    if (details) {
        if (auto sz = fixed_record_size(e)) {
            std::cout << " " << ansi.dim() << "record=" << *sz << "B payload=" << (*sz * e.count) << "B" << ansi.reset();
        } else {
            std::cout << " " << ansi.dim() << "record=variable" << ansi.reset();
        }
    }
    std::cout << "\n";

    for (const auto& kv : e.properties) {
        const plyr::PropertyDef& p = kv.second;
        std::cout << "  " << ansi.cyan() << p.name << ansi.reset()
                  << " " << ansi.yellow() << plyr::to_string(p.type) << ansi.reset();
        if (details) {
            std::cout << " " << ansi.dim() << "width=" << fmt_width(p.type) << ansi.reset();
        }
        std::cout << "\n";
    }
}

// ----------------- Interactive UI rows (FTXUI) -----------------

struct UiRow {
    const plyr::ElementDef* element{nullptr};
    const plyr::PropertyDef* property{nullptr}; // null for element rows
    int depth{0};
};

static std::vector<UiRow> flatten_rows(const std::vector<const plyr::ElementDef*>& elements,
                                       const std::set<std::string>& expanded) {
    std::vector<UiRow> out;
    for (const plyr::ElementDef* e : elements) {
        out.push_back(UiRow{e, nullptr, 0});
        if (expanded.find(e->name) == expanded.end()) continue;
        for (const auto& kv : e->properties) {
            out.push_back(UiRow{e, &kv.second, 1});
        }
    }
    return out;
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (rows.empty()) return nullptr;
    if (idx < 0) return nullptr;
    if ((std::size_t)idx >= rows.size()) return nullptr;
    return &rows[(std::size_t)idx];
}

static std::vector<std::string> preview_lines(
    const std::vector<plyr::DefaultElement>& records,
    const UiRow& r,
    std::size_t max_elems
) {
    std::vector<std::string> out;
    const std::size_t show = std::min(max_elems, records.size());
    for (std::size_t i = 0; i < show; ++i) {
        std::ostringstream oss;
        oss << "[" << i << "] ";
        if (r.property) {
            oss << fmt_property(records[i], *r.property, max_elems);
        } else {
            bool first = true;
            for (const auto& kv : r.element->properties) {
                if (!first) oss << "  ";
                first = false;
                oss << kv.first << "=" << fmt_property(records[i], kv.second, max_elems);
            }
        }
        out.push_back(oss.str());
    }
    if (show < records.size()) {
        out.push_back("... " + std::to_string(records.size() - show) + " more");
    }
    return out;
}

static int run_browser(const Args& a, const plyr::Parser<plyr::DefaultElement>& parser, const plyr::Header& hdr) {
    using namespace ftxui;

    std::vector<const plyr::ElementDef*> elements;
    for (const auto& kv : hdr.elements) {
        if (a.element.empty() || kv.first == a.element) elements.push_back(&kv.second);
    }

    std::set<std::string> expanded;
    if (!a.element.empty()) expanded.insert(a.element);

    int selected = 0;
    int left_scroll = 0; // first visible row index in left pane

    struct StatusKV {
        std::string k;
        std::string v;
    };
    std::vector<StatusKV> status_kv;
    std::vector<std::string> preview;
    std::string selected_path;

    // The payload is decoded on the first preview request and kept.
    std::optional<plyr::Ply<plyr::DefaultElement>> ply;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out = flatten_rows(elements, expanded);
        if (out.empty()) {
            selected = 0;
        } else {
            if (selected < 0) selected = 0;
            if (selected >= (int)out.size()) selected = (int)out.size() - 1;
        }
        return out;
    };

    auto rows = rebuild();

    auto load_preview_for_selected = [&]() {
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return;
        const UiRow& r = *pr;
        selected_path = r.element->name + (r.property ? "." + r.property->name : "");

        status_kv.clear();
        if (r.property) {
            status_kv.push_back({"type", plyr::to_string(r.property->type)});
            status_kv.push_back({"width", fmt_width(r.property->type)});
        } else {
            status_kv.push_back({"count", std::to_string(r.element->count)});
            status_kv.push_back({"properties", std::to_string(r.element->properties.size())});
            auto sz = fixed_record_size(*r.element);
            status_kv.push_back({"record", sz ? std::to_string(*sz) + "B" : "variable"});
        }

        try {
            if (!ply) ply = parser.read_ply(std::filesystem::path(a.file));
            preview = preview_lines(ply->payload.at(r.element->name), r, a.max_elems);
        } catch (const std::exception& e) {
            preview.clear();
            status_kv.push_back({"error", e.what()});
        }
    };

    load_preview_for_selected();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        // The left pane scrolls inside its own viewport.
        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);

        // header (1) + separator (1) + border (2) + a bit of margin
        int visible_rows = std::max(3, term_h - 6);

        int total = (int)rows.size();
        if (total <= 0) {
            left_scroll = 0;
        } else {
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
            if (selected < left_scroll) left_scroll = selected;
            if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
        }

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        items.reserve((std::size_t)std::max(0, end - begin) + 2);

        constexpr int kLeftLineMax = 58; // pane width is 60, leave room for borders

        if (begin > 0) {
            items.push_back(text("↑ more") | color(Color::GrayDark));
        }

        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[(std::size_t)i];

            std::string glyph;
            std::string name;
            std::string meta;
            if (r.property) {
                glyph = "• ";
                name = r.property->name;
                meta = plyr::to_string(r.property->type);
            } else {
                glyph = (expanded.find(r.element->name) != expanded.end()) ? "▾ " : "▸ ";
                name = r.element->name;
                meta = "[" + std::to_string(r.element->count) + "]";
            }
            std::string indent((std::size_t)r.depth * 2, ' ');

            Element left_txt = text(indent + glyph + name) | color(r.property ? Color::Cyan : Color::Magenta) | flex;
            Element right_txt = text(meta) | color(Color::Yellow);
            Element line = hbox({ left_txt, right_txt }) | size(WIDTH, LESS_THAN, kLeftLineMax);

            if (i == selected) {
                line = line | inverted;
            }
            items.push_back(line);
        }

        if (end < total) {
            items.push_back(text("↓ more") | color(Color::GrayDark));
        }

        auto header = hbox({
            text("PLY") | bold | color(Color::White),
            text("  "),
            text(plyr::to_string(hdr.encoding)) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" preview") | color(Color::GrayDark)
        });

        return vbox({
                   header,
                   separator(),
                   vbox(std::move(items)) | flex,
               }) |
               flex |
               border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        meta_lines.reserve(status_kv.size() + 1);
        for (const auto& kv : status_kv) {
            meta_lines.push_back(
                hbox({
                    text(kv.k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(kv.v) | color(Color::GrayLight) | flex,
                })
            );
        }

        std::vector<Element> body_lines;
        body_lines.reserve(preview.size() + 1);
        for (const auto& l : preview) body_lines.push_back(text(l) | color(Color::White));
        if (body_lines.empty()) body_lines.push_back(text("(no records)") | color(Color::GrayDark));

        Element top = vbox({
            text(selected_path.empty() ? a.file : selected_path) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 10) | flex;

        Element body = vbox({
            text("records") | bold | color(Color::Magenta),
            separator(),
            vbox(std::move(body_lines)) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) |
               flex |
               border;
    });

    auto layout = Renderer([&] {
        int left_w = 60;

        // Clamp the whole UI to the terminal viewport.
        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        auto ui = hbox({
            left_pane->Render() | size(WIDTH, EQUAL, left_w),
            right_pane->Render() | flex,
        }) | flex;

        return ui
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        rows = rebuild();

        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return false;
        const UiRow& r = *pr;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < (int)rows.size()) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min((int)rows.size() - 1, selected + 25);
            return true;
        }

        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min((int)rows.size() - 1, selected + 3);
                return true;
            }
        }

        if (e == Event::ArrowRight) {
            if (!r.property) {
                expanded.insert(r.element->name);
                rows = rebuild();
            }
            return true;
        }
        if (e == Event::ArrowLeft) {
            expanded.erase(r.element->name);
            rows = rebuild();
            return true;
        }
        if (e == Event::Return) {
            load_preview_for_selected();
            return true;
        }

        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    try {
        if (!parse_args(argc, argv, a)) {
            usage();
            return 2;
        }
    } catch (const std::exception&) {
        std::cerr << "Invalid numeric option value\n";
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    plyr::ReadOptions opts;
    opts.decompress = !a.no_gzip;
    const plyr::Parser<plyr::DefaultElement> parser(opts);

    try {
        if (a.cmd == "header") {
            const plyr::Header hdr = plyr::read_header_only(a.file, opts);

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Format" << ansi.reset() << ": " << plyr::to_string(hdr.encoding)
                      << " " << hdr.version.major << "." << hdr.version.minor << "\n";
            std::cout << ansi.bold() << "Elements" << ansi.reset() << ": " << hdr.elements.size() << "\n";
            for (const auto& kv : hdr.elements) {
                std::cout << "  " << ansi.cyan() << kv.first << ansi.reset()
                          << " " << ansi.gray() << kv.second.count << " records, "
                          << kv.second.properties.size() << " properties" << ansi.reset() << "\n";
            }
            for (const auto& c : hdr.comments) {
                std::cout << ansi.bold() << "Comment" << ansi.reset() << ": " << c << "\n";
            }
            for (const auto& o : hdr.obj_infos) {
                std::cout << ansi.bold() << "Obj info" << ansi.reset() << ": " << o << "\n";
            }

            if (a.raw) {
                std::cout << plyr::to_string(hdr);
            } else {
                std::cout << ansi.dim() << "(use --raw to print the canonical header text)\n" << ansi.reset();
            }
            return 0;
        }

        if (a.cmd == "tree") {
            const plyr::Header hdr = plyr::read_header_only(a.file, opts);

            if (!a.element.empty()) {
                const plyr::ElementDef* e = hdr.elements.find(a.element);
                if (!e) {
                    std::cerr << "element not found: " << a.element << "\n";
                    return 2;
                }
                std::cout << ansi.dim() << "element: " << a.element << ansi.reset() << "\n";
                print_element(*e, ansi, a.details);
                return 0;
            }

            std::cout << ansi.bold() << "PLY element tree" << ansi.reset() << ": " << a.file << "\n";
            for (const auto& kv : hdr.elements) {
                print_element(kv.second, ansi, a.details);
            }
            return 0;
        }

        if (a.cmd == "show") {
            const plyr::Header hdr = parser.read_header(std::filesystem::path(a.file));
            if (!a.element.empty() && !hdr.elements.contains(a.element)) {
                std::cerr << ansi.red() << "Error" << ansi.reset() << ": element not found: " << a.element << "\n";
                return 2;
            }
            return run_browser(a, parser, hdr);
        }

    } catch (const plyr::PlyError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " (" << plyr::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
