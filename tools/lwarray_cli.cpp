
#include "lwarray/document.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
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
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
};

} // namespace

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string fmt_shape(const std::vector<std::size_t>& shape) {
    if (shape.empty()) return "[?]";
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) oss << " x ";
        oss << shape[i];
    }
    oss << ']';
    return oss.str();
}

static void usage() {
    std::cerr <<
        "lwarray - LIGO_LW Array inspector\n"
        "\n"
        "Usage:\n"
        "  lwarray list    <FILE> [--strict] [--verbose] [--no-color]\n"
        "  lwarray dump    <FILE> [<NAME>] [--max-elems N] [--rows N] [--cols N] [--strict] [--no-color]\n"
        "  lwarray show    <FILE> [<NAME>] [--max-elems N] [--rows N] [--cols N] [--strict]\n"
        "  lwarray rewrite <FILE> <OUT> [--gzip] [--level N] [--strict] [--verbose]\n"
        "\n"
        "FILE may be gzip-compressed.\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string name;
    std::string out;
    bool strict{false};
    bool gzip{false};
    bool verbose{false};
    bool no_color{false};
    int level{6};
    std::size_t max_elems{20};
    std::size_t rows{6};
    std::size_t cols{6};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional NAME for dump/show, OUT for rewrite
    if ((a.cmd == "dump" || a.cmd == "show") && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.name = argv[i++];
    }
    if (a.cmd == "rewrite") {
        if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) {
            std::cerr << "rewrite needs an output file\n";
            return false;
        }
        a.out = argv[i++];
    }

    try {
        while (i < argc) {
            std::string opt = argv[i++];
            if (opt == "--strict") a.strict = true;
            else if (opt == "--gzip") a.gzip = true;
            else if (opt == "--verbose") a.verbose = true;
            else if (opt == "--no-color") a.no_color = true;
            else if (opt == "--level" && i < argc) a.level = std::stoi(argv[i++]);
            else if (opt == "--max-elems" && i < argc) a.max_elems = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--rows" && i < argc) a.rows = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--cols" && i < argc) a.cols = static_cast<std::size_t>(std::stoull(argv[i++]));
            else {
                std::cerr << "Unknown option: " << opt << "\n";
                return false;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Bad numeric option value\n";
        return false;
    }

    if (a.cmd != "list" && a.cmd != "dump" && a.cmd != "show" && a.cmd != "rewrite") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

static void log_verbose(const Args& a, const Ansi& ansi, const std::string& msg) {
    if (!a.verbose) return;
    std::cerr << ansi.dim() << "[lwarray] " << msg << ansi.reset() << "\n";
}

// ----------------- Array preview -----------------

static std::string preview_to_string(const lwarray::Array& arr, std::size_t max_elems, std::size_t rows, std::size_t cols) {
    std::ostringstream oss;
    oss << "array:\n";
    oss << "  name=" << arr.name() << "\n";
    oss << "  type=" << arr.type_name() << " (" << lwarray::name_for(arr.scalar_type()) << ")\n";
    oss << "  dims=" << fmt_shape(arr.dimensions()) << "\n";
    oss << "  shape=" << fmt_shape(arr.shape()) << "\n";
    oss << "  state=" << lwarray::to_string(arr.state()) << "\n";
    if (const auto* s = arr.stream()) {
        oss << "  delimiter=\"" << s->delimiter() << "\"\n";
    }

    if (arr.state() == lwarray::ArrayState::Empty) {
        oss << "(no data)\n";
        return oss.str();
    }

    const lwarray::NdArray& a = arr.array();
    const std::size_t n = a.size();
    oss << "preview:\n";
    if (n == 0) {
        oss << "  (empty)\n";
        return oss.str();
    }

    if (a.shape.size() == 2) {
        // storage rows are shape[0], columns shape[1]
        const std::size_t r = std::min(rows, a.shape[0]);
        const std::size_t c = std::min(cols, a.shape[1]);
        for (std::size_t i = 0; i < r; ++i) {
            oss << "  ";
            for (std::size_t j = 0; j < c; ++j) {
                if (j) oss << "  ";
                oss << lwarray::format_element(a, lwarray::flat_offset(a.shape, {i, j}));
            }
            if (c < a.shape[1]) oss << "  ...";
            oss << "\n";
        }
        if (r < a.shape[0]) oss << "  ...\n";
        return oss.str();
    }

    const std::size_t m = std::min(max_elems, n);
    oss << "  ";
    for (std::size_t i = 0; i < m; ++i) {
        if (i) oss << ", ";
        oss << lwarray::format_element(a, i);
    }
    if (m < n) oss << ", ... (" << n << " total)";
    oss << "\n";
    return oss.str();
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());
    for (const auto& line : lines) {
        // section headers like "array:" / "preview:"
        if (!line.empty() && line.back() == ':' && line.rfind("  ", 0) != 0) {
            els.push_back(text(line) | bold | color(Color::Magenta));
            continue;
        }
        if (line.rfind("  ", 0) == 0) {
            std::string rest = line.substr(2);
            auto eq = rest.find('=');
            if (eq != std::string::npos) {
                els.push_back(hbox({
                    text("  "),
                    text(rest.substr(0, eq)) | bold | color(Color::Yellow),
                    text("=") | color(Color::GrayDark),
                    text(rest.substr(eq + 1)) | color(Color::GrayLight) | flex,
                }));
                continue;
            }
        }
        els.push_back(text(line) | color(Color::White));
    }
    return vbox(std::move(els));
}

// ----------------- Commands -----------------

static std::unique_ptr<lwarray::Document> load(const Args& a, const Ansi& ansi) {
    lwarray::ReadOptions ro;
    ro.strict_fill = a.strict;
    log_verbose(a, ansi, "reading " + a.file + (a.strict ? " (strict fill)" : ""));
    auto doc = lwarray::load_file(a.file, ro);
    log_verbose(a, ansi, "found " + std::to_string(doc->get_elements_by_tag_name("Array").size()) + " Array element(s)");
    return doc;
}

static std::vector<lwarray::Array*> all_arrays(lwarray::Document& doc) {
    std::vector<lwarray::Array*> out;
    for (lwarray::Element* e : doc.get_elements_by_tag_name("Array")) {
        if (auto* arr = dynamic_cast<lwarray::Array*>(e)) out.push_back(arr);
    }
    return out;
}

static int cmd_list(const Args& a, const Ansi& ansi) {
    auto doc = load(a, ansi);
    auto arrays = all_arrays(*doc);
    std::cout << ansi.bold() << "Arrays" << ansi.reset() << ": " << a.file << "\n";
    for (const auto* arr : arrays) {
        std::cout << "  " << ansi.cyan() << arr->name() << ansi.reset()
                  << "  " << ansi.yellow() << arr->type_name() << ansi.reset()
                  << "  " << fmt_shape(arr->shape())
                  << ansi.dim() << "  (" << (arr->state() == lwarray::ArrayState::Empty ? 0 : arr->array().size())
                  << " elements)" << ansi.reset() << "\n";
    }
    if (arrays.empty()) std::cout << ansi.dim() << "  (none)" << ansi.reset() << "\n";
    return 0;
}

static int cmd_dump(const Args& a, const Ansi& ansi) {
    auto doc = load(a, ansi);
    std::vector<lwarray::Array*> arrays;
    if (a.name.empty()) arrays = all_arrays(*doc);
    else arrays.push_back(&lwarray::get_array(*doc, a.name));

    for (const auto* arr : arrays) {
        std::cout << ansi.green() << lwarray::strip_array_name(arr->name()) << ansi.reset() << "\n";
        std::cout << preview_to_string(*arr, a.max_elems, a.rows, a.cols) << "\n";
    }
    return 0;
}

static int cmd_rewrite(const Args& a, const Ansi& ansi) {
    auto doc = load(a, ansi);
    lwarray::WriteOptions wo;
    wo.gzip = a.gzip;
    wo.zlib_level = a.level;
    log_verbose(a, ansi, "writing " + a.out + (a.gzip ? " (gzip level " + std::to_string(a.level) + ")" : ""));
    lwarray::write_file(a.out, *doc, wo);
    std::cout << "Wrote: " << a.out << "\n";
    return 0;
}

static int cmd_show(const Args& a, const Ansi& ansi) {
    auto doc = load(a, ansi);
    auto arrays = all_arrays(*doc);

    using namespace ftxui;

    int selected = 0;
    if (!a.name.empty()) {
        const lwarray::Array* start = &lwarray::get_array(*doc, a.name);
        auto it = std::find(arrays.begin(), arrays.end(), start);
        selected = (int)(it - arrays.begin());
    }
    int left_scroll = 0;
    std::string preview;
    auto refresh = [&]() {
        if (arrays.empty()) {
            preview.clear();
            return;
        }
        selected = std::max(0, std::min(selected, (int)arrays.size() - 1));
        try {
            preview = preview_to_string(*arrays[(std::size_t)selected], a.max_elems, a.rows, a.cols);
        } catch (const std::exception& e) {
            preview = std::string("error:\n  ") + e.what() + "\n";
        }
    };
    refresh();

    auto left_pane = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        int visible_rows = std::max(3, std::max(10, dim.dimy) - 6);
        int total = (int)arrays.size();
        if (selected < left_scroll) left_scroll = selected;
        if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
        left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;
        if (begin > 0) items.push_back(text("↑ more") | color(Color::GrayDark));
        for (int i = begin; i < end; ++i) {
            const lwarray::Array& arr = *arrays[(std::size_t)i];
            Element line = hbox({
                text(arr.name()) | color(Color::Cyan) | flex,
                text(fmt_shape(arr.shape()) + "  " + arr.type_name()) | color(Color::Yellow),
            }) | size(WIDTH, LESS_THAN, 58);
            if (i == selected) line = line | inverted;
            items.push_back(line);
        }
        if (end < total) items.push_back(text("↓ more") | color(Color::GrayDark));
        if (items.empty()) items.push_back(text("(no Array elements)") | color(Color::GrayDark));

        auto header = hbox({
            text("LIGO_LW") | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move") | color(Color::GrayDark),
        });

        return vbox({header, separator(), vbox(std::move(items)) | flex}) | flex | border;
    });

    auto right_pane = Renderer([&] {
        return vbox({
                   text("preview") | bold | color(Color::Magenta),
                   separator(),
                   render_preview_colored(preview) | flex,
               }) |
               vscroll_indicator | frame | flex | border;
    });

    auto layout = Renderer([&] {
        auto dim = ftxui::Terminal::Size();
        return hbox({
                   left_pane->Render() | size(WIDTH, EQUAL, 60),
                   right_pane->Render() | flex,
               }) |
               size(WIDTH, EQUAL, std::max(20, dim.dimx)) |
               size(HEIGHT, EQUAL, std::max(10, dim.dimy));
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (arrays.empty()) return false;
        int last = (int)arrays.size() - 1;
        int before = selected;
        if (e == Event::ArrowUp) selected = std::max(0, selected - 1);
        else if (e == Event::ArrowDown) selected = std::min(last, selected + 1);
        else if (e == Event::PageUp) selected = std::max(0, selected - 25);
        else if (e == Event::PageDown) selected = std::min(last, selected + 25);
        else if (e.is_mouse() && e.mouse().button == Mouse::WheelUp) selected = std::max(0, selected - 3);
        else if (e.is_mouse() && e.mouse().button == Mouse::WheelDown) selected = std::min(last, selected + 3);
        else return false;
        if (selected != before) refresh();
        return true;
    });

    screen.Loop(app);
    return 0;
}

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "list") return cmd_list(a, ansi);
        if (a.cmd == "dump") return cmd_dump(a, ansi);
        if (a.cmd == "show") return cmd_show(a, ansi);
        if (a.cmd == "rewrite") return cmd_rewrite(a, ansi);
    } catch (const lwarray::LwError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " [" << lwarray::to_string(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
