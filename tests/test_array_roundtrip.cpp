#include "lwarray/document.hpp"
#include "lwarray/easy.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

static const char* kHeader =
    "<?xml version='1.0' encoding='utf-8' ?>\n"
    "<!DOCTYPE LIGO_LW SYSTEM \"http://ldas-sw.ligo.caltech.edu/doc/ligolwAPI/html/ligolw_dtd.txt\">\n";

// 2x3 int_4s array, written the way write() lays it out.
static std::string sample_document() {
    return std::string(kHeader) +
        "<LIGO_LW>\n"
        "\t<Array Name=\"test:array\" Type=\"int_4s\">\n"
        "\t\t<Dim>3</Dim>\n"
        "\t\t<Dim>2</Dim>\n"
        "\t\t<Stream Type=\"Local\" Delimiter=\",\">\n"
        "\t\t\t1,4,\n"
        "\t\t\t2,5,\n"
        "\t\t\t3,6\n"
        "\t\t</Stream>\n"
        "\t</Array>\n"
        "</LIGO_LW>\n";
}

static std::string array_document(const std::string& type, const std::vector<std::string>& dims,
                                  const std::string& stream_attrs, const std::string& text) {
    std::string s = "<LIGO_LW><Array Name=\"a:array\" Type=\"" + type + "\">";
    for (const auto& d : dims) s += "<Dim>" + d + "</Dim>";
    s += "<Stream" + stream_attrs + ">" + text + "</Stream></Array></LIGO_LW>";
    return s;
}

static bool load_fails_with(const std::string& xml, lwarray::ErrorKind kind,
                            const lwarray::ReadOptions& opts = lwarray::ReadOptions{}) {
    try {
        (void)lwarray::load_string(xml, opts);
    } catch (const lwarray::LwError& e) {
        return e.kind() == kind;
    }
    return false;
}

template <typename T>
static void check_roundtrip(const std::string& name, lwarray::Shape shape, std::vector<T> values, char delimiter) {
    using namespace lwarray;
    NdArray original = easy::make_ndarray<T>(std::move(shape), std::move(values));

    Document doc;
    Element& root = easy::new_ligo_lw(doc);
    root.append_child(from_array(name, original, {}, delimiter));

    const std::string text = to_string(doc);
    auto back = load_string(text);
    Array& arr = get_array(*back, name);
    CHECK(arr.state() == ArrayState::Complete);
    CHECK(arr.array() == original);
    CHECK(to_string(*back) == text);
}

int main() {
    try {
        using namespace lwarray;

        // Parse: declared Dims reversed, values placed in sequencer order
        {
            auto doc = load_string(sample_document());
            Array& arr = get_array(*doc, "test");
            CHECK(arr.scalar_type() == ScalarType::Int32);
            CHECK(arr.kind() == StorageKind::IntegerFamily);
            CHECK((arr.dimensions() == DimensionList{3, 2}));
            CHECK((arr.shape() == Shape{2, 3}));
            CHECK((easy::values<std::int32_t>(arr.array()) == std::vector<std::int32_t>{1, 2, 3, 4, 5, 6}));
            CHECK(easy::at<std::int32_t>(arr.array(), {1, 0}) == 4);
            CHECK(arr.stream() != nullptr);
            CHECK(arr.stream()->delimiter() == ',');
            CHECK(arr.stream()->values_read() == 6);
        }

        // Write: delimiter before the line break, no delimiter after the last value
        {
            Document doc;
            Element& root = easy::new_ligo_lw(doc);
            root.append_child(from_array("test:array",
                                         easy::make_ndarray<std::int32_t>({2, 3}, {1, 2, 3, 4, 5, 6}), {}, ','));
            CHECK(to_string(doc) == sample_document());

            auto reread = load_string(sample_document());
            CHECK(to_string(*reread) == sample_document());
        }

        // Round trips across types and sizes
        {
            check_roundtrip<double>("x:array", {3}, {0.5, 1.25, -3.0}, ' ');
            check_roundtrip<double>("one:array", {1}, {7.0}, ' ');
            check_roundtrip<double>("none:array", {0}, {}, ' ');
            check_roundtrip<std::int16_t>("s:array", {2, 2}, {-1, 2, -3, 4}, ',');
            check_roundtrip<std::uint64_t>("u:array", {2}, {0, 18446744073709551615ull}, ',');
            check_roundtrip<float>("f:array", {2, 3}, {0.1f, 0.2f, 0.3f, 1e-20f, 3.4e38f, -0.0f}, ' ');
            check_roundtrip<double>("d:array", {2, 2, 3},
                                    {1.0 / 3.0, 2.0 / 3.0, 1e300, -1e-300, 0, 1, 2, 3, 4, 5, 6, 7}, ',');
            check_roundtrip<std::int32_t>("empty2:array", {3, 0}, {}, ',');
            check_roundtrip<double>("t:array", {2, 2}, {1, 2, 3, 4}, '\t');
        }

        // Whitespace delimiters survive attribute normalization
        {
            CHECK(xml_escape("a\tb\nc\rd", true) == "a&#9;b&#10;c&#13;d");
            CHECK(xml_escape("a\tb\n", false) == "a\tb\n");

            Document doc;
            Element& root = easy::new_ligo_lw(doc);
            root.append_child(from_array("tab:array", easy::make_ndarray<double>({2, 2}, {1, 2, 3, 4}), {}, '\t'));
            const std::string text = to_string(doc);
            CHECK(text.find("Delimiter=\"&#9;\"") != std::string::npos);

            auto back = load_string(text);
            const Array& arr = get_array(*back, "tab");
            CHECK(arr.stream()->delimiter() == '\t');
            CHECK(arr.stream()->attribute("Delimiter") == "\t");
            CHECK((easy::values<double>(arr.array()) == std::vector<double>{1, 2, 3, 4}));
        }

        // Empty array writes a Stream with no values
        {
            Document doc;
            Element& root = easy::new_ligo_lw(doc);
            root.append_child(from_array("e:array", easy::make_ndarray<double>({0}, {})));
            const std::string text = to_string(doc);
            CHECK(text.find("<Stream Type=\"Local\" Delimiter=\" \">\n\n\t\t</Stream>") != std::string::npos);
        }

        // Overflow: five values into a 2x2 array
        {
            std::string xml = array_document("int_4s", {"2", "2"}, " Delimiter=\",\"", "1,2,3,4,5");
            CHECK(load_fails_with(xml, ErrorKind::ArrayOverflow));
            std::string xml2 = array_document("int_4s", {"2", "2"}, " Delimiter=\",\"", "1,2,3,4,5,");
            CHECK(load_fails_with(xml2, ErrorKind::ArrayOverflow));
        }

        // Exactly full, checking placement
        {
            auto doc = load_string(array_document("int_4s", {"2", "2"}, " Delimiter=\",\"", "1,2,3,4"));
            const NdArray& a = get_array(*doc, "a").array();
            CHECK((easy::values<std::int32_t>(a) == std::vector<std::int32_t>{1, 3, 2, 4}));
            CHECK(easy::at<std::int32_t>(a, {1, 0}) == 2);
            CHECK(easy::at<std::int32_t>(a, {0, 1}) == 3);
        }

        // Short Streams leave zeros unless strict
        {
            std::string xml = array_document("real_8", {"2", "2"}, "", "1.5,2.5");
            auto doc = load_string(xml);
            const NdArray& a = get_array(*doc, "a").array();
            CHECK((easy::values<double>(a) == std::vector<double>{1.5, 0.0, 2.5, 0.0}));

            ReadOptions strict;
            strict.strict_fill = true;
            CHECK(load_fails_with(xml, ErrorKind::ArrayUnderflow, strict));
            (void)load_string(array_document("real_8", {"2", "2"}, "", "1,2,3,4"), strict);
        }

        // Results do not depend on how character data is chunked
        {
            const std::string xml = sample_document();
            for (std::size_t n = 1; n <= 7; ++n) {
                ReadOptions opts;
                opts.chunk_size = n;
                auto doc = load_string(xml, opts);
                CHECK((easy::values<std::int32_t>(get_array(*doc, "test").array())
                       == std::vector<std::int32_t>{1, 2, 3, 4, 5, 6}));
            }

            std::istringstream is(xml);
            ReadOptions opts;
            opts.chunk_size = 3;
            auto doc = load_stream(is, opts);
            CHECK(to_string(*doc) == xml);
        }

        // Hand-built parse through the content handler, one character at a time
        {
            Document doc;
            ContentHandler h(doc);
            h.start_element("LIGO_LW", {});
            h.start_element("Array", {{"Name", "h:array"}, {"Type", "int_8s"}});
            h.start_element("Dim", {});
            h.characters("3");
            h.end_element("Dim");
            h.start_element("Stream", {{"Delimiter", " "}});
            CHECK(dynamic_cast<ArrayStream*>(&h.current()) != nullptr);
            for (char c : std::string("10 -20\n30")) h.characters(std::string_view(&c, 1));
            Array& arr = get_array(doc, "h");
            CHECK(arr.state() == ArrayState::Allocated);
            h.end_element("Stream");
            CHECK(arr.state() == ArrayState::Complete);
            h.end_element("Array");
            h.end_element("LIGO_LW");
            CHECK((easy::values<std::int64_t>(arr.array()) == std::vector<std::int64_t>{10, -20, 30}));
        }

        // Malformed input
        {
            CHECK(load_fails_with(array_document("complex_8", {"2"}, "", "1,2"), ErrorKind::UnknownType));
            CHECK(load_fails_with(array_document("int_4s", {"2"}, "", "1,x"), ErrorKind::BadToken));
            CHECK(load_fails_with(array_document("int_2s", {"2"}, "", "1,40000"), ErrorKind::BadToken));
            CHECK(load_fails_with(array_document("int_4s", {"two"}, "", "1,2"), ErrorKind::InvalidData));
            CHECK(load_fails_with(array_document("int_4s", {"2"}, " Type=\"Remote\"", "1,2"), ErrorKind::InvalidData));
            CHECK(load_fails_with(array_document("int_4s", {"2"}, " Delimiter=\";;\"", "1;;2"), ErrorKind::InvalidData));
            CHECK(load_fails_with(array_document("int_4s", {}, "", "1,2"), ErrorKind::InvalidData));
            CHECK(load_fails_with(array_document("int_4s", {"1000000000000000"}, "", "1,2"), ErrorKind::InvalidData));
            CHECK(load_fails_with(array_document("real_8", {"4294967296", "4294967296"}, "", "1"), ErrorKind::InvalidData));
            CHECK(load_fails_with("<LIGO_LW><Array Name=\"a\" Type=\"int_4s\">", ErrorKind::XmlParse));
            CHECK(load_fails_with("<LIGO_LW></Array>", ErrorKind::XmlParse));
        }

        // Names and lookup
        {
            CHECK(strip_array_name("process:test:array") == "test");
            CHECK(strip_array_name("test:array") == "test");
            CHECK(strip_array_name("Test:array") == "Test:array");
            CHECK(strip_array_name("plain") == "plain");
            CHECK(strip_array_name("a:b:c:array") == "a:b:c:array");
            CHECK(compare_array_names("x:psd:array", "psd") == 0);
            CHECK(compare_array_names("a:array", "b:array") < 0);

            Document doc;
            Element& root = easy::new_ligo_lw(doc);
            easy::add_array<double>(root, "psd:array", {2}, {1.0, 2.0});
            easy::add_array<double>(root, "dup:array", {1}, {1.0});
            easy::add_array<double>(root, "other:dup:array", {1}, {2.0});

            CHECK(get_array(doc, "psd").name() == "psd:array");
            CHECK(get_arrays_by_name(doc, "dup").size() == 2);

            bool threw = false;
            try {
                (void)get_array(doc, "dup");
            } catch (const LwError& e) {
                threw = e.kind() == ErrorKind::InvalidData;
            }
            CHECK(threw);

            threw = false;
            try {
                (void)get_array(doc, "missing");
            } catch (const LwError& e) {
                threw = e.kind() == ErrorKind::NotFound;
            }
            CHECK(threw);
        }

        // from_array: Dim names in declaration order
        {
            auto arr = from_array("spectrogram:array", easy::make_ndarray<float>({2, 3}, std::vector<float>(6, 1.0f)),
                                  {"frequency", "time"});
            CHECK(arr->type_name() == "real_4");
            CHECK(arr->children().size() == 3);
            CHECK(arr->children()[0]->attribute("Name") == "frequency");
            CHECK(arr->children()[0]->pcdata() == "3");
            CHECK(arr->children()[1]->attribute("Name") == "time");
            CHECK(arr->children()[1]->pcdata() == "2");
            CHECK(arr->stream() != nullptr);
            CHECK(arr->stream()->delimiter() == ' ');

            bool threw = false;
            try {
                (void)from_array("bad:array", easy::make_ndarray<float>({2}, {1.0f, 2.0f}), {"a", "b"});
            } catch (const LwError& e) {
                threw = e.kind() == ErrorKind::InvalidData;
            }
            CHECK(threw);
        }

        // Removing an Array from the tree releases its storage
        {
            auto doc = load_string(sample_document());
            Element& root = *doc->children().front();
            Array& arr = get_array(*doc, "test");
            auto detached = root.remove_child(arr);
            auto& a = static_cast<Array&>(*detached);
            CHECK(a.state() == ArrayState::Empty);
            CHECK(get_arrays_by_name(*doc, "test").empty());
        }

        // Files, plain and gzip
        {
            std::filesystem::path dir = std::filesystem::temp_directory_path();
            std::filesystem::path plain = dir / "lwarray_test.xml";
            std::filesystem::path gz = dir / "lwarray_test.xml.gz";
            std::filesystem::remove(plain);
            std::filesystem::remove(gz);

            auto doc = load_string(sample_document());
            write_file(plain, *doc);
            WriteOptions wo;
            wo.gzip = true;
            wo.zlib_level = 9;
            write_file(gz, *doc, wo);

            std::ifstream f(gz, std::ios::binary);
            unsigned char magic[2] = {0, 0};
            f.read(reinterpret_cast<char*>(magic), 2);
            CHECK(magic[0] == 0x1f && magic[1] == 0x8b);

            CHECK(to_string(*load_file(plain)) == sample_document());
            CHECK(to_string(*load_file(gz)) == sample_document());

            bool threw = false;
            try {
                (void)load_file(dir / "lwarray_test_missing.xml");
            } catch (const LwError& e) {
                threw = e.kind() == ErrorKind::Io;
            }
            CHECK(threw);

            std::filesystem::remove(plain);
            std::filesystem::remove(gz);
        }

        std::cout << "All tests passed.\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
