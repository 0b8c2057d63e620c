
#pragma once

#include "lwarray/lwarray.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lwarray {

// ------------------------------
// Options
// ------------------------------

struct ReadOptions {
    bool strict_fill{false}; // reject Streams that supply fewer values than the Array holds
    std::size_t chunk_size{64u * 1024u}; // bytes handed to the XML parser per call
};

struct WriteOptions {
    bool gzip{false};
    int zlib_level{6}; // 0..9
};

// ------------------------------
// Document tree
// ------------------------------

using Attributes = std::vector<std::pair<std::string, std::string>>;

// One level of indentation in written documents.
extern const char* const kIndent;

class Element {
public:
    explicit Element(std::string tag_name, Attributes attrs = {});
    virtual ~Element();

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    const std::string& tag_name() const noexcept { return tag_name_; }

    const Attributes& attributes() const noexcept { return attrs_; }
    bool has_attribute(const std::string& name) const;
    /// Throws NotFound.
    const std::string& attribute(const std::string& name) const;
    std::string attribute_or(const std::string& name, const std::string& def) const;
    void set_attribute(const std::string& name, std::string value);

    Element* parent() const noexcept { return parent_; }
    const std::vector<std::unique_ptr<Element>>& children() const noexcept { return children_; }

    /// Takes ownership and sets the child's parent link.
    Element& append_child(std::unique_ptr<Element> child);

    /// Detaches `child`, running its unlink() hook. Throws NotFound.
    std::unique_ptr<Element> remove_child(const Element& child);

    /// Descendants (not this element) matching `pred`, in document order.
    std::vector<Element*> get_elements(const std::function<bool(const Element&)>& pred);
    std::vector<Element*> get_elements_by_tag_name(const std::string& tag);

    const std::string& pcdata() const noexcept { return pcdata_; }

    // --- Parser hooks ---

    /// One chunk of character data, already entity-decoded.
    virtual void append_data(std::string_view chunk);
    /// The element's end tag has been read.
    virtual void end_element();
    /// Called when the element leaves the tree; releases per-node state.
    virtual void unlink();

    virtual void write(std::ostream& os, const std::string& indent) const;

protected:
    virtual void child_appended(Element& child);

    std::string start_tag(const std::string& indent) const;
    std::string end_tag(const std::string& indent) const;

    std::string pcdata_{};

private:
    std::string tag_name_;
    Attributes attrs_;
    Element* parent_{nullptr};
    std::vector<std::unique_ptr<Element>> children_{};
};

// Root of a loaded document. Holds the LIGO_LW element(s); writes the XML
// declaration and DOCTYPE ahead of them.
class Document : public Element {
public:
    Document();

    void write(std::ostream& os, const std::string& indent) const override;
};

class Dim : public Element {
public:
    explicit Dim(Attributes attrs = {});
    Dim(std::size_t size, const std::string& name);

    /// Parsed text of the element. Throws InvalidData.
    std::size_t size() const;
};

/// Parses a Dim's text as a nonnegative integer. Throws InvalidData.
std::size_t parse_dim_size(std::string_view text);

class ArrayStream;

enum class ArrayState {
    Empty,     // no storage yet
    Allocated, // storage exists, Stream text is being read into it
    Complete,  // storage holds the array
};

std::string to_string(ArrayState s);

class Array : public Element {
public:
    /// Classifies the Type attribute; throws UnknownType.
    explicit Array(Attributes attrs);

    std::string name() const { return attribute_or("Name", ""); }
    const std::string& type_name() const { return attribute("Type"); }
    ScalarType scalar_type() const noexcept { return type_; }
    StorageKind kind() const noexcept { return storage_kind(type_); }

    /// Sizes of the Dim children in document order; fixed once storage is
    /// allocated.
    DimensionList dimensions() const;
    Shape shape() const { return resolve_shape(dimensions()); }

    ArrayState state() const noexcept { return state_; }

    /// Throws InvalidData while Empty.
    const NdArray& array() const;

    /// Attach storage directly; the array becomes Complete. The scalar type
    /// and shape must match this element's Type and Dim children.
    void set_array(NdArray a);

    /// The Stream child, or nullptr.
    ArrayStream* stream() const;

    void unlink() override;

protected:
    void child_appended(Element& child) override;

private:
    friend class ArrayStream;

    // Empty -> Allocated: fix the dimensions and zero-fill storage.
    NdArray& allocate();
    // Allocated -> Complete.
    void complete();

    ScalarType type_;
    ArrayState state_{ArrayState::Empty};
    DimensionList dims_{};
    NdArray array_{};
};

// Stream child of an Array. Converts delimited character data into the
// parent's storage while parsing, and the storage back into text on write.
class ArrayStream : public Element {
public:
    /// Throws InvalidData for a non-Local Type or a Delimiter that is not a
    /// single character.
    explicit ArrayStream(Attributes attrs);

    char delimiter() const noexcept { return tokenizer_.delimiter(); }

    void set_strict_fill(bool strict) noexcept { strict_fill_ = strict; }
    bool strict_fill() const noexcept { return strict_fill_; }

    /// Values stored so far during the current parse.
    std::size_t values_read() const noexcept { return values_read_; }

    void append_data(std::string_view chunk) override;
    void end_element() override;
    void unlink() override;
    void write(std::ostream& os, const std::string& indent) const override;

private:
    Array& parent_array() const;

    Tokenizer tokenizer_;
    std::optional<IndexSequencer> cursor_{};
    std::size_t values_read_{0};
    bool strict_fill_{false};
};

// ------------------------------
// Content handler
// ------------------------------

// Builds a Document from SAX events. Array, Dim and Array-nested Stream
// elements get their specialised classes; everything else is a plain
// Element.
class ContentHandler {
public:
    explicit ContentHandler(Document& doc, const ReadOptions& opts = ReadOptions{});
    virtual ~ContentHandler();

    void start_element(const std::string& tag, Attributes attrs);
    void end_element(const std::string& tag);
    void characters(std::string_view chunk);

    Element& current() const noexcept { return *current_; }

protected:
    virtual std::unique_ptr<Element> make_element(const std::string& tag, Attributes attrs);

private:
    Document& doc_;
    ReadOptions opts_;
    Element* current_;
};

// ------------------------------
// Document I/O
// ------------------------------

std::unique_ptr<Document> load_string(std::string_view xml, const ReadOptions& opts = ReadOptions{});
std::unique_ptr<Document> load_stream(std::istream& is, const ReadOptions& opts = ReadOptions{});

/// Reads plain or gzip-compressed files.
std::unique_ptr<Document> load_file(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

void write(std::ostream& os, const Document& doc);
std::string to_string(const Document& doc);
void write_file(const std::filesystem::path& file, const Document& doc, const WriteOptions& opts = WriteOptions{});

std::string xml_escape(std::string_view s, bool attribute);

// ------------------------------
// Array names and lookup
// ------------------------------

/// "prefix:name:array" or "name:array" -> "name"; anything else unchanged.
std::string strip_array_name(const std::string& name);

/// Three-way comparison of stripped names.
int compare_array_names(const std::string& a, const std::string& b);

std::vector<Array*> get_arrays_by_name(Element& elem, const std::string& name);

/// The single Array called `name` below `elem`. Throws NotFound when there
/// is none and InvalidData when there are several.
Array& get_array(Element& elem, const std::string& name);

/// Array subtree for an in-memory array: one Dim per axis (declaration
/// order, so reversed from `a.shape`), then a Local Stream. `dim_names`, when
/// given, name the Dims in declaration order.
std::unique_ptr<Array> from_array(
    const std::string& name,
    NdArray a,
    const std::vector<std::string>& dim_names = {},
    char delimiter = ' '
);

} // namespace lwarray
