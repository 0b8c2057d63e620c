
#include "lwarray/document.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <ostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace lwarray {

const char* const kIndent = "\t";

// Largest storage a single Array may request (64 TiB).
static constexpr std::uint64_t kMaxArrayBytes = std::uint64_t(1) << 46;

// ------------------------------
// Small helpers
// ------------------------------

static bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// ------------------------------
// Element
// ------------------------------

Element::Element(std::string tag_name, Attributes attrs)
    : tag_name_(std::move(tag_name)), attrs_(std::move(attrs)) {}

Element::~Element() = default;

bool Element::has_attribute(const std::string& name) const {
    return std::any_of(attrs_.begin(), attrs_.end(), [&](const auto& kv) { return kv.first == name; });
}

const std::string& Element::attribute(const std::string& name) const {
    for (const auto& kv : attrs_) {
        if (kv.first == name) return kv.second;
    }
    throw LwError(ErrorKind::NotFound, "<" + tag_name_ + "> has no attribute '" + name + "'");
}

std::string Element::attribute_or(const std::string& name, const std::string& def) const {
    for (const auto& kv : attrs_) {
        if (kv.first == name) return kv.second;
    }
    return def;
}

void Element::set_attribute(const std::string& name, std::string value) {
    for (auto& kv : attrs_) {
        if (kv.first == name) {
            kv.second = std::move(value);
            return;
        }
    }
    attrs_.emplace_back(name, std::move(value));
}

Element& Element::append_child(std::unique_ptr<Element> child) {
    if (!child) throw LwError(ErrorKind::InvalidData, "cannot append a null element");
    child->parent_ = this;
    children_.push_back(std::move(child));
    Element& added = *children_.back();
    try {
        child_appended(added);
    } catch (...) {
        added.parent_ = nullptr;
        children_.pop_back();
        throw;
    }
    return added;
}

std::unique_ptr<Element> Element::remove_child(const Element& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [&](const std::unique_ptr<Element>& c) { return c.get() == &child; });
    if (it == children_.end()) {
        throw LwError(ErrorKind::NotFound, "<" + child.tag_name() + "> is not a child of <" + tag_name_ + ">");
    }
    std::unique_ptr<Element> out = std::move(*it);
    children_.erase(it);
    out->unlink();
    out->parent_ = nullptr;
    return out;
}

std::vector<Element*> Element::get_elements(const std::function<bool(const Element&)>& pred) {
    std::vector<Element*> out;
    for (const auto& c : children_) {
        if (pred(*c)) out.push_back(c.get());
        auto below = c->get_elements(pred);
        out.insert(out.end(), below.begin(), below.end());
    }
    return out;
}

std::vector<Element*> Element::get_elements_by_tag_name(const std::string& tag) {
    return get_elements([&](const Element& e) { return e.tag_name() == tag; });
}

void Element::append_data(std::string_view chunk) {
    pcdata_.append(chunk.data(), chunk.size());
}

void Element::end_element() {}

void Element::unlink() {
    for (auto& c : children_) c->unlink();
}

void Element::child_appended(Element&) {}

std::string Element::start_tag(const std::string& indent) const {
    std::string s = indent + "<" + tag_name_;
    for (const auto& kv : attrs_) {
        s += " " + kv.first + "=\"" + xml_escape(kv.second, true) + "\"";
    }
    s += ">";
    return s;
}

std::string Element::end_tag(const std::string& indent) const {
    return indent + "</" + tag_name_ + ">";
}

void Element::write(std::ostream& os, const std::string& indent) const {
    std::string_view text = trim(pcdata_);
    if (children_.empty()) {
        os << start_tag(indent) << xml_escape(text, false) << end_tag("") << "\n";
        return;
    }
    os << start_tag(indent) << "\n";
    for (const auto& c : children_) c->write(os, indent + kIndent);
    if (!text.empty()) os << indent << kIndent << xml_escape(text, false) << "\n";
    os << end_tag(indent) << "\n";
}

// ------------------------------
// Document
// ------------------------------

Document::Document() : Element("") {}

void Document::write(std::ostream& os, const std::string& indent) const {
    os << "<?xml version='1.0' encoding='utf-8' ?>\n";
    os << "<!DOCTYPE LIGO_LW SYSTEM \"http://ldas-sw.ligo.caltech.edu/doc/ligolwAPI/html/ligolw_dtd.txt\">\n";
    for (const auto& c : children()) c->write(os, indent);
}

// ------------------------------
// Dim
// ------------------------------

std::size_t parse_dim_size(std::string_view text) {
    std::string_view t = trim(text);
    if (t.empty() || !std::all_of(t.begin(), t.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw LwError(ErrorKind::InvalidData, "malformed Dim size: '" + std::string(text) + "'");
    }
    std::size_t n = 0;
    for (char c : t) {
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (n > ((std::numeric_limits<std::size_t>::max)() - digit) / 10) {
            throw LwError(ErrorKind::InvalidData, "Dim size overflow: '" + std::string(t) + "'");
        }
        n = n * 10 + digit;
    }
    return n;
}

Dim::Dim(Attributes attrs) : Element("Dim", std::move(attrs)) {}

Dim::Dim(std::size_t size, const std::string& name) : Element("Dim") {
    if (!name.empty()) set_attribute("Name", name);
    pcdata_ = std::to_string(size);
}

std::size_t Dim::size() const {
    return parse_dim_size(pcdata_);
}

// ------------------------------
// Array
// ------------------------------

std::string to_string(ArrayState s) {
    switch (s) {
        case ArrayState::Empty: return "empty";
        case ArrayState::Allocated: return "allocated";
        case ArrayState::Complete: return "complete";
    }
    return "unknown";
}

static ScalarType declared_type(const Element& e) {
    if (!e.has_attribute("Type")) {
        throw LwError(ErrorKind::UnknownType, "Array '" + e.attribute_or("Name", "") + "' has no Type attribute");
    }
    return storage_scalar_type(e.attribute("Type"));
}

Array::Array(Attributes attrs)
    : Element("Array", std::move(attrs)), type_(declared_type(*this)) {}

DimensionList Array::dimensions() const {
    if (state_ != ArrayState::Empty) return dims_;
    DimensionList dims;
    for (const auto& c : children()) {
        if (const auto* d = dynamic_cast<const Dim*>(c.get())) dims.push_back(d->size());
    }
    return dims;
}

const NdArray& Array::array() const {
    if (state_ == ArrayState::Empty) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' holds no data");
    }
    return array_;
}

void Array::set_array(NdArray a) {
    if (state_ == ArrayState::Allocated) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' is being read from its Stream");
    }
    a.validate();
    if (a.type != type_) {
        throw LwError(ErrorKind::InvalidData,
                      "Array '" + name() + "' is " + type_name() + ", data is " + name_for(a.type));
    }
    DimensionList dims = dimensions_from_shape(a.shape);
    if (dims != dimensions()) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' data shape does not match its Dim children");
    }
    dims_ = std::move(dims);
    array_ = std::move(a);
    state_ = ArrayState::Complete;
}

ArrayStream* Array::stream() const {
    for (const auto& c : children()) {
        if (auto* s = dynamic_cast<ArrayStream*>(c.get())) return s;
    }
    return nullptr;
}

void Array::unlink() {
    Element::unlink();
    array_ = NdArray{};
    dims_.clear();
    state_ = ArrayState::Empty;
}

void Array::child_appended(Element& child) {
    if (child.tag_name() == "Dim" && state_ != ArrayState::Empty) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' cannot take a Dim after its data");
    }
    if (dynamic_cast<ArrayStream*>(&child) != nullptr) {
        for (const auto& c : children()) {
            if (c.get() != &child && dynamic_cast<ArrayStream*>(c.get()) != nullptr) {
                throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' has more than one Stream");
            }
        }
    }
}

NdArray& Array::allocate() {
    if (state_ != ArrayState::Empty) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' already holds data");
    }
    DimensionList dims = dimensions();
    if (dims.empty()) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' has no Dim children");
    }
    Shape shape = resolve_shape(dims);
    std::size_t n = numel(shape);
    std::size_t elem = bytes_per_elem(type_);
    if (static_cast<std::uint64_t>(n) > kMaxArrayBytes / elem) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name() + "' is too large: " + std::to_string(n) + " elements");
    }
    try {
        array_ = NdArray::zeros(type_, shape);
    } catch (const std::bad_alloc&) {
        throw LwError(ErrorKind::InvalidData, "cannot allocate storage for Array '" + name() + "'");
    } catch (const std::length_error&) {
        throw LwError(ErrorKind::InvalidData, "cannot allocate storage for Array '" + name() + "'");
    }
    dims_ = std::move(dims);
    state_ = ArrayState::Allocated;
    return array_;
}

void Array::complete() {
    state_ = ArrayState::Complete;
}

// ------------------------------
// ArrayStream
// ------------------------------

static char declared_delimiter(const Attributes& attrs) {
    std::string delim = ",";
    std::string type = "Local";
    for (const auto& kv : attrs) {
        if (kv.first == "Delimiter") delim = kv.second;
        if (kv.first == "Type") type = kv.second;
    }
    if (type != "Local") {
        throw LwError(ErrorKind::InvalidData, "unsupported Array Stream type '" + type + "'");
    }
    if (delim.size() != 1) {
        throw LwError(ErrorKind::InvalidData, "Stream Delimiter must be a single character, got '" + delim + "'");
    }
    return delim[0];
}

ArrayStream::ArrayStream(Attributes attrs)
    : Element("Stream", attrs), tokenizer_(declared_delimiter(attrs)) {}

Array& ArrayStream::parent_array() const {
    auto* a = dynamic_cast<Array*>(parent());
    if (!a) throw LwError(ErrorKind::InvalidData, "array Stream is not inside an Array");
    return *a;
}

template <typename T>
static T scalar_as(const Scalar& s) {
    return std::visit([](auto x) { return static_cast<T>(x); }, s);
}

void ArrayStream::append_data(std::string_view chunk) {
    Array& arr = parent_array();

    // the first text allocates; shape and type are fixed from here on
    if (arr.state() == ArrayState::Empty) {
        NdArray& storage = arr.allocate();
        tokenizer_.reset();
        tokenizer_.set_type(arr.scalar_type());
        cursor_.emplace(storage.shape);
        values_read_ = 0;
    } else if (arr.state() == ArrayState::Complete || !cursor_) {
        throw LwError(ErrorKind::InvalidData, "Array '" + arr.name() + "' already holds data");
    }

    NdArray& storage = arr.array_;
    for (const Scalar& token : tokenizer_.feed(chunk)) {
        if (cursor_->exhausted()) {
            throw LwError(ErrorKind::ArrayOverflow, "too many values in Array '" + arr.name() + "'");
        }
        std::size_t off = flat_offset(storage.shape, cursor_->index());
        std::visit([&](auto& v) {
            using T = typename std::decay_t<decltype(v)>::value_type;
            v[off] = scalar_as<T>(token);
        }, storage.data);
        cursor_->advance();
        ++values_read_;
    }
}

void ArrayStream::end_element() {
    // the tokenizer only releases a field once it sees the delimiter after it
    append_data(std::string(1, tokenizer_.delimiter()));

    Array& arr = parent_array();
    if (strict_fill_ && !cursor_->exhausted()) {
        std::ostringstream oss;
        oss << "too few values in Array '" << arr.name() << "': got " << values_read_
            << ", expected " << arr.array_.size();
        throw LwError(ErrorKind::ArrayUnderflow, oss.str());
    }
    arr.complete();
    cursor_.reset();
}

void ArrayStream::unlink() {
    cursor_.reset();
    tokenizer_.reset();
    values_read_ = 0;
    Element::unlink();
}

void ArrayStream::write(std::ostream& os, const std::string& indent) const {
    const NdArray& a = parent_array().array();
    const std::string delim = xml_escape(std::string(1, delimiter()), false);
    const std::string line_start = indent + kIndent;

    os << start_tag(indent) << "\n";
    IndexSequencer seq(a.shape);
    if (!seq.exhausted()) {
        os << line_start;
        while (true) {
            os << format_element(a, flat_offset(a.shape, seq.index()));
            seq.advance();
            if (seq.exhausted()) break;
            os << delim;
            // a full run of the fastest dimension ends the line
            if (seq.index()[0] == 0) os << "\n" << line_start;
        }
    }
    os << "\n" << end_tag(indent) << "\n";
}

// ------------------------------
// ContentHandler
// ------------------------------

ContentHandler::ContentHandler(Document& doc, const ReadOptions& opts)
    : doc_(doc), opts_(opts), current_(&doc) {}

ContentHandler::~ContentHandler() = default;

std::unique_ptr<Element> ContentHandler::make_element(const std::string& tag, Attributes attrs) {
    if (tag == "Array") return std::make_unique<Array>(std::move(attrs));
    if (tag == "Dim") return std::make_unique<Dim>(std::move(attrs));
    if (tag == "Stream" && current_->tag_name() == "Array") {
        auto s = std::make_unique<ArrayStream>(std::move(attrs));
        s->set_strict_fill(opts_.strict_fill);
        return s;
    }
    return std::make_unique<Element>(tag, std::move(attrs));
}

void ContentHandler::start_element(const std::string& tag, Attributes attrs) {
    current_ = &current_->append_child(make_element(tag, std::move(attrs)));
}

void ContentHandler::end_element(const std::string& tag) {
    if (current_ == &doc_ || current_->tag_name() != tag) {
        throw LwError(ErrorKind::XmlParse, "unexpected end tag </" + tag + ">");
    }
    current_->end_element();
    current_ = current_->parent();
}

void ContentHandler::characters(std::string_view chunk) {
    if (current_ == &doc_) {
        if (!is_blank(chunk)) throw LwError(ErrorKind::XmlParse, "character data outside the root element");
        return;
    }
    current_->append_data(chunk);
}

// ------------------------------
// Names
// ------------------------------

std::string strip_array_name(const std::string& name) {
    static const std::regex pattern("^(?:[a-z0-9_]+:)?([a-z0-9_]+):array$");
    std::smatch m;
    if (std::regex_match(name, m, pattern)) return m[1].str();
    return name;
}

int compare_array_names(const std::string& a, const std::string& b) {
    return strip_array_name(a).compare(strip_array_name(b));
}

std::vector<Array*> get_arrays_by_name(Element& elem, const std::string& name) {
    std::vector<Array*> out;
    for (Element* e : elem.get_elements([&](const Element& x) {
             return x.tag_name() == "Array" && compare_array_names(x.attribute_or("Name", ""), name) == 0;
         })) {
        if (auto* a = dynamic_cast<Array*>(e)) out.push_back(a);
    }
    return out;
}

Array& get_array(Element& elem, const std::string& name) {
    auto found = get_arrays_by_name(elem, name);
    if (found.empty()) throw LwError(ErrorKind::NotFound, "no Array named '" + name + "'");
    if (found.size() > 1) {
        throw LwError(ErrorKind::InvalidData, "found " + std::to_string(found.size()) + " Arrays named '" + name + "'");
    }
    return *found.front();
}

// ------------------------------
// Construction from memory
// ------------------------------

std::unique_ptr<Array> from_array(
    const std::string& name,
    NdArray a,
    const std::vector<std::string>& dim_names,
    char delimiter
) {
    a.validate();
    if (a.shape.empty()) {
        throw LwError(ErrorKind::InvalidData, "Array '" + name + "' needs at least one dimension");
    }
    DimensionList dims = dimensions_from_shape(a.shape);
    if (!dim_names.empty() && dim_names.size() != dims.size()) {
        throw LwError(ErrorKind::InvalidData, "dimension name count does not match the array rank");
    }

    auto arr = std::make_unique<Array>(Attributes{{"Name", name}, {"Type", name_for(a.type)}});
    for (std::size_t i = 0; i < dims.size(); ++i) {
        arr->append_child(std::make_unique<Dim>(dims[i], dim_names.empty() ? std::string() : dim_names[i]));
    }
    arr->append_child(std::make_unique<ArrayStream>(
        Attributes{{"Type", "Local"}, {"Delimiter", std::string(1, delimiter)}}));
    arr->set_array(std::move(a));
    return arr;
}

} // namespace lwarray
