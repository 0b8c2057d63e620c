
#include "lwarray/lwarray.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace lwarray {

LwError::LwError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

ErrorKind LwError::kind() const noexcept { return kind_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::XmlParse: return "xml-parse";
        case ErrorKind::ZlibError: return "zlib";
        case ErrorKind::UnknownType: return "unknown-type";
        case ErrorKind::ArrayOverflow: return "array-overflow";
        case ErrorKind::ArrayUnderflow: return "array-underflow";
        case ErrorKind::BadToken: return "bad-token";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::InvalidData: return "invalid-data";
    }
    return "unknown";
}

// ------------------------------
// Small helpers
// ------------------------------

static bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) { out = 0; return true; }
    if (a > (std::numeric_limits<std::size_t>::max)() / b) return false;
    out = a * b;
    return true;
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

static bool is_infinity_literal(std::string_view s) {
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) s.remove_prefix(1);
    std::string t;
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return t == "inf" || t == "infinity";
}

// True when the decimal magnitude of `s` is below one: a negative exponent,
// or no exponent and only zeros before the point.
static bool has_negative_exponent(std::string_view s) {
    auto e = s.find_first_of("eE");
    if (e != std::string_view::npos) return e + 1 < s.size() && s[e + 1] == '-';
    for (char c : s) {
        if (c == '.') break;
        if (c != '0') return false;
    }
    return true;
}

// ------------------------------
// Type classification
// ------------------------------

namespace internal {

struct TypeEntry {
    const char* name;
    ScalarType type;
};

// Canonical names first; name_for() returns the first match.
static constexpr TypeEntry kTypeTable[] = {
    {"int_2s", ScalarType::Int16},
    {"int_2u", ScalarType::UInt16},
    {"int_4s", ScalarType::Int32},
    {"int_4u", ScalarType::UInt32},
    {"int_8s", ScalarType::Int64},
    {"int_8u", ScalarType::UInt64},
    {"real_4", ScalarType::Float32},
    {"real_8", ScalarType::Float64},
    {"int", ScalarType::Int32},
    {"float", ScalarType::Float32},
    {"double", ScalarType::Float64},
};

} // namespace internal

ScalarType storage_scalar_type(const std::string& type_name) {
    std::string t;
    t.reserve(type_name.size());
    for (char c : type_name) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    for (const auto& e : internal::kTypeTable) {
        if (t == e.name) return e.type;
    }
    throw LwError(ErrorKind::UnknownType, "unrecognized Array type: '" + type_name + "'");
}

StorageKind classify(const std::string& type_name) {
    return storage_kind(storage_scalar_type(type_name));
}

std::string name_for(ScalarType t) {
    for (const auto& e : internal::kTypeTable) {
        if (e.type == t) return e.name;
    }
    throw LwError(ErrorKind::UnknownType, "scalar type has no LIGO_LW name");
}

StorageKind storage_kind(ScalarType t) noexcept {
    switch (t) {
        case ScalarType::Float32:
        case ScalarType::Float64:
            return StorageKind::FloatFamily;
        default:
            return StorageKind::IntegerFamily;
    }
}

std::size_t bytes_per_elem(ScalarType t) noexcept {
    switch (t) {
        case ScalarType::Int16: return 2;
        case ScalarType::UInt16: return 2;
        case ScalarType::Int32: return 4;
        case ScalarType::UInt32: return 4;
        case ScalarType::Int64: return 8;
        case ScalarType::UInt64: return 8;
        case ScalarType::Float32: return 4;
        case ScalarType::Float64: return 8;
    }
    return 1;
}

// ------------------------------
// Shapes and indices
// ------------------------------

Shape resolve_shape(const DimensionList& dimensions) {
    return Shape(dimensions.rbegin(), dimensions.rend());
}

DimensionList dimensions_from_shape(const Shape& shape) {
    return DimensionList(shape.rbegin(), shape.rend());
}

std::size_t numel(const Shape& shape) {
    std::size_t n = 1;
    for (auto d : shape) {
        if (d == 0) return 0;
    }
    for (auto d : shape) {
        std::size_t tmp = 0;
        if (!checked_mul_size(n, d, tmp)) throw LwError(ErrorKind::InvalidData, "shape size overflow");
        n = tmp;
    }
    return n;
}

std::size_t flat_offset(const Shape& shape, const Index& index) {
    if (index.size() != shape.size()) {
        throw LwError(ErrorKind::InvalidData, "index rank does not match shape");
    }
    std::size_t off = 0;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (index[i] >= shape[i]) throw LwError(ErrorKind::InvalidData, "index out of range");
        off = off * shape[i] + index[i];
    }
    return off;
}

IndexSequencer::IndexSequencer(Shape shape)
    : shape_(std::move(shape)), index_(shape_.size(), 0) {
    exhausted_ = std::find(shape_.begin(), shape_.end(), std::size_t{0}) != shape_.end();
}

void IndexSequencer::advance() {
    if (exhausted_) return;
    for (std::size_t i = 0; i < index_.size(); ++i) {
        if (++index_[i] < shape_[i]) return;
        index_[i] = 0;
    }
    exhausted_ = true;
}

// ------------------------------
// NdArray
// ------------------------------

static NdArray::Data make_data(ScalarType t, std::size_t n) {
    switch (t) {
        case ScalarType::Int16: return std::vector<std::int16_t>(n);
        case ScalarType::UInt16: return std::vector<std::uint16_t>(n);
        case ScalarType::Int32: return std::vector<std::int32_t>(n);
        case ScalarType::UInt32: return std::vector<std::uint32_t>(n);
        case ScalarType::Int64: return std::vector<std::int64_t>(n);
        case ScalarType::UInt64: return std::vector<std::uint64_t>(n);
        case ScalarType::Float32: return std::vector<float>(n);
        case ScalarType::Float64: return std::vector<double>(n);
    }
    throw LwError(ErrorKind::UnknownType, "unhandled scalar type");
}

// Variant alternatives are declared in ScalarType order.
static std::size_t data_index(ScalarType t) noexcept {
    return static_cast<std::size_t>(t);
}

NdArray NdArray::zeros(ScalarType t, const Shape& shape) {
    NdArray a;
    a.type = t;
    a.shape = shape;
    a.data = make_data(t, numel(shape));
    return a;
}

std::size_t NdArray::size() const {
    return std::visit([](const auto& v) { return v.size(); }, data);
}

void NdArray::validate() const {
    if (data.index() != data_index(type)) {
        throw LwError(ErrorKind::InvalidData, "array data does not hold " + name_for(type) + " values");
    }
    if (size() != numel(shape)) {
        throw LwError(ErrorKind::InvalidData, "array data length does not match shape");
    }
}

bool operator==(const NdArray& a, const NdArray& b) {
    return a.type == b.type && a.shape == b.shape && a.data == b.data;
}

bool operator!=(const NdArray& a, const NdArray& b) {
    return !(a == b);
}

// ------------------------------
// Tokenizer
// ------------------------------

// Locale-independent, so text written under the classic locale always reads
// back. Overflow yields +-inf; underflow yields a signed zero.
static bool parse_double(std::string_view s, double& out) {
    bool negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    // a second sign is not a number
    if (s.empty() || s.front() == '+' || s.front() == '-') return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ptr != last) return false;
    if (ec == std::errc::result_out_of_range) {
        v = has_negative_exponent(s) ? 0.0 : std::numeric_limits<double>::infinity();
    } else if (ec != std::errc()) {
        return false;
    }
    out = negative ? -v : v;
    return true;
}

static LwError bad_token(std::string_view token, ScalarType t, const char* why) {
    std::ostringstream oss;
    oss << "cannot convert '" << token << "' to " << name_for(t) << ": " << why;
    return LwError(ErrorKind::BadToken, oss.str());
}

Scalar cast_token(std::string_view token, ScalarType t) {
    const std::string s(token);
    if (s.empty()) throw bad_token(token, t, "empty field");
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;

    if (storage_kind(t) == StorageKind::FloatFamily) {
        double v = 0.0;
        if (!parse_double(token, v)) throw bad_token(token, t, "not a number");
        if (std::isinf(v) && !is_infinity_literal(token)) throw bad_token(token, t, "out of range");
        if (t == ScalarType::Float32 && std::isfinite(v) &&
            std::fabs(v) > static_cast<double>((std::numeric_limits<float>::max)())) {
            throw bad_token(token, t, "out of range");
        }
        return v;
    }

    const bool is_unsigned = (t == ScalarType::UInt16 || t == ScalarType::UInt32 || t == ScalarType::UInt64);
    if (is_unsigned) {
        if (s[0] == '-') throw bad_token(token, t, "negative value");
        unsigned long long v = std::strtoull(begin, &end, 10);
        if (end != begin + s.size()) throw bad_token(token, t, "not an integer");
        if (errno == ERANGE) throw bad_token(token, t, "out of range");
        std::uint64_t limit = (std::numeric_limits<std::uint64_t>::max)();
        if (t == ScalarType::UInt16) limit = (std::numeric_limits<std::uint16_t>::max)();
        if (t == ScalarType::UInt32) limit = (std::numeric_limits<std::uint32_t>::max)();
        if (v > limit) throw bad_token(token, t, "out of range");
        return static_cast<std::uint64_t>(v);
    }

    long long v = std::strtoll(begin, &end, 10);
    if (end != begin + s.size()) throw bad_token(token, t, "not an integer");
    if (errno == ERANGE) throw bad_token(token, t, "out of range");
    std::int64_t lo = (std::numeric_limits<std::int64_t>::min)();
    std::int64_t hi = (std::numeric_limits<std::int64_t>::max)();
    if (t == ScalarType::Int16) {
        lo = (std::numeric_limits<std::int16_t>::min)();
        hi = (std::numeric_limits<std::int16_t>::max)();
    } else if (t == ScalarType::Int32) {
        lo = (std::numeric_limits<std::int32_t>::min)();
        hi = (std::numeric_limits<std::int32_t>::max)();
    }
    if (v < lo || v > hi) throw bad_token(token, t, "out of range");
    return static_cast<std::int64_t>(v);
}

Tokenizer::Tokenizer(char delimiter)
    : delimiter_(delimiter), whitespace_delimiter_(is_space(delimiter)) {}

bool Tokenizer::is_separator(char c) const noexcept {
    return whitespace_delimiter_ ? is_space(c) : c == delimiter_;
}

void Tokenizer::flush_field(std::vector<Scalar>& out) {
    std::string_view field = trim(pending_);
    if (!field.empty()) {
        out.push_back(cast_token(field, type_));
    }
    pending_.clear();
}

std::vector<Scalar> Tokenizer::feed(std::string_view text) {
    std::vector<Scalar> out;
    for (char c : text) {
        if (is_separator(c)) {
            flush_field(out);
            continue;
        }
        // leading whitespace never belongs to a field
        if (pending_.empty() && is_space(c)) continue;
        pending_.push_back(c);
    }
    return out;
}

void Tokenizer::reset() noexcept {
    pending_.clear();
}

// ------------------------------
// Formatting
// ------------------------------

template <typename T>
static std::string format_float(T v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(std::numeric_limits<T>::digits10) << v;
    std::string s = oss.str();
    if (!std::isfinite(v)) return s;

    T back{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), back);
    if (ec != std::errc() || ptr != s.data() + s.size() || back != v) {
        std::ostringstream exact;
        exact.imbue(std::locale::classic());
        exact << std::setprecision(std::numeric_limits<T>::max_digits10) << v;
        s = exact.str();
    }
    return s;
}

std::string format_element(const NdArray& a, std::size_t flat) {
    return std::visit([flat](const auto& v) -> std::string {
        using T = typename std::decay_t<decltype(v)>::value_type;
        if (flat >= v.size()) throw LwError(ErrorKind::InvalidData, "element offset out of range");
        if constexpr (std::is_floating_point_v<T>) {
            return format_float(v[flat]);
        } else {
            return std::to_string(v[flat]);
        }
    }, a.data);
}

} // namespace lwarray
