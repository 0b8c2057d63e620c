
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lwarray {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    XmlParse,
    ZlibError,
    UnknownType,
    ArrayOverflow,
    ArrayUnderflow,
    BadToken,
    NotFound,
    InvalidData,
};

class LwError : public std::runtime_error {
public:
    LwError(ErrorKind k, const std::string& msg);
    ErrorKind kind() const noexcept;

private:
    ErrorKind kind_;
};

std::string to_string(ErrorKind k);

// ------------------------------
// Type classification
// ------------------------------

enum class StorageKind {
    IntegerFamily,
    FloatFamily,
};

enum class ScalarType {
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Float32,
    Float64,
};

/// Declared LIGO_LW type name -> integer/float family. Throws UnknownType.
StorageKind classify(const std::string& type_name);

/// Declared LIGO_LW type name -> storage scalar. Throws UnknownType.
ScalarType storage_scalar_type(const std::string& type_name);

/// Canonical LIGO_LW type name for a storage scalar ("int_4s", "real_8", ...).
std::string name_for(ScalarType t);

StorageKind storage_kind(ScalarType t) noexcept;
std::size_t bytes_per_elem(ScalarType t) noexcept;

// ------------------------------
// Shapes and indices
// ------------------------------

using Shape = std::vector<std::size_t>;
using DimensionList = std::vector<std::size_t>;
using Index = std::vector<std::size_t>;

/// Storage shape from declared dimensions: the list reversed in full, so
/// shape[0] (fastest-varying) is the last declared dimension.
Shape resolve_shape(const DimensionList& dimensions);

/// Inverse of resolve_shape.
DimensionList dimensions_from_shape(const Shape& shape);

/// Product of the sizes. Zero when any dimension is zero, one for an empty
/// shape. Throws InvalidData on size_t overflow.
std::size_t numel(const Shape& shape);

/// Row-major offset of `index` within `shape` (last position contiguous).
std::size_t flat_offset(const Shape& shape, const Index& index);

// Enumerates every index of a shape in odometer order, position 0 fastest.
// A zero-size dimension leaves the sequencer exhausted from the start.
class IndexSequencer {
public:
    explicit IndexSequencer(Shape shape);

    bool exhausted() const noexcept { return exhausted_; }

    // Valid only while !exhausted().
    const Index& index() const noexcept { return index_; }

    // Step to the next index; exhausts after the last one. No-op once
    // exhausted.
    void advance();

    const Shape& shape() const noexcept { return shape_; }

private:
    Shape shape_;
    Index index_;
    bool exhausted_{false};
};

// ------------------------------
// In-memory arrays
// ------------------------------

struct NdArray {
    using Data = std::variant<
        std::vector<std::int16_t>,
        std::vector<std::uint16_t>,
        std::vector<std::int32_t>,
        std::vector<std::uint32_t>,
        std::vector<std::int64_t>,
        std::vector<std::uint64_t>,
        std::vector<float>,
        std::vector<double>
    >;

    ScalarType type{ScalarType::Float64};
    Shape shape{};
    // Row-major over `shape`, length = numel(shape).
    Data data{};

    /// Zero-filled array of the given scalar type and shape.
    static NdArray zeros(ScalarType t, const Shape& shape);

    std::size_t size() const;

    /// Throws InvalidData when the stored vector type or length does not
    /// match `type` / `shape`.
    void validate() const;
};

bool operator==(const NdArray& a, const NdArray& b);
bool operator!=(const NdArray& a, const NdArray& b);

// ------------------------------
// Incremental tokenizer
// ------------------------------

using Scalar = std::variant<std::int64_t, std::uint64_t, double>;

// Splits delimited text that arrives in arbitrary chunks and casts each
// field to the configured scalar type. A field not yet terminated by a
// delimiter is held back until a later feed() completes it. Whitespace
// around fields is ignored; when the delimiter is itself whitespace, any
// run of whitespace separates fields. A field that is empty after trimming
// produces no token.
class Tokenizer {
public:
    explicit Tokenizer(char delimiter);

    void set_type(ScalarType t) noexcept { type_ = t; }
    ScalarType type() const noexcept { return type_; }
    char delimiter() const noexcept { return delimiter_; }

    /// Tokens completed by `text`, in order. Throws BadToken.
    std::vector<Scalar> feed(std::string_view text);

    /// Characters of the pending, unterminated field.
    const std::string& pending() const noexcept { return pending_; }

    void reset() noexcept;

private:
    char delimiter_;
    bool whitespace_delimiter_;
    ScalarType type_{ScalarType::Float64};
    std::string pending_{};

    bool is_separator(char c) const noexcept;
    void flush_field(std::vector<Scalar>& out);
};

/// Cast one trimmed field to `t`, checking the target range. Throws BadToken.
Scalar cast_token(std::string_view token, ScalarType t);

/// Text form of one element, as written into a Stream.
std::string format_element(const NdArray& a, std::size_t flat);

} // namespace lwarray
