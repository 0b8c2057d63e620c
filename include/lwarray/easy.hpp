#pragma once

#include "lwarray/document.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lwarray::easy {

namespace detail {
template <typename T> struct always_false : std::false_type {};
} // namespace detail

// Storage scalar for a C++ element type.
template <typename T>
constexpr ScalarType scalar_type_of() {
    if constexpr (std::is_same_v<T, std::int16_t>) return ScalarType::Int16;
    else if constexpr (std::is_same_v<T, std::uint16_t>) return ScalarType::UInt16;
    else if constexpr (std::is_same_v<T, std::int32_t>) return ScalarType::Int32;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return ScalarType::UInt32;
    else if constexpr (std::is_same_v<T, std::int64_t>) return ScalarType::Int64;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return ScalarType::UInt64;
    else if constexpr (std::is_same_v<T, float>) return ScalarType::Float32;
    else if constexpr (std::is_same_v<T, double>) return ScalarType::Float64;
    else static_assert(detail::always_false<T>::value, "no LIGO_LW storage type for T");
}

// `data_rowmajor` is laid out with the last entry of `shape` contiguous.
template <typename T>
inline NdArray make_ndarray(Shape shape, std::vector<T> data_rowmajor) {
    NdArray a;
    a.type = scalar_type_of<T>();
    a.shape = std::move(shape);
    a.data = std::move(data_rowmajor);
    a.validate();
    return a;
}

// Throws InvalidData when the array does not hold T.
template <typename T>
inline const std::vector<T>& values(const NdArray& a) {
    if (const auto* v = std::get_if<std::vector<T>>(&a.data)) return *v;
    throw LwError(ErrorKind::InvalidData, "array holds " + name_for(a.type) + " values");
}

template <typename T>
inline T at(const NdArray& a, const Index& index) {
    return values<T>(a)[flat_offset(a.shape, index)];
}

// Array element named `name` with a Local Stream, appended below `parent`.
template <typename T>
inline Array& add_array(Element& parent, const std::string& name, Shape shape, std::vector<T> data_rowmajor,
                        const std::vector<std::string>& dim_names = {}) {
    auto arr = from_array(name, make_ndarray<T>(std::move(shape), std::move(data_rowmajor)), dim_names);
    return static_cast<Array&>(parent.append_child(std::move(arr)));
}

// Document holding one empty LIGO_LW element; returns that element.
inline Element& new_ligo_lw(Document& doc) {
    return doc.append_child(std::make_unique<Element>("LIGO_LW"));
}

} // namespace lwarray::easy
