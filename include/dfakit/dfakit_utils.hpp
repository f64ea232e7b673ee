/*
 * dfakit_utils - small helpers shared by all dfakit headers
 *
 * SPDX-FileCopyrightText: 2022-2023 Nicolai Waniek <n@rochus.net>
 * SPDX-License-Identifier: MIT
 * See LICENSE file for more details
 *
 * This file contains the conversions between strings and the value types of
 * cvars, operators for enums that are used as flags, and helpers that treat a
 * std::vector either as a sequence or, after canonicalize, as a set.
 *
 * Due to the nature of this file, this file does *not* include any other
 * dfakit headers and can be used standalone.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace dfakit {


/*
 * str_to_type<T> - parse a value of type T from a string
 *
 * The entire string has to be consumed, except for trailing whitespace.
 * Otherwise, the result is empty. Unsigned types reject negative numbers. Calling str_to_type on a type for which no
 * specialization exists is a link time error.
 */
template <typename T>
std::optional<T>
str_to_type(const std::string &str);


/*
 * type_to_str<T> - format a value of type T, such that str_to_type<T> reads it
 *
 * Floating point values are written with enough digits to be read back
 * exactly.
 */
template <typename T>
std::optional<std::string>
type_to_str(const T &value);


// types for which plain stream extraction and insertion do the job
#define DFAKIT_STREAM_CONVERTIBLE_TYPES(_) \
	_(int)                                 \
	_(unsigned)                            \
	_(double)

#define DFAKIT_STREAM_CONVERSION_IMPL(T)                                  \
	template <>                                                           \
	inline std::optional<T>                                               \
	str_to_type(const std::string &str)                                   \
	{                                                                     \
		/* streams wrap negative input around for unsigned types */       \
		if constexpr (std::is_unsigned_v<T>) {                            \
			auto first = str.find_first_not_of(" \t\n\v\f\r");            \
			if (first != std::string::npos && str[first] == '-')          \
				return {};                                                \
		}                                                                 \
		T result;                                                         \
		std::istringstream is(str);                                       \
		if (!(is >> result))                                              \
			return {};                                                    \
		/* anything but whitespace after the value is an error */         \
		std::string rest;                                                 \
		if (is >> rest)                                                   \
			return {};                                                    \
		return result;                                                    \
	}                                                                     \
                                                                          \
	template <>                                                           \
	inline std::optional<std::string>                                     \
	type_to_str(const T &value)                                           \
	{                                                                     \
		std::ostringstream os;                                            \
		if constexpr (std::is_floating_point_v<T>)                        \
			os << std::setprecision(std::numeric_limits<T>::max_digits10); \
		os << value;                                                      \
		return os.fail() ? std::nullopt : std::optional{os.str()};        \
	}

DFAKIT_STREAM_CONVERTIBLE_TYPES(DFAKIT_STREAM_CONVERSION_IMPL)
#undef DFAKIT_STREAM_CONVERSION_IMPL
#undef DFAKIT_STREAM_CONVERTIBLE_TYPES


/*
 * str_to_type<bool> - '0', '1', 'false', and 'true'
 */
template <>
inline std::optional<bool>
str_to_type(const std::string &str)
{
	if (str == "1" || str == "true")
		return true;
	if (str == "0" || str == "false")
		return false;
	return {};
}


template <>
inline std::optional<std::string>
type_to_str(const bool &value)
{
	return value ? "true" : "false";
}


template <>
inline std::optional<std::string>
str_to_type(const std::string &str)
{
	return str;
}


template <>
inline std::optional<std::string>
type_to_str(const std::string &value)
{
	return value;
}


/*
 * to_underlying - Get the underlying type of some type
 *
 * This is an implementation of C++23's to_underlying function, which is not yet
 * available in C++20 but handy for casting enum-structs to their underlying
 * type (see DFAKIT_DEFINE_ENUM_FLAG_OPERATORS for an example).
 */
template <typename E>
constexpr typename std::underlying_type<E>::type
to_underlying(E e) noexcept {
    return static_cast<typename std::underlying_type<E>::type>(e);
}


/*
 * DFAKIT_DEFINE_ENUM_FLAG_OPERATORS - bit-wise operators for enums used as flags
 *
 * With these, validation results can be accumulated with `flags |= X;` and
 * queried with `test(flags & X)`.
 */
#define DFAKIT_ENUM_BINARY_OPERATOR(ENUM_T, OP) \
	inline ENUM_T operator OP(ENUM_T a, ENUM_T b) { \
		return static_cast<ENUM_T>(dfakit::to_underlying(a) OP dfakit::to_underlying(b)); \
	} \
	inline ENUM_T& operator OP##=(ENUM_T &a, ENUM_T b) { \
		return a = a OP b; \
	}

#define DFAKIT_DEFINE_ENUM_FLAG_OPERATORS(ENUM_T) \
	inline ENUM_T operator~(ENUM_T a) { return static_cast<ENUM_T>(~dfakit::to_underlying(a)); } \
	DFAKIT_ENUM_BINARY_OPERATOR(ENUM_T, |) \
	DFAKIT_ENUM_BINARY_OPERATOR(ENUM_T, &) \
	DFAKIT_ENUM_BINARY_OPERATOR(ENUM_T, ^)


/*
 * contains - determine if a container holds a certain element
 */
template <typename ContainerT, typename U>
inline bool
contains(const ContainerT &container, const U &needle)
{
	return std::find(container.begin(), container.end(), needle) != container.end();
}


/*
 * get_index_of - position of the first occurrence of needle, if any
 */
template <typename T>
inline std::optional<size_t>
get_index_of(const std::vector<T> &vec, const T &needle)
{
	auto it = std::find(vec.begin(), vec.end(), needle);
	if (it == vec.end())
		return {};
	return static_cast<size_t>(it - vec.begin());
}


/*
 * canonicalize - sort a vector and remove duplicates (in-place)
 *
 * After canonicalization, two vectors hold the same set of elements if and
 * only if they compare equal.
 */
template <typename T>
inline void
canonicalize(std::vector<T> &vec)
{
	std::sort(vec.begin(), vec.end());
	vec.erase(std::unique(vec.begin(), vec.end()), vec.end());
}


/*
 * unique_in_order - remove duplicates while keeping first occurrences in place
 *
 * Only equality is required on T.
 */
template <typename T>
inline std::vector<T>
unique_in_order(const std::vector<T> &vec)
{
	std::vector<T> result;
	result.reserve(vec.size());
	for (auto &v: vec)
		if (!contains(result, v))
			result.push_back(v);
	return result;
}


/*
 * difference - all elements of lhs that are not in rhs, in the order of lhs
 */
template <typename T>
inline std::vector<T>
difference(const std::vector<T> &lhs, const std::vector<T> &rhs)
{
	std::vector<T> result;
	for (auto &v: lhs)
		if (!contains(rhs, v))
			result.push_back(v);
	return result;
}


/*
 * intersects - test if two vectors share at least one element
 */
template <typename T>
inline bool
intersects(const std::vector<T> &lhs, const std::vector<T> &rhs)
{
	return std::any_of(lhs.begin(), lhs.end(), [&rhs](const T &v) { return contains(rhs, v); });
}


} // dfakit::
