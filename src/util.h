/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_UTIL_H__
#define __VARIANT_FINDER_UTIL_H__

#include "defines.h"
#include "vf_assert.h"
#include <algorithm>
#include <cstdlib>
#include <fmt/format.h>
#include <iostream>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <utility>

BEGIN_NAMESPACE_VF

template <typename... T>
void print(fmt::format_string<T...> fmt, T&&... args)
{
	std::cerr << fmt::format(fmt, std::forward<T>(args)...);
}

template <typename... T>
void println(fmt::format_string<T...> fmt, T&&... args)
{
	std::cerr << fmt::format(fmt, std::forward<T>(args)...) << '\n';
}

///////////////////////////////////////////////////

// Messages below the process-wide threshold are dropped.
enum class log_level_t : uint8_t {
	debug,
	info,
	warn,
	error,
	quiet,
};

log_level_t get_log_level();
void        set_log_level(log_level_t level);
log_level_t as_log_level(std::string_view s);
const char* log_level_as_str(log_level_t level);

template <typename... T>
void log(log_level_t level, fmt::format_string<T...> fmt, T&&... args)
{
	if (level < get_log_level())
		return;
	println("{}: {}", log_level_as_str(level), fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T> void log_debug(fmt::format_string<T...> fmt, T&&... args) { log(log_level_t::debug, fmt, std::forward<T>(args)...); }
template <typename... T> void log_info (fmt::format_string<T...> fmt, T&&... args) { log(log_level_t::info,  fmt, std::forward<T>(args)...); }
template <typename... T> void log_warn (fmt::format_string<T...> fmt, T&&... args) { log(log_level_t::warn,  fmt, std::forward<T>(args)...); }
template <typename... T> void log_error(fmt::format_string<T...> fmt, T&&... args) { log(log_level_t::error, fmt, std::forward<T>(args)...); }

///////////////////////////////////////////////////

template <typename Y, typename X>
INLINE Y int_cast(X x)
{
	VF_CHECK(std::in_range<Y>(x), value, "int_cast: integer overflow when casting {}.", x);
	return Y(x);
}

template <class Enum>
constexpr std::underlying_type_t<Enum> as_ordinal(Enum e) noexcept
{
	return static_cast<std::underlying_type_t<Enum>>(e);
}

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_UTIL_H__
