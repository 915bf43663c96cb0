/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_STRUTIL_H__
#define __VARIANT_FINDER_STRUTIL_H__

#include "defines.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

BEGIN_NAMESPACE_VF
using std::string;
using std::string_view;
using std::vector;

///////////////////////////////////////////////////

inline bool endswith(string_view s, string_view end)     { return s.ends_with(end); }
inline bool contains(string_view s, string_view substr)  { return s.find(substr) != string::npos; }
inline string_view strip(string_view s)
{
	const auto start = std::find_if(std::begin(s), std::end(s), [](auto x) { return isspace((unsigned char)x) == 0; });
	s = s.substr(std::distance(std::begin(s), start));
	const auto stop  = std::find_if(std::rbegin(s), std::rend(s), [](auto x) { return isspace((unsigned char)x) == 0; });
	return s.substr(0, std::distance(std::begin(s), stop.base()));
}

// Strip any of the characters in chars from both ends of s.
inline string_view strip_chars(string_view s, string_view chars)
{
	const auto first = s.find_first_not_of(chars);
	if (first == string_view::npos)
		return {};
	const auto last = s.find_last_not_of(chars);
	return s.substr(first, last - first + 1);
}

INLINE char upper(char c) { return (c >= 'a' && c <= 'z') ? c + ('A' - 'a') : c; }
INLINE char lower(char c) { return (c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c; }

inline string upper(string_view s)
{
	string out(s);
	std::transform(out.begin(), out.end(), out.begin(), [](char c) { return upper(c); });
	return out;
}

inline string lower(string_view s)
{
	string out(s);
	std::transform(out.begin(), out.end(), out.begin(), [](char c) { return lower(c); });
	return out;
}

inline bool iequals(string_view a, string_view b)
{
	return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return upper(x) == upper(y); });
}

///////////////////////////////////////////////////

INLINE char* find_delim(char* begin, char* end, char delim)
{
	char* p = (char*)::memchr(begin, delim, end-begin);
	return p ? p : end;
}

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols=0x7fffffff);
int  split_view(string_view s, char delim, string_view* out, int max_cols = 0x7fffffff);

// Split on delim, dropping empty items, e.g. the trailing "" of "NM_1,NM_2,".
vector<string> split_nonempty(string_view s, char delim);

string join(const vector<string>& items, string_view sep);

// Index of each named column in a header row; throws value_error if one is missing.
vector<int> find_columns(const vector<string_view>& header, std::initializer_list<string_view> names);

struct string_hash {
	using hash_type      = std::hash<std::string_view>;
	using is_transparent = void;

	std::size_t operator()(const char* str) const noexcept { return hash_type{}(str); }
	std::size_t operator()(std::string_view str) const noexcept { return hash_type{}(str); }
	std::size_t operator()(const std::string& str) const noexcept { return hash_type{}(str); }
};

template <class Key, class T, class Allocator = std::allocator<std::pair<const Key, T>>>
using string_map = std::unordered_map<Key, T, string_hash, std::equal_to<>, Allocator>;

/////////////////////////////////////////////////////

int as_int(string_view s);

////////////////////////////////////////////////////

void   reverse_complement(char* dst, int size);
string reverse_complement(string_view s);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_STRUTIL_H__
