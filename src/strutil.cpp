/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "strutil.h"
#include "vf_assert.h"
#include <algorithm>
#include <array>
#include <charconv>
#include <iterator>
#include <string>
#include <system_error>

using namespace std;

BEGIN_NAMESPACE_VF

/////////////////////////////////////////////

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols)
{
	out.clear();
	while (!empty(s)) {
		if ((int)size(out) + 1 < max_cols) {
			auto pos = s.find(delim);
			out.push_back(s.substr(0, pos));
			if (pos != string_view::npos) {
				s.remove_prefix(pos + 1);
			} else {
				break;
			}
		} else {
			out.push_back(s);
			break;
		}
	}
}

int split_view(string_view s, char delim, string_view* out, int max_cols)
{
	int n = 0;
	for (;!empty(s); ++n) {
		if (n + 1 < max_cols) {
			auto pos = s.find(delim);
			out[n] = s.substr(0, pos);
			if (pos != string_view::npos) {
				s.remove_prefix(pos + 1);
			} else {
				break;
			}
		} else {
			out[n] = s;
			break;
		}
	}
	return n + 1;
}

vector<string> split_nonempty(string_view s, char delim)
{
	vector<string_view> cols;
	split_view(s, delim, cols);
	vector<string> out;
	for (auto col : cols) {
		col = strip(col);
		if (!empty(col))
			out.emplace_back(col);
	}
	return out;
}

string join(const vector<string>& items, string_view sep)
{
	string out;
	for (size_t i = 0; i < size(items); ++i) {
		if (i)
			out += sep;
		out += items[i];
	}
	return out;
}

vector<int> find_columns(const vector<string_view>& header, std::initializer_list<string_view> names)
{
	vector<int> cols;
	for (auto name : names) {
		auto it = find(header.begin(), header.end(), name);
		VF_CHECK(it != header.end(), value, "Missing column \"{}\" in header", name);
		cols.push_back((int)(it - header.begin()));
	}
	return cols;
}

int as_int(string_view s)
{
	if (s.starts_with("+"))
		s.remove_prefix(1);

	int  val{};
	auto stop      = s.data() + s.size();
	auto [ptr, ec] = from_chars(s.data(), stop, val);
	if (ptr == stop && ec == errc{})
		return val;

	VF_CHECK(ec != errc::result_out_of_range, value, "Overflow detected when parsing \"{}\" as integer.", s);
	VF_THROW(value, "Failed to parse \"{}\" as integer.", s);
}

static const array<char, 256> g_dna_complement = [] {
	array<char, 256> table{};
	table.fill('?');
	auto add_pair = [&table](char a, char b) {
		table[(unsigned char)upper(a)] = upper(b);
		table[(unsigned char)lower(a)] = lower(b);
		table[(unsigned char)upper(b)] = upper(a);
		table[(unsigned char)lower(b)] = lower(a);
	};
	add_pair('A', 'T');
	add_pair('C', 'G');
	add_pair('K', 'M');
	add_pair('N', 'N');
	add_pair('R', 'Y');
	add_pair('S', 'S');
	add_pair('W', 'W');
	return table;
}();

void reverse_complement(char* dst, int size)
{
	for (int i = 0; i < size/2; ++i) {
		char a = g_dna_complement[(unsigned char)dst[i]];
		char b = g_dna_complement[(unsigned char)dst[size-1-i]];
		dst[i] = b;
		dst[size-1-i] = a;
	}
	if (size & 1)
		dst[size/2] = g_dna_complement[(unsigned char)dst[size/2]];
}

string reverse_complement(string_view s)
{
	string out(s);
	reverse_complement(out.data(), (int)out.size());
	return out;
}

END_NAMESPACE_VF
