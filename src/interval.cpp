/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "interval.h"
#include "strutil.h"

BEGIN_NAMESPACE_VF

bed_t bed_t::shift(pos_t amount) const
{
	bed_t b{*this};
	b.start       += amount;
	b.end         += amount;
	b.thick_start += amount;
	b.thick_end   += amount;
	return b;
}

static string as_csv(const vector<pos_t>& values)
{
	string s;
	for (auto v : values)
		s += fmt::format("{},", v);
	if (!s.empty())
		s.pop_back();
	return s;
}

std::vector<string> bed_t::as_row() const
{
	return {
		chrom,
		fmt::format("{}", start),
		fmt::format("{}", end),
		name,
		fmt::format("{}", score),
		string(1, strand_as_char(strand)),
		fmt::format("{}", thick_start),
		fmt::format("{}", thick_end),
		fmt::format("{}", item_rgb),
		fmt::format("{}", block_count()),
		as_csv(block_sizes),
		as_csv(block_starts),
	};
}

string bed_t::as_str() const
{
	return join(as_row(), "\t");
}

END_NAMESPACE_VF
