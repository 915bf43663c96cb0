/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_INTERVAL_H__
#define __VARIANT_FINDER_INTERVAL_H__

#include "defines.h"
#include "util.h"
#include "vf_assert.h"
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF
using std::string;
using std::vector;

using pos_t = int32_t;          // Position within a coordinate system
enum class strand_t : uint8_t { // Strand index [+,-]
	neg_strand,
	pos_strand,
	num_strand
};

static constexpr auto neg_strand = strand_t::neg_strand;
static constexpr auto pos_strand = strand_t::pos_strand;
static constexpr auto num_strand = as_ordinal(strand_t::num_strand);

// Convert between '+'/'-' and strand_t
INLINE strand_t as_strand(char c)            { VF_CHECK(c == '+' || c == '-', value, "Expected strand to be '+' or '-' but found '{}'.", c); return c=='+' ? pos_strand : neg_strand; }
INLINE strand_t as_strand(std::string_view s)
{
	VF_CHECK(s.size() == 1, value, "Expected strand string \"{}\" to be \"+\" or \"-\".", s);
	return as_strand(s[0]);
}
INLINE bool is_valid_strand(strand_t strand) { return as_ordinal(strand) < num_strand; }
INLINE char strand_as_char(strand_t strand)  { VF_DBASSERT(is_valid_strand(strand)); return strand == pos_strand ? '+' : '-'; }
INLINE strand_t opp_strand(strand_t strand)  { return strand == pos_strand ? neg_strand : pos_strand; }

/////////////////////////////////////////////////////////////////

// A 12-column BED feature on the genome, 0-based half-open.
struct bed_t {
	string           chrom;
	pos_t            start{};
	pos_t            end{};
	string           name;
	int              score{1};
	strand_t         strand{pos_strand};
	pos_t            thick_start{};
	pos_t            thick_end{};
	int              item_rgb{};
	vector<pos_t>    block_sizes;
	vector<pos_t>    block_starts;   // relative to start

	INLINE int   block_count() const { return (int)block_sizes.size(); }
	INLINE pos_t size()        const { return end - start; }

	// Moves the feature and its thick part by amount; blocks keep their relative layout.
	bed_t shift(pos_t amount) const;

	std::vector<string> as_row() const;
	string as_str() const;
};

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_INTERVAL_H__
