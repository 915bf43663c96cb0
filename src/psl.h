/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_PSL_H__
#define __VARIANT_FINDER_PSL_H__

#include "interval.h"
#include "variant.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// One gapped alignment in UCSC PSL format.
//
// Block starts are given on the strand named by the strand field:
// q_starts on the query strand, t_starts on the target strand. The
// q_start/q_end/t_start/t_end summary fields are always on the positive strand.
struct psl_t {
	int    matches{};
	int    mis_matches{};
	int    rep_matches{};
	int    n_count{};
	int    q_num_insert{};
	int    q_base_insert{};
	int    t_num_insert{};
	int    t_base_insert{};
	string strand;        // "+", "-", or two characters query+target, e.g. "+-"
	string q_name;
	int    q_size{};
	int    q_start{};
	int    q_end{};
	string t_name;
	int    t_size{};
	int    t_start{};
	int    t_end{};
	vector<int> block_sizes;
	vector<int> q_starts;
	vector<int> t_starts;

	// Accepts 21 columns, or 22 with a leading UCSC bin column.
	static psl_t from_row(const vector<string_view>& cols);

	INLINE int  block_count() const { return (int)block_sizes.size(); }
	INLINE char q_strand()    const { return strand.empty() ? '+' : strand[0]; }
	INLINE char t_strand()    const { return strand.size() > 1 ? strand[1] : '+'; }

	// Same alignment seen from the opposite strand of both sequences.
	// A "-" alignment becomes "+-", so the query reads forward.
	psl_t reverse_complement() const;
};

// Projects query interval [start, end) onto the target, one block per
// aligned piece. Returns nullopt if no part of the interval is aligned.
std::optional<bed_t> map_query(const psl_t& psl, int start, int end, std::string_view name = {});

// The variant moved onto the psl target, or nullopt if it cannot be
// projected without changing its length.
std::optional<variant_desc> psl_map_variant(const variant_desc& variant, const psl_t& psl);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_PSL_H__
