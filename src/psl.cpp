/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "psl.h"
#include "strutil.h"
#include "util.h"
#include <algorithm>
#include <tuple>
#include <utility>

BEGIN_NAMESPACE_VF

static vector<int> as_int_list(string_view s)
{
	vector<int> values;
	for (const auto& item : split_nonempty(s, ','))
		values.push_back(as_int(item));
	return values;
}

psl_t psl_t::from_row(const vector<string_view>& row)
{
	VF_CHECK(row.size() == 21 || row.size() == 22, value, "Expected 21 PSL columns but found {}.", row.size());
	const string_view* c = row.data() + (row.size() == 22 ? 1 : 0);

	psl_t psl;
	psl.matches       = as_int(c[0]);
	psl.mis_matches   = as_int(c[1]);
	psl.rep_matches   = as_int(c[2]);
	psl.n_count       = as_int(c[3]);
	psl.q_num_insert  = as_int(c[4]);
	psl.q_base_insert = as_int(c[5]);
	psl.t_num_insert  = as_int(c[6]);
	psl.t_base_insert = as_int(c[7]);
	psl.strand        = string(c[8]);
	psl.q_name        = string(c[9]);
	psl.q_size        = as_int(c[10]);
	psl.q_start       = as_int(c[11]);
	psl.q_end         = as_int(c[12]);
	psl.t_name        = string(c[13]);
	psl.t_size        = as_int(c[14]);
	psl.t_start       = as_int(c[15]);
	psl.t_end         = as_int(c[16]);
	const int count   = as_int(c[17]);
	psl.block_sizes   = as_int_list(c[18]);
	psl.q_starts      = as_int_list(c[19]);
	psl.t_starts      = as_int_list(c[20]);

	VF_CHECK(psl.strand.size() == 1 || psl.strand.size() == 2, value, "Invalid PSL strand \"{}\".", psl.strand);
	for (char s : psl.strand)
		as_strand(s);
	VF_CHECK(count == psl.block_count() && count == (int)psl.q_starts.size() && count == (int)psl.t_starts.size(),
	         value, "PSL for {} declares {} blocks but lists {}/{}/{}.", psl.q_name, count,
	         psl.block_sizes.size(), psl.q_starts.size(), psl.t_starts.size());
	return psl;
}

psl_t psl_t::reverse_complement() const
{
	psl_t rc{*this};
	rc.strand = { strand_as_char(opp_strand(as_strand(q_strand()))),
	              strand_as_char(opp_strand(as_strand(t_strand()))) };
	const int n = block_count();
	for (int i = 0; i < n; ++i) {
		const int j = n - 1 - i;
		rc.block_sizes[i] = block_sizes[j];
		rc.q_starts[i]    = q_size - (q_starts[j] + block_sizes[j]);
		rc.t_starts[i]    = t_size - (t_starts[j] + block_sizes[j]);
	}
	return rc;
}

std::optional<bed_t> map_query(const psl_t& psl, int start, int end, std::string_view name)
{
	if (psl.q_strand() == '-')
		return map_query(psl.reverse_complement(), start, end, name);

	const bool neg_target = psl.t_strand() == '-';
	vector<std::pair<pos_t, pos_t>> pieces;
	for (int i = 0; i < psl.block_count(); ++i) {
		const int qs = psl.q_starts[i];
		const int qe = qs + psl.block_sizes[i];
		const int lo = std::max(start, qs);
		const int hi = std::min(end, qe);
		if (lo >= hi)
			continue;
		pos_t t_lo = psl.t_starts[i] + (lo - qs);
		pos_t t_hi = t_lo + (hi - lo);
		if (neg_target)
			std::tie(t_lo, t_hi) = std::pair{ psl.t_size - t_hi, psl.t_size - t_lo };
		pieces.emplace_back(t_lo, t_hi);
	}
	if (pieces.empty())
		return std::nullopt;

	std::sort(pieces.begin(), pieces.end());
	bed_t bed;
	bed.chrom       = psl.t_name;
	bed.start       = pieces.front().first;
	bed.end         = pieces.back().second;
	bed.name        = string(name);
	bed.strand      = neg_target ? neg_strand : pos_strand;
	bed.thick_start = bed.start;
	bed.thick_end   = bed.end;
	for (auto [lo, hi] : pieces) {
		bed.block_sizes.push_back(hi - lo);
		bed.block_starts.push_back(lo - bed.start);
	}
	return bed;
}

std::optional<variant_desc> psl_map_variant(const variant_desc& variant, const psl_t& psl)
{
	auto bed = map_query(psl, variant.start, variant.end);
	if (!bed)
		return std::nullopt;
	if (bed->size() != variant.end - variant.start) {
		log_debug("{} spans {} bases on {} instead of {}", variant.name(), bed->size(), psl.t_name, variant.end - variant.start);
		return std::nullopt;
	}
	return variant.with_seq_id(bed->chrom).with_range(bed->start, bed->end);
}

END_NAMESPACE_VF
