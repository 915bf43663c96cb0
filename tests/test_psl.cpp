/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "testing.h"
#include "interval.h"
#include "psl.h"
#include "strutil.h"
#include "variant.h"
#include <exception>
#include <string>
#include <vector>

USING_NAMESPACE_VF

using std::string;
using std::vector;

// BRCA1-like transcript on the minus strand, two exons.
static const char* const g_minus_psl =
	"350\t0\t0\t0\t0\t0\t1\t2250\t-\tNM_007294\t350\t0\t350\tchr17\t81195210\t41256000\t41258600\t2\t150,200,\t0,150,\t41256000,41258400,";

// Single exon on the plus strand.
static const char* const g_plus_psl =
	"270\t0\t0\t0\t0\t0\t0\t0\t+\tNM_000059\t270\t0\t270\tchr13\t115169878\t32889600\t32889870\t1\t270,\t0,\t32889600,";

static psl_t parse_psl(string_view line)
{
	vector<string_view> cols;
	split_view(line, '\t', cols);
	return psl_t::from_row(cols);
}

void psl_from_row_test()
{
	auto psl = parse_psl(g_minus_psl);
	VF_ASSERT(psl.matches == 350);
	VF_ASSERT(psl.t_base_insert == 2250);
	VF_ASSERT(psl.q_name == "NM_007294");
	VF_ASSERT(psl.q_strand() == '-' && psl.t_strand() == '+');
	VF_ASSERT(psl.t_name == "chr17" && psl.t_size == 81195210);
	VF_ASSERT(psl.block_count() == 2);
	VF_ASSERT((psl.block_sizes == vector<int>{ 150, 200 }));
	VF_ASSERT((psl.t_starts == vector<int>{ 41256000, 41258400 }));

	// Leading bin column
	auto binned = parse_psl(string("585\t") + g_plus_psl);
	VF_ASSERT(binned.q_name == "NM_000059");
	VF_ASSERT(binned.q_size == 270);

	VF_ASSERT_THROWS(value, parse_psl("350\t0\t0"));
	string bad_strand = g_plus_psl;
	bad_strand.replace(bad_strand.find("\t+\t"), 3, "\tx\t");
	VF_ASSERT_THROWS(value, parse_psl(bad_strand));
	string bad_count = g_plus_psl;
	bad_count.replace(bad_count.find("\t1\t270,"), 7, "\t2\t270,");
	VF_ASSERT_THROWS(value, parse_psl(bad_count));
}

void psl_reverse_complement_test()
{
	auto rc = parse_psl(g_minus_psl).reverse_complement();
	VF_ASSERT(rc.strand == "+-");
	VF_ASSERT(rc.q_strand() == '+' && rc.t_strand() == '-');
	VF_ASSERT((rc.block_sizes == vector<int>{ 200, 150 }));
	VF_ASSERT((rc.q_starts == vector<int>{ 0, 200 }));
	VF_ASSERT((rc.t_starts == vector<int>{ 81195210 - 41258600, 81195210 - 41256150 }));
	VF_ASSERT(rc.t_start == 41256000 && rc.t_end == 41258600);
}

void map_query_test()
{
	auto minus = parse_psl(g_minus_psl);

	auto bed = map_query(minus, 230, 231, "NM_007294.3:r.230A>G");
	VF_ASSERT(bed);
	VF_ASSERT(bed->chrom == "chr17");
	VF_ASSERT(bed->start == 41256119 && bed->end == 41256120);
	VF_ASSERT(bed->strand == neg_strand);
	VF_ASSERT(bed->name == "NM_007294.3:r.230A>G");
	VF_ASSERT(bed->thick_start == bed->start && bed->thick_end == bed->end);

	// Same result through an already reverse-complemented record.
	auto rc_bed = map_query(minus.reverse_complement(), 230, 231);
	VF_ASSERT(rc_bed && rc_bed->start == 41256119 && rc_bed->end == 41256120);

	// Across the exon junction: one block per exon, ordered on the genome.
	auto split = map_query(minus, 195, 205);
	VF_ASSERT(split);
	VF_ASSERT(split->start == 41256145 && split->end == 41258405);
	VF_ASSERT((split->block_sizes == vector<pos_t>{ 5, 5 }));
	VF_ASSERT((split->block_starts == vector<pos_t>{ 0, 2255 }));

	VF_ASSERT(!map_query(minus, 350, 360));

	auto plus = parse_psl(g_plus_psl);
	auto plus_bed = map_query(plus, 220, 221);
	VF_ASSERT(plus_bed);
	VF_ASSERT(plus_bed->chrom == "chr13");
	VF_ASSERT(plus_bed->start == 32889820 && plus_bed->end == 32889821);
	VF_ASSERT(plus_bed->strand == pos_strand);
}

void psl_map_variant_test()
{
	auto minus = parse_psl(g_minus_psl);
	const variant_desc rna{ mut_type_t::sub, seq_type_t::rna, 230, 231, "A", "G", "NM_007294.3" };
	auto mapped = psl_map_variant(rna, minus);
	VF_ASSERT(mapped);
	VF_ASSERT(mapped->seq_id == "chr17");
	VF_ASSERT(mapped->start == 41256119 && mapped->end == 41256120);
	VF_ASSERT(mapped->orig_seq == "A" && mapped->mut_seq == "G");

	// A deletion across the junction would change length on the genome.
	const variant_desc del{ mut_type_t::del, seq_type_t::rna, 195, 205, "AAAAAAAAAA", "", "NM_007294.3" };
	VF_ASSERT(!psl_map_variant(del, minus));

	// Partially aligned
	psl_t gapped = parse_psl(g_plus_psl);
	gapped.q_size      = 250;
	gapped.block_sizes = { 100, 100 };
	gapped.q_starts    = { 0, 150 };
	gapped.t_starts    = { 1000, 1100 };
	const variant_desc ins{ mut_type_t::ins, seq_type_t::rna, 140, 160, "", "TT", "NM_000059.3" };
	VF_ASSERT(!psl_map_variant(ins, gapped));
	auto inside = psl_map_variant(ins.with_range(150, 160), gapped);
	VF_ASSERT(inside && inside->start == 1100 && inside->end == 1110);
}

void bed_test()
{
	bed_t bed;
	bed.chrom        = "chr17";
	bed.start        = 41256119;
	bed.end          = 41256120;
	bed.name         = "NM_007294.3:r.230A>G";
	bed.strand       = neg_strand;
	bed.thick_start  = bed.start;
	bed.thick_end    = bed.end;
	bed.block_sizes  = { 1 };
	bed.block_starts = { 0 };
	VF_ASSERT((bed.as_row() == vector<string>{ "chr17", "41256119", "41256120", "NM_007294.3:r.230A>G", "1", "-",
	                                           "41256119", "41256120", "0", "1", "1", "0" }));
	VF_ASSERT(bed.as_str() == "chr17\t41256119\t41256120\tNM_007294.3:r.230A>G\t1\t-\t41256119\t41256120\t0\t1\t1\t0");

	auto shifted = bed.shift(-3);
	VF_ASSERT(shifted.start == 41256116 && shifted.end == 41256117);
	VF_ASSERT(shifted.thick_start == 41256116 && shifted.thick_end == 41256117);
	VF_ASSERT(shifted.block_starts == bed.block_starts);

	VF_ASSERT(as_strand('+') == pos_strand);
	VF_ASSERT(as_strand("-") == neg_strand);
	VF_ASSERT(strand_as_char(opp_strand(pos_strand)) == '-');
	VF_ASSERT_THROWS(value, as_strand('.'));
	VF_ASSERT_THROWS(value, as_strand("+-"));
}

int main()
{
	try {
		VF_RUN_TEST(psl_from_row_test);
		VF_RUN_TEST(psl_reverse_complement_test);
		VF_RUN_TEST(map_query_test);
		VF_RUN_TEST(psl_map_variant_test);
		VF_RUN_TEST(bed_test);
	} catch (const std::exception& e) {
		nested_exception_print(e);
		return -1;
	}
	return 0;
}
