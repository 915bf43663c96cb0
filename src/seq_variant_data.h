/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_SEQ_VARIANT_DATA_H__
#define __VARIANT_FINDER_SEQ_VARIANT_DATA_H__

#include "interval.h"
#include "variant.h"
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

BEGIN_NAMESPACE_VF

// Mentions of one rs id in the document.
using rs_mentions_t = std::vector<std::pair<std::string, std::vector<mention_t>>>;

// One output row: a variant located on a gene, or a text-only record for
// a variant that could not be located. Multi-valued columns are joined
// with '|', start/end lists with ','.
struct seq_variant_data {
	std::string chrom;
	std::string start;
	std::string end;
	std::string offset;
	std::string var_id;
	std::string in_db;
	std::string pat_type;
	std::string hgvs_prot;
	std::string hgvs_coding;
	std::string hgvs_rna;
	std::string comment;
	std::string rs_ids;
	std::string prot_id;
	std::string texts;
	std::string rs_ids_mentioned;
	std::string db_snp_starts;
	std::string db_snp_ends;
	std::string gene_symbol;
	std::string gene_type;
	std::string entrez_id;
	std::string gene_starts;
	std::string gene_ends;
	std::string seq_type;
	std::string mut_pat_names;
	std::string mut_starts;
	std::string mut_ends;
	std::string mut_snippets;
	std::string gene_snippets;
	std::string db_snp_snippets;

	static const std::vector<std::string>& header();
	std::vector<std::string> as_row() const;

	// A variant verified on a gene; chrom, start and end come from the first BED.
	static seq_variant_data grounded(std::string_view doc_id,
	                                 const variant_desc& variant,
	                                 const std::vector<variant_desc>& prot_vars,
	                                 const std::vector<variant_desc>& coding_vars,
	                                 const std::vector<variant_desc>& rna_vars,
	                                 const std::vector<bed_t>& beds,
	                                 std::string_view entrez_id,
	                                 std::string_view gene_sym,
	                                 const std::vector<std::string>& rs_ids,
	                                 const rs_mentions_t& db_snp_mentions,
	                                 const std::vector<mention_t>& mentions,
	                                 std::string_view text);

	// Only the text mentions of a variant that no gene could confirm.
	static seq_variant_data ungrounded(seq_type_t seq_type, std::string_view pat_type,
	                                   const std::vector<mention_t>& mentions, std::string_view text);
};

// Header line then one tab-separated line per row.
void write_tsv(std::FILE* out, const std::vector<seq_variant_data>& rows);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_SEQ_VARIANT_DATA_H__
