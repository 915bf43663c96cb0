/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_VARIANT_FINDER_H__
#define __VARIANT_FINDER_VARIANT_FINDER_H__

#include "config.h"
#include "coord_mapper.h"
#include "extraction.h"
#include "interval.h"
#include "pattern_registry.h"
#include "seq_data.h"
#include "seq_variant_data.h"
#include "variant.h"
#include <optional>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

BEGIN_NAMESPACE_VF

// c.N of a transcript is at 0-based offset N + cds_start + coding_to_rna_shift.
inline constexpr int coding_to_rna_shift = -1;

// Outcome of grounding one variant against the candidate genes of a document.
struct ground_result_t {
	std::vector<seq_variant_data>   grounded;        // one per gene that verified the variant
	std::optional<seq_variant_data> ungrounded;      // set when no gene verified it
	std::vector<bed_t>              beds;
	std::vector<std::string>        mapped_rs_ids;   // document rs ids matched by the beds
	std::vector<seq_variant_data>   unmapped_snps;   // dbSnp mentions not matched by this variant
};

// Sequence databases whose accessions verified a variant.
struct seq_check_t {
	std::string              db;
	std::vector<std::string> seq_ids;
};

struct symbol_grounding_t {
	std::vector<bed_t>        beds;
	std::vector<variant_desc> coding;
	std::vector<variant_desc> rna;
};

// Patterns, reference data and settings for extracting and grounding
// variants. One instance per worker thread.
class variant_finder {
	NOCOPY(variant_finder)
public:
	variant_finder(pattern_registry registry, seq_data data, finder_config config);
	variant_finder(variant_finder&&) = default;

	// Loads the pattern table and reference data from config.data_dir.
	static variant_finder open(const finder_config& config);

	const pattern_registry& registry() const { return _registry; }
	const seq_data&         data()     const { return _data; }
	const finder_config&    config()   const { return _config; }

	variants_by_type_t find_variant_descriptions(std::string_view text, const std::set<int>& excluded = {}) const;

	// True if seq_id carries the wild-type sequence of variant at its position.
	bool is_seq_correct(std::string_view seq_id, const variant_desc& variant);

	// First sequence database with accessions of gene_id ("672" or "672/675")
	// that verify variant; empty seq_ids if none does.
	seq_check_t check_variant_against_sequence(const variant_desc& variant, std::string_view gene_id);

	// Projects transcript variants onto the genome through their first alignment.
	std::vector<bed_t> map_to_genome(const std::vector<variant_desc>& rna_vars, std::string_view name);

	// The rs id at each BED locus, "na" where there is none.
	std::vector<std::string> bed_to_rs_ids(const std::vector<bed_t>& beds) const;

	ground_result_t ground_variant(std::string_view doc_id,
	                               std::string_view text,
	                               const variant_desc& variant,
	                               const std::vector<mention_t>& mentions,
	                               const std::vector<variant_mentions_t>& snp_mentions,
	                               const std::vector<std::string>& gene_ids);

	// Extracts and grounds every variant of a document. Rows of grounded
	// and ungrounded variants come first, then unmatched dbSnp mentions.
	std::vector<seq_variant_data> ground_document(std::string_view doc_id,
	                                              std::string_view text,
	                                              const std::vector<std::string>& gene_ids,
	                                              const std::set<int>& excluded = {});

	// ground_symbol_variant("BRCA1", "R71G"): the first entrez gene of the symbol whose
	// proteins verify the variant, projected onto transcripts and the genome.
	std::optional<symbol_grounding_t> ground_symbol_variant(std::string_view sym, std::string_view prot_desc);

private:
	bool try_ground_on_gene(ground_result_t& result, std::string_view doc_id, std::string_view text,
	                        const variant_desc& variant, const std::vector<mention_t>& mentions,
	                        const std::vector<variant_mentions_t>& snp_mentions, const std::string& gene_id);

	pattern_registry _registry;
	seq_data         _data;
	finder_config    _config;
	std::mt19937     _rng;   // shuffle mode only
};

// Mentions of the document's rs ids that appear in mapped_rs_ids, in document order.
rs_mentions_t get_snp_mentions(const std::vector<std::string>& mapped_rs_ids,
                               const std::vector<variant_mentions_t>& snp_variants);

// Placeholder records for rs ids that no grounded variant matched.
std::vector<seq_variant_data> unmapped_snp_records(const std::vector<variant_mentions_t>& snp_variants,
                                                   const std::vector<std::string>& mapped_rs_ids,
                                                   std::string_view text);

// Where a gene was named in the text, [start, end) byte offsets.
struct gene_mentions_t {
	std::string                      gene_id;
	std::vector<std::pair<int, int>> spans;
};

// The gene named closest to any of the mentions; nullopt if no gene has a span.
std::optional<std::string> find_closest_gene_mention(const std::vector<mention_t>& mentions,
                                                     const std::vector<gene_mentions_t>& genes);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_VARIANT_FINDER_H__
