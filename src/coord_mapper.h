/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_COORD_MAPPER_H__
#define __VARIANT_FINDER_COORD_MAPPER_H__

#include "config.h"
#include "seq_data.h"
#include "variant.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// Codons of a transcript for 0-based codon range [start, end) of its CDS.
struct coding_window_t {
	std::string dna;
	int         start{};   // transcript offset of the first base
	int         end{};
};

// Fetches the codons and checks they translate to expected_aa.
// Returns nullopt if the transcript sequence or CDS start is unknown.
// Throws consistency_error on a translation mismatch, unless check is false.
std::optional<coding_window_t> dna_at_coding_pos(const seq_data& data, std::string_view refseq_id,
                                                 int start, int end, std::string_view expected_aa,
                                                 bool check = true);

struct coding_and_rna_t {
	std::vector<variant_desc> coding;   // seq_type cds, 1-based c. numbering
	std::vector<variant_desc> rna;      // seq_type rna, 0-based transcript offsets
};

// Projects protein variants bound to protein accessions onto their transcripts.
// Every nucleotide edit consistent with the genetic code yields one coding and
// one RNA variant. Returns nullopt if a transcript sequence is missing.
std::optional<coding_and_rna_t> map_to_coding_and_rna(const seq_data& data,
                                                      const std::vector<variant_desc>& prot_vars,
                                                      const finder_config& config);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_COORD_MAPPER_H__
