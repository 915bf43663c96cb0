/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "coord_mapper.h"
#include "back_translate.h"
#include "genetic_code.h"
#include "util.h"

BEGIN_NAMESPACE_VF

std::optional<coding_window_t> dna_at_coding_pos(const seq_data& data, std::string_view refseq_id,
                                                 int start, int end, std::string_view expected_aa,
                                                 bool check)
{
	log_debug("Making sure that codons {}-{} in {} correspond to {}", start, end, refseq_id, expected_aa);
	const auto cds_start = data.get_cds_start(refseq_id);
	const auto seq       = data.get_seq(refseq_id);
	if (!cds_start || !seq) {
		log_warn("Could not find sequence or CDS start of {}", refseq_id);
		return std::nullopt;
	}

	coding_window_t window;
	window.start = *cds_start + 3 * start;
	window.end   = window.start + 3 * (end - start);
	VF_CHECK(0 <= window.start && window.end <= (int)seq->size(), consistency,
	         "Codons {}-{} lie outside of {} (length {}).", start, end, refseq_id, seq->size());
	window.dna = std::string(seq->substr(window.start, window.end - window.start));

	const auto found_aa = translate(window.dna);
	log_debug("CDS start is {}, nucl pos is {}, codon is {}", *cds_start, window.start, window.dna);
	if (check)
		VF_CHECK(found_aa == expected_aa, consistency, "Codons {} at {}:{} translate to {}, not {}.",
		         window.dna, refseq_id, window.start, found_aa, expected_aa);
	return window;
}

std::optional<coding_and_rna_t> map_to_coding_and_rna(const seq_data& data,
                                                      const std::vector<variant_desc>& prot_vars,
                                                      const finder_config& config)
{
	coding_and_rna_t result;
	for (const auto& prot_var : prot_vars) {
		if (prot_var.orig_seq.empty()) {
			log_debug("{} has no wild-type residues and cannot be mapped to a transcript", prot_var.name());
			continue;
		}
		const auto trans_id = data.get_refseq_id(prot_var.seq_id);
		if (!trans_id) {
			log_error("Could not resolve {} to a transcript. Skipping this protein.", prot_var.seq_id);
			continue;
		}

		const int pos = prot_var.start - 1;
		std::optional<coding_window_t> window;
		try {
			window = dna_at_coding_pos(data, *trans_id, pos, pos + (int)prot_var.orig_seq.size(),
			                           prot_var.orig_seq, !config.shuffle);
		} catch (const consistency_error& e) {
			log_warn("Skipping transcript {}: {}", *trans_id, e.what());
			continue;
		}
		if (!window)
			return std::nullopt;

		const int orig_len = 3 * (int)prot_var.orig_seq.size();
		if (prot_var.mut_type == mut_type_t::del && prot_var.mut_seq.empty()) {
			// Deletions are anchored at the codons of the deleted residues.
			const int cd_start = 3 * prot_var.start;
			result.coding.push_back(variant_desc{ prot_var.mut_type, seq_type_t::cds, cd_start, cd_start + orig_len,
			                                      window->dna, {}, *trans_id, prot_var.orig_str });
			result.rna.push_back(variant_desc{ prot_var.mut_type, seq_type_t::rna, window->start, window->start + orig_len,
			                                   window->dna, {}, *trans_id, prot_var.orig_str });
			continue;
		}

		for (const auto& change : possible_dna_changes(prot_var.orig_seq, prot_var.mut_seq, window->dna,
		                                               config.allow_two_bp_variants)) {
			const int cd_start = 3 * (prot_var.start - 1) + change.rel_pos + 1;
			result.coding.push_back(variant_desc{ prot_var.mut_type, seq_type_t::cds, cd_start,
			                                      cd_start + (int)change.old_bases.size(), change.old_bases,
			                                      change.new_bases, *trans_id, prot_var.orig_str });
			const int rna_start = window->start + change.rel_pos;
			result.rna.push_back(variant_desc{ prot_var.mut_type, seq_type_t::rna, rna_start,
			                                   rna_start + (int)change.new_bases.size(), change.old_bases,
			                                   change.new_bases, *trans_id, prot_var.orig_str });
		}
	}
	return result;
}

END_NAMESPACE_VF
