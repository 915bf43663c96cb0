/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "back_translate.h"
#include "genetic_code.h"
#include "strutil.h"
#include "util.h"
#include <algorithm>

BEGIN_NAMESPACE_VF

std::vector<std::string> back_translate(std::string_view protein)
{
	std::vector<std::string> sequences;
	if (protein.empty())
		return sequences;

	sequences = codons_for(protein[0]);
	for (char aa : protein.substr(1)) {
		const auto& codons = codons_for(aa);
		std::vector<std::string> extended;
		extended.reserve(codons.size() * sequences.size());
		for (const auto& codon : codons)
			for (const auto& seq : sequences)
				extended.push_back(seq + codon);
		sequences = std::move(extended);
	}
	if (sequences.empty())
		log_debug("No codons for protein sequence \"{}\"", protein);
	return sequences;
}

std::optional<dna_change_t> first_diff_nucl(std::string_view a, std::string_view b, int max_diff)
{
	VF_CHECK(a.size() == b.size(), value, "Cannot compare \"{}\" and \"{}\" of different lengths", a, b);

	std::vector<int> diff_pos;
	for (size_t i = 0; i < a.size(); ++i)
		if (a[i] != b[i])
			diff_pos.push_back((int)i);

	if (diff_pos.empty() || (int)diff_pos.size() > max_diff)
		return std::nullopt;
	if (diff_pos.size() == 1)
		return dna_change_t{ diff_pos[0], std::string(1, a[diff_pos[0]]), std::string(1, b[diff_pos[0]]) };
	if (diff_pos.size() == 2 && diff_pos[0] + 1 == diff_pos[1])
		return dna_change_t{ diff_pos[0], std::string(a.substr(diff_pos[0], 2)), std::string(b.substr(diff_pos[0], 2)) };
	return std::nullopt;
}

std::vector<dna_change_t> possible_dna_changes(std::string_view orig_aa,
                                               std::string_view mut_aa,
                                               std::string_view orig_dna,
                                               bool allow_two_bp)
{
	const int max_diff = allow_two_bp ? 2 : 1;
	const std::string ref = upper(orig_dna);

	log_debug("Looking for possible DNA change. Aa change {} -> {}, original dna {}", orig_aa, mut_aa, ref);
	std::vector<dna_change_t> changes;
	for (const auto& mut_dna : back_translate(mut_aa)) {
		if (mut_dna.size() != ref.size())
			continue;
		if (auto change = first_diff_nucl(ref, mut_dna, max_diff)) {
			log_debug("found possible mutated DNA: {}", mut_dna);
			changes.push_back(std::move(*change));
		}
	}
	std::sort(changes.begin(), changes.end());
	changes.erase(std::unique(changes.begin(), changes.end()), changes.end());

	if (changes.empty())
		log_debug("No possible DNA change found (max {} bp change).", max_diff);
	return changes;
}

END_NAMESPACE_VF
