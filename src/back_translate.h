/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_BACK_TRANSLATE_H__
#define __VARIANT_FINDER_BACK_TRANSLATE_H__

#include "defines.h"
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// A nucleotide edit relative to the start of a codon window.
struct dna_change_t {
	int         rel_pos{};
	std::string old_bases;
	std::string new_bases;

	auto operator<=>(const dna_change_t&) const = default;
};

// All nucleotide strings that encode protein. Codons of later residues vary
// slowest, so back_translate("CD") is {TGTGAT, TGCGAT, TGTGAC, TGCGAC}.
std::vector<std::string> back_translate(std::string_view protein);

// Where a and b differ, if they differ in at most max_diff positions.
// Two differences are only reported when adjacent; identical strings report nothing.
std::optional<dna_change_t> first_diff_nucl(std::string_view a, std::string_view b, int max_diff = 1);

// Nucleotide edits of orig_dna that turn it into a codon sequence for mut_aa.
// One-base edits only, unless allow_two_bp also admits two adjacent bases.
// The result is deduplicated and sorted.
std::vector<dna_change_t> possible_dna_changes(std::string_view orig_aa,
                                               std::string_view mut_aa,
                                               std::string_view orig_dna,
                                               bool allow_two_bp = false);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_BACK_TRANSLATE_H__
