/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "genetic_code.h"
#include "strutil.h"
#include "util.h"
#include <array>
#include <utility>

BEGIN_NAMESPACE_VF

// Amino acid for each codon with bases enumerated in TCAG order, first position slowest.
static constexpr std::string_view g_codon_aa   = "FFLLSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG";
static constexpr std::string_view g_tcag       = "TCAG";

static int base_index(char c)
{
	switch (upper(c)) {
	case 'T':
	case 'U': return 0;
	case 'C': return 1;
	case 'A': return 2;
	case 'G': return 3;
	default:  return -1;
	}
}

char translate_codon(std::string_view codon)
{
	if (codon.size() != 3)
		return unknown_aa;
	int i0 = base_index(codon[0]);
	int i1 = base_index(codon[1]);
	int i2 = base_index(codon[2]);
	if (i0 < 0 || i1 < 0 || i2 < 0)
		return unknown_aa;
	return g_codon_aa[i0*16 + i1*4 + i2];
}

std::string translate(std::string_view dna)
{
	std::string aas;
	aas.reserve((dna.size() + 2) / 3);
	for (size_t i = 0; i < dna.size(); i += 3)
		aas.push_back(translate_codon(dna.substr(i, 3)));
	return aas;
}

using codon_table_t = std::array<std::vector<std::string>, 256>;

static const codon_table_t g_aa_codons = [] {
	codon_table_t table;
	for (int i = 0; i < 64; ++i) {
		std::string codon{ g_tcag[i / 16], g_tcag[(i / 4) % 4], g_tcag[i % 4] };
		table[(unsigned char)g_codon_aa[i]].push_back(std::move(codon));
	}
	return table;
}();

const std::vector<std::string>& codons_for(char aa)
{
	return g_aa_codons[(unsigned char)upper(aa)];
}

struct aa_name_t {
	std::string_view name;
	char             aa;
};

static constexpr aa_name_t g_aa_three[] = {
	{ "Ala", 'A' }, { "Arg", 'R' }, { "Asn", 'N' }, { "Asp", 'D' }, { "Cys", 'C' },
	{ "Gln", 'Q' }, { "Glu", 'E' }, { "Gly", 'G' }, { "His", 'H' }, { "Ile", 'I' },
	{ "Leu", 'L' }, { "Lys", 'K' }, { "Met", 'M' }, { "Phe", 'F' }, { "Pro", 'P' },
	{ "Ser", 'S' }, { "Thr", 'T' }, { "Trp", 'W' }, { "Tyr", 'Y' }, { "Val", 'V' },
	{ "Ter", '*' },
};

// Ordered longest first so that a run like "glutamic acidlysine" splits greedily.
static constexpr aa_name_t g_aa_full[] = {
	{ "phenylalanine", 'F' }, { "aspartic acid", 'D' }, { "glutamic acid", 'E' },
	{ "isoleucine", 'I' }, { "methionine", 'M' }, { "asparagine", 'N' }, { "tryptophan", 'W' },
	{ "glutamine", 'Q' }, { "threonine", 'T' }, { "histidine", 'H' }, { "aspartate", 'D' },
	{ "glutamate", 'E' }, { "arginine", 'R' }, { "cysteine", 'C' }, { "tyrosine", 'Y' },
	{ "leucine", 'L' }, { "alanine", 'A' }, { "glycine", 'G' }, { "proline", 'P' },
	{ "valine", 'V' }, { "lysine", 'K' }, { "serine", 'S' }, { "stop", '*' },
	{ "xaa", unknown_aa }, { "fs", unknown_aa }, { "x", unknown_aa },
};

std::string_view aa_one_to_three(char aa)
{
	for (auto& entry : g_aa_three)
		if (entry.aa == upper(aa))
			return entry.name;
	return "Xaa";
}

std::optional<char> aa_name_to_one(std::string_view name)
{
	name = strip(name);
	for (auto& entry : g_aa_three)
		if (iequals(entry.name, name))
			return entry.aa;
	for (auto& entry : g_aa_full)
		if (iequals(entry.name, name))
			return entry.aa;
	return std::nullopt;
}

std::optional<std::string> aa_names_to_one(std::string_view names)
{
	std::string aas;
	while (!names.empty()) {
		size_t matched = 0;
		for (auto& entry : g_aa_full) {
			if (names.size() >= entry.name.size() && iequals(names.substr(0, entry.name.size()), entry.name)) {
				aas.push_back(entry.aa);
				matched = entry.name.size();
				break;
			}
		}
		if (!matched && names.size() >= 3) {
			for (auto& entry : g_aa_three) {
				if (iequals(names.substr(0, 3), entry.name)) {
					aas.push_back(entry.aa);
					matched = 3;
					break;
				}
			}
		}
		if (!matched) {
			log_debug("Could not split \"{}\" into amino acid names", names);
			return std::nullopt;
		}
		names.remove_prefix(matched);
	}
	return aas;
}

END_NAMESPACE_VF
