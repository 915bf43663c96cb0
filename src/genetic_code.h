/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_GENETIC_CODE_H__
#define __VARIANT_FINDER_GENETIC_CODE_H__

#include "defines.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// Residue used for codons that are not three unambiguous nucleotides,
// and for frameshift markers ("fs") in mutant amino-acid tokens.
inline constexpr char unknown_aa = 'X';
inline constexpr char stop_aa    = '*';

// Standard genetic code. Case-insensitive, U is read as T.
char        translate_codon(std::string_view codon);
std::string translate(std::string_view dna);

// Codons for a one-letter residue, in TCAG order (TTT before TTC).
// Empty for residues without codons, e.g. 'X'.
const std::vector<std::string>& codons_for(char aa);

// "Arg" for 'R', "Ter" for '*', "Xaa" for anything else.
std::string_view aa_one_to_three(char aa);

// Accepts three-letter codes and full names, any case ("Arg", "GLUTAMIC ACID", "stop").
std::optional<char> aa_name_to_one(std::string_view name);

// Splits a run of concatenated names ("ArgGlyTer") into one-letter residues ("RG*").
std::optional<std::string> aa_names_to_one(std::string_view names);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_GENETIC_CODE_H__
