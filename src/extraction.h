/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_EXTRACTION_H__
#define __VARIANT_FINDER_EXTRACTION_H__

#include "pattern_registry.h"
#include "sources.h"
#include "variant.h"
#include <map>
#include <set>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// A distinct variant and every place it was mentioned.
struct variant_mentions_t {
	variant_desc       variant;
	vector<mention_t>  mentions;
};

// Variants grouped by category: prot, dna, intron and dbSnp, each always present.
using variants_by_type_t = std::map<seq_type_t, vector<variant_mentions_t>>;

// Categories reported by find_variant_descriptions.
inline constexpr seq_type_t extracted_seq_types[] = {
	seq_type_t::prot, seq_type_t::dna, seq_type_t::intron, seq_type_t::dbsnp
};

// Runs every pattern over text and merges matches that describe the same variant.
// Matches covering any byte offset in excluded (e.g. gene names) are ignored.
// Variants and their mentions appear in the order they were first found.
variants_by_type_t find_variant_descriptions(const pattern_registry& registry,
                                             const dbsnp_source& dbsnp,
                                             std::string_view text,
                                             const std::set<int>& excluded = {});

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_EXTRACTION_H__
