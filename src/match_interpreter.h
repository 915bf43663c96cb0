/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_MATCH_INTERPRETER_H__
#define __VARIANT_FINDER_MATCH_INTERPRETER_H__

#include "pattern_registry.h"
#include "sources.h"
#include "variant.h"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

BEGIN_NAMESPACE_VF

// Position groups shared by the range-based mutation kinds.
struct position_fields_t {
	std::optional<int> pos;
	std::optional<int> from_pos;
	std::optional<int> to_pos;
	int                offset{};   // signed, only read by non-coding patterns
};

struct sub_fields_t      { position_fields_t at; std::string orig; std::string mut; };
struct del_fields_t      { position_fields_t at; std::string orig; };
struct ins_fields_t      { position_fields_t at; std::string mut; };
struct dup_fields_t      { position_fields_t at; std::string orig; };
struct splicing_fields_t { int pos{}; int offset{}; std::string orig; std::string mut; };
struct dbsnp_fields_t    { std::string rs_id; };   // digits only

using match_fields_t = std::variant<sub_fields_t, del_fields_t, ins_fields_t,
                                    dup_fields_t, splicing_fields_t, dbsnp_fields_t>;

// Collects the groups of a match into the field set of the pattern's mutation kind.
// Residues come back as upper-case one-letter codes; a frameshift marker becomes 'X'.
// Throws value_error for unknown amino-acid names or unparsable numbers.
match_fields_t read_match_fields(const compiled_pattern& pattern, const pattern_match_t& match);

// True for strings like T47D that name cell lines, genes or chemicals rather than variants.
bool is_blacklisted(std::string_view orig, int pos, std::string_view mut);

// The variant described by a match, or nullopt if the match is blacklisted,
// names an unknown rs id, or does not describe a valid variant.
std::optional<variant_desc> interpret_match(const compiled_pattern& pattern,
                                            const pattern_match_t& match,
                                            const dbsnp_source& dbsnp);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_MATCH_INTERPRETER_H__
