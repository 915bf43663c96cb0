/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_PATTERN_REGISTRY_H__
#define __VARIANT_FINDER_PATTERN_REGISTRY_H__

#include "util.h"
#include "variant.h"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2 { class RE2; }

BEGIN_NAMESPACE_VF

// Named capture groups that pattern templates can produce through placeholders.
enum class group_t : uint8_t {
	pos,
	from_pos,
	to_pos,
	offset,
	plus_minus,
	orig_aa_short,
	orig_aas_short,
	orig_aa_long,
	orig_aas_long,
	mut_aa_short,
	mut_aas_short,
	mut_aa_long,
	mut_aas_long,
	dna,
	dnas,
	orig_dna,
	orig_dnas,
	mut_dna,
	fs,
	intron,
	rs_id,
	num_group
};

inline constexpr int num_group = as_ordinal(group_t::num_group);

// Group name as used in templates and in (?P<name>...), e.g. "fromPos".
const char* group_name(group_t group);

// Replaces each {placeholder} in a pattern template with its regular expression.
// "{{" and "}}" produce literal braces. Throws config_error on unknown placeholders.
std::string expand_placeholders(std::string_view pattern_template);

/////////////////////////////////////////////////////////////////

// One row of the pattern table, as text.
struct pattern_row_t {
	std::string seq_type;
	std::string mut_type;
	std::string is_coding;   // "True" or "False"
	std::string pat_name;    // defaults to the template
	std::string pattern;     // template with {placeholders}
};

// One regex match, with the catalog groups that took part in it.
struct pattern_match_t {
	int start{};
	int end{};
	std::string_view str;
	std::array<std::optional<std::string_view>, num_group> groups;

	INLINE const std::optional<std::string_view>& group(group_t g) const { return groups[as_ordinal(g)]; }
	INLINE bool has(group_t g) const { return group(g).has_value(); }
};

// A compiled pattern whose named groups were checked against its mutation kind.
class compiled_pattern {
public:
	// Throws config_error when the row cannot be used.
	explicit compiled_pattern(const pattern_row_t& row);
	compiled_pattern(compiled_pattern&&) noexcept;
	compiled_pattern& operator=(compiled_pattern&&) noexcept;
	~compiled_pattern();

	seq_type_t         seq_type()  const { return _seq_type; }
	mut_type_t         mut_type()  const { return _mut_type; }
	bool               is_coding() const { return _is_coding; }
	const std::string& name()      const { return _name; }
	const std::string& regex()     const { return _regex; }
	bool               case_sensitive() const { return _case_sensitive; }
	bool               defines(group_t g) const { return _group_index[as_ordinal(g)] >= 0; }

	// Successive non-overlapping matches, left to right.
	std::vector<pattern_match_t> find_all(std::string_view text) const;

private:
	void validate_schema() const;

	seq_type_t  _seq_type;
	mut_type_t  _mut_type;
	bool        _is_coding;
	bool        _case_sensitive;
	std::string _name;
	std::string _regex;
	std::unique_ptr<re2::RE2> _re;
	std::array<int, num_group> _group_index;   // capture index per group, -1 if not defined
};

/////////////////////////////////////////////////////////////////

// The ordered set of compiled patterns. Read-only once built and
// shared by every document processed with it.
class pattern_registry {
	NOCOPY(pattern_registry)
public:
	pattern_registry() = default;
	pattern_registry(pattern_registry&&) = default;
	pattern_registry& operator=(pattern_registry&&) = default;

	// Rows that fail to compile are logged and skipped.
	explicit pattern_registry(const std::vector<pattern_row_t>& rows);

	// Tab-separated table with a header naming seqType, mutType, isCoding, patName, pat.
	static pattern_registry from_file(const std::string& path);
	static std::vector<pattern_row_t> read_rows(const std::string& path);

	const std::vector<compiled_pattern>& patterns() const { return _patterns; }
	size_t size()  const { return _patterns.size(); }
	bool   empty() const { return _patterns.empty(); }
	size_t num_skipped() const { return _num_skipped; }

private:
	std::vector<compiled_pattern> _patterns;
	size_t _num_skipped{};
};

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_PATTERN_REGISTRY_H__
