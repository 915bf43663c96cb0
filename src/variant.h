/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_VARIANT_H__
#define __VARIANT_FINDER_VARIANT_H__

#include "defines.h"
#include "vf_assert.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF
using std::string;
using std::string_view;
using std::vector;

enum class mut_type_t : uint8_t {
	sub,
	del,
	ins,
	dup,
	splicing,
	dbsnp,
};

enum class seq_type_t : uint8_t {
	prot,
	dna,    // coding DNA, positions as written in text (c. numbering)
	cds,    // coding DNA bound to a transcript accession
	rna,    // 0-based transcript positions
	intron,
	dbsnp,
};

const char* as_str(mut_type_t type);
const char* as_str(seq_type_t type);
std::optional<mut_type_t> as_mut_type(string_view s);
std::optional<seq_type_t> as_seq_type(string_view s);

/////////////////////////////////////////////////////////////////

// One regex match in the source text, [start, end) in bytes.
struct mention_t {
	string pat_name;
	int    start{};
	int    end{};

	bool operator==(const mention_t&) const = default;
};

/////////////////////////////////////////////////////////////////

// A mutation event on a (possibly still unknown) sequence.
//
// Extracted variants keep the position as written in the text in start,
// with end = start + length. Variants are never modified in place;
// re-projection onto another sequence goes through the with_* methods.
struct variant_desc {
	mut_type_t mut_type;
	seq_type_t seq_type;
	int        start;
	int        end;
	string     orig_seq;   // wild type; the rs id ("rs123") for dbSnp variants
	string     mut_seq;    // mutant; empty for deletions
	string     seq_id;     // accession; chromosome for dbSnp variants
	string     orig_str;   // text of the match
	int        offset;     // intron offset, e.g. -3 for c.1184-3A>T

	variant_desc(mut_type_t mut_type, seq_type_t seq_type, int start, int end,
	             string orig_seq, string mut_seq, string seq_id = {}, string orig_str = {}, int offset = 0);

	variant_desc with_seq_id(string new_seq_id) const;
	variant_desc with_seq_type(seq_type_t new_seq_type) const;
	variant_desc with_range(int new_start, int new_end) const;

	INLINE bool is_bound() const { return !seq_id.empty(); }

	// HGVS-like name: "p.R71G" while unbound, "NP_009225.1:p.Arg71Gly" once bound.
	// Substitutions, single-residue protein deletions and all coding-DNA kinds are
	// found again by the default patterns. Protein range deletions ("p.K10_12del")
	// and protein insertions ("p.10_11insQQ") keep only the residues that were
	// matched, so those names serve as deduplication keys only.
	string name() const;

	// Deduplication key; includes the sequence type so categories never merge.
	string key() const;

	string as_str() const;
};

// "NP_1:p.Arg71Gly", "NM_1:c.211A>G", "NM_1:r.230A>G", "NM_1:c.1184-3A>T".
// An empty seq_id drops the accession prefix.
string make_hgvs_str(seq_type_t seq_type, string_view seq_id, string_view orig_seq, int pos,
                     string_view mut_seq, int offset = 0);

/////////////////////////////////////////////////////////////////

// "The<<< R71G>>> BRCA1 mutation": the mention with up to max_context bytes on either side.
string get_snippet(string_view text, int start, int end, int max_context = 50);

// Per-mention output columns, in mention order.
struct mention_fields_t {
	vector<string> starts;
	vector<string> ends;
	vector<string> pat_names;
	vector<string> snippets;
	vector<string> texts;
};

mention_fields_t mentions_fields(const vector<mention_t>& mentions, string_view text);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_VARIANT_H__
