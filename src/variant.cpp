/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "variant.h"
#include "genetic_code.h"
#include "strutil.h"
#include "util.h"
#include <algorithm>
#include <iterator>
#include <utility>

BEGIN_NAMESPACE_VF

static const char* const g_mut_type_names[] = { "sub", "del", "ins", "dup", "splicing", "dbSnp" };
static const char* const g_seq_type_names[] = { "prot", "dna", "cds", "rna", "intron", "dbSnp" };

const char* as_str(mut_type_t type) { return g_mut_type_names[as_ordinal(type)]; }
const char* as_str(seq_type_t type) { return g_seq_type_names[as_ordinal(type)]; }

std::optional<mut_type_t> as_mut_type(string_view s)
{
	for (size_t i = 0; i < std::size(g_mut_type_names); ++i)
		if (s == g_mut_type_names[i])
			return scast<mut_type_t>(i);
	return std::nullopt;
}

std::optional<seq_type_t> as_seq_type(string_view s)
{
	for (size_t i = 0; i < std::size(g_seq_type_names); ++i)
		if (s == g_seq_type_names[i])
			return scast<seq_type_t>(i);
	return std::nullopt;
}

/////////////////////////////////////////////////////////////////

variant_desc::variant_desc(mut_type_t mut_type, seq_type_t seq_type, int start, int end,
                           string orig_seq, string mut_seq, string seq_id, string orig_str, int offset)
	: mut_type(mut_type)
	, seq_type(seq_type)
	, start(start)
	, end(end)
	, orig_seq(std::move(orig_seq))
	, mut_seq(std::move(mut_seq))
	, seq_id(std::move(seq_id))
	, orig_str(std::move(orig_str))
	, offset(offset)
{
	VF_CHECK(0 <= start && start < end, value, "Invalid {} variant range [{}, {}).", vf::as_str(mut_type), start, end);
	if (mut_type == mut_type_t::sub) {
		VF_CHECK(!this->orig_seq.empty() && this->orig_seq.size() == this->mut_seq.size()
		             && (int)this->orig_seq.size() == end - start,
		         value, "Substitution {}>{} does not span [{}, {}).", this->orig_seq, this->mut_seq, start, end);
	}
}

variant_desc variant_desc::with_seq_id(string new_seq_id) const
{
	variant_desc v{*this};
	v.seq_id = std::move(new_seq_id);
	return v;
}

variant_desc variant_desc::with_seq_type(seq_type_t new_seq_type) const
{
	variant_desc v{*this};
	v.seq_type = new_seq_type;
	return v;
}

variant_desc variant_desc::with_range(int new_start, int new_end) const
{
	return variant_desc{ mut_type, seq_type, new_start, new_end, orig_seq, mut_seq, seq_id, orig_str, offset };
}

static string position_str(int pos, int offset)
{
	return offset == 0 ? fmt::format("{}", pos) : fmt::format("{}{:+d}", pos, offset);
}

static string residues_str(string_view aas, bool three_letter)
{
	if (!three_letter)
		return string(aas);
	string s;
	for (char aa : aas)
		s += aa_one_to_three(aa);
	return s;
}

static const char* coord_prefix(seq_type_t seq_type)
{
	switch (seq_type) {
	case seq_type_t::prot: return "p.";
	case seq_type_t::rna:  return "r.";
	default:               return "c.";
	}
}

string make_hgvs_str(seq_type_t seq_type, string_view seq_id, string_view orig_seq, int pos,
                     string_view mut_seq, int offset)
{
	string desc = seq_id.empty() ? string{} : fmt::format("{}:", seq_id);
	if (seq_type == seq_type_t::prot)
		desc += fmt::format("p.{}{}{}", residues_str(orig_seq, true), pos, residues_str(mut_seq, true));
	else
		desc += fmt::format("{}{}{}>{}", coord_prefix(seq_type), position_str(pos, offset), orig_seq, mut_seq);
	return desc;
}

string variant_desc::name() const
{
	if (mut_type == mut_type_t::dbsnp)
		return orig_seq;

	const bool is_prot = seq_type == seq_type_t::prot;
	if (mut_type == mut_type_t::sub || mut_type == mut_type_t::splicing) {
		if (is_bound())
			return make_hgvs_str(seq_type, seq_id, orig_seq, start, mut_seq, offset);
		if (is_prot)
			return fmt::format("p.{}{}{}", orig_seq, start, mut_seq);
		return make_hgvs_str(seq_type, {}, orig_seq, start, mut_seq, offset);
	}

	// Bound protein variants use three-letter residues, like make_hgvs_str.
	const bool three = is_prot && is_bound();
	const string first = position_str(start, offset);
	const string range = end - start == 1 ? first : fmt::format("{}_{}", first, position_str(end - 1, offset));
	string body;
	switch (mut_type) {
	case mut_type_t::del:
		body = is_prot ? fmt::format("{}{}del", residues_str(orig_seq, three), range)
		               : fmt::format("{}del{}", range, orig_seq);
		break;
	case mut_type_t::ins:
		body = fmt::format("{}_{}ins{}", first, position_str(end, offset), residues_str(mut_seq, three));
		break;
	case mut_type_t::dup:
		body = fmt::format("{}dup{}", range, residues_str(orig_seq, three));
		break;
	default:
		VF_UNREACHABLE();
	}
	string prefix = is_bound() ? fmt::format("{}:", seq_id) : string{};
	return prefix + coord_prefix(seq_type) + body;
}

string variant_desc::key() const
{
	return fmt::format("{}:{}", vf::as_str(seq_type), name());
}

string variant_desc::as_str() const
{
	return fmt::format("variant_desc({},{},{}-{},{}>{},{},{})", vf::as_str(mut_type), vf::as_str(seq_type),
	                   start, end, orig_seq, mut_seq, seq_id.empty() ? "None" : seq_id, offset);
}

/////////////////////////////////////////////////////////////////

string get_snippet(string_view text, int start, int end, int max_context)
{
	VF_CHECK(0 <= start && start <= end && end <= (int)text.size(), index,
	         "Snippet range [{}, {}) outside of text of length {}.", start, end, text.size());
	const int left  = std::max(0, start - max_context);
	const int right = std::min((int)text.size(), end + max_context);
	string snippet = fmt::format("{}<<<{}>>>{}", text.substr(left, start - left), text.substr(start, end - start),
	                             text.substr(end, right - end));
	std::replace_if(snippet.begin(), snippet.end(), [](char c) { return c == '\n' || c == '\r' || c == '\t'; }, ' ');
	return snippet;
}

mention_fields_t mentions_fields(const vector<mention_t>& mentions, string_view text)
{
	mention_fields_t fields;
	for (const auto& m : mentions) {
		fields.starts.push_back(fmt::format("{}", m.start));
		fields.ends.push_back(fmt::format("{}", m.end));
		fields.pat_names.push_back(m.pat_name);
		string snippet = get_snippet(text, m.start, m.end);
		std::replace(snippet.begin(), snippet.end(), '|', ' ');
		fields.snippets.push_back(std::move(snippet));
		fields.texts.emplace_back(strip_chars(text.substr(m.start, m.end - m.start), "() -;,."));
	}
	return fields;
}

END_NAMESPACE_VF
