/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "match_interpreter.h"
#include "genetic_code.h"
#include "strutil.h"
#include "util.h"
#include <limits>
#include <set>
#include <tuple>
#include <utility>

BEGIN_NAMESPACE_VF

// Gene names, satellites, cell lines (incl. Cellosaurus) and yeast strains.
static const std::set<std::tuple<char, int, char>> g_blacklist = {
	{ 'E', 2, 'F' }, { 'D', 11, 'S' }, { 'D', 12, 'S' }, { 'D', 13, 'S' }, { 'D', 14, 'S' }, { 'D', 15, 'S' },
	{ 'D', 16, 'S' }, { 'A', 84, 'M' }, { 'A', 84, 'P' }, { 'A', 94, 'P' }, { 'C', 127, 'I' }, { 'C', 86, 'M' },
	{ 'C', 86, 'P' }, { 'L', 283, 'R' }, { 'H', 96, 'V' }, { 'L', 5178, 'Y' }, { 'L', 89, 'M' }, { 'L', 89, 'P' },
	{ 'L', 929, 'S' }, { 'T', 89, 'G' }, { 'T', 47, 'D' }, { 'T', 84, 'M' }, { 'T', 98, 'G' }, { 'S', 288, 'C' },
	{ 'T', 229, 'C' }, { 'F', 442, 'A' }, { 'A', 101, 'D' }, { 'A', 2, 'H' }, { 'A', 375, 'M' }, { 'A', 375, 'P' },
	{ 'A', 529, 'L' }, { 'A', 6, 'L' }, { 'B', 10, 'R' }, { 'B', 10, 'S' }, { 'B', 1203, 'L' }, { 'C', 2, 'M' },
	{ 'C', 2, 'W' }, { 'B', 16, 'V' }, { 'B', 35, 'M' }, { 'B', 3, 'D' }, { 'B', 46, 'M' }, { 'C', 33, 'A' },
	{ 'C', 4, 'I' }, { 'C', 463, 'A' }, { 'C', 611, 'B' }, { 'C', 831, 'L' }, { 'D', 18, 'T' }, { 'D', 1, 'B' },
	{ 'D', 2, 'N' }, { 'D', 422, 'T' }, { 'D', 8, 'G' }, { 'F', 36, 'E' }, { 'F', 36, 'P' }, { 'F', 11, 'G' },
	{ 'F', 1, 'B' }, { 'F', 4, 'N' }, { 'G', 14, 'D' }, { 'G', 1, 'B' }, { 'G', 1, 'E' }, { 'H', 2, 'M' },
	{ 'H', 2, 'P' }, { 'H', 48, 'N' }, { 'H', 4, 'M' }, { 'H', 4, 'S' }, { 'H', 69, 'V' }, { 'C', 3, 'A' },
	{ 'C', 1, 'R' }, { 'H', 766, 'T' }, { 'I', 51, 'T' }, { 'K', 562, 'R' }, { 'L', 2, 'C' }, { 'M', 59, 'K' },
	{ 'M', 10, 'K' }, { 'M', 10, 'T' }, { 'M', 14, 'K' }, { 'M', 22, 'K' }, { 'M', 24, 'K' }, { 'M', 25, 'K' },
	{ 'M', 28, 'K' }, { 'M', 33, 'K' }, { 'M', 38, 'K' }, { 'M', 9, 'A' }, { 'M', 9, 'K' }, { 'H', 1755, 'A' },
	{ 'H', 295, 'A' }, { 'H', 295, 'R' }, { 'H', 322, 'M' }, { 'H', 460, 'M' }, { 'H', 510, 'A' }, { 'H', 676, 'B' },
	{ 'P', 3, 'D' }, { 'R', 201, 'C' }, { 'R', 2, 'C' }, { 'S', 16, 'Y' }, { 'S', 594, 'S' }, { 'N', 303, 'L' },
	{ 'N', 1003, 'L' }, { 'N', 2307, 'L' }, { 'N', 1108, 'L' }, { 'T', 27, 'A' }, { 'T', 88, 'M' }, { 'H', 5, 'D' },
	{ 'C', 1, 'A' }, { 'C', 1, 'D' }, { 'C', 2, 'D' }, { 'C', 2, 'G' }, { 'C', 2, 'H' }, { 'C', 2, 'N' },
	{ 'V', 79, 'B' }, { 'V', 9, 'P' }, { 'V', 10, 'M' }, { 'V', 9, 'M' }, { 'X', 16, 'C' },
};

bool is_blacklisted(std::string_view orig, int pos, std::string_view mut)
{
	if (orig.size() != 1 || mut.size() != 1)
		return false;
	const char o = orig[0];
	const char m = mut[0];
	if (g_blacklist.contains({ o, pos, m })) {
		log_debug("Variant {},{},{} is blacklisted", o, pos, m);
		return true;
	}
	if ((o == 'H' && pos < 80 && contains("ACDE", mut)) || (o == 'C' && pos < 80 && m == 'H')) {
		log_debug("Variant {},{},{} looks like a chemical symbol", o, pos, m);
		return true;
	}
	return false;
}

/////////////////////////////////////////////////////////////////

namespace {

// Positions are later widened by one and multiplied by three for codons.
constexpr int max_text_pos = std::numeric_limits<int>::max() / 3;

class field_reader {
public:
	field_reader(const compiled_pattern& pattern, const pattern_match_t& match): _pattern(pattern), _match(match) { }

	std::optional<int> number(group_t g) const
	{
		const auto& s = _match.group(g);
		if (!s)
			return std::nullopt;
		const int n = as_int(*s);
		VF_CHECK(n < max_text_pos, value, "Group {} value {} is out of range.", group_name(g), n);
		return n;
	}

	int required_number(group_t g) const
	{
		auto n = number(g);
		VF_CHECK(n, value, "Group {} did not take part in the match.", group_name(g));
		return *n;
	}

	position_fields_t positions() const
	{
		position_fields_t at{ number(group_t::pos), number(group_t::from_pos), number(group_t::to_pos) };
		if (!_pattern.is_coding())
			at.offset = signed_offset();
		return at;
	}

	int signed_offset() const
	{
		const auto& sign = _match.group(group_t::plus_minus);
		if (!sign)
			return 0;
		const int offset = required_number(group_t::offset);
		return *sign == "-" ? -offset : offset;
	}

	// First group present among groups, as one-letter residues or upper-case bases.
	std::string residues(std::initializer_list<group_t> groups) const
	{
		for (auto g : groups) {
			const auto& s = _match.group(g);
			if (s)
				return as_residues(g, *s);
		}
		return {};
	}

private:
	static std::string as_residues(group_t g, std::string_view s)
	{
		switch (g) {
		case group_t::orig_aa_long:
		case group_t::mut_aa_long: {
			auto aa = aa_name_to_one(s);
			VF_CHECK(aa, value, "Unknown amino acid \"{}\".", s);
			return std::string(1, *aa);
		}
		case group_t::orig_aas_long:
		case group_t::mut_aas_long: {
			auto aas = aa_names_to_one(s);
			VF_CHECK(aas, value, "Unknown amino acids \"{}\".", s);
			return *aas;
		}
		case group_t::mut_aa_short:
		case group_t::mut_aas_short: {
			// lower-case f is the start of a frameshift marker
			std::string aas(s);
			for (auto& c : aas)
				if (c == 'f')
					c = unknown_aa;
			return aas;
		}
		default:
			return upper(s);
		}
	}

	const compiled_pattern& _pattern;
	const pattern_match_t&  _match;
};

} // namespace

match_fields_t read_match_fields(const compiled_pattern& pattern, const pattern_match_t& match)
{
	const field_reader f{pattern, match};
	switch (pattern.mut_type()) {
	case mut_type_t::sub:
		return sub_fields_t{ f.positions(),
		                     f.residues({ group_t::orig_dna, group_t::orig_aa_long, group_t::orig_aa_short }),
		                     f.residues({ group_t::mut_dna, group_t::mut_aa_long, group_t::mut_aa_short }) };
	case mut_type_t::del:
		return del_fields_t{ f.positions(),
		                     f.residues({ group_t::orig_aa_short, group_t::orig_aa_long, group_t::orig_dna,
		                                  group_t::orig_dnas, group_t::orig_aas_long, group_t::orig_aas_short }) };
	case mut_type_t::ins:
		return ins_fields_t{ f.positions(),
		                     f.residues({ group_t::dnas, group_t::mut_aas_long, group_t::mut_aas_short }) };
	case mut_type_t::dup:
		return dup_fields_t{ f.positions(), f.residues({ group_t::orig_dna, group_t::orig_dnas }) };
	case mut_type_t::splicing:
		return splicing_fields_t{ f.required_number(group_t::pos), f.signed_offset(),
		                          f.residues({ group_t::orig_dna }), f.residues({ group_t::mut_dna }) };
	case mut_type_t::dbsnp:
		return dbsnp_fields_t{ std::string(*match.group(group_t::rs_id)) };
	}
	VF_UNREACHABLE();
}

/////////////////////////////////////////////////////////////////

namespace {

// Builds the variant for one field set; nullopt drops the match.
struct variant_builder {
	const compiled_pattern& pattern;
	const dbsnp_source&     dbsnp;
	std::string             orig_str;

	int start_of(const position_fields_t& at) const
	{
		VF_CHECK(at.pos || at.from_pos, value, "Match has no position.");
		return at.pos ? *at.pos : *at.from_pos;
	}

	variant_desc make(mut_type_t mut_type, int start, int end, std::string orig, std::string mut, int offset) const
	{
		return variant_desc{ mut_type, pattern.seq_type(), start, end, std::move(orig), std::move(mut), {}, orig_str, offset };
	}

	std::optional<variant_desc> operator()(const sub_fields_t& f) const
	{
		if (f.at.pos) {
			if (is_blacklisted(f.orig, *f.at.pos, f.mut))
				return std::nullopt;
			return make(mut_type_t::sub, *f.at.pos, *f.at.pos + 1, f.orig, f.mut, f.at.offset);
		}
		const int start = start_of(f.at);
		const int end   = f.at.to_pos ? *f.at.to_pos : start + (int)f.orig.size();
		return make(mut_type_t::sub, start, end, f.orig, f.mut, f.at.offset);
	}

	std::optional<variant_desc> operator()(const del_fields_t& f) const
	{
		VF_CHECK(!f.orig.empty(), value, "Deletion without deleted residues.");
		const int start = start_of(f.at);
		const int end   = f.at.to_pos ? *f.at.to_pos + 1 : start + 1;
		return make(mut_type_t::del, start, end, f.orig, {}, f.at.offset);
	}

	std::optional<variant_desc> operator()(const ins_fields_t& f) const
	{
		const int start = start_of(f.at);
		const int end   = f.at.to_pos ? *f.at.to_pos : start + 1;
		return make(mut_type_t::ins, start, end, {}, f.mut, f.at.offset);
	}

	std::optional<variant_desc> operator()(const dup_fields_t& f) const
	{
		VF_CHECK(!f.orig.empty(), value, "Duplication without duplicated bases.");
		const int len = (int)f.orig.size();
		int start, end;
		if (f.at.pos) {
			start = *f.at.pos;
			end   = start + 1;
		} else {
			VF_CHECK(f.at.from_pos && f.at.to_pos, value, "Duplication without a range.");
			start = *f.at.from_pos;
			end   = *f.at.to_pos;
			if (end - start != len && end - start == len - 1) {
				log_warn("Duplication {} gives an inclusive range, extending it by one", orig_str);
				++end;
			}
		}
		return make(mut_type_t::dup, start, end, f.orig, f.orig + f.orig, f.at.offset);
	}

	std::optional<variant_desc> operator()(const splicing_fields_t& f) const
	{
		return make(mut_type_t::splicing, f.pos, f.pos + 1, f.orig, f.mut, f.offset);
	}

	std::optional<variant_desc> operator()(const dbsnp_fields_t& f) const
	{
		auto locus = dbsnp.lookup_locus_by_rs_id(f.rs_id);
		if (!locus) {
			log_debug("rs{} is not in dbSNP, ignoring {}", f.rs_id, orig_str);
			return std::nullopt;
		}
		return variant_desc{ mut_type_t::dbsnp, seq_type_t::dbsnp, locus->start, locus->end,
		                     fmt::format("rs{}", f.rs_id), {}, locus->chrom, orig_str };
	}
};

} // namespace

std::optional<variant_desc> interpret_match(const compiled_pattern& pattern,
                                            const pattern_match_t& match,
                                            const dbsnp_source& dbsnp)
{
	try {
		const auto fields = read_match_fields(pattern, match);
		return std::visit(variant_builder{ pattern, dbsnp, std::string(strip(match.str)) }, fields);
	} catch (const value_error& e) {
		log_debug("Discarding match \"{}\" of pattern {}: {}", match.str, pattern.name(), e.what());
		return std::nullopt;
	}
}

END_NAMESPACE_VF
