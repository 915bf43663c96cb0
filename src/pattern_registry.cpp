/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "pattern_registry.h"
#include "file.h"
#include "strutil.h"
#include "util.h"
#include <re2/re2.h>
#include <iterator>
#include <map>
#include <utility>

BEGIN_NAMESPACE_VF

static const char* const g_group_names[] = {
	"pos", "fromPos", "toPos", "offset", "plusMinus",
	"origAaShort", "origAasShort", "origAaLong", "origAasLong",
	"mutAaShort", "mutAasShort", "mutAaLong", "mutAasLong",
	"dna", "dnas", "origDna", "origDnas", "mutDna",
	"fs", "intron", "rsId",
};
static_assert(std::size(g_group_names) == num_group);

const char* group_name(group_t group) { return g_group_names[as_ordinal(group)]; }

#define VF_AA_NAMES "CYS|ILE|SER|GLN|MET|ASN|PRO|LYS|ASP|THR|PHE|ALA|GLY|HIS|LEU|ARG|TRP|VAL|GLU|TYR|TER" \
	"|GLUTAMINE|GLUTAMIC ACID|LEUCINE|VALINE|ISOLEUCINE|LYSINE|ALANINE|GLYCINE|ASPARTATE|METHIONINE" \
	"|THREONINE|HISTIDINE|ASPARTIC ACID|ARGININE|ASPARAGINE|TRYPTOPHAN|PROLINE|PHENYLALANINE|CYSTEINE" \
	"|SERINE|GLUTAMATE|TYROSINE|STOP|XAA|X"

static const std::map<std::string, std::string, std::less<>> g_placeholders = {
	{ "sep",          R"((?:^|[:;\s\(\['"/,\-]))" },
	{ "fromPos",      "(?P<fromPos>[1-9][0-9]*)" },
	{ "toPos",        "(?P<toPos>[1-9][0-9]*)" },
	{ "pos",          "(?P<pos>[1-9][0-9]*)" },
	{ "offset",       "(?P<offset>[1-9][0-9]*)" },
	{ "plusMinus",    "(?P<plusMinus>[+-])" },
	{ "origAaShort",  "(?P<origAaShort>[CISQMNPKDTFAGHLRWVEYX])" },
	{ "origAasShort", "(?P<origAasShort>[CISQMNPKDTFAGHLRWVEYX]+)" },
	{ "skipAa",       "(?:" VF_AA_NAMES ")" },
	{ "origAaLong",   "(?P<origAaLong>" VF_AA_NAMES ")" },
	{ "origAasLong",  "(?P<origAasLong>(?:" VF_AA_NAMES ")+)" },
	{ "mutAaShort",   "(?P<mutAaShort>[fCISQMNPKDTFAGHLRWVEYX*])" },   // f tolerates "fs"
	{ "mutAasShort",  "(?P<mutAasShort>[fCISQMNPKDTFAGHLRWVEYX*]+)" },
	{ "mutAaLong",    "(?P<mutAaLong>" VF_AA_NAMES "|FS)" },
	{ "mutAasLong",   "(?P<mutAasLong>(?:" VF_AA_NAMES "|FS)+)" },
	{ "dna",          "(?P<dna>[actgACTG])" },
	{ "dnas",         "(?P<dnas>[actgACTG]+)" },
	{ "origDna",      "(?P<origDna>[actgACTG])" },
	{ "origDnas",     "(?P<origDnas>[actgACTG]+)" },
	{ "mutDna",       "(?P<mutDna>[actgACTGfs])" },
	{ "fs",           R"((?P<fs>(?:fs\*?[0-9]*)|fs\*|fs|)?)" },
	{ "intron",       "(?P<intron>[1-9][0-9]*)" },
	{ "rsId",         "(?P<rsId>[1-9][0-9]*)" },
	// ->, -->, U+2192, &gt;, OCR confusions of the arrow, and the U+FB02 ligature
	{ "rightArrow",   "(?:-*>|\xE2\x86\x92|-?&gt;|r|R|4|\xEF\xAC\x82)" },
	// no-break space, space, or nothing
	{ "sp",           "(?:\xC2\xA0| |)" },
};

#undef VF_AA_NAMES

std::string expand_placeholders(std::string_view tmpl)
{
	std::string out;
	for (size_t i = 0; i < tmpl.size(); ++i) {
		const char c = tmpl[i];
		if (c == '{' && i + 1 < tmpl.size() && tmpl[i+1] == '{') {
			out += '{';
			++i;
		} else if (c == '}' && i + 1 < tmpl.size() && tmpl[i+1] == '}') {
			out += '}';
			++i;
		} else if (c == '{') {
			const auto close = tmpl.find('}', i);
			VF_CHECK(close != std::string_view::npos, config, "Unterminated placeholder at offset {} in \"{}\".", i, tmpl);
			const auto name = tmpl.substr(i + 1, close - i - 1);
			const auto it = g_placeholders.find(name);
			VF_CHECK(it != g_placeholders.end(), config, "Unknown placeholder {{{}}} in \"{}\".", name, tmpl);
			out += it->second;
			i = close;
		} else {
			VF_CHECK(c != '}', config, "Unmatched '}}' at offset {} in \"{}\".", i, tmpl);
			out += c;
		}
	}
	return out;
}

/////////////////////////////////////////////////////////////////

compiled_pattern::compiled_pattern(const pattern_row_t& row)
{
	auto seq_type = as_seq_type(row.seq_type);
	VF_CHECK(seq_type, config, "Unknown sequence type \"{}\".", row.seq_type);
	auto mut_type = as_mut_type(row.mut_type);
	VF_CHECK(mut_type, config, "Unknown mutation type \"{}\".", row.mut_type);
	VF_CHECK(row.is_coding == "True" || row.is_coding == "False", config,
	         "Invalid value for isCoding: \"{}\".", row.is_coding);

	_seq_type       = *seq_type;
	_mut_type       = *mut_type;
	_is_coding      = row.is_coding == "True";
	_name           = row.pat_name.empty() ? row.pattern : row.pat_name;
	_regex          = expand_placeholders(row.pattern);
	_case_sensitive = !contains(row.pattern, "Long}");

	RE2::Options options;
	options.set_case_sensitive(_case_sensitive);
	options.set_log_errors(false);
	_re = std::make_unique<RE2>(_regex, options);
	VF_CHECK(_re->ok(), config, "Pattern \"{}\" does not compile: {}", _name, _re->error());

	_group_index.fill(-1);
	for (const auto& [group, index] : _re->NamedCapturingGroups()) {
		for (int g = 0; g < num_group; ++g)
			if (group == g_group_names[g])
				_group_index[g] = index;
	}
	validate_schema();
	log_debug("Compiled pattern {} ({} {}): {}", _name, as_str(_seq_type), as_str(_mut_type), _regex);
}

compiled_pattern::compiled_pattern(compiled_pattern&&) noexcept = default;
compiled_pattern& compiled_pattern::operator=(compiled_pattern&&) noexcept = default;
compiled_pattern::~compiled_pattern() = default;

void compiled_pattern::validate_schema() const
{
	auto any_of = [this](std::initializer_list<group_t> groups) {
		for (auto g : groups)
			if (defines(g))
				return true;
		return false;
	};

	VF_CHECK(_seq_type == seq_type_t::prot || _seq_type == seq_type_t::dna || _seq_type == seq_type_t::intron
	             || _seq_type == seq_type_t::dbsnp,
	         config, "Pattern {} has sequence type {}; expected prot, dna, intron or dbSnp.", _name, as_str(_seq_type));
	VF_CHECK((_seq_type == seq_type_t::dbsnp) == (_mut_type == mut_type_t::dbsnp), config,
	         "Pattern {} must use dbSnp as both sequence and mutation type, or neither.", _name);

	if (_mut_type == mut_type_t::dbsnp) {
		VF_CHECK(defines(group_t::rs_id), config, "dbSnp pattern {} needs an {{rsId}} group.", _name);
		return;
	}

	VF_CHECK(!defines(group_t::to_pos) || defines(group_t::from_pos), config, "Pattern {} has {{toPos}} without {{fromPos}}.", _name);
	VF_CHECK(defines(group_t::plus_minus) == defines(group_t::offset), config,
	         "Pattern {} must use {{plusMinus}} and {{offset}} together.", _name);

	const bool has_pos = any_of({ group_t::pos, group_t::from_pos });
	switch (_mut_type) {
	case mut_type_t::sub:
		VF_CHECK(has_pos, config, "Substitution pattern {} has no position group.", _name);
		VF_CHECK(any_of({ group_t::orig_aa_short, group_t::orig_aa_long, group_t::orig_dna }), config,
		         "Substitution pattern {} has no wild-type group.", _name);
		VF_CHECK(any_of({ group_t::mut_aa_short, group_t::mut_aa_long, group_t::mut_dna }), config,
		         "Substitution pattern {} has no mutant group.", _name);
		break;
	case mut_type_t::del:
		VF_CHECK(has_pos, config, "Deletion pattern {} has no position group.", _name);
		VF_CHECK(any_of({ group_t::orig_aa_short, group_t::orig_aa_long, group_t::orig_aas_short, group_t::orig_aas_long, group_t::orig_dna, group_t::orig_dnas }), config,
		         "Deletion pattern {} has no wild-type group.", _name);
		break;
	case mut_type_t::ins:
		VF_CHECK(has_pos, config, "Insertion pattern {} has no position group.", _name);
		break;
	case mut_type_t::dup:
		VF_CHECK(any_of({ group_t::orig_dna, group_t::orig_dnas }), config, "Duplication pattern {} has no wild-type group.", _name);
		VF_CHECK(defines(group_t::pos) || (defines(group_t::from_pos) && defines(group_t::to_pos)), config,
		         "Duplication pattern {} needs {{pos}} or both {{fromPos}} and {{toPos}}.", _name);
		break;
	case mut_type_t::splicing:
		VF_CHECK(defines(group_t::pos) && defines(group_t::plus_minus) && defines(group_t::offset) && defines(group_t::orig_dna) && defines(group_t::mut_dna), config,
		         "Splicing pattern {} needs {{pos}}, {{plusMinus}}, {{offset}}, {{origDna}} and {{mutDna}}.", _name);
		break;
	default:
		VF_UNREACHABLE();
	}
}

std::vector<pattern_match_t> compiled_pattern::find_all(std::string_view text) const
{
	std::vector<pattern_match_t> matches;
	const int num_subs = _re->NumberOfCapturingGroups() + 1;
	std::vector<re2::StringPiece> subs(num_subs);
	const re2::StringPiece input(text.data(), text.size());

	size_t pos = 0;
	while (pos <= text.size() && _re->Match(input, pos, text.size(), RE2::UNANCHORED, subs.data(), num_subs)) {
		pattern_match_t m;
		m.start = int_cast<int>(subs[0].data() - text.data());
		m.end   = m.start + int_cast<int>(subs[0].size());
		m.str   = text.substr(m.start, m.end - m.start);
		for (int g = 0; g < num_group; ++g) {
			const int index = _group_index[g];
			if (index >= 0 && subs[index].data() != nullptr)
				m.groups[g] = std::string_view(subs[index].data(), subs[index].size());
		}
		pos = m.end > m.start ? (size_t)m.end : (size_t)m.end + 1;
		matches.push_back(std::move(m));
	}
	return matches;
}

/////////////////////////////////////////////////////////////////

pattern_registry::pattern_registry(const std::vector<pattern_row_t>& rows)
{
	for (const auto& row : rows) {
		try {
			_patterns.emplace_back(row);
		} catch (const config_error& e) {
			log_warn("Skipping pattern \"{}\": {}", row.pattern, e.what());
			++_num_skipped;
		}
	}
	log_info("Compiled {} patterns, skipped {}", _patterns.size(), _num_skipped);
}

std::vector<pattern_row_t> pattern_registry::read_rows(const std::string& path)
{
	std::vector<pattern_row_t> rows;
	try {
		std::vector<int> col_index;
		std::vector<std::string_view> cols;
		for (zline_reader lr{path}; !lr.done(); ++lr) {
			auto line = lr.line();
			if (strip(line).empty() || line.starts_with('#'))
				continue;
			split_view(line, '\t', cols);
			if (col_index.empty()) {
				col_index = find_columns(cols, { "seqType", "mutType", "isCoding", "patName", "pat" });
				continue;
			}
			auto col = [&](int c) -> std::string {
				const int i = col_index[c];
				return i < (int)cols.size() ? std::string(cols[i]) : std::string{};
			};
			VF_CHECK(!col(4).empty(), value, "Empty pattern on line {}", lr.line_num());
			rows.push_back({ col(0), col(1), col(2), col(3), col(4) });
		}
		VF_CHECK(!col_index.empty(), value, "No header line");
	}
	VF_RETHROW("Could not read pattern table {}", path);
	return rows;
}

pattern_registry pattern_registry::from_file(const std::string& path)
{
	return pattern_registry{ read_rows(path) };
}

END_NAMESPACE_VF
