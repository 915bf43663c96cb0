/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "testing.h"
#include "extraction.h"
#include "genetic_code.h"
#include "match_interpreter.h"
#include "pattern_registry.h"
#include "sources.h"
#include "variant.h"
#include <exception>
#include <set>
#include <string>
#include <vector>

USING_NAMESPACE_VF

using std::string;
using std::vector;

static const pattern_registry& test_registry()
{
	static const pattern_registry registry = pattern_registry::from_file(test_data_path("regex.txt"));
	return registry;
}

static dbsnp_table test_dbsnp()
{
	dbsnp_table dbsnp;
	dbsnp.add("chr17", 41256119, 41256120, 80357382);
	dbsnp.add("chr17", 41256200, 41256201, 1799966);
	return dbsnp;
}

static const variant_mentions_t* find_key(const variants_by_type_t& variants, seq_type_t seq_type, string_view key)
{
	for (const auto& v : variants.at(seq_type))
		if (v.variant.key() == key)
			return &v;
	return nullptr;
}

/////////////////////////////////////////////////////////////////

void expand_placeholders_test()
{
	VF_ASSERT(expand_placeholders("{pos}del") == "(?P<pos>[1-9][0-9]*)del");
	VF_ASSERT(expand_placeholders(R"(c\.)") == R"(c\.)");
	VF_ASSERT(expand_placeholders(R"(\x{{2192}})") == R"(\x{2192})");
	VF_ASSERT(expand_placeholders("{sp}") == "(?:\xC2\xA0| |)");
	VF_ASSERT_THROWS(config, expand_placeholders("{nope}"));
	VF_ASSERT_THROWS(config, expand_placeholders("{pos"));
	VF_ASSERT_THROWS(config, expand_placeholders("a}b"));
	VF_ASSERT(string(group_name(group_t::from_pos)) == "fromPos");
	VF_ASSERT(string(group_name(group_t::rs_id)) == "rsId");
}

void compiled_pattern_test()
{
	compiled_pattern short_sub{ { "prot", "sub", "True", "short", "{sep}{origAaShort}{pos}{mutAaShort}\\b" } };
	VF_ASSERT(short_sub.seq_type() == seq_type_t::prot);
	VF_ASSERT(short_sub.mut_type() == mut_type_t::sub);
	VF_ASSERT(short_sub.is_coding());
	VF_ASSERT(short_sub.case_sensitive());
	VF_ASSERT(short_sub.name() == "short");
	VF_ASSERT(short_sub.defines(group_t::pos));
	VF_ASSERT(!short_sub.defines(group_t::from_pos));

	compiled_pattern long_sub{ { "prot", "sub", "True", "", "{sep}{origAaLong}{pos}{mutAaLong}\\b" } };
	VF_ASSERT(!long_sub.case_sensitive());
	VF_ASSERT(long_sub.name() == "{sep}{origAaLong}{pos}{mutAaLong}\\b");

	compiled_pattern splicing{ { "intron", "splicing", "False", "", "c\\.{pos}{plusMinus}{offset}{origDna}>{mutDna}" } };
	VF_ASSERT(!splicing.is_coding());
}

void pattern_schema_test()
{
	auto compile = [](string seq_type, string mut_type, string pattern) {
		return compiled_pattern{ pattern_row_t{ seq_type, mut_type, "True", "", pattern } };
	};
	VF_ASSERT_THROWS(config, compile("cds", "sub", "{origDna}{pos}{mutDna}"));
	VF_ASSERT_THROWS(config, compile("prot", "swap", "{origAaShort}{pos}{mutAaShort}"));
	VF_ASSERT_THROWS(config, compile("prot", "sub", "{origAaShort}{pos}"));
	VF_ASSERT_THROWS(config, compile("prot", "sub", "{origAaShort}{mutAaShort}"));
	VF_ASSERT_THROWS(config, compile("prot", "del", "{pos}del"));
	VF_ASSERT_THROWS(config, compile("dna", "dup", "c\\.{fromPos}dup{origDnas}"));
	VF_ASSERT_THROWS(config, compile("dna", "del", "c\\.{toPos}del{origDnas}"));
	VF_ASSERT_THROWS(config, compile("intron", "splicing", "c\\.{pos}{origDna}>{mutDna}"));
	VF_ASSERT_THROWS(config, compile("dna", "sub", "c\\.{pos}{plusMinus}{origDna}>{mutDna}"));
	VF_ASSERT_THROWS(config, compile("dbSnp", "sub", "rs{rsId}"));
	VF_ASSERT_THROWS(config, compile("prot", "dbSnp", "rs{rsId}"));
	VF_ASSERT_THROWS(config, compile("dbSnp", "dbSnp", "rs{pos}"));
	VF_ASSERT_THROWS(config, compile("dna", "sub", "({pos}{origDna}>{mutDna}"));
	VF_ASSERT_THROWS(config, (compiled_pattern{ pattern_row_t{ "dna", "sub", "yes", "", "{pos}{origDna}>{mutDna}" } }));
}

void pattern_registry_test()
{
	vector<pattern_row_t> rows = {
		{ "dna", "sub", "True", "", "{pos}{origDna}>{mutDna}" },
		{ "prot", "sub", "True", "", "{origAaShort}{pos}" },
		{ "dbSnp", "dbSnp", "True", "rs", "rs{rsId}" },
		{ "prot", "ins", "True", "", "{unknown}" },
	};
	pattern_registry registry{ rows };
	VF_ASSERT(registry.size() == 2);
	VF_ASSERT(registry.num_skipped() == 2);
	VF_ASSERT(registry.patterns()[1].name() == "rs");

	const auto& file_registry = test_registry();
	VF_ASSERT(file_registry.size() == 20);
	VF_ASSERT(file_registry.num_skipped() == 0);
	VF_ASSERT(file_registry.patterns()[4].name() == "longArrow");

	VF_ASSERT_THROWS(value, pattern_registry::read_rows(test_data_path("entrez.tab")));
	VF_ASSERT_THROWS(file, pattern_registry::read_rows(test_data_path("missing.txt")));
}

void find_all_test()
{
	compiled_pattern pattern{ { "dna", "sub", "True", "", "{pos}{origDna}>{mutDna}" } };
	auto matches = pattern.find_all("1A>G, 22C>T");
	VF_ASSERT(matches.size() == 2);
	VF_ASSERT(matches[0].start == 0 && matches[0].end == 4);
	VF_ASSERT(matches[0].str == "1A>G");
	VF_ASSERT(*matches[0].group(group_t::pos) == "1");
	VF_ASSERT(*matches[0].group(group_t::mut_dna) == "G");
	VF_ASSERT(matches[1].start == 6 && matches[1].end == 11);
	VF_ASSERT(*matches[1].group(group_t::pos) == "22");
	VF_ASSERT(!matches[1].has(group_t::offset));
	VF_ASSERT(pattern.find_all("no variants here").empty());
}

void blacklist_test()
{
	VF_ASSERT(is_blacklisted("T", 47, "D"));
	VF_ASSERT(is_blacklisted("V", 79, "B"));
	VF_ASSERT(is_blacklisted("H", 20, "D"));
	VF_ASSERT(is_blacklisted("C", 5, "H"));
	VF_ASSERT(!is_blacklisted("H", 90, "D"));
	VF_ASSERT(!is_blacklisted("R", 71, "G"));
	VF_ASSERT(!is_blacklisted("TT", 47, "D"));
}

void read_match_fields_test()
{
	compiled_pattern splicing{ { "intron", "splicing", "False", "", "c\\.{pos}{plusMinus}{offset}{origDna}>{mutDna}" } };
	auto matches = splicing.find_all("c.1184-3a>t");
	VF_ASSERT(matches.size() == 1);
	auto fields = std::get<splicing_fields_t>(read_match_fields(splicing, matches[0]));
	VF_ASSERT(fields.pos == 1184);
	VF_ASSERT(fields.offset == -3);
	VF_ASSERT(fields.orig == "A" && fields.mut == "T");

	compiled_pattern long_sub{ { "prot", "sub", "True", "", "{origAaLong}{pos}{mutAaLong}" } };
	matches = long_sub.find_all("GLUTAMIC ACID12Lys");
	VF_ASSERT(matches.size() == 1);
	auto sub = std::get<sub_fields_t>(read_match_fields(long_sub, matches[0]));
	VF_ASSERT(sub.orig == "E" && sub.mut == "K");
	VF_ASSERT(sub.at.pos == 12 && !sub.at.from_pos);

	dbsnp_table dbsnp = test_dbsnp();
	auto variant = interpret_match(long_sub, matches[0], dbsnp);
	VF_ASSERT(variant);
	VF_ASSERT(variant->start == 12 && variant->end == 13);
	VF_ASSERT(variant->orig_str == "GLUTAMIC ACID12Lys");
}

void interpret_match_test()
{
	const auto dbsnp = test_dbsnp();
	const string text = "Frameshift p.R71fs, insertion p.K10_L11insQQ, deletion p.K10_L12del and c.10_12dupAGA.";
	auto variants = find_variant_descriptions(test_registry(), dbsnp, text);

	auto fs = find_key(variants, seq_type_t::prot, "prot:p.R71X");
	VF_ASSERT(fs);
	VF_ASSERT(fs->variant.mut_seq == "X");
	VF_ASSERT((fs->mentions[0] == mention_t{ test_registry().patterns()[0].name(), 10, 17 }));

	auto ins = find_key(variants, seq_type_t::prot, "prot:p.10_11insQQ");
	VF_ASSERT(ins);
	VF_ASSERT(ins->variant.mut_type == mut_type_t::ins);
	VF_ASSERT(ins->variant.start == 10 && ins->variant.end == 11);
	VF_ASSERT(ins->variant.orig_seq.empty() && ins->variant.mut_seq == "QQ");

	auto del = find_key(variants, seq_type_t::prot, "prot:p.K10_12del");
	VF_ASSERT(del);
	VF_ASSERT(del->variant.start == 10 && del->variant.end == 13);
	VF_ASSERT(del->variant.orig_seq == "K" && del->variant.mut_seq.empty());

	// An inclusive range "10_12" covering three bases is widened to [10, 13).
	auto dup = find_key(variants, seq_type_t::dna, "dna:c.10_12dupAGA");
	VF_ASSERT(dup);
	VF_ASSERT(dup->variant.start == 10 && dup->variant.end == 13);
	VF_ASSERT(dup->variant.mut_seq == "AGAAGA");
	VF_ASSERT(dup->variant.orig_str == "c.10_12dupAGA");

	VF_ASSERT(variants.at(seq_type_t::prot).size() == 3);
	VF_ASSERT(variants.at(seq_type_t::dna).size() == 1);
	VF_ASSERT(variants.at(seq_type_t::intron).empty());
	VF_ASSERT(variants.at(seq_type_t::dbsnp).empty());

	// Positions that cannot be widened or scaled to codons are dropped.
	variants = find_variant_descriptions(test_registry(), dbsnp,
		"The R2147483647G case, R99999999999G, R715827882G, R715827881G and c.2147483646_2147483647delAG.");
	VF_ASSERT(variants.at(seq_type_t::prot).size() == 1);
	VF_ASSERT(variants.at(seq_type_t::prot)[0].variant.key() == "prot:p.R715827881G");
	VF_ASSERT(variants.at(seq_type_t::dna).empty());
}

void find_variant_descriptions_test()
{
	const auto dbsnp = test_dbsnp();
	const auto& registry = test_registry();

	// Two patterns find the same variant; mentions follow pattern order.
	const string text = "The R71G BRCA1 mutation is really a p.R71G mutation";
	auto variants = find_variant_descriptions(registry, dbsnp, text);
	VF_ASSERT(variants.size() == 4);
	const auto& prot = variants.at(seq_type_t::prot);
	VF_ASSERT(prot.size() == 1);
	VF_ASSERT(prot[0].variant.name() == "p.R71G");
	VF_ASSERT(prot[0].variant.start == 71 && prot[0].variant.end == 72);
	VF_ASSERT(prot[0].variant.orig_str == "p.R71G");
	VF_ASSERT(prot[0].mentions.size() == 2);
	VF_ASSERT((prot[0].mentions[0] == mention_t{ registry.patterns()[0].name(), 35, 42 }));
	VF_ASSERT((prot[0].mentions[1] == mention_t{ registry.patterns()[1].name(), 3, 8 }));

	// Matches over excluded offsets are dropped.
	variants = find_variant_descriptions(registry, dbsnp, text, { 4, 5, 6, 7 });
	VF_ASSERT(variants.at(seq_type_t::prot).size() == 1);
	VF_ASSERT(variants.at(seq_type_t::prot)[0].mentions.size() == 1);
	VF_ASSERT(variants.at(seq_type_t::prot)[0].mentions[0].start == 35);

	variants = find_variant_descriptions(registry, dbsnp, text, { 36, 4 });
	VF_ASSERT(variants.at(seq_type_t::prot).empty());

	variants = find_variant_descriptions(registry, dbsnp, "");
	VF_ASSERT(variants.size() == 4);
	for (auto seq_type : extracted_seq_types)
		VF_ASSERT(variants.at(seq_type).empty());
}

void long_form_test()
{
	const auto dbsnp = test_dbsnp();
	const auto& registry = test_registry();
	const string text = "Carriers of (p.Arg71Gly), i.e. Arg 71 -> Gly or Arg71\xE2\x86\x92Gly.";
	auto variants = find_variant_descriptions(registry, dbsnp, text);
	const auto& prot = variants.at(seq_type_t::prot);
	VF_ASSERT(prot.size() == 1);
	VF_ASSERT(prot[0].variant.key() == "prot:p.R71G");
	VF_ASSERT(prot[0].mentions.size() == 3);
	VF_ASSERT(prot[0].mentions[0].start == 12 && prot[0].mentions[0].end == 24);
	VF_ASSERT((prot[0].mentions[1] == mention_t{ "longArrow", 30, 44 }));
	VF_ASSERT((prot[0].mentions[2] == mention_t{ "longArrow", 47, 59 }));
}

// Names built by variant_desc are found again as the same variant.
void rematch_name_test()
{
	const auto dbsnp = test_dbsnp();
	const vector<variant_desc> prot_vars = {
		{ mut_type_t::sub, seq_type_t::prot, 71, 72, "R", "G" },
		{ mut_type_t::sub, seq_type_t::prot, 5, 6, "W", "*" },
		{ mut_type_t::sub, seq_type_t::prot, 71, 72, "R", string(1, unknown_aa) },
		{ mut_type_t::del, seq_type_t::prot, 10, 11, "K", "" },
	};
	const vector<variant_desc> dna_vars = {
		{ mut_type_t::sub, seq_type_t::dna, 211, 212, "A", "G" },
		{ mut_type_t::del, seq_type_t::dna, 50, 53, "AGA", "" },
		{ mut_type_t::ins, seq_type_t::dna, 100, 101, "", "T" },
		{ mut_type_t::dup, seq_type_t::dna, 10, 13, "AGA", "AGAAGA" },
	};
	auto rematch = [&](const variant_desc& expected, const string& name) {
		auto variants = find_variant_descriptions(test_registry(), dbsnp, "Seen as " + name + " here.");
		const auto& found = variants.at(expected.seq_type);
		VF_ASSERT(found.size() == 1, "{} was found {} times", name, found.size());
		const auto& v = found[0].variant;
		VF_ASSERT(v.mut_type == expected.mut_type, "{}", name);
		VF_ASSERT(v.start == expected.start && v.end == expected.end, "{} gave {}", name, v.as_str());
		VF_ASSERT(v.orig_seq == expected.orig_seq && v.mut_seq == expected.mut_seq, "{} gave {}", name, v.as_str());
	};
	for (const auto& v : prot_vars) {
		rematch(v, v.name());
		rematch(v, v.with_seq_id("NP_1.1").name());
	}
	for (const auto& v : dna_vars)
		rematch(v, v.name());

	// Range deletions and insertions on proteins keep key-only names.
	auto variants = find_variant_descriptions(test_registry(), dbsnp, "Seen as p.K10_12del and p.10_11insQQ here.");
	VF_ASSERT(variants.at(seq_type_t::prot).empty());
}

void mixed_document_test()
{
	const auto dbsnp = test_dbsnp();
	const string text = "Patients carried c.211A>G and c.100-3A>T, plus c.50_52delAGA and rs80357382 or rs 1799966; T47D cells. rs999 is unknown.";
	auto variants = find_variant_descriptions(test_registry(), dbsnp, text);

	auto sub = find_key(variants, seq_type_t::dna, "dna:c.211A>G");
	VF_ASSERT(sub);
	VF_ASSERT(sub->variant.start == 211 && sub->variant.end == 212);
	VF_ASSERT(sub->mentions[0].start == 16 && sub->mentions[0].end == 25);

	auto del = find_key(variants, seq_type_t::dna, "dna:c.50_52delAGA");
	VF_ASSERT(del);
	VF_ASSERT(del->variant.start == 50 && del->variant.end == 53);

	auto splicing = find_key(variants, seq_type_t::intron, "intron:c.100-3A>T");
	VF_ASSERT(splicing);
	VF_ASSERT(splicing->variant.mut_type == mut_type_t::splicing);
	VF_ASSERT(splicing->variant.offset == -3);
	VF_ASSERT(splicing->variant.start == 100);

	const auto& snps = variants.at(seq_type_t::dbsnp);
	VF_ASSERT(snps.size() == 2);
	VF_ASSERT(snps[0].variant.name() == "rs80357382");
	VF_ASSERT(snps[0].variant.seq_id == "chr17");
	VF_ASSERT(snps[0].variant.start == 41256119 && snps[0].variant.end == 41256120);
	VF_ASSERT(snps[1].variant.name() == "rs1799966");
	VF_ASSERT(snps[1].variant.orig_str == "rs 1799966");

	// T47D is a cell line.
	VF_ASSERT(variants.at(seq_type_t::prot).empty());
}

void variant_desc_test()
{
	VF_ASSERT_THROWS(value, variant_desc(mut_type_t::sub, seq_type_t::prot, -1, 0, "R", "G"));
	VF_ASSERT_THROWS(value, variant_desc(mut_type_t::del, seq_type_t::dna, 5, 5, "A", ""));
	VF_ASSERT_THROWS(value, variant_desc(mut_type_t::sub, seq_type_t::dna, 5, 6, "AC", "G"));
	VF_ASSERT_THROWS(value, variant_desc(mut_type_t::sub, seq_type_t::dna, 5, 7, "A", "G"));

	const variant_desc prot{ mut_type_t::sub, seq_type_t::prot, 71, 72, "R", "G" };
	VF_ASSERT(!prot.is_bound());
	VF_ASSERT(prot.name() == "p.R71G");
	VF_ASSERT(prot.key() == "prot:p.R71G");
	VF_ASSERT(prot.with_seq_id("NP_009225.1").name() == "NP_009225.1:p.Arg71Gly");
	VF_ASSERT(prot.name() == "p.R71G");

	const variant_desc cds = prot.with_seq_type(seq_type_t::cds).with_range(211, 212);
	VF_ASSERT(cds.start == 211 && cds.orig_seq == "R");
	VF_ASSERT_THROWS(value, prot.with_range(3, 3));

	const variant_desc dna{ mut_type_t::sub, seq_type_t::cds, 211, 212, "A", "G", "NM_007294.3" };
	VF_ASSERT(dna.name() == "NM_007294.3:c.211A>G");
	VF_ASSERT(dna.with_seq_type(seq_type_t::rna).with_range(230, 231).name() == "NM_007294.3:r.230A>G");
	VF_ASSERT(dna.as_str() == "variant_desc(sub,cds,211-212,A>G,NM_007294.3,0)");

	VF_ASSERT(make_hgvs_str(seq_type_t::intron, "NM_1", "A", 1184, "T", -3) == "NM_1:c.1184-3A>T");
	VF_ASSERT(make_hgvs_str(seq_type_t::prot, "", "R*", 71, "G", 0) == "p.ArgTer71Gly");

	const variant_desc del{ mut_type_t::del, seq_type_t::prot, 10, 13, "K", "" };
	VF_ASSERT(del.with_seq_id("NP_1.1").name() == "NP_1.1:p.Lys10_12del");
	const variant_desc dna_del{ mut_type_t::del, seq_type_t::dna, 50, 51, "A", "" };
	VF_ASSERT(dna_del.name() == "c.50delA");

	VF_ASSERT(string(as_str(mut_type_t::dbsnp)) == "dbSnp");
	VF_ASSERT(string(as_str(seq_type_t::rna)) == "rna");
	VF_ASSERT(as_mut_type("splicing") == mut_type_t::splicing);
	VF_ASSERT(as_seq_type("dbSnp") == seq_type_t::dbsnp);
	VF_ASSERT(!as_seq_type("protein"));
}

void snippet_test()
{
	const string text = "The R71G BRCA1\tmutation";
	VF_ASSERT(get_snippet(text, 3, 8, 2) == "he<<< R71G>>> B");
	VF_ASSERT(get_snippet(text, 3, 8) == "The<<< R71G>>> BRCA1 mutation");
	VF_ASSERT(get_snippet(text, 0, 0, 3) == "<<<>>>The");
	VF_ASSERT_THROWS(index, get_snippet(text, 20, 40));

	auto fields = mentions_fields({ { "p1", 3, 8 }, { "p2", 9, 14 } }, text);
	VF_ASSERT((fields.starts == vector<string>{ "3", "9" }));
	VF_ASSERT((fields.ends == vector<string>{ "8", "14" }));
	VF_ASSERT((fields.pat_names == vector<string>{ "p1", "p2" }));
	VF_ASSERT((fields.texts == vector<string>{ "R71G", "BRCA1" }));
	VF_ASSERT(fields.snippets[1] == "The R71G <<<BRCA1>>> mutation");
}

int main()
{
	try {
		VF_RUN_TEST(expand_placeholders_test);
		VF_RUN_TEST(compiled_pattern_test);
		VF_RUN_TEST(pattern_schema_test);
		VF_RUN_TEST(pattern_registry_test);
		VF_RUN_TEST(find_all_test);
		VF_RUN_TEST(blacklist_test);
		VF_RUN_TEST(read_match_fields_test);
		VF_RUN_TEST(interpret_match_test);
		VF_RUN_TEST(find_variant_descriptions_test);
		VF_RUN_TEST(long_form_test);
		VF_RUN_TEST(rematch_name_test);
		VF_RUN_TEST(mixed_document_test);
		VF_RUN_TEST(variant_desc_test);
		VF_RUN_TEST(snippet_test);
	} catch (const std::exception& e) {
		nested_exception_print(e);
		return -1;
	}
	return 0;
}
