/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "variant_finder.h"
#include "file.h"
#include "psl.h"
#include "strutil.h"
#include "util.h"
#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <limits>

BEGIN_NAMESPACE_VF

variant_finder::variant_finder(pattern_registry registry, seq_data data, finder_config config)
	: _registry(std::move(registry))
	, _data(std::move(data))
	, _config(std::move(config))
	, _rng(_config.shuffle_seed)
{
	if (_registry.empty())
		log_warn("No usable patterns; no variants will be found");
}

variant_finder variant_finder::open(const finder_config& config)
{
	VF_CHECK(!config.data_dir.empty(), config, "No data directory configured; set data_dir or VARFINDER_DATA_DIR.");
	auto registry = pattern_registry::from_file(find_data_file(config.data_dir, data_files::patterns));
	return variant_finder{ std::move(registry), seq_data::open(config), config };
}

variants_by_type_t variant_finder::find_variant_descriptions(std::string_view text, const std::set<int>& excluded) const
{
	return vf::find_variant_descriptions(_registry, _data.dbsnp(), text, excluded);
}

/////////////////////////////////////////////////////////////////

bool variant_finder::is_seq_correct(std::string_view seq_id, const variant_desc& variant)
{
	if (seq_id.starts_with("NR_")) {
		log_info("Skipping noncoding sequence ID {}", seq_id);
		return false;
	}
	if (variant.mut_type == mut_type_t::ins && variant.orig_seq.empty())
		return _config.insertion_rv;

	// Text positions are 1-based.
	const int v_start = variant.start - 1;
	const int v_end   = variant.end - 1;
	const auto seq_view = _data.get_seq(seq_id);
	if (!seq_view) {
		log_debug("Sequence {} is not human or not available", seq_id);
		return false;
	}
	if (v_end > (int)seq_view->size()) {
		log_debug("Sequence {} is too short", seq_id);
		return false;
	}

	std::string seq{*seq_view};
	if (_config.shuffle)
		std::shuffle(seq.begin(), seq.end(), _rng);

	int cds_start = 0;
	if (variant.seq_type == seq_type_t::dna) {
		auto cds = _data.get_cds_start(seq_id);
		if (!cds) {
			log_debug("No CDS start for {}", seq_id);
			return false;
		}
		cds_start = *cds;
	}
	const int lo = v_start + cds_start;
	const int hi = v_end + cds_start;
	if (lo < 0 || hi > (int)seq.size())
		return false;

	const std::string_view found = std::string_view{seq}.substr(lo, hi - lo);
	if (iequals(found, variant.orig_seq)) {
		log_debug("Seq match: found {} at {}-{} in {}", variant.orig_seq, v_start, v_end, seq_id);
		return true;
	}
	log_debug("No seq match: need {} but found {} at {}-{} in {} (CDS start {})",
	          variant.orig_seq, upper(found), v_start, v_end, seq_id, cds_start);
	return false;
}

seq_check_t variant_finder::check_variant_against_sequence(const variant_desc& variant, std::string_view gene_id)
{
	for (auto entrez_id : split_entrez_ids(gene_id)) {
		log_debug("Trying to ground {} to entrez gene {}", variant.as_str(), entrez_id);
		for (const auto& db : _config.seq_dbs) {
			std::vector<std::string> seq_ids;
			if (variant.seq_type == seq_type_t::prot)
				seq_ids = _data.entrez_to_prot_db_ids(entrez_id, db);
			else if (variant.seq_type == seq_type_t::dna || variant.seq_type == seq_type_t::intron)
				seq_ids = _data.entrez_to_coding_seq_db_ids(entrez_id, db);
			else {
				log_debug("{} is neither a DNA nor a protein variant", variant.as_str());
				continue;
			}

			seq_check_t found{ db, {} };
			for (const auto& seq_id : seq_ids)
				if (is_seq_correct(seq_id, variant))
					found.seq_ids.push_back(seq_id);
			if (!found.seq_ids.empty())
				return found;
		}
	}
	return {};
}

std::vector<bed_t> variant_finder::map_to_genome(const std::vector<variant_desc>& rna_vars, std::string_view name)
{
	std::vector<bed_t> beds;
	for (const auto& rna_var : rna_vars) {
		log_debug("Mapping {}:{}-{} (offset {}) to genome", rna_var.seq_id, rna_var.start, rna_var.end, rna_var.offset);
		const auto& psls = _data.get_refseq_psls(rna_var.seq_id);
		if (psls.empty()) {
			log_warn("No mapping for {}, skipping variant", rna_var.seq_id);
			continue;
		}
		if (psls.size() > 1)
			log_warn("{} maps to multiple places, using only first one", rna_var.seq_id);

		auto bed = map_query(psls.front(), rna_var.start, rna_var.end, name);
		if (!bed) {
			log_debug("Found alignment of {} but nothing was mapped", rna_var.seq_id);
			continue;
		}
		beds.push_back(bed->shift(rna_var.offset));
		log_debug("Got bed: {}", beds.back().as_str());
	}
	return beds;
}

std::vector<std::string> variant_finder::bed_to_rs_ids(const std::vector<bed_t>& beds) const
{
	std::vector<std::string> rs_ids;
	for (const auto& bed : beds) {
		auto rs_id = _data.lookup_db_snp(bed.chrom, bed.start, bed.end);
		if (!rs_id)
			log_debug("{}:{}-{} does not map to any dbSNP", bed.chrom, bed.start, bed.end);
		rs_ids.push_back(rs_id ? std::move(*rs_id) : "na");
	}
	return rs_ids;
}

/////////////////////////////////////////////////////////////////

bool variant_finder::try_ground_on_gene(ground_result_t& result, std::string_view doc_id, std::string_view text,
                                        const variant_desc& variant, const std::vector<mention_t>& mentions,
                                        const std::vector<variant_mentions_t>& snp_mentions, const std::string& gene_id)
{
	const auto sym = _data.entrez_to_sym(gene_id);
	if (!sym) {
		log_warn("No symbol for entrez gene {}. Skipping gene.", gene_id);
		return false;
	}
	const auto check = check_variant_against_sequence(variant, gene_id);
	if (check.seq_ids.empty()) {
		log_debug("{} does not match any sequence of {}", variant.name(), *sym);
		return false;
	}

	std::vector<variant_desc> prot_vars, coding_vars, rna_vars;
	if (variant.seq_type == seq_type_t::prot) {
		for (const auto& prot_id : check.seq_ids)
			prot_vars.push_back(variant.with_seq_id(prot_id));
		auto mapped = map_to_coding_and_rna(_data, prot_vars, _config);
		if (!mapped)
			return false;
		coding_vars = std::move(mapped->coding);
		rna_vars    = std::move(mapped->rna);
	} else {
		for (const auto& seq_id : check.seq_ids) {
			const auto cds_start = _data.get_cds_start(seq_id);
			if (!cds_start)
				continue;
			const int shift = *cds_start + coding_to_rna_shift;
			coding_vars.push_back(variant.with_seq_id(seq_id).with_seq_type(seq_type_t::cds));
			rna_vars.push_back(variant.with_seq_id(seq_id).with_seq_type(seq_type_t::rna)
			                       .with_range(variant.start + shift, variant.end + shift));
		}
	}
	const auto beds = map_to_genome(rna_vars, doc_id);
	log_info("{} on {}: {} protein, {} coding, {} RNA variants, {} beds", variant.name(), *sym,
	         prot_vars.size(), coding_vars.size(), rna_vars.size(), beds.size());

	const auto rs_ids   = bed_to_rs_ids(beds);
	const auto snp_refs = get_snp_mentions(rs_ids, snp_mentions);
	for (const auto& [rs_id, rs_mentions] : snp_refs)
		result.mapped_rs_ids.push_back(rs_id);

	result.grounded.push_back(seq_variant_data::grounded(doc_id, variant, prot_vars, coding_vars, rna_vars, beds,
	                                                     gene_id, *sym, rs_ids, snp_refs, mentions, text));
	result.beds.insert(result.beds.end(), beds.begin(), beds.end());
	return true;
}

ground_result_t variant_finder::ground_variant(std::string_view doc_id,
                                               std::string_view text,
                                               const variant_desc& variant,
                                               const std::vector<mention_t>& mentions,
                                               const std::vector<variant_mentions_t>& snp_mentions,
                                               const std::vector<std::string>& gene_ids)
{
	log_debug("Grounding {} onto {} genes", variant.as_str(), gene_ids.size());
	ground_result_t result;
	bool success = false;
	if (variant.seq_type == seq_type_t::prot || variant.seq_type == seq_type_t::dna) {
		for (const auto& gene_id : gene_ids) {
			try {
				success |= try_ground_on_gene(result, doc_id, text, variant, mentions, snp_mentions, gene_id);
			} catch (const consistency_error& e) {
				log_warn("Could not ground {} on gene {}: {}", variant.name(), gene_id, e.what());
			} catch (const value_error& e) {
				log_warn("Could not ground {} on gene {}: {}", variant.name(), gene_id, e.what());
			}
		}
	} else {
		log_debug("{} variants are not grounded", as_str(variant.seq_type));
	}

	if (!success)
		result.ungrounded = seq_variant_data::ungrounded(variant.seq_type, as_str(variant.mut_type), mentions, text);
	result.unmapped_snps = unmapped_snp_records(snp_mentions, result.mapped_rs_ids, text);
	return result;
}

std::vector<seq_variant_data> variant_finder::ground_document(std::string_view doc_id,
                                                              std::string_view text,
                                                              const std::vector<std::string>& gene_ids,
                                                              const std::set<int>& excluded)
{
	const auto variants = find_variant_descriptions(text, excluded);
	const auto& snp_mentions = variants.at(seq_type_t::dbsnp);

	std::vector<seq_variant_data> rows;
	std::vector<std::string> mapped_rs_ids;
	for (auto seq_type : { seq_type_t::prot, seq_type_t::dna, seq_type_t::intron }) {
		for (const auto& [variant, mentions] : variants.at(seq_type)) {
			auto result = ground_variant(doc_id, text, variant, mentions, snp_mentions, gene_ids);
			for (auto& row : result.grounded)
				rows.push_back(std::move(row));
			if (result.ungrounded)
				rows.push_back(std::move(*result.ungrounded));
			mapped_rs_ids.insert(mapped_rs_ids.end(), result.mapped_rs_ids.begin(), result.mapped_rs_ids.end());
		}
	}
	for (auto& row : unmapped_snp_records(snp_mentions, mapped_rs_ids, text))
		rows.push_back(std::move(row));
	return rows;
}

std::optional<symbol_grounding_t> variant_finder::ground_symbol_variant(std::string_view sym, std::string_view prot_desc)
{
	const auto variants = find_variant_descriptions(prot_desc);
	const auto& prot = variants.at(seq_type_t::prot);
	if (prot.empty()) {
		log_debug("No protein variant in \"{}\"", prot_desc);
		return std::nullopt;
	}
	const auto& variant = prot.front().variant;

	seq_check_t check;
	for (auto entrez_id : _data.genes().map_sym_to_entrez(sym)) {
		check = check_variant_against_sequence(variant, fmt::format("{}", entrez_id));
		if (!check.seq_ids.empty())
			break;
	}
	if (check.seq_ids.empty()) {
		log_debug("{} does not match any protein of {}", variant.name(), sym);
		return std::nullopt;
	}

	std::vector<variant_desc> prot_vars;
	for (const auto& prot_id : check.seq_ids)
		prot_vars.push_back(variant.with_seq_id(prot_id));
	auto mapped = map_to_coding_and_rna(_data, prot_vars, _config);
	if (!mapped)
		return std::nullopt;

	symbol_grounding_t result;
	result.beds   = map_to_genome(mapped->rna, fmt::format("{}:{}", sym, strip(prot_desc)));
	result.coding = std::move(mapped->coding);
	result.rna    = std::move(mapped->rna);
	return result;
}

/////////////////////////////////////////////////////////////////

rs_mentions_t get_snp_mentions(const std::vector<std::string>& mapped_rs_ids,
                               const std::vector<variant_mentions_t>& snp_variants)
{
	rs_mentions_t result;
	for (const auto& [variant, mentions] : snp_variants) {
		const auto& rs_id = variant.orig_seq;
		if (rs_id == "na" || std::find(mapped_rs_ids.begin(), mapped_rs_ids.end(), rs_id) == mapped_rs_ids.end())
			continue;
		auto it = std::find_if(result.begin(), result.end(), [&](const auto& item) { return item.first == rs_id; });
		if (it == result.end()) {
			result.emplace_back(rs_id, std::vector<mention_t>{});
			it = std::prev(result.end());
		}
		it->second.insert(it->second.end(), mentions.begin(), mentions.end());
	}
	return result;
}

std::vector<seq_variant_data> unmapped_snp_records(const std::vector<variant_mentions_t>& snp_variants,
                                                   const std::vector<std::string>& mapped_rs_ids,
                                                   std::string_view text)
{
	std::vector<seq_variant_data> records;
	for (const auto& [variant, mentions] : snp_variants) {
		if (std::find(mapped_rs_ids.begin(), mapped_rs_ids.end(), variant.orig_seq) != mapped_rs_ids.end())
			continue;
		records.push_back(seq_variant_data::ungrounded(seq_type_t::dbsnp, "dbSnp", mentions, text));
	}
	return records;
}

std::optional<std::string> find_closest_gene_mention(const std::vector<mention_t>& mentions,
                                                     const std::vector<gene_mentions_t>& genes)
{
	std::optional<std::string> closest;
	int closest_distance = std::numeric_limits<int>::max();
	for (const auto& mention : mentions) {
		for (const auto& gene : genes) {
			for (auto [start, end] : gene.spans) {
				const int distance = std::min(std::abs(start - mention.start), std::abs(end - mention.end));
				if (distance < closest_distance) {
					closest_distance = distance;
					closest = gene.gene_id;
				}
			}
		}
	}
	return closest;
}

END_NAMESPACE_VF
