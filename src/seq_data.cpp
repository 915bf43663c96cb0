/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "seq_data.h"
#include "file.h"
#include "util.h"
#include <utility>

BEGIN_NAMESPACE_VF

seq_data::seq_data(gene_table genes,
                   std::unique_ptr<sequence_source> seqs,
                   std::unique_ptr<alignment_source> alignments,
                   std::unique_ptr<dbsnp_source> dbsnp)
	: _genes(std::move(genes))
	, _seqs(std::move(seqs))
	, _alignments(std::move(alignments))
	, _dbsnp(std::move(dbsnp))
{
	VF_CHECK(_seqs && _alignments && _dbsnp, value, "seq_data requires sequence, alignment and dbSNP sources.");
}

seq_data seq_data::open(const finder_config& config)
{
	const auto& dir = config.data_dir;
	VF_CHECK(!dir.empty(), config, "No data directory configured; set data_dir or VARFINDER_DATA_DIR.");

	gene_table genes;
	genes.load(find_data_file(dir, data_files::genes));

	auto seqs = std::make_unique<sequence_table>();
	seqs->load_fasta(find_data_file(dir, data_files::sequences));
	seqs->load_refseq_info(find_data_file(dir, data_files::refseq_info));

	auto alignments = std::make_unique<alignment_table>();
	alignments->load_psl(find_data_file(dir, data_files::alignments));

	auto dbsnp = std::make_unique<dbsnp_table>();
	dbsnp->load(find_data_file(dir, data_files::dbsnp));

	log_info("Reading of data from {} finished", dir);
	return seq_data{ std::move(genes), std::move(seqs), std::move(alignments), std::move(dbsnp) };
}

std::vector<std::string> seq_data::entrez_to_prot_db_ids(entrez_id_t entrez_id, std::string_view db) const
{
	if (db == "refseq")
		return _genes.refseq_prot_ids(entrez_id);
	if (db == "oldRefseq")
		return new_to_old_refseqs(_genes.refseq_prot_ids(entrez_id));
	VF_THROW(config, "Unknown sequence database \"{}\".", db);
}

std::vector<std::string> seq_data::entrez_to_coding_seq_db_ids(entrez_id_t entrez_id, std::string_view db) const
{
	if (db == "refseq")
		return _genes.refseq_ids(entrez_id);
	if (db == "oldRefseq")
		return new_to_old_refseqs(_genes.refseq_ids(entrez_id));
	VF_THROW(config, "Unknown sequence database \"{}\".", db);
}

std::optional<std::string> seq_data::lookup_db_snp(std::string_view chrom, int start, int end) const
{
	return _dbsnp->lookup_by_locus(chrom, start, end);
}

const std::vector<psl_t>& seq_data::get_refseq_psls(std::string_view refseq_id)
{
	const auto key = strip_version(refseq_id);
	if (auto it = _psl_cache.find(key); it != _psl_cache.end())
		return it->second;

	std::vector<psl_t> psls = _alignments->get_alignments(key, false);
	if (psls.empty())
		log_error("Could not find PSL for {}", key);
	for (auto& psl : psls)
		if (psl.q_strand() == '-')
			psl = psl.reverse_complement();
	return _psl_cache.emplace(std::string(key), std::move(psls)).first->second;
}

END_NAMESPACE_VF
