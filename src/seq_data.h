/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_SEQ_DATA_H__
#define __VARIANT_FINDER_SEQ_DATA_H__

#include "config.h"
#include "gene_table.h"
#include "sources.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// Genes, sequences, alignments and dbSNP loci for one reference organism.
//
// Not thread-safe: alignment lookups fill a cache. Workers that run in
// parallel must each open their own seq_data.
class seq_data {
	NOCOPY(seq_data)
public:
	seq_data(gene_table genes,
	         std::unique_ptr<sequence_source> seqs,
	         std::unique_ptr<alignment_source> alignments,
	         std::unique_ptr<dbsnp_source> dbsnp);
	seq_data(seq_data&&) = default;
	seq_data& operator=(seq_data&&) = default;

	// Loads every table from the data_files names inside config.data_dir.
	static seq_data open(const finder_config& config);

	const gene_table&   genes() const { return _genes; }
	const dbsnp_source& dbsnp() const { return *_dbsnp; }

	std::optional<std::string_view> get_seq(std::string_view acc) const { return _seqs->get_seq(acc); }
	std::optional<int>              get_cds_start(std::string_view acc) const { return _seqs->get_cds_start(acc); }
	std::optional<std::string>      get_refseq_id(std::string_view prot_id) const { return _seqs->get_refseq_id(prot_id); }

	std::optional<std::string> entrez_to_sym(std::string_view gene_id) const { return _genes.entrez_to_sym(gene_id); }

	// Accessions in sequence database db ("refseq" or "oldRefseq").
	std::vector<std::string> entrez_to_prot_db_ids(entrez_id_t entrez_id, std::string_view db) const;
	std::vector<std::string> entrez_to_coding_seq_db_ids(entrez_id_t entrez_id, std::string_view db) const;

	// "rs123" or nullopt.
	std::optional<std::string> lookup_db_snp(std::string_view chrom, int start, int end) const;

	// Genome alignments of a transcript with the version stripped, query strand always '+'.
	const std::vector<psl_t>& get_refseq_psls(std::string_view refseq_id);

private:
	gene_table                        _genes;
	std::unique_ptr<sequence_source>  _seqs;
	std::unique_ptr<alignment_source> _alignments;
	std::unique_ptr<dbsnp_source>     _dbsnp;
	string_map<std::string, std::vector<psl_t>> _psl_cache;
};

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_SEQ_DATA_H__
