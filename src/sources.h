/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_SOURCES_H__
#define __VARIANT_FINDER_SOURCES_H__

#include "psl.h"
#include "strutil.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// Lookups on these interfaces report a miss through an empty optional or
// an empty vector. Implementations are read-only once loaded.

class sequence_source {
public:
	virtual ~sequence_source() = default;

	// Transcript or protein sequence by versioned accession, e.g. "NM_007294.3".
	virtual std::optional<std::string_view> get_seq(std::string_view acc) const = 0;

	// 0-based CDS start within a transcript.
	virtual std::optional<int> get_cds_start(std::string_view acc) const = 0;

	// Transcript that encodes a protein, e.g. "NP_009225.1" -> "NM_007294.3".
	virtual std::optional<std::string> get_refseq_id(std::string_view prot_id) const = 0;
};

class alignment_source {
public:
	virtual ~alignment_source() = default;

	// Alignments of a transcript to the genome, as stored (not reverse-complemented).
	virtual std::vector<psl_t> get_alignments(std::string_view acc, bool strip_version) const = 0;
};

struct snp_locus_t {
	std::string chrom;
	int         start{};
	int         end{};
};

class dbsnp_source {
public:
	virtual ~dbsnp_source() = default;

	// "rs80357382" for an exact genome interval match.
	virtual std::optional<std::string> lookup_by_locus(std::string_view chrom, int start, int end) const = 0;

	// Accepts "80357382" or "rs80357382".
	virtual std::optional<snp_locus_t> lookup_locus_by_rs_id(std::string_view rs_id) const = 0;
};

/////////////////////////////////////////////////////////////////

// Sequences from FASTA plus the protein-to-transcript table (refProt, refSeq, cdsStart).
class sequence_table : public sequence_source {
public:
	std::optional<std::string_view> get_seq(std::string_view acc) const override;
	std::optional<int>              get_cds_start(std::string_view acc) const override;
	std::optional<std::string>      get_refseq_id(std::string_view prot_id) const override;

	void add_seq(std::string acc, std::string seq);
	void add_refseq_info(std::string prot_id, std::string refseq_id, int cds_start);

	// FASTA records are keyed by the first word of the header line.
	void load_fasta(const std::string& path);

	// cdsStart is 1-based in the file.
	void load_refseq_info(const std::string& path);

	size_t num_seqs() const { return _seqs.size(); }

private:
	string_map<std::string, std::string> _seqs;
	string_map<std::string, int>         _cds_starts;
	string_map<std::string, std::string> _prot_to_refseq;
};

// PSL records keyed by query name without version.
class alignment_table : public alignment_source {
public:
	std::vector<psl_t> get_alignments(std::string_view acc, bool strip_version) const override;

	void add(psl_t psl);
	void load_psl(const std::string& path);

	size_t size() const { return _num_psls; }

private:
	string_map<std::string, std::vector<psl_t>> _psls;
	size_t _num_psls{};
};

// dbSNP loci from rows of chrom, start, end, numeric rs id.
class dbsnp_table : public dbsnp_source {
public:
	std::optional<std::string> lookup_by_locus(std::string_view chrom, int start, int end) const override;
	std::optional<snp_locus_t> lookup_locus_by_rs_id(std::string_view rs_id) const override;

	void add(std::string chrom, int start, int end, long long rs_id);
	void load(const std::string& path);

	size_t size() const { return _loci.size(); }

private:
	static std::string locus_key(std::string_view chrom, int start, int end);

	std::unordered_map<long long, snp_locus_t> _loci;
	string_map<std::string, long long>         _rs_by_locus;
};

// "NM_007294.3" -> "NM_007294"
std::string_view strip_version(std::string_view acc);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_SOURCES_H__
