/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "sources.h"
#include "file.h"
#include "util.h"
#include <algorithm>
#include <charconv>
#include <iterator>
#include <system_error>
#include <utility>

BEGIN_NAMESPACE_VF

std::string_view strip_version(std::string_view acc)
{
	return acc.substr(0, acc.find('.'));
}

static long long as_rs_number(std::string_view s)
{
	if (s.starts_with("rs"))
		s.remove_prefix(2);
	long long val{};
	auto stop      = s.data() + s.size();
	auto [ptr, ec] = std::from_chars(s.data(), stop, val);
	VF_CHECK(!s.empty() && ptr == stop && ec == std::errc{} && val > 0, value, "Invalid rs id \"{}\".", s);
	return val;
}

/////////////////////////////////////////////////////////////////

std::optional<std::string_view> sequence_table::get_seq(std::string_view acc) const
{
	auto it = _seqs.find(acc);
	if (it == _seqs.end())
		return std::nullopt;
	return std::string_view{it->second};
}

std::optional<int> sequence_table::get_cds_start(std::string_view acc) const
{
	auto it = _cds_starts.find(acc);
	if (it == _cds_starts.end())
		return std::nullopt;
	return it->second;
}

std::optional<std::string> sequence_table::get_refseq_id(std::string_view prot_id) const
{
	auto it = _prot_to_refseq.find(prot_id);
	if (it == _prot_to_refseq.end())
		return std::nullopt;
	return it->second;
}

void sequence_table::add_seq(std::string acc, std::string seq)
{
	VF_CHECK(!acc.empty(), value, "Sequence without accession.");
	auto [it, inserted] = _seqs.try_emplace(std::move(acc), std::move(seq));
	VF_CHECK(inserted, value, "Duplicate sequence for {}.", it->first);
}

void sequence_table::add_refseq_info(std::string prot_id, std::string refseq_id, int cds_start)
{
	VF_CHECK(cds_start >= 0, value, "Negative CDS start {} for {}.", cds_start, refseq_id);
	_cds_starts[refseq_id] = cds_start;
	_prot_to_refseq[std::move(prot_id)] = std::move(refseq_id);
}

void sequence_table::load_fasta(const std::string& path)
{
	try {
		std::string acc;
		std::string seq;
		for (zline_reader lr{path}; !lr.done(); ++lr) {
			auto line = strip(lr.line());
			if (line.empty())
				continue;
			if (line[0] == '>') {
				if (!acc.empty())
					add_seq(std::exchange(acc, {}), std::exchange(seq, {}));
				line.remove_prefix(1);
				acc = std::string(line.substr(0, line.find_first_of(" \t")));
				VF_CHECK(!acc.empty(), value, "Empty FASTA header on line {}", lr.line_num());
			} else {
				VF_CHECK(!acc.empty(), value, "Sequence before first FASTA header on line {}", lr.line_num());
				seq += line;
			}
		}
		if (!acc.empty())
			add_seq(std::move(acc), std::move(seq));
	}
	VF_RETHROW("Could not load sequences from {}", path);
	log_info("Loaded {} sequences from {}", _seqs.size(), path);
}

void sequence_table::load_refseq_info(const std::string& path)
{
	try {
		std::vector<int> col_index;
		std::vector<std::string_view> cols;
		for (zline_reader lr{path}; !lr.done(); ++lr) {
			auto line = lr.line();
			if (strip(line).empty() || line.starts_with('#'))
				continue;
			split_view(line, '\t', cols);
			if (col_index.empty()) {
				col_index = find_columns(cols, { "refProt", "refSeq", "cdsStart" });
				continue;
			}
			VF_CHECK(cols.size() > (size_t)*std::max_element(col_index.begin(), col_index.end()), value,
			         "Expected {} columns on line {} but found {}", col_index.size(), lr.line_num(), cols.size());
			add_refseq_info(std::string(cols[col_index[0]]), std::string(cols[col_index[1]]),
			                as_int(cols[col_index[2]]) - 1);
		}
	}
	VF_RETHROW("Could not load transcript information from {}", path);
}

/////////////////////////////////////////////////////////////////

std::vector<psl_t> alignment_table::get_alignments(std::string_view acc, bool strip_version) const
{
	auto it = _psls.find(strip_version ? vf::strip_version(acc) : acc);
	if (it == _psls.end())
		return {};
	return it->second;
}

void alignment_table::add(psl_t psl)
{
	std::string key{strip_version(psl.q_name)};
	_psls[key].push_back(std::move(psl));
	++_num_psls;
}

void alignment_table::load_psl(const std::string& path)
{
	try {
		std::vector<std::string_view> cols;
		for (zline_reader lr{path}; !lr.done(); ++lr) {
			auto line = lr.line();
			if (strip(line).empty() || line.starts_with('#'))
				continue;
			split_view(line, '\t', cols);
			try {
				add(psl_t::from_row(cols));
			}
			VF_RETHROW("Invalid PSL record on line {}", lr.line_num());
		}
	}
	VF_RETHROW("Could not load alignments from {}", path);
	log_info("Loaded {} alignments from {}", _num_psls, path);
}

/////////////////////////////////////////////////////////////////

std::string dbsnp_table::locus_key(std::string_view chrom, int start, int end)
{
	return fmt::format("{}:{}-{}", chrom, start, end);
}

std::optional<std::string> dbsnp_table::lookup_by_locus(std::string_view chrom, int start, int end) const
{
	auto it = _rs_by_locus.find(locus_key(chrom, start, end));
	if (it == _rs_by_locus.end())
		return std::nullopt;
	return fmt::format("rs{}", it->second);
}

std::optional<snp_locus_t> dbsnp_table::lookup_locus_by_rs_id(std::string_view rs_id) const
{
	auto it = _loci.find(as_rs_number(rs_id));
	if (it == _loci.end())
		return std::nullopt;
	return it->second;
}

void dbsnp_table::add(std::string chrom, int start, int end, long long rs_id)
{
	VF_CHECK(0 <= start && start < end, value, "Invalid locus {}:{}-{} for rs{}.", chrom, start, end, rs_id);
	// First row wins for both directions of the lookup.
	_rs_by_locus.try_emplace(locus_key(chrom, start, end), rs_id);
	_loci.try_emplace(rs_id, snp_locus_t{ std::move(chrom), start, end });
}

void dbsnp_table::load(const std::string& path)
{
	try {
		string_view cols[5];
		for (zline_reader lr{path}; !lr.done(); ++lr) {
			auto line = lr.line();
			if (strip(line).empty() || line.starts_with('#'))
				continue;
			const int count = split_view(line, '\t', cols, (int)std::size(cols));
			VF_CHECK(count == 4, value, "Expected 4 columns on line {} but found {}", lr.line_num(), count);
			add(std::string(cols[0]), as_int(cols[1]), as_int(cols[2]), as_rs_number(cols[3]));
		}
	}
	VF_RETHROW("Could not load dbSNP loci from {}", path);
	log_info("Loaded {} dbSNP loci from {}", _loci.size(), path);
}

END_NAMESPACE_VF
