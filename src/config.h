/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_CONFIG_H__
#define __VARIANT_FINDER_CONFIG_H__

#include "defines.h"
#include "util.h"
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_VF

// Names of the files expected inside data_dir; each may also carry a .gz suffix.
namespace data_files {
	inline constexpr const char* patterns    = "regex.txt";
	inline constexpr const char* genes       = "entrez.tab";
	inline constexpr const char* refseq_info = "refseqInfo.tab";
	inline constexpr const char* sequences   = "seqs.fa";
	inline constexpr const char* alignments  = "refGenePsls.psl";
	inline constexpr const char* dbsnp       = "dbSnp.tab";
}

// Settings shared by every stage of the pipeline.
//
// Precedence, lowest first: defaults, a key=value .cfg file,
// the VARFINDER_* environment variables, then whatever the caller sets.
struct finder_config {
	std::string data_dir;
	bool        allow_two_bp_variants{false};   // back-translation may change two adjacent bases
	bool        shuffle{false};                 // shuffle reference sequences for background estimates
	unsigned    shuffle_seed{0};
	bool        insertion_rv{false};            // verdict for variants without wild-type sequence
	std::vector<std::string> seq_dbs{"refseq"}; // "refseq" and/or "oldRefseq", tried in order
	log_level_t log_level{log_level_t::warn};

	// Throws config_error for unknown keys and value_error for bad values.
	void set(std::string_view key, std::string_view value);

	// Reads key=value lines, '#' starts a comment.
	void load_cfg(const std::string& path);

	// VARFINDER_DATA_DIR and VARFINDER_LOG_LEVEL.
	void load_env();

	// Makes log_level the process-wide threshold.
	void apply_log_level() const;
};

// Defaults, then the .cfg file if cfg_path is non-empty, then the environment.
finder_config load_config(const std::string& cfg_path = {});

bool as_bool(std::string_view s);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_CONFIG_H__
