/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "config.h"
#include "file.h"
#include "strutil.h"
#include <cstdlib>
#include <iterator>

BEGIN_NAMESPACE_VF

bool as_bool(std::string_view s)
{
	const string v = lower(strip(s));
	if (v == "1" || v == "true" || v == "yes" || v == "on")
		return true;
	if (v == "0" || v == "false" || v == "no" || v == "off")
		return false;
	VF_THROW(value, "Expected a boolean but found \"{}\".", s);
}

void finder_config::set(std::string_view key, std::string_view value)
{
	key   = strip(key);
	value = strip(value);
	if (key == "data_dir") {
		data_dir = value;
	} else if (key == "allow_two_bp_variants") {
		allow_two_bp_variants = as_bool(value);
	} else if (key == "shuffle") {
		shuffle = as_bool(value);
	} else if (key == "shuffle_seed") {
		shuffle_seed = int_cast<unsigned>(as_int(value));
	} else if (key == "insertion_rv") {
		insertion_rv = as_bool(value);
	} else if (key == "seq_dbs") {
		auto dbs = split_nonempty(value, ',');
		VF_CHECK(!dbs.empty(), value, "seq_dbs must name at least one database.");
		for (const auto& db : dbs)
			VF_CHECK(db == "refseq" || db == "oldRefseq", config, "Unknown sequence database \"{}\".", db);
		seq_dbs = std::move(dbs);
	} else if (key == "log_level") {
		log_level = as_log_level(value);
	} else {
		VF_THROW(config, "Unknown configuration key \"{}\".", key);
	}
}

void finder_config::load_cfg(const std::string& path)
{
	try {
		for (line_reader lr{path}; !lr.done(); ++lr) {
			auto line = strip(lr.line());
			if (line.empty() || line.starts_with('#'))
				continue;
			string_view k_v[2];
			const auto  count = split_view(line, '=', k_v, (int)std::size(k_v));
			VF_CHECK(count == (int)std::size(k_v), config, "Invalid line in {}:{}", path, lr.line_num());
			set(k_v[0], k_v[1]);
		}
	}
	VF_RETHROW("Could not load configuration from {}", path);
}

void finder_config::load_env()
{
	if (const char* dir = getenv("VARFINDER_DATA_DIR"))
		data_dir = dir;
	if (const char* level = getenv("VARFINDER_LOG_LEVEL"))
		log_level = as_log_level(level);
}

void finder_config::apply_log_level() const
{
	set_log_level(log_level);
}

finder_config load_config(const std::string& cfg_path)
{
	finder_config config;
	if (!cfg_path.empty())
		config.load_cfg(cfg_path);
	config.load_env();
	return config;
}

END_NAMESPACE_VF
