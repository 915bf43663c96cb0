/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
// varfinder: extract variants from one document and ground them on candidate genes.
//
//   varfinder [options] [TEXT_FILE|-]
//
//   --data-dir DIR     reference data directory (overrides VARFINDER_DATA_DIR)
//   --config FILE      key=value settings file
//   --genes IDS        candidate entrez genes, comma-separated ("672,675/676")
//   --exclude RANGES   byte ranges to ignore, comma-separated ("10-15,40-44")
//   --doc-id ID        value of the varId column
//   --insertion-rv     accept variants without wild-type sequence on every gene
//   --log-level LEVEL  debug, info, warn, error or quiet
//
// Rows are written tab-separated to stdout, preceded by a header.

#include "config.h"
#include "file.h"
#include "strutil.h"
#include "util.h"
#include "variant_finder.h"
#include <cstdio>
#include <set>
#include <string>
#include <vector>

USING_NAMESPACE_VF

static void print_usage()
{
	println("usage: varfinder [--data-dir DIR] [--config FILE] [--genes IDS] [--exclude RANGES]\n"
	        "                 [--doc-id ID] [--insertion-rv] [--log-level LEVEL] [TEXT_FILE|-]");
}

static std::set<int> parse_excluded(std::string_view ranges)
{
	std::set<int> excluded;
	for (const auto& range : split_nonempty(ranges, ',')) {
		string_view lo_hi[2];
		const int count = split_view(range, '-', lo_hi, 2);
		const int lo = as_int(lo_hi[0]);
		const int hi = count == 2 ? as_int(lo_hi[1]) : lo + 1;
		VF_CHECK(0 <= lo && lo < hi, value, "Invalid excluded range \"{}\".", range);
		for (int i = lo; i < hi; ++i)
			excluded.insert(i);
	}
	return excluded;
}

static std::string read_text(const std::string& path)
{
	std::string text;
	try {
		for (line_reader lr{path}; !lr.done(); ++lr) {
			if (!text.empty())
				text += '\n';
			text += lr.line();
		}
	}
	VF_RETHROW("Could not read document {}", path);
	return text;
}

int main(int argc, char* argv[])
{
	try {
		std::string cfg_path;
		std::string data_dir;
		std::string log_level;
		std::string doc_id = "0";
		std::string text_path = stdin_path;
		std::vector<std::string> gene_ids;
		std::set<int> excluded;
		bool insertion_rv = false;

		for (int i = 1; i < argc; ++i) {
			const std::string_view arg = argv[i];
			auto next = [&]() -> std::string {
				VF_CHECK(i + 1 < argc, value, "Option {} needs a value.", arg);
				return argv[++i];
			};
			if (arg == "-h" || arg == "--help") {
				print_usage();
				return 0;
			} else if (arg == "--config") {
				cfg_path = next();
			} else if (arg == "--data-dir") {
				data_dir = next();
			} else if (arg == "--genes") {
				gene_ids = split_nonempty(next(), ',');
			} else if (arg == "--exclude") {
				excluded = parse_excluded(next());
			} else if (arg == "--doc-id") {
				doc_id = next();
			} else if (arg == "--insertion-rv") {
				insertion_rv = true;
			} else if (arg == "--log-level") {
				log_level = next();
			} else if (arg == "-") {
				text_path = stdin_path;
			} else if (arg.starts_with("-")) {
				print_usage();
				VF_THROW(value, "Unknown option {}.", arg);
			} else {
				text_path = std::string(arg);
			}
		}

		finder_config config = load_config(cfg_path);
		if (!data_dir.empty())
			config.data_dir = data_dir;
		if (!log_level.empty())
			config.log_level = as_log_level(log_level);
		if (insertion_rv)
			config.insertion_rv = true;
		config.apply_log_level();

		auto finder = variant_finder::open(config);
		const auto text = read_text(text_path);
		const auto rows = finder.ground_document(doc_id, text, gene_ids, excluded);

		write_tsv(stdout, rows);
		log_info("Wrote {} rows for document {}", rows.size(), doc_id);

	} catch (const std::exception& e) {
		nested_exception_print(e);
		return -1;
	}
	return 0;
}
