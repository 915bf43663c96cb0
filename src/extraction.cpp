/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "extraction.h"
#include "match_interpreter.h"
#include "strutil.h"
#include "util.h"
#include <utility>

BEGIN_NAMESPACE_VF

static bool is_overlapping(const pattern_match_t& match, const std::set<int>& excluded)
{
	auto it = excluded.lower_bound(match.start);
	return it != excluded.end() && *it < match.end;
}

variants_by_type_t find_variant_descriptions(const pattern_registry& registry,
                                             const dbsnp_source& dbsnp,
                                             std::string_view text,
                                             const std::set<int>& excluded)
{
	variants_by_type_t variants;
	for (auto seq_type : extracted_seq_types)
		variants[seq_type];

	string_map<string, std::pair<seq_type_t, size_t>> index_by_key;
	for (const auto& pattern : registry.patterns()) {
		for (const auto& match : pattern.find_all(text)) {
			if (is_overlapping(match, excluded)) {
				log_debug("Match \"{}\" overlaps an excluded position", match.str);
				continue;
			}
			auto variant = interpret_match(pattern, match, dbsnp);
			if (!variant)
				continue;

			mention_t mention{ pattern.name(), match.start, match.end };
			log_debug("Found variant {}, snippet {}", variant->as_str(), get_snippet(text, match.start, match.end, 60));

			auto& list = variants.at(variant->seq_type);
			auto [it, inserted] = index_by_key.try_emplace(variant->key(), variant->seq_type, list.size());
			if (inserted)
				list.push_back({ std::move(*variant), {} });
			variants.at(it->second.first)[it->second.second].mentions.push_back(std::move(mention));
		}
	}
	return variants;
}

END_NAMESPACE_VF
