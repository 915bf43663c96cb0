/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __VARIANT_FINDER_GENE_TABLE_H__
#define __VARIANT_FINDER_GENE_TABLE_H__

#include "strutil.h"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

BEGIN_NAMESPACE_VF

using entrez_id_t = int;

// Entrez genes with their symbol, transcript and protein accessions.
class gene_table {
public:
	struct gene_t {
		entrez_id_t         entrez_id{};
		std::string         sym;
		std::vector<string> refseq_ids;        // NM_/NR_ accessions, versioned
		std::vector<string> refseq_prot_ids;   // NP_ accessions, versioned
	};

	void add(gene_t gene);

	// Columns entrezId, sym, refseqIds, refseqProtIds; id lists are comma-separated.
	void load(const std::string& path);

	// Accepts "672" or "672/675"; only the first id of a list is resolved.
	std::optional<std::string> entrez_to_sym(std::string_view gene_id) const;

	// Entrez ids of a symbol in table order; empty if unknown.
	const std::vector<entrez_id_t>& map_sym_to_entrez(std::string_view sym) const;

	// Empty for unknown or non-coding genes.
	const std::vector<string>& refseq_ids(entrez_id_t entrez_id) const;
	const std::vector<string>& refseq_prot_ids(entrez_id_t entrez_id) const;

	size_t size() const { return _genes.size(); }

private:
	const gene_t* find(entrez_id_t entrez_id) const;

	std::vector<gene_t>                         _genes;
	std::unordered_map<entrez_id_t, size_t>     _index;
	string_map<std::string, std::vector<entrez_id_t>> _sym_to_entrez;
};

// Parses the numeric ids of "672/675".
std::vector<entrez_id_t> split_entrez_ids(std::string_view gene_id);

// All earlier versions of versioned accessions: "NM_000325.5" -> NM_000325.1 .. NM_000325.4.
std::vector<std::string> new_to_old_refseqs(const std::vector<std::string>& accs);

END_NAMESPACE_VF

#endif // __VARIANT_FINDER_GENE_TABLE_H__
