/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "gene_table.h"
#include "file.h"
#include "util.h"
#include <utility>

BEGIN_NAMESPACE_VF

static const std::vector<string> g_no_ids;
static const std::vector<entrez_id_t> g_no_entrez_ids;

void gene_table::add(gene_t gene)
{
	auto [it, inserted] = _index.try_emplace(gene.entrez_id, _genes.size());
	VF_CHECK(inserted, value, "Duplicate entrez gene {}.", gene.entrez_id);
	if (!gene.sym.empty())
		_sym_to_entrez[gene.sym].push_back(gene.entrez_id);
	_genes.push_back(std::move(gene));
}

void gene_table::load(const std::string& path)
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
				col_index = find_columns(cols, { "entrezId", "sym", "refseqIds", "refseqProtIds" });
				continue;
			}
			auto col = [&](int c) -> std::string_view {
				const int i = col_index[c];
				return i < (int)cols.size() ? cols[i] : std::string_view{};
			};
			add({ as_int(col(0)), std::string(strip(col(1))), split_nonempty(col(2), ','), split_nonempty(col(3), ',') });
		}
	}
	VF_RETHROW("Could not load genes from {}", path);
	log_info("Loaded {} genes from {}", _genes.size(), path);
}

const gene_table::gene_t* gene_table::find(entrez_id_t entrez_id) const
{
	auto it = _index.find(entrez_id);
	return it == _index.end() ? nullptr : &_genes[it->second];
}

std::optional<std::string> gene_table::entrez_to_sym(std::string_view gene_id) const
{
	const auto ids = split_entrez_ids(gene_id);
	if (ids.size() > 1)
		log_debug("Got multiple entrez genes {}. Using only first to get symbol.", gene_id);
	const gene_t* gene = ids.empty() ? nullptr : find(ids[0]);
	if (!gene || gene->sym.empty())
		return std::nullopt;
	return gene->sym;
}

const std::vector<entrez_id_t>& gene_table::map_sym_to_entrez(std::string_view sym) const
{
	auto it = _sym_to_entrez.find(sym);
	return it == _sym_to_entrez.end() ? g_no_entrez_ids : it->second;
}

const std::vector<string>& gene_table::refseq_ids(entrez_id_t entrez_id) const
{
	const gene_t* gene = find(entrez_id);
	if (!gene) {
		log_debug("Gene {} is not valid or not in the selected species", entrez_id);
		return g_no_ids;
	}
	return gene->refseq_ids;
}

const std::vector<string>& gene_table::refseq_prot_ids(entrez_id_t entrez_id) const
{
	const gene_t* gene = find(entrez_id);
	if (!gene) {
		log_debug("Gene {} is not valid or not in the selected species", entrez_id);
		return g_no_ids;
	}
	return gene->refseq_prot_ids;
}

std::vector<entrez_id_t> split_entrez_ids(std::string_view gene_id)
{
	std::vector<entrez_id_t> ids;
	for (const auto& id : split_nonempty(gene_id, '/'))
		ids.push_back(as_int(id));
	return ids;
}

std::vector<std::string> new_to_old_refseqs(const std::vector<std::string>& accs)
{
	std::vector<std::string> old_accs;
	for (const auto& acc : accs) {
		const auto dot = acc.rfind('.');
		VF_CHECK(dot != std::string::npos, value, "Accession {} has no version.", acc);
		const std::string_view prefix{acc.data(), dot};
		const int version = as_int(std::string_view{acc}.substr(dot + 1));
		for (int v = 1; v < version; ++v)
			old_accs.push_back(fmt::format("{}.{}", prefix, v));
	}
	return old_accs;
}

END_NAMESPACE_VF
