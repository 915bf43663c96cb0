/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "seq_variant_data.h"
#include "strutil.h"
#include <algorithm>
#include <fmt/format.h>

BEGIN_NAMESPACE_VF

const std::vector<std::string>& seq_variant_data::header()
{
	static const std::vector<std::string> columns = {
		"chrom", "start", "end", "offset", "varId", "inDb", "patType", "hgvsProt", "hgvsCoding", "hgvsRna",
		"comment", "rsIds", "protId", "texts", "rsIdsMentioned", "dbSnpStarts", "dbSnpEnds",
		"geneSymbol", "geneType", "entrezId", "geneStarts", "geneEnds", "seqType", "mutPatNames",
		"mutStarts", "mutEnds", "mutSnippets", "geneSnippets", "dbSnpSnippets",
	};
	return columns;
}

std::vector<std::string> seq_variant_data::as_row() const
{
	return {
		chrom, start, end, offset, var_id, in_db, pat_type, hgvs_prot, hgvs_coding, hgvs_rna,
		comment, rs_ids, prot_id, texts, rs_ids_mentioned, db_snp_starts, db_snp_ends,
		gene_symbol, gene_type, entrez_id, gene_starts, gene_ends, seq_type, mut_pat_names,
		mut_starts, mut_ends, mut_snippets, gene_snippets, db_snp_snippets,
	};
}

static std::string join_names(const std::vector<variant_desc>& variants)
{
	std::vector<std::string> names;
	for (const auto& v : variants)
		names.push_back(v.name());
	return join(names, "|");
}

static std::vector<std::string> unique_in_order(const std::vector<std::string>& items)
{
	std::vector<std::string> out;
	for (const auto& item : items)
		if (std::find(out.begin(), out.end(), item) == out.end())
			out.push_back(item);
	return out;
}

// Fills the mention and dbSNP columns shared by every kind of record.
static void set_mention_columns(seq_variant_data& data, const std::vector<mention_t>& mentions,
                                const rs_mentions_t& db_snp_mentions, std::string_view text)
{
	std::vector<std::string> starts, ends, snippets, rs_ids;
	for (const auto& [rs_id, rs_mentions] : db_snp_mentions) {
		auto fields = mentions_fields(rs_mentions, text);
		starts.insert(starts.end(), fields.starts.begin(), fields.starts.end());
		ends.insert(ends.end(), fields.ends.begin(), fields.ends.end());
		snippets.insert(snippets.end(), fields.snippets.begin(), fields.snippets.end());
		rs_ids.insert(rs_ids.end(), rs_mentions.size(), rs_id);
	}
	data.db_snp_starts    = join(starts, ",");
	data.db_snp_ends      = join(ends, ",");
	data.db_snp_snippets  = join(snippets, "|");
	data.rs_ids_mentioned = join(rs_ids, "|");

	auto fields = mentions_fields(mentions, text);
	data.mut_starts    = join(fields.starts, ",");
	data.mut_ends      = join(fields.ends, ",");
	data.mut_pat_names = join(fields.pat_names, "|");
	data.mut_snippets  = join(fields.snippets, "|");
	data.texts         = join(unique_in_order(fields.texts), "|");
}

seq_variant_data seq_variant_data::grounded(std::string_view doc_id,
                                            const variant_desc& variant,
                                            const std::vector<variant_desc>& prot_vars,
                                            const std::vector<variant_desc>& coding_vars,
                                            const std::vector<variant_desc>& rna_vars,
                                            const std::vector<bed_t>& beds,
                                            std::string_view entrez_id,
                                            std::string_view gene_sym,
                                            const std::vector<std::string>& rs_ids,
                                            const rs_mentions_t& db_snp_mentions,
                                            const std::vector<mention_t>& mentions,
                                            std::string_view text)
{
	seq_variant_data data;
	if (!beds.empty()) {
		data.chrom = beds.front().chrom;
		data.start = fmt::format("{}", beds.front().start);
		data.end   = fmt::format("{}", beds.front().end);
	}
	data.offset      = fmt::format("{}", variant.offset);
	data.var_id      = std::string(doc_id);
	data.pat_type    = as_str(variant.mut_type);
	data.seq_type    = as_str(variant.seq_type);
	data.hgvs_prot   = join_names(prot_vars);
	data.hgvs_coding = join_names(coding_vars);
	data.hgvs_rna    = join_names(rna_vars);
	data.rs_ids      = join(rs_ids, "|");
	if (!prot_vars.empty())
		data.prot_id = prot_vars.front().seq_id;
	data.gene_symbol = std::string(gene_sym);
	data.gene_type   = "entrez";
	data.entrez_id   = std::string(entrez_id);
	set_mention_columns(data, mentions, db_snp_mentions, text);
	return data;
}

seq_variant_data seq_variant_data::ungrounded(seq_type_t seq_type, std::string_view pat_type,
                                              const std::vector<mention_t>& mentions, std::string_view text)
{
	seq_variant_data data;
	data.pat_type  = std::string(pat_type);
	data.seq_type  = as_str(seq_type);
	data.gene_type = "entrez";
	set_mention_columns(data, mentions, {}, text);
	return data;
}

void write_tsv(std::FILE* out, const std::vector<seq_variant_data>& rows)
{
	fmt::print(out, "{}\n", join(seq_variant_data::header(), "\t"));
	for (const auto& row : rows)
		fmt::print(out, "{}\n", join(row.as_row(), "\t"));
}

END_NAMESPACE_VF
