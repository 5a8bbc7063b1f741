//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "plural/plural_forms_rules.h"
#include "string_similarity.h"
#include "catalog_merger.h"
#include <algorithm>

using namespace std;

namespace
{
	const vector<string> INFORMATIVE_COMMENT = {
		"## The msgids in this file come from the template (.pot) file.",
		"##",
		"## Do not add, change or remove msgids manually here, they are",
		"## tied to the ones in the template of the same domain.",
		"## Merge the template into this file instead."
	};
}

string ChangeSummary::ToString() const
{
	return "new: " + to_string(new_count) + ", removed: " + to_string(removed) + ", unchanged: "
			+ to_string(unchanged) + ", fuzzy: " + to_string(fuzzy) + ", obsolete: " + to_string(obsolete);
}

MergeResult CatalogMerger::Merge(const Catalog& old_catalog, const Catalog& template_catalog, const string& locale) const
{
	const CatalogLogger logger(locale);

	const auto& [form_count, plural_forms] = GetPluralForms(locale);

	const auto& old_entries = old_catalog.GetEntries();

	// Old entries that have found a counterpart in the template
	vector<bool> used(old_entries.size());

	map<entry_key, size_t> old_keys;
	for (size_t i = 0; i < old_entries.size(); i++) {
		if (!old_entries[i]->IsObsolete()) {
			old_keys.try_emplace(old_entries[i]->GetKey(), i);
		}
	}

	vector<shared_ptr<Entry>> template_entries;
	ranges::copy_if(template_catalog.GetEntries(), back_inserter(template_entries),
			[] (const auto& entry) { return !entry->IsObsolete(); });

	vector<shared_ptr<Entry>> merged(template_entries.size());

	ChangeSummary summary;

	for (size_t i = 0; i < template_entries.size(); i++) {
		if (const auto& it = old_keys.find(template_entries[i]->GetKey()); it != old_keys.end() && !used[it->second]) {
			merged[i] = MergeExact(*old_entries[it->second], *template_entries[i], form_count, logger);
			used[it->second] = true;
			summary.unchanged++;
		}
	}

	for (size_t i = 0; i < template_entries.size(); i++) {
		if (merged[i]) {
			continue;
		}

		const Entry& template_entry = *template_entries[i];

		if (policy.IsFuzzy()) {
			if (const int match = FindFuzzyMatch(template_entry, old_entries, used); match != -1) {
				logger.Debug("Fuzzy match of '" + template_entry.GetMsgid() + "' with '"
						+ old_entries[match]->GetMsgid() + "'");

				merged[i] = MergeFuzzy(*old_entries[match], template_entry, form_count, logger);
				used[match] = true;
				summary.fuzzy++;
				continue;
			}
		}

		merged[i] = CreateUntranslated(template_entry, form_count);
		summary.new_count++;
	}

	Catalog catalog;
	catalog.SetTopComments(old_catalog.GetTopComments());
	catalog.SetHeaderFlags(old_catalog.GetHeaderFlags());

	CatalogHeader header = old_catalog.GetHeader();
	header.Set(CatalogHeader::LANGUAGE, locale);
	header.Set(CatalogHeader::PLURAL_FORMS, plural_forms);
	catalog.SetHeader(header);

	set<entry_key> live_keys;
	for (const auto& entry : merged) {
		live_keys.insert(entry->GetKey());
		catalog.AddEntry(entry);
	}

	for (size_t i = 0; i < old_entries.size(); i++) {
		if (used[i]) {
			continue;
		}

		const auto& entry = old_entries[i];

		if (policy.GetOnObsolete() == obsolete_handling::remove) {
			logger.Trace("Removing entry '" + entry->GetMsgid() + "'");
			summary.removed++;
		}
		else if (entry->IsObsolete()) {
			// An obsolete entry is superseded by a live entry with the same key
			if (live_keys.contains(entry->GetKey())) {
				summary.removed++;
			}
			else {
				catalog.AddEntry(entry->Clone());
			}
		}
		else {
			auto obsolete_entry = entry->Clone();
			obsolete_entry->SetObsolete(true);
			catalog.AddEntry(obsolete_entry);
			summary.obsolete++;
		}
	}

	logger.Info("Merged catalog with template, " + summary.ToString());

	return { catalog, summary };
}

MergeResult CatalogMerger::CreateFromTemplate(const Catalog& template_catalog, const string& locale) const
{
	const CatalogLogger logger(locale);

	const auto& [form_count, plural_forms] = GetPluralForms(locale);

	Catalog catalog;
	catalog.SetTopComments(INFORMATIVE_COMMENT);

	CatalogHeader header;
	header.Set(CatalogHeader::LANGUAGE, locale);
	header.Set(CatalogHeader::PLURAL_FORMS, plural_forms);
	catalog.SetHeader(header);

	ChangeSummary summary;

	for (const auto& template_entry : template_catalog.GetEntries()) {
		if (template_entry->IsObsolete()) {
			continue;
		}

		auto entry = CreateUntranslated(*template_entry, form_count);

		// "##" comments are meant for developers
		vector<string> comments;
		ranges::copy_if(entry->GetComments(), back_inserter(comments),
				[] (const string& comment) { return !comment.starts_with("##"); });
		entry->SetComments(comments);

		catalog.AddEntry(entry);
		summary.new_count++;
	}

	logger.Info("Created catalog from template, " + summary.ToString());

	return { catalog, summary };
}

pair<int, string> CatalogMerger::GetPluralForms(const string& locale) const
{
	if (!policy.GetPluralFormsHeader().empty()) {
		const PluralFormsRules rules;
		const auto& state = rules.Init(policy.GetPluralFormsHeader());
		return { rules.FormCount(*state), rules.GetPluralFormsHeader(*state) };
	}

	const auto& state = plural_rules->Init(locale);
	return { plural_rules->FormCount(*state), plural_rules->GetPluralFormsHeader(*state) };
}

int CatalogMerger::FindFuzzyMatch(const Entry& template_entry, const vector<shared_ptr<Entry>>& old_entries,
		const vector<bool>& used) const
{
	int best = -1;
	double best_score = -1.0;

	for (size_t i = 0; i < old_entries.size(); i++) {
		if (used[i] || old_entries[i]->IsObsolete()) {
			continue;
		}

		// Ties go to the earliest entry
		if (const double score = string_similarity::Jaro(old_entries[i]->GetMsgid(), template_entry.GetMsgid());
				score > best_score) {
			best = static_cast<int>(i);
			best_score = score;
		}
	}

	return best_score >= policy.GetFuzzyThreshold() ? best : -1;
}

shared_ptr<Entry> CatalogMerger::MergeExact(const Entry& old_entry, const Entry& template_entry, int form_count,
		const CatalogLogger& logger) const
{
	auto entry = template_entry.Clone();
	TransferMsgstr(old_entry, *entry, form_count, logger);
	entry->SetComments(old_entry.GetComments());
	entry->RemoveFlag(Entry::FLAG_FUZZY);
	entry->SetPrevious(nullopt);
	entry->SetObsolete(false);

	return entry;
}

shared_ptr<Entry> CatalogMerger::MergeFuzzy(const Entry& old_entry, const Entry& template_entry, int form_count,
		const CatalogLogger& logger) const
{
	auto entry = template_entry.Clone();
	TransferMsgstr(old_entry, *entry, form_count, logger);
	entry->SetComments(old_entry.GetComments());
	entry->AddFlag(Entry::FLAG_FUZZY);
	entry->SetObsolete(false);

	if (policy.IsStorePreviousMessageOnFuzzyMatch()) {
		PreviousMessage previous;
		previous.msgctxt = old_entry.GetMsgctxt();
		previous.msgid = old_entry.GetMsgidFragments();
		if (old_entry.IsPlural()) {
			previous.msgid_plural = static_cast<const PluralEntry&>(old_entry).GetMsgidPluralFragments();
		}
		entry->SetPrevious(previous);
	}
	else {
		entry->SetPrevious(nullopt);
	}

	return entry;
}

shared_ptr<Entry> CatalogMerger::CreateUntranslated(const Entry& template_entry, int form_count)
{
	auto entry = template_entry.Clone();
	entry->SetPrevious(nullopt);
	entry->SetObsolete(false);

	if (entry->IsPlural()) {
		static_pointer_cast<PluralEntry>(entry)->SetMsgstr(CreateEmptyForms(form_count));
	}
	else {
		static_pointer_cast<SingularEntry>(entry)->SetMsgstr({ "" });
	}

	return entry;
}

void CatalogMerger::TransferMsgstr(const Entry& from, Entry& to, int form_count, const CatalogLogger& logger)
{
	if (!to.IsPlural()) {
		auto& target = static_cast<SingularEntry&>(to);

		if (!from.IsPlural()) {
			target.SetMsgstr(static_cast<const SingularEntry&>(from).GetMsgstrFragments());
		}
		else {
			const auto& forms = static_cast<const PluralEntry&>(from).GetMsgstr();
			const auto& it = forms.find(0);
			target.SetMsgstr(it != forms.end() ? it->second : fragments { "" });
		}

		return;
	}

	auto forms = CreateEmptyForms(form_count);

	if (!from.IsPlural()) {
		for (auto& form : forms) {
			form.second = static_cast<const SingularEntry&>(from).GetMsgstrFragments();
		}
	}
	else {
		for (const auto& [index, f] : static_cast<const PluralEntry&>(from).GetMsgstr()) {
			if (index < form_count) {
				forms[index] = f;
			}
			else {
				logger.Warn("Dropping plural form " + to_string(index) + " of '" + from.GetMsgid() + "', the locale has "
						+ to_string(form_count) + " plural forms");
			}
		}
	}

	static_cast<PluralEntry&>(to).SetMsgstr(forms);
}

map<int, fragments> CatalogMerger::CreateEmptyForms(int form_count)
{
	map<int, fragments> forms;

	for (int i = 0; i < form_count; i++) {
		forms[i] = { "" };
	}

	return forms;
}
