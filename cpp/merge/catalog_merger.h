//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Synchronizes a translated catalog with a freshly extracted template
//
//---------------------------------------------------------------------------

#pragma once

#include "catalog/catalog.h"
#include "catalog/catalog_logger.h"
#include "plural/plural_rules.h"
#include "merge_policy.h"
#include <memory>
#include <string>

using namespace std;

struct ChangeSummary
{
	int new_count = 0;
	int removed = 0;
	int unchanged = 0;
	int fuzzy = 0;
	int obsolete = 0;

	string ToString() const;

	bool operator==(const ChangeSummary&) const = default;
};

struct MergeResult
{
	Catalog catalog;
	ChangeSummary summary;
};

class CatalogMerger
{
	MergePolicy policy;

	shared_ptr<const PluralRules> plural_rules;

public:

	CatalogMerger(const MergePolicy& p, shared_ptr<const PluralRules> r) : policy(p), plural_rules(r) {}
	~CatalogMerger() = default;

	MergeResult Merge(const Catalog&, const Catalog&, const string&) const;

	// For a locale without a catalog yet
	MergeResult CreateFromTemplate(const Catalog&, const string&) const;

private:

	// Count and header value of the Plural-Forms header for a locale
	pair<int, string> GetPluralForms(const string&) const;

	int FindFuzzyMatch(const Entry&, const vector<shared_ptr<Entry>>&, const vector<bool>&) const;

	shared_ptr<Entry> MergeExact(const Entry&, const Entry&, int, const CatalogLogger&) const;
	shared_ptr<Entry> MergeFuzzy(const Entry&, const Entry&, int, const CatalogLogger&) const;
	static shared_ptr<Entry> CreateUntranslated(const Entry&, int);

	static void TransferMsgstr(const Entry&, Entry&, int, const CatalogLogger&);
	static map<int, fragments> CreateEmptyForms(int);
};
