//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Runtime lookup of translations by locale, domain, context and message id.
// Missing translations fall back to the source text.
//
//---------------------------------------------------------------------------

#pragma once

#include "catalog/catalog.h"
#include "plural/plural_rules.h"
#include "interpolation/interpolation.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

using namespace std;

class TranslationTable
{
	struct EntryKeyHash
	{
		size_t operator()(const entry_key& key) const
		{
			const size_t h = hash<string>()(key.second);
			return key.first ? h ^ (hash<string>()(*key.first) * 31 + 1) : h;
		}
	};

	using entries = unordered_map<entry_key, shared_ptr<const Entry>, EntryKeyHash>;

	struct LocaleTable
	{
		unique_ptr<PluralState> plural_state;

		unordered_map<string, entries> domains;
	};

public:

	explicit TranslationTable(shared_ptr<const PluralRules> r) : plural_rules(r) {}
	~TranslationTable() = default;

	void Add(const string&, const string&, const Catalog&);

	string Gettext(const string&, const string&, const optional<string>&, const string&,
			const interpolation::bindings& = {}) const;

	// The count is available as the "count" binding
	string Ngettext(const string&, const string&, const optional<string>&, const string&, const string&, uint64_t,
			const interpolation::bindings& = {}) const;

	size_t GetSize(const string&, const string&) const;

private:

	pair<const LocaleTable *, shared_ptr<const Entry>> Find(const string&, const string&, const entry_key&) const;

	shared_ptr<const PluralRules> plural_rules;

	unordered_map<string, LocaleTable> locales;
};
