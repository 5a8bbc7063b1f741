//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Built-in plural rules for the common gettext language families
//
//---------------------------------------------------------------------------

#pragma once

#include "plural_rules.h"
#include <string>
#include <unordered_map>

using namespace std;

enum class plural_family {
	one_form,
	// n != 1
	two_forms_1,
	// n > 1
	two_forms_2,
	slavic,
	slavic_alt,
	ar,
	csb,
	cy,
	ga,
	gd,
	is,
	jv,
	kw,
	lt,
	lv,
	mk,
	mnk,
	mt,
	pl,
	pt_br,
	ro,
	sl
};

class DefaultPluralRules : public PluralRules
{
	class DefaultPluralState : public PluralState
	{
		plural_family family;

	public:

		DefaultPluralState(const string& locale, plural_family f) : PluralState(locale), family(f) {}
		~DefaultPluralState() override = default;

		plural_family GetFamily() const { return family; }
	};

public:

	DefaultPluralRules() = default;
	~DefaultPluralRules() override = default;

	unique_ptr<PluralState> Init(const string&) const override;
	int FormCount(const PluralState&) const override;
	int FormIndex(const PluralState&, uint64_t) const override;
	string GetPluralFormsHeader(const PluralState&) const override;

	plural_family GetFamily(const string&) const;

	static int GetFormCount(plural_family);
	static int GetFormIndex(plural_family, uint64_t);

private:

	static const unordered_map<string, plural_family> families;

	static const unordered_map<plural_family, string> headers;
};
