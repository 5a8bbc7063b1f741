//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Settings for merging a catalog with a template. All setters validate their
// argument and throw policy_exception for invalid values.
//
//---------------------------------------------------------------------------

#pragma once

#include <string>

using namespace std;

enum class obsolete_handling {
	mark_as_obsolete,
	remove
};

class MergePolicy
{
	obsolete_handling on_obsolete = obsolete_handling::mark_as_obsolete;

	bool fuzzy = true;

	double fuzzy_threshold = DEFAULT_FUZZY_THRESHOLD;

	bool store_previous_message_on_fuzzy_match = false;

	// Empty for deriving the plural forms from the locale
	string plural_forms_header;

public:

	static constexpr double DEFAULT_FUZZY_THRESHOLD = 0.8;

	MergePolicy() = default;
	~MergePolicy() = default;

	obsolete_handling GetOnObsolete() const { return on_obsolete; }
	void SetOnObsolete(obsolete_handling o) { on_obsolete = o; }
	void SetOnObsolete(const string&);
	bool IsFuzzy() const { return fuzzy; }
	void SetFuzzy(bool f) { fuzzy = f; }
	double GetFuzzyThreshold() const { return fuzzy_threshold; }
	void SetFuzzyThreshold(double);
	bool IsStorePreviousMessageOnFuzzyMatch() const { return store_previous_message_on_fuzzy_match; }
	void SetStorePreviousMessageOnFuzzyMatch(bool s) { store_previous_message_on_fuzzy_match = s; }
	const string& GetPluralFormsHeader() const { return plural_forms_header; }
	void SetPluralFormsHeader(const string&);

	static obsolete_handling ParseOnObsolete(const string&);
	static string ToString(obsolete_handling);
};
