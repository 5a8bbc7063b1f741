//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_exceptions.h"
#include "shared/posync_util.h"
#include "plural/plural_forms_rules.h"
#include "merge_policy.h"
#include <cmath>

using namespace std;

void MergePolicy::SetOnObsolete(const string& value)
{
	on_obsolete = ParseOnObsolete(value);
}

void MergePolicy::SetFuzzyThreshold(double threshold)
{
	if (isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
		throw policy_exception("Invalid fuzzy threshold " + to_string(threshold) + ", must be in the range [0.0, 1.0]");
	}

	fuzzy_threshold = threshold;
}

void MergePolicy::SetPluralFormsHeader(const string& header)
{
	const string h = posync_util::Trim(header);

	if (!h.empty()) {
		try {
			PluralFormsRules().Init(h);
		}
		catch (const plural_forms_exception& e) {
			throw policy_exception(e.what());
		}
	}

	plural_forms_header = h;
}

obsolete_handling MergePolicy::ParseOnObsolete(const string& value)
{
	if (value == "mark_as_obsolete") {
		return obsolete_handling::mark_as_obsolete;
	}

	if (value == "delete") {
		return obsolete_handling::remove;
	}

	throw policy_exception("Invalid obsolete handling '" + value + "', must be 'mark_as_obsolete' or 'delete'");
}

string MergePolicy::ToString(obsolete_handling o)
{
	return o == obsolete_handling::remove ? "delete" : "mark_as_obsolete";
}
