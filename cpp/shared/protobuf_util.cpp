//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_exceptions.h"
#include "protobuf_util.h"
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/text_format.h>

using namespace std;
using namespace google::protobuf;
using namespace google::protobuf::util;
using namespace posync_interface;

MergePolicy protobuf_util::ParseMergePolicy(const string& data, protobuf_format format)
{
	PbMergePolicy pb_policy;

	switch (format) {
		case protobuf_format::binary:
			if (!pb_policy.ParseFromString(data)) {
				throw policy_exception("Can't parse binary protobuf merge policy");
			}
			break;

		case protobuf_format::json:
			if (const auto& status = JsonStringToMessage(data, &pb_policy); !status.ok()) {
				throw policy_exception("Can't parse JSON protobuf merge policy: " + status.ToString());
			}
			break;

		case protobuf_format::text:
			if (!TextFormat::ParseFromString(data, &pb_policy)) {
				throw policy_exception("Can't parse text format protobuf merge policy");
			}
			break;

		default:
			throw policy_exception("Unknown protobuf format");
	}

	return ToMergePolicy(pb_policy);
}

MergePolicy protobuf_util::ToMergePolicy(const PbMergePolicy& pb_policy)
{
	MergePolicy policy;

	switch (pb_policy.on_obsolete()) {
		case PbObsoletePolicy::MARK_AS_OBSOLETE:
			policy.SetOnObsolete(obsolete_handling::mark_as_obsolete);
			break;

		case PbObsoletePolicy::DELETE:
			policy.SetOnObsolete(obsolete_handling::remove);
			break;

		default:
			throw policy_exception("Invalid obsolete handling " + to_string(pb_policy.on_obsolete()));
	}

	if (pb_policy.has_fuzzy()) {
		policy.SetFuzzy(pb_policy.fuzzy());
	}

	if (pb_policy.has_fuzzy_threshold()) {
		policy.SetFuzzyThreshold(pb_policy.fuzzy_threshold());
	}

	policy.SetStorePreviousMessageOnFuzzyMatch(pb_policy.store_previous_message_on_fuzzy_match());
	policy.SetPluralFormsHeader(pb_policy.plural_forms_header());

	return policy;
}

PbMergePolicy protobuf_util::FromMergePolicy(const MergePolicy& policy)
{
	PbMergePolicy pb_policy;

	pb_policy.set_on_obsolete(policy.GetOnObsolete() == obsolete_handling::remove ?
			PbObsoletePolicy::DELETE : PbObsoletePolicy::MARK_AS_OBSOLETE);
	pb_policy.set_fuzzy(policy.IsFuzzy());
	pb_policy.set_fuzzy_threshold(policy.GetFuzzyThreshold());
	pb_policy.set_store_previous_message_on_fuzzy_match(policy.IsStorePreviousMessageOnFuzzyMatch());
	pb_policy.set_plural_forms_header(policy.GetPluralFormsHeader());

	return pb_policy;
}

void protobuf_util::SetChangeSummary(PbChangeSummary& pb_summary, const ChangeSummary& summary)
{
	pb_summary.set_new_count(summary.new_count);
	pb_summary.set_removed(summary.removed);
	pb_summary.set_unchanged(summary.unchanged);
	pb_summary.set_fuzzy(summary.fuzzy);
	pb_summary.set_obsolete(summary.obsolete);
}

string protobuf_util::FormatMergeReport(const string& locale, const ChangeSummary& summary, protobuf_format format)
{
	PbMergeReport report;
	report.set_locale(locale);
	SetChangeSummary(*report.mutable_summary(), summary);

	string s;

	switch (format) {
		case protobuf_format::binary:
			s = report.SerializeAsString();
			break;

		case protobuf_format::json:
			if (const auto& status = MessageToJsonString(report, &s); !status.ok()) {
				throw io_exception("Can't convert merge report to JSON: " + status.ToString());
			}
			break;

		case protobuf_format::text:
			if (!TextFormat::PrintToString(report, &s)) {
				throw io_exception("Can't convert merge report to text format");
			}
			break;

		default:
			throw io_exception("Unknown merge report format " + to_string(static_cast<int>(format)));
	}

	return s;
}
