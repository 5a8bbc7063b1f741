//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Helper methods for converting between protobuf messages and merge settings/results
//
//---------------------------------------------------------------------------

#pragma once

#include "merge/merge_policy.h"
#include "merge/catalog_merger.h"
#include "generated/posync_interface.pb.h"
#include <string>

using namespace std;
using namespace posync_interface;

namespace protobuf_util
{
	enum class protobuf_format {
		binary,
		json,
		text
	};

	// Throws policy_exception for unparsable data or invalid settings
	MergePolicy ParseMergePolicy(const string&, protobuf_format);

	MergePolicy ToMergePolicy(const PbMergePolicy&);
	PbMergePolicy FromMergePolicy(const MergePolicy&);

	void SetChangeSummary(PbChangeSummary&, const ChangeSummary&);

	// Throws io_exception if the report cannot be converted
	string FormatMergeReport(const string&, const ChangeSummary&, protobuf_format);
}
