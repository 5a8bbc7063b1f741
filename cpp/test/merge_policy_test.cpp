//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "shared/posync_exceptions.h"
#include "merge/merge_policy.h"
#include <cmath>

using namespace std;

TEST(MergePolicyTest, Defaults)
{
	const MergePolicy policy;

	EXPECT_EQ(obsolete_handling::mark_as_obsolete, policy.GetOnObsolete());
	EXPECT_TRUE(policy.IsFuzzy());
	EXPECT_DOUBLE_EQ(0.8, policy.GetFuzzyThreshold());
	EXPECT_FALSE(policy.IsStorePreviousMessageOnFuzzyMatch());
	EXPECT_EQ("", policy.GetPluralFormsHeader());
}

TEST(MergePolicyTest, SetOnObsolete)
{
	MergePolicy policy;

	policy.SetOnObsolete("delete");
	EXPECT_EQ(obsolete_handling::remove, policy.GetOnObsolete());
	policy.SetOnObsolete("mark_as_obsolete");
	EXPECT_EQ(obsolete_handling::mark_as_obsolete, policy.GetOnObsolete());

	EXPECT_THROW(policy.SetOnObsolete("remove"), policy_exception);
	EXPECT_THROW(policy.SetOnObsolete(""), policy_exception);
	EXPECT_EQ(obsolete_handling::mark_as_obsolete, policy.GetOnObsolete());

	EXPECT_EQ("delete", MergePolicy::ToString(obsolete_handling::remove));
	EXPECT_EQ("mark_as_obsolete", MergePolicy::ToString(obsolete_handling::mark_as_obsolete));
}

TEST(MergePolicyTest, SetFuzzyThreshold)
{
	MergePolicy policy;

	policy.SetFuzzyThreshold(0.0);
	EXPECT_DOUBLE_EQ(0.0, policy.GetFuzzyThreshold());
	policy.SetFuzzyThreshold(1.0);
	EXPECT_DOUBLE_EQ(1.0, policy.GetFuzzyThreshold());

	EXPECT_THROW(policy.SetFuzzyThreshold(-0.1), policy_exception);
	EXPECT_THROW(policy.SetFuzzyThreshold(1.5), policy_exception);
	EXPECT_THROW(policy.SetFuzzyThreshold(NAN), policy_exception);
	EXPECT_DOUBLE_EQ(1.0, policy.GetFuzzyThreshold());
}

TEST(MergePolicyTest, SetPluralFormsHeader)
{
	MergePolicy policy;

	policy.SetPluralFormsHeader(" nplurals=2; plural=(n != 1); ");
	EXPECT_EQ("nplurals=2; plural=(n != 1);", policy.GetPluralFormsHeader());

	EXPECT_THROW(policy.SetPluralFormsHeader("nplurals=2"), policy_exception);
	EXPECT_EQ("nplurals=2; plural=(n != 1);", policy.GetPluralFormsHeader());

	policy.SetPluralFormsHeader("nplurals=100; plural=n;");
	EXPECT_THROW(policy.SetPluralFormsHeader("nplurals=101; plural=0;"), policy_exception);
	EXPECT_THROW(policy.SetPluralFormsHeader("nplurals=2147483647; plural=0;"), policy_exception);
	EXPECT_EQ("nplurals=100; plural=n;", policy.GetPluralFormsHeader());

	const string nested = "nplurals=2; plural=" + string(100000, '(') + "n" + string(100000, ')') + ";";
	EXPECT_THROW(policy.SetPluralFormsHeader(nested), policy_exception);

	policy.SetPluralFormsHeader("");
	EXPECT_EQ("", policy.GetPluralFormsHeader());
}
