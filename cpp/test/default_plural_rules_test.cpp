//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "plural/default_plural_rules.h"
#include "plural/plural_forms_rules.h"

using namespace std;

namespace
{
	// One locale for each plural family
	const vector<string> LOCALES = { "ja", "en", "fr", "ru", "cs", "ar", "csb", "cy", "ga", "gd", "is", "jv", "kw",
			"lt", "lv", "mk", "mnk", "mt", "pl", "pt_BR", "ro", "sl" };
}

TEST(DefaultPluralRulesTest, GetFamily)
{
	const DefaultPluralRules rules;

	EXPECT_EQ(plural_family::two_forms_1, rules.GetFamily("en"));
	EXPECT_EQ(plural_family::two_forms_1, rules.GetFamily("de_AT"));
	EXPECT_EQ(plural_family::two_forms_1, rules.GetFamily("en-US"));
	EXPECT_EQ(plural_family::two_forms_2, rules.GetFamily("fr"));
	EXPECT_EQ(plural_family::slavic, rules.GetFamily("sr_RS.UTF-8@latin"));
	EXPECT_EQ(plural_family::slavic, rules.GetFamily("uk.UTF-8"));
	EXPECT_EQ(plural_family::pt_br, rules.GetFamily("pt_BR"));
	EXPECT_EQ(plural_family::pt_br, rules.GetFamily("pt-BR"));
	EXPECT_EQ(plural_family::pt_br, rules.GetFamily("pt-BR.UTF-8"));
	EXPECT_EQ(plural_family::two_forms_1, rules.GetFamily("pt_PT"));
	EXPECT_EQ(plural_family::one_form, rules.GetFamily("zh_CN"));

	// Unknown locales use the rules for English
	EXPECT_EQ(plural_family::two_forms_1, rules.GetFamily("xx"));
	EXPECT_EQ(plural_family::two_forms_1, rules.GetFamily(""));
}

TEST(DefaultPluralRulesTest, FormCount)
{
	const DefaultPluralRules rules;

	EXPECT_EQ(1, rules.FormCountFor("ja"));
	EXPECT_EQ(2, rules.FormCountFor("en"));
	EXPECT_EQ(2, rules.FormCountFor("de"));
	EXPECT_EQ(3, rules.FormCountFor("ru"));
	EXPECT_EQ(3, rules.FormCountFor("pl"));
	EXPECT_EQ(4, rules.FormCountFor("sl"));
	EXPECT_EQ(5, rules.FormCountFor("ga"));
	EXPECT_EQ(6, rules.FormCountFor("ar"));
	EXPECT_EQ(2, rules.FormCountFor("xx"));
}

TEST(DefaultPluralRulesTest, FormIndex)
{
	const DefaultPluralRules rules;

	EXPECT_EQ(1, rules.FormIndexFor("en", 0));
	EXPECT_EQ(0, rules.FormIndexFor("en", 1));
	EXPECT_EQ(1, rules.FormIndexFor("en", 2));

	EXPECT_EQ(0, rules.FormIndexFor("fr", 0));
	EXPECT_EQ(0, rules.FormIndexFor("fr", 1));
	EXPECT_EQ(1, rules.FormIndexFor("fr", 2));
	EXPECT_EQ(0, rules.FormIndexFor("pt_BR", 0));
	EXPECT_EQ(0, rules.FormIndexFor("pt-BR", 0));
	EXPECT_EQ(1, rules.FormIndexFor("pt", 0));

	EXPECT_EQ(0, rules.FormIndexFor("ja", 5));

	EXPECT_EQ(0, rules.FormIndexFor("ru", 1));
	EXPECT_EQ(1, rules.FormIndexFor("ru", 2));
	EXPECT_EQ(2, rules.FormIndexFor("ru", 5));
	EXPECT_EQ(2, rules.FormIndexFor("ru", 11));
	EXPECT_EQ(0, rules.FormIndexFor("ru", 21));
	EXPECT_EQ(1, rules.FormIndexFor("ru", 22));
	EXPECT_EQ(2, rules.FormIndexFor("ru", 112));

	EXPECT_EQ(0, rules.FormIndexFor("pl", 1));
	EXPECT_EQ(1, rules.FormIndexFor("pl", 2));
	EXPECT_EQ(2, rules.FormIndexFor("pl", 5));
	EXPECT_EQ(2, rules.FormIndexFor("pl", 21));
	EXPECT_EQ(1, rules.FormIndexFor("pl", 22));

	EXPECT_EQ(0, rules.FormIndexFor("ar", 0));
	EXPECT_EQ(1, rules.FormIndexFor("ar", 1));
	EXPECT_EQ(2, rules.FormIndexFor("ar", 2));
	EXPECT_EQ(3, rules.FormIndexFor("ar", 5));
	EXPECT_EQ(4, rules.FormIndexFor("ar", 11));
	EXPECT_EQ(5, rules.FormIndexFor("ar", 100));

	EXPECT_EQ(0, rules.FormIndexFor("sl", 5));
	EXPECT_EQ(1, rules.FormIndexFor("sl", 101));
	EXPECT_EQ(2, rules.FormIndexFor("sl", 2));
	EXPECT_EQ(3, rules.FormIndexFor("sl", 203));
}

TEST(DefaultPluralRulesTest, Totality)
{
	const DefaultPluralRules rules;

	for (const auto& locale : LOCALES) {
		const auto& state = rules.Init(locale);
		const int count = rules.FormCount(*state);
		EXPECT_LE(1, count);

		for (const uint64_t n : { 0, 1, 2, 5, 11, 21, 100, 1000 }) {
			const int index = rules.FormIndex(*state, n);
			EXPECT_LE(0, index) << locale << " " << n;
			EXPECT_GT(count, index) << locale << " " << n;
		}

		EXPECT_GT(count, rules.FormIndex(*state, UINT64_MAX)) << locale;
	}
}

TEST(DefaultPluralRulesTest, PluralFormsHeader)
{
	const DefaultPluralRules rules;
	const PluralFormsRules header_rules;

	EXPECT_EQ("nplurals=2; plural=(n != 1);", rules.GetPluralFormsHeader(*rules.Init("de")));

	// The header formulas must select the same forms as the built-in rules
	for (const auto& locale : LOCALES) {
		const auto& state = rules.Init(locale);
		const auto& header_state = header_rules.Init(rules.GetPluralFormsHeader(*state));

		EXPECT_EQ(rules.FormCount(*state), header_rules.FormCount(*header_state)) << locale;

		for (uint64_t n = 0; n < 250; n++) {
			EXPECT_EQ(rules.FormIndex(*state, n), header_rules.FormIndex(*header_state, n)) << locale << " " << n;
		}

		for (const uint64_t n : { 1000, 1001, 1002, 1011, 1021, 1111 }) {
			EXPECT_EQ(rules.FormIndex(*state, n), header_rules.FormIndex(*header_state, n)) << locale << " " << n;
		}
	}
}
