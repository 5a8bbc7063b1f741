//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "mocks.h"
#include "shared/posync_exceptions.h"
#include "plural/default_plural_rules.h"
#include "lookup/translation_table.h"

using namespace std;

namespace
{
	const string GERMAN =
			"msgid \"\"\n"
			"msgstr \"\"\n"
			"\"Language: de\\n\"\n"
			"\n"
			"msgid \"Hello\"\n"
			"msgstr \"Hallo\"\n"
			"\n"
			"msgid \"Hello %{name}\"\n"
			"msgstr \"Hallo %{name}\"\n"
			"\n"
			"msgctxt \"menu\"\n"
			"msgid \"Open\"\n"
			"msgstr \"Öffnen\"\n"
			"\n"
			"msgid \"Open\"\n"
			"msgstr \"Offen\"\n"
			"\n"
			"#, fuzzy\n"
			"msgid \"Fuzzy\"\n"
			"msgstr \"Unscharf\"\n"
			"\n"
			"msgid \"Untranslated\"\n"
			"msgstr \"\"\n"
			"\n"
			"msgid \"%{count} file\"\n"
			"msgid_plural \"%{count} files\"\n"
			"msgstr[0] \"%{count} Datei\"\n"
			"msgstr[1] \"%{count} Dateien\"\n"
			"\n"
			"msgid \"%{count} dir\"\n"
			"msgid_plural \"%{count} dirs\"\n"
			"msgstr[0] \"%{count} Verzeichnis\"\n"
			"\n"
			"#~ msgid \"Obsolete\"\n"
			"#~ msgstr \"Veraltet\"\n";
}

class TranslationTableTest : public Test
{
protected:

	void SetUp() override
	{
		table.Add("de", "default", ParseCatalog(GERMAN));
	}

	TranslationTable table { make_shared<DefaultPluralRules>() };
};

TEST_F(TranslationTableTest, Add)
{
	// Fuzzy, untranslated and obsolete entries are not used
	EXPECT_EQ(6, table.GetSize("de", "default"));
	EXPECT_EQ(0, table.GetSize("de", "errors"));
	EXPECT_EQ(0, table.GetSize("fr", "default"));
}

TEST_F(TranslationTableTest, Gettext)
{
	EXPECT_EQ("Hallo", table.Gettext("de", "default", nullopt, "Hello"));
	EXPECT_EQ("Hallo Welt", table.Gettext("de", "default", nullopt, "Hello %{name}", { { "name", "Welt" } }));
	EXPECT_EQ("Öffnen", table.Gettext("de", "default", "menu", "Open"));
	EXPECT_EQ("Offen", table.Gettext("de", "default", nullopt, "Open"));

	// Missing translations fall back to the source text
	EXPECT_EQ("Fuzzy", table.Gettext("de", "default", nullopt, "Fuzzy"));
	EXPECT_EQ("Untranslated", table.Gettext("de", "default", nullopt, "Untranslated"));
	EXPECT_EQ("Obsolete", table.Gettext("de", "default", nullopt, "Obsolete"));
	EXPECT_EQ("Open", table.Gettext("de", "default", "", "Open"));
	EXPECT_EQ("Hello", table.Gettext("de", "errors", nullopt, "Hello"));
	EXPECT_EQ("Hello", table.Gettext("fr", "default", nullopt, "Hello"));
	EXPECT_EQ("Hello Welt", table.Gettext("fr", "default", nullopt, "Hello %{name}", { { "name", "Welt" } }));
}

TEST_F(TranslationTableTest, LocaleFallback)
{
	EXPECT_EQ("Hallo", table.Gettext("de_AT", "default", nullopt, "Hello"));
	EXPECT_EQ("Hallo", table.Gettext("de-CH", "default", nullopt, "Hello"));
	EXPECT_EQ("Hallo", table.Gettext("de.UTF-8", "default", nullopt, "Hello"));

	Catalog austrian = CreateCatalog({ CreateSingular("Hello", "Servus") });
	table.Add("de_AT", "default", austrian);
	EXPECT_EQ("Servus", table.Gettext("de_AT", "default", nullopt, "Hello"));
	EXPECT_EQ("Offen", table.Gettext("de_AT", "default", nullopt, "Open"));
	EXPECT_EQ("Hallo", table.Gettext("de", "default", nullopt, "Hello"));
}

TEST_F(TranslationTableTest, Ngettext)
{
	EXPECT_EQ("1 Datei", table.Ngettext("de", "default", nullopt, "%{count} file", "%{count} files", 1));
	EXPECT_EQ("0 Dateien", table.Ngettext("de", "default", nullopt, "%{count} file", "%{count} files", 0));
	EXPECT_EQ("5 Dateien", table.Ngettext("de", "default", nullopt, "%{count} file", "%{count} files", 5));

	EXPECT_EQ("1 item", table.Ngettext("de", "default", nullopt, "%{count} item", "%{count} items", 1));
	EXPECT_EQ("3 items", table.Ngettext("de", "default", nullopt, "%{count} item", "%{count} items", 3));

	// A singular translation is used for all counts
	EXPECT_EQ("Hallo", table.Ngettext("de", "default", nullopt, "Hello", "Hellos", 2));

	// The count binding takes precedence
	EXPECT_EQ("2 Dateien", table.Ngettext("de", "default", nullopt, "%{count} file", "%{count} files", 2,
			{ { "count", "ignored" } }));
}

TEST_F(TranslationTableTest, MissingPluralForm)
{
	EXPECT_EQ("1 Verzeichnis", table.Ngettext("de", "default", nullopt, "%{count} dir", "%{count} dirs", 1));

	try {
		table.Ngettext("de", "default", nullopt, "%{count} dir", "%{count} dirs", 2);
		FAIL();
	}
	catch (const plural_form_exception& e) {
		EXPECT_EQ(1, e.get_form());
		EXPECT_EQ("de", e.get_locale());
		EXPECT_EQ(30, e.get_line());
	}
}

TEST_F(TranslationTableTest, MissingBindings)
{
	EXPECT_THROW(table.Gettext("de", "default", nullopt, "Hello %{name}"), render_exception);
	EXPECT_THROW(table.Gettext("fr", "default", nullopt, "Hello %{name}"), render_exception);
}

TEST_F(TranslationTableTest, PluralStateInitializedOnce)
{
	auto rules = make_shared<MockPluralRules>();
	EXPECT_CALL(*rules, Init("xx")).WillOnce(Return(ByMove(make_unique<PluralState>("xx"))));
	EXPECT_CALL(*rules, FormIndex(_, 7)).WillRepeatedly(Return(1));

	TranslationTable custom_table(rules);
	custom_table.Add("xx", "default", CreateCatalog({ CreatePlural("a", "as", { "x", "xs" }) }));
	custom_table.Add("xx", "errors", CreateCatalog({ CreateSingular("b", "y") }));

	EXPECT_EQ("xs", custom_table.Ngettext("xx", "default", nullopt, "a", "as", 7));
	EXPECT_EQ("xs", custom_table.Ngettext("xx", "default", nullopt, "a", "as", 7));
	EXPECT_EQ("y", custom_table.Gettext("xx", "errors", nullopt, "b"));
}
