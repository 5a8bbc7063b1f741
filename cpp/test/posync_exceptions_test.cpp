//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "shared/posync_exceptions.h"

TEST(PosyncExceptionsTest, ParserException)
{
	try {
		throw parser_exception(12, "msg");
	}
	catch (const parser_exception& e) {
		EXPECT_STREQ("12: msg", e.what());
		EXPECT_EQ(12, e.get_line());
		EXPECT_EQ("msg", e.get_reason());
	}
}

TEST(PosyncExceptionsTest, LexException)
{
	try {
		throw lex_exception(3, "newline in string");
	}
	catch (const parser_exception& e) {
		EXPECT_STREQ("3: newline in string", e.what());
		EXPECT_EQ(3, e.get_line());
	}
}

TEST(PosyncExceptionsTest, DuplicateKeyException)
{
	try {
		throw duplicate_key_exception(5, 1, "foo");
	}
	catch (const syntax_exception& e) {
		EXPECT_STREQ("5: found duplicate on line 1 for msgid: 'foo'", e.what());
	}

	try {
		throw duplicate_key_exception(7, 2, "file", "files");
	}
	catch (const duplicate_key_exception& e) {
		EXPECT_EQ(7, e.get_line());
		EXPECT_EQ(2, e.get_original_line());
		EXPECT_EQ("file", e.get_msgid());
		EXPECT_EQ("files", e.get_msgid_plural());
		EXPECT_EQ("found duplicate on line 2 for msgid: 'file' and msgid_plural: 'files'", e.get_reason());
	}
}

TEST(PosyncExceptionsTest, RenderException)
{
	try {
		throw render_exception({ "b", "a" }, "%{a} %{b}");
	}
	catch (const render_exception& e) {
		EXPECT_STREQ("missing interpolation keys: a, b", e.what());
		EXPECT_EQ(set<string>({ "a", "b" }), e.get_missing_keys());
		EXPECT_EQ("%{a} %{b}", e.get_partial());
	}
}

TEST(PosyncExceptionsTest, PolicyException)
{
	try {
		throw policy_exception("msg");
	}
	catch (const policy_exception& e) {
		EXPECT_STREQ("msg", e.what());
	}
}

TEST(PosyncExceptionsTest, IoException)
{
	try {
		throw io_exception("msg");
	}
	catch (const io_exception& e) {
		EXPECT_STREQ("msg", e.what());
	}
}

TEST(PosyncExceptionsTest, PluralFormException)
{
	try {
		throw plural_form_exception(2, "ru", 17);
	}
	catch (const plural_form_exception& e) {
		EXPECT_STREQ("plural form 2 is required for locale 'ru' but is missing for message on line 17", e.what());
		EXPECT_EQ(2, e.get_form());
		EXPECT_EQ("ru", e.get_locale());
		EXPECT_EQ(17, e.get_line());
	}
}
