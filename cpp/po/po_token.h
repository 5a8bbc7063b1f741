//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#pragma once

#include <string>

using namespace std;

enum class token_type {
	comment,
	msgctxt,
	msgid,
	msgid_plural,
	msgstr,
	plural_msgstr,
	string_literal
};

class PoToken
{

public:

	PoToken(token_type type, int line, const string& value = "", int plural_index = 0, bool obsolete = false)
		: type(type), line(line), value(value), plural_index(plural_index), obsolete(obsolete) {}
	~PoToken() = default;

	token_type GetType() const { return type; }
	int GetLine() const { return line; }
	const string& GetValue() const { return value; }
	int GetPluralIndex() const { return plural_index; }
	bool IsObsolete() const { return obsolete; }

	bool IsKeyword() const { return type != token_type::comment && type != token_type::string_literal; }

	// The token as it would appear in catalog text, used for error messages
	string ToLiteral() const;

	static string GetKeyword(token_type);

	// Inverse of the escape handling of the scanner
	static string Escape(string_view);

	bool operator==(const PoToken&) const = default;

private:

	token_type type;

	int line;

	// Decoded string contents or the raw comment including '#'
	string value;

	// N of msgstr[N]
	int plural_index;

	// Scanned from a "#~" line
	bool obsolete;
};
