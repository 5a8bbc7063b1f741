//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "po_token.h"

using namespace std;

string PoToken::ToLiteral() const
{
	switch (type) {
		case token_type::comment:
			return value;

		case token_type::string_literal:
			return "\"" + Escape(value) + "\"";

		case token_type::plural_msgstr:
			return "msgstr[" + to_string(plural_index) + "]";

		default:
			return GetKeyword(type);
	}
}

string PoToken::GetKeyword(token_type t)
{
	switch (t) {
		case token_type::msgctxt:
			return "msgctxt";

		case token_type::msgid:
			return "msgid";

		case token_type::msgid_plural:
			return "msgid_plural";

		case token_type::msgstr:
		case token_type::plural_msgstr:
			return "msgstr";

		default:
			return "";
	}
}

string PoToken::Escape(string_view s)
{
	string escaped;
	escaped.reserve(s.size());

	for (const char c : s) {
		switch (c) {
			case '\\':
				escaped += "\\\\";
				break;

			case '"':
				escaped += "\\\"";
				break;

			case '\n':
				escaped += "\\n";
				break;

			case '\t':
				escaped += "\\t";
				break;

			default:
				escaped += c;
				break;
		}
	}

	return escaped;
}
