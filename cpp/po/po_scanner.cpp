//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_exceptions.h"
#include "shared/posync_util.h"
#include "po_scanner.h"

using namespace std;

vector<PoToken> PoScanner::Scan(string_view s, int first_line)
{
	text = s;
	pos = 0;
	line = first_line;
	obsolete = false;

	if (text.starts_with(BOM)) {
		pos = BOM.size();
	}

	vector<PoToken> tokens;

	while (pos < text.size()) {
		const char c = text[pos];

		if (c == '\n') {
			line++;
			obsolete = false;
			pos++;
		}
		else if (IsWhitespace(c)) {
			pos++;
		}
		else if (c == '#') {
			ScanComment(tokens);
		}
		else if (c == '"') {
			tokens.push_back(ScanString());
		}
		else {
			tokens.push_back(ScanKeyword());
		}
	}

	return tokens;
}

void PoScanner::ScanComment(vector<PoToken>& tokens)
{
	if (!obsolete && text.substr(pos).starts_with("#~")) {
		pos += 2;

		// "#~|" is the previous message of an obsolete entry
		if (pos < text.size() && text[pos] == '|') {
			const string_view rest = GetRestOfLine();
			tokens.emplace_back(token_type::comment, line, "#" + string(rest), 0, true);
			pos += rest.size();
		}
		else {
			obsolete = true;
		}

		return;
	}

	string_view comment = GetRestOfLine();
	pos += comment.size();

	if (comment.ends_with('\r')) {
		comment.remove_suffix(1);
	}

	tokens.emplace_back(token_type::comment, line, string(comment), 0, obsolete);
}

PoToken PoScanner::ScanString()
{
	const int start_line = line;

	// Opening quote
	pos++;

	string value;

	while (pos < text.size()) {
		const char c = text[pos++];

		if (c == '"') {
			return PoToken(token_type::string_literal, start_line, value, 0, obsolete);
		}

		if (c == '\n') {
			throw lex_exception(line, "newline in string");
		}

		if (c != '\\') {
			value += c;
			continue;
		}

		if (pos == text.size()) {
			break;
		}

		switch (text[pos++]) {
			case 'n':
				value += '\n';
				break;

			case 't':
				value += '\t';
				break;

			case '\\':
				value += '\\';
				break;

			case '"':
				value += '"';
				break;

			default:
				throw lex_exception(line, "unsupported escape code");
		}
	}

	throw lex_exception(start_line, "missing token '\"'");
}

PoToken PoScanner::ScanKeyword()
{
	const size_t start = pos;
	while (pos < text.size() && !IsWhitespace(text[pos]) && text[pos] != '"') {
		pos++;
	}

	const string word = string(text.substr(start, pos - start));

	token_type type;
	int plural_index = 0;
	if (word == "msgctxt") {
		type = token_type::msgctxt;
	}
	else if (word == "msgid") {
		type = token_type::msgid;
	}
	else if (word == "msgid_plural") {
		type = token_type::msgid_plural;
	}
	else if (word == "msgstr") {
		type = token_type::msgstr;
	}
	else if (word.starts_with("msgstr[") && word.ends_with(']')
			&& posync_util::GetAsUnsignedInt(word.substr(7, word.size() - 8), plural_index)) {
		type = token_type::plural_msgstr;
	}
	else {
		throw lex_exception(line, "unknown keyword '" + word + "'");
	}

	if (pos == text.size() || !IsWhitespace(text[pos])) {
		throw lex_exception(line, "no space after '" + word + "'");
	}

	return PoToken(type, line, "", plural_index, obsolete);
}

string_view PoScanner::GetRestOfLine() const
{
	const size_t end = text.find('\n', pos);

	return text.substr(pos, end == string_view::npos ? string_view::npos : end - pos);
}
