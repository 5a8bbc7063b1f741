//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Builds a catalog from the tokens of a catalog file.
//
// entry := comment* (msgctxt string+)? msgid string+ msgstr-block
// msgstr-block := msgstr string+ | msgid_plural string+ (msgstr[N] string+)+
//
//---------------------------------------------------------------------------

#pragma once

#include "catalog/catalog.h"
#include "po_token.h"
#include <span>
#include <string>
#include <vector>

using namespace std;

class PoParser
{
	enum class comment_kind {
		translator,
		extracted,
		reference,
		flag,
		previous
	};

	struct Comment
	{
		comment_kind kind;
		string text;
		int line;
	};

	span<const PoToken> tokens;

	size_t pos = 0;

	// Line of the most recently consumed token
	int last_line = 1;

public:

	PoParser() = default;
	~PoParser() = default;

	// Throws lex_exception, syntax_exception or duplicate_key_exception
	Catalog Parse(string_view);
	Catalog Parse(span<const PoToken>);

	static vector<Reference> ParseReferences(string_view);
	static set<string> ParseFlags(string_view);

private:

	vector<Comment> ParseComments();
	shared_ptr<Entry> ParseEntry();
	fragments ParseStrings(bool);
	const PoToken& Expect(token_type, bool);
	PreviousMessage ParsePreviousMessage();

	void ApplyComments(Entry&, const vector<Comment>&) const;
	static void ApplyHeader(Catalog&, const SingularEntry&, const vector<Comment>&);

	bool HasMore(token_type type) const { return pos < tokens.size() && tokens[pos].GetType() == type; }
	const PoToken& Next();
	[[noreturn]] void ThrowUnexpected() const;

	static comment_kind Classify(const string&);
	static bool IsHeader(const Entry&);
};
