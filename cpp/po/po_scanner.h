//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Converts catalog text into tokens, single pass with line tracking
//
//---------------------------------------------------------------------------

#pragma once

#include "po_token.h"
#include <string>
#include <vector>

using namespace std;

class PoScanner
{
	static inline const string BOM = "\xef\xbb\xbf";

	string_view text;

	size_t pos = 0;

	int line = 1;

	// Set for the remainder of a "#~" line
	bool obsolete = false;

public:

	PoScanner() = default;
	~PoScanner() = default;

	// Throws lex_exception
	vector<PoToken> Scan(string_view, int = 1);

private:

	void ScanComment(vector<PoToken>&);
	PoToken ScanString();
	PoToken ScanKeyword();

	string_view GetRestOfLine() const;

	static bool IsWhitespace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
};
