//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#pragma once

#include <string>
#include <vector>

using namespace std;

namespace string_similarity
{
	// Invalid UTF-8 bytes are passed through as single code points
	vector<char32_t> DecodeUtf8(string_view);

	// Jaro similarity of the code points, 1.0 for identical strings, 0.0 if nothing matches
	double Jaro(string_view, string_view);
}
