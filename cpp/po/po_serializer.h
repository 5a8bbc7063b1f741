//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Writes a catalog as canonical catalog text
//
//---------------------------------------------------------------------------

#pragma once

#include "catalog/catalog.h"
#include <string>
#include <ostream>

using namespace std;

class PoSerializer
{
	static const size_t MAX_REFERENCE_LINE_LENGTH = 80;

public:

	PoSerializer() = default;
	~PoSerializer() = default;

	string Serialize(const Catalog&) const;

private:

	void WriteHeader(ostream&, const Catalog&) const;
	void WriteEntry(ostream&, const Entry&) const;
	void WriteReferences(ostream&, const vector<Reference>&) const;
	void WritePrevious(ostream&, const PreviousMessage&) const;
	void WriteKeyword(ostream&, const string&, const string&, const fragments&) const;
};
