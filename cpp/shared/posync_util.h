//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#pragma once

#include "shared/posync_exceptions.h"
#include <climits>
#include <string>
#include <sstream>
#include <vector>

using namespace std;

namespace posync_util
{
	// Separator for compound options like LEVEL:LOCALE
	static const char COMPONENT_SEPARATOR = ':';

	string Join(const auto& collection, const string_view separator = ", ") {
		ostringstream s;

		for (const auto& element : collection) {
			if (s.tellp()) {
				s << separator;
			}

			s << element;
		}

		return s.str();
	}

	vector<string> Split(const string&, char, int = INT_MAX);
	string Trim(string_view);
	bool GetAsUnsignedInt(const string&, int&);
	string FormatError(const string&, const parser_exception&);

	bool SetLogLevel(const string&);
}
