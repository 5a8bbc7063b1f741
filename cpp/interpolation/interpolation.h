//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Substitution of %{name} placeholders
//
//---------------------------------------------------------------------------

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

using namespace std;

namespace interpolation
{
	using bindings = map<string, string, less<>>;

	struct Segment
	{
		// The literal text or the placeholder name
		string text;

		bool placeholder = false;
	};

	// "%{}" and an unterminated "%{" are literal text
	vector<Segment> Split(string_view);

	set<string> Placeholders(string_view);

	// Throws render_exception with all missing names if a binding is missing
	string Render(string_view, const bindings&);
}
