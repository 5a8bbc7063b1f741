//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_exceptions.h"
#include "interpolation.h"

using namespace std;

vector<interpolation::Segment> interpolation::Split(string_view s)
{
	vector<Segment> segments;
	string literal;

	size_t pos = 0;
	while (pos < s.size()) {
		const size_t start = s.find("%{", pos);
		const size_t end = start == string_view::npos ? string_view::npos : s.find('}', start + 2);

		if (end == string_view::npos) {
			literal += s.substr(pos);
			break;
		}

		literal += s.substr(pos, start - pos);

		if (end == start + 2) {
			literal += "%{}";
		}
		else {
			if (!literal.empty()) {
				segments.push_back({ literal, false });
				literal.clear();
			}
			segments.push_back({ string(s.substr(start + 2, end - start - 2)), true });
		}

		pos = end + 1;
	}

	if (!literal.empty()) {
		segments.push_back({ literal, false });
	}

	return segments;
}

set<string> interpolation::Placeholders(string_view s)
{
	set<string> names;

	for (const auto& segment : Split(s)) {
		if (segment.placeholder) {
			names.insert(segment.text);
		}
	}

	return names;
}

string interpolation::Render(string_view s, const bindings& b)
{
	string result;
	set<string> missing;

	for (const auto& segment : Split(s)) {
		if (!segment.placeholder) {
			result += segment.text;
		}
		else if (const auto& it = b.find(segment.text); it != b.end()) {
			result += it->second;
		}
		else {
			result += "%{" + segment.text + "}";
			missing.insert(segment.text);
		}
	}

	if (!missing.empty()) {
		throw render_exception(missing, result);
	}

	return result;
}
