//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "string_similarity.h"
#include <algorithm>

using namespace std;

vector<char32_t> string_similarity::DecodeUtf8(string_view s)
{
	vector<char32_t> code_points;
	code_points.reserve(s.size());

	size_t i = 0;
	while (i < s.size()) {
		const auto c = static_cast<unsigned char>(s[i]);

		int length = 1;
		char32_t code_point = c;
		if ((c & 0xe0) == 0xc0) {
			length = 2;
			code_point = c & 0x1f;
		}
		else if ((c & 0xf0) == 0xe0) {
			length = 3;
			code_point = c & 0x0f;
		}
		else if ((c & 0xf8) == 0xf0) {
			length = 4;
			code_point = c & 0x07;
		}

		bool valid = i + length <= s.size();
		for (int j = 1; valid && j < length; j++) {
			const auto next = static_cast<unsigned char>(s[i + j]);
			if ((next & 0xc0) != 0x80) {
				valid = false;
			}
			else {
				code_point = (code_point << 6) | (next & 0x3f);
			}
		}

		if (valid) {
			code_points.push_back(code_point);
			i += length;
		}
		else {
			code_points.push_back(c);
			i++;
		}
	}

	return code_points;
}

double string_similarity::Jaro(string_view s1, string_view s2)
{
	const auto& a = DecodeUtf8(s1);
	const auto& b = DecodeUtf8(s2);

	if (a.empty() && b.empty()) {
		return 1.0;
	}

	if (a.empty() || b.empty()) {
		return 0.0;
	}

	const size_t window = max(a.size(), b.size()) / 2 > 0 ? max(a.size(), b.size()) / 2 - 1 : 0;

	vector<bool> a_matched(a.size());
	vector<bool> b_matched(b.size());

	size_t matches = 0;
	for (size_t i = 0; i < a.size(); i++) {
		const size_t start = i > window ? i - window : 0;
		const size_t end = min(i + window + 1, b.size());

		for (size_t j = start; j < end; j++) {
			if (!b_matched[j] && a[i] == b[j]) {
				a_matched[i] = true;
				b_matched[j] = true;
				matches++;
				break;
			}
		}
	}

	if (!matches) {
		return 0.0;
	}

	// Half the number of matched code points that are out of order
	size_t transpositions = 0;
	size_t k = 0;
	for (size_t i = 0; i < a.size(); i++) {
		if (a_matched[i]) {
			while (!b_matched[k]) {
				k++;
			}
			if (a[i] != b[k]) {
				transpositions++;
			}
			k++;
		}
	}

	const auto m = static_cast<double>(matches);

	return (m / static_cast<double>(a.size()) + m / static_cast<double>(b.size())
			+ (m - static_cast<double>(transpositions) / 2.0) / m) / 3.0;
}
