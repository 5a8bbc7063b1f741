//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_util.h"
#include "po_token.h"
#include "po_serializer.h"
#include <sstream>

using namespace std;
using namespace posync_util;

string PoSerializer::Serialize(const Catalog& catalog) const
{
	ostringstream s;

	const bool has_header = !catalog.GetHeader().IsEmpty() || !catalog.GetHeaderFlags().empty()
			|| (!catalog.GetTopComments().empty() && !catalog.IsEmpty());

	if (has_header) {
		WriteHeader(s, catalog);
	}
	else {
		for (const auto& comment : catalog.GetTopComments()) {
			s << comment << '\n';
		}
	}

	for (const auto& entry : catalog.GetEntries()) {
		if (s.tellp()) {
			s << '\n';
		}

		WriteEntry(s, *entry);
	}

	return s.str();
}

void PoSerializer::WriteHeader(ostream& s, const Catalog& catalog) const
{
	for (const auto& comment : catalog.GetTopComments()) {
		s << comment << '\n';
	}

	if (!catalog.GetHeaderFlags().empty()) {
		s << "#, " << Join(catalog.GetHeaderFlags()) << '\n';
	}

	fragments fields = { "" };
	for (const auto& [key, value] : catalog.GetHeader().GetFields()) {
		fields.push_back(key + ": " + value + "\n");
	}

	WriteKeyword(s, "", "msgid", { "" });
	WriteKeyword(s, "", "msgstr", fields);
}

void PoSerializer::WriteEntry(ostream& s, const Entry& entry) const
{
	for (const auto& comment : entry.GetComments()) {
		s << comment << '\n';
	}

	for (const auto& comment : entry.GetExtractedComments()) {
		s << "#. " << comment << '\n';
	}

	WriteReferences(s, entry.GetReferences());

	if (!entry.GetFlags().empty()) {
		s << "#, " << Join(entry.GetFlags()) << '\n';
	}

	if (entry.GetPrevious()) {
		WritePrevious(s, *entry.GetPrevious());
	}

	const string prefix = entry.IsObsolete() ? "#~ " : "";

	if (entry.GetMsgctxt()) {
		WriteKeyword(s, prefix, "msgctxt", { *entry.GetMsgctxt() });
	}

	WriteKeyword(s, prefix, "msgid", entry.GetMsgidFragments());

	if (entry.IsPlural()) {
		const auto& plural_entry = static_cast<const PluralEntry&>(entry);

		WriteKeyword(s, prefix, "msgid_plural", plural_entry.GetMsgidPluralFragments());

		for (const auto& [index, msgstr] : plural_entry.GetMsgstr()) {
			WriteKeyword(s, prefix, "msgstr[" + to_string(index) + "]", msgstr);
		}
	}
	else {
		WriteKeyword(s, prefix, "msgstr", static_cast<const SingularEntry&>(entry).GetMsgstrFragments());
	}
}

void PoSerializer::WriteReferences(ostream& s, const vector<Reference>& references) const
{
	string line = "#:";
	bool has_lineless = false;

	for (const auto& reference : references) {
		const string r = " " + reference.ToString();

		// A reference with a line number must not follow a path without one on the same line
		if (line.size() > 2 && (line.size() + r.size() > MAX_REFERENCE_LINE_LENGTH || (has_lineless && reference.line))) {
			s << line << '\n';
			line = "#:";
			has_lineless = false;
		}

		line += r;
		has_lineless |= !reference.line;
	}

	if (line.size() > 2) {
		s << line << '\n';
	}
}

void PoSerializer::WritePrevious(ostream& s, const PreviousMessage& previous) const
{
	if (previous.msgctxt) {
		WriteKeyword(s, "#| ", "msgctxt", { *previous.msgctxt });
	}

	WriteKeyword(s, "#| ", "msgid", previous.msgid);

	if (!previous.msgid_plural.empty()) {
		WriteKeyword(s, "#| ", "msgid_plural", previous.msgid_plural);
	}
}

void PoSerializer::WriteKeyword(ostream& s, const string& prefix, const string& keyword, const fragments& f) const
{
	s << prefix << keyword << " \"" << (f.empty() ? "" : PoToken::Escape(f.front())) << "\"\n";

	for (size_t i = 1; i < f.size(); i++) {
		s << prefix << '"' << PoToken::Escape(f[i]) << "\"\n";
	}
}
