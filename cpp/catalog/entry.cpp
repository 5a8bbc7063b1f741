//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "entry.h"
#include <algorithm>

using namespace std;

string Entry::Concat(const fragments& f)
{
	string s;
	for (const auto& fragment : f) {
		s += fragment;
	}
	return s;
}

bool Entry::Equals(const Entry& other) const
{
	return IsPlural() == other.IsPlural() && msgctxt == other.msgctxt && msgid == other.msgid
			&& comments == other.comments && extracted_comments == other.extracted_comments
			&& references == other.references && flags == other.flags && obsolete == other.obsolete
			&& previous == other.previous;
}

bool SingularEntry::Equals(const Entry& other) const
{
	if (!Entry::Equals(other)) {
		return false;
	}

	return msgstr == static_cast<const SingularEntry&>(other).msgstr;
}

bool SingularEntry::IsTranslated() const
{
	return !GetMsgstr().empty();
}

bool PluralEntry::Equals(const Entry& other) const
{
	if (!Entry::Equals(other)) {
		return false;
	}

	const auto& p = static_cast<const PluralEntry&>(other);
	return msgid_plural == p.msgid_plural && msgstr == p.msgstr;
}

bool PluralEntry::IsTranslated() const
{
	return ranges::any_of(msgstr, [] (const auto& form) { return !Concat(form.second).empty(); });
}

string PluralEntry::GetMsgstr(int index) const
{
	const auto& it = msgstr.find(index);
	return it != msgstr.end() ? Concat(it->second) : "";
}
