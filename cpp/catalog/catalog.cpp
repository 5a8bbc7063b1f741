//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "catalog.h"
#include <algorithm>

using namespace std;

bool CatalogHeader::Contains(const string& key) const
{
	return ranges::any_of(fields, [&key] (const auto& field) { return field.first == key; });
}

string CatalogHeader::Get(const string& key) const
{
	const auto& it = ranges::find_if(fields, [&key] (const auto& field) { return field.first == key; });
	return it != fields.end() ? it->second : "";
}

void CatalogHeader::Set(const string& key, const string& value)
{
	if (auto it = ranges::find_if(fields, [&key] (const auto& field) { return field.first == key; });
			it != fields.end()) {
		it->second = value;
	}
	else {
		fields.emplace_back(key, value);
	}
}

bool CatalogHeader::Remove(const string& key)
{
	return erase_if(fields, [&key] (const auto& field) { return field.first == key; }) > 0;
}

bool CatalogHeader::operator==(const CatalogHeader& other) const
{
	if (fields.size() != other.fields.size()) {
		return false;
	}

	return ranges::all_of(fields, [&other] (const auto& field) {
		return other.Contains(field.first) && other.Get(field.first) == field.second;
	});
}

Catalog::Catalog(const Catalog& other)
	: top_comments(other.top_comments), header_flags(other.header_flags), header(other.header)
{
	for (const auto& entry : other.entries) {
		entries.push_back(entry->Clone());
	}
}

Catalog& Catalog::operator=(const Catalog& other)
{
	if (this != &other) {
		Catalog copy(other);
		*this = std::move(copy);
	}

	return *this;
}

shared_ptr<Entry> Catalog::Find(const entry_key& key) const
{
	const auto& it = ranges::find_if(entries, [&key] (const auto& entry) {
		return !entry->IsObsolete() && entry->GetKey() == key;
	});
	return it != entries.end() ? *it : nullptr;
}

size_t Catalog::CountObsolete() const
{
	return ranges::count_if(entries, [] (const auto& entry) { return entry->IsObsolete(); });
}

bool Catalog::operator==(const Catalog& other) const
{
	return top_comments == other.top_comments && header_flags == other.header_flags && header == other.header
			&& ranges::equal(entries, other.entries, [] (const auto& e1, const auto& e2) { return e1->Equals(*e2); });
}
