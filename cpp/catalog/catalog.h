//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// The parsed contents of one catalog file: header and entries
//
//---------------------------------------------------------------------------

#pragma once

#include "entry.h"
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace std;

// The header fields in the order they were first set
class CatalogHeader
{
	vector<pair<string, string>> fields;

public:

	static inline const string LANGUAGE = "Language";
	static inline const string PLURAL_FORMS = "Plural-Forms";

	CatalogHeader() = default;
	~CatalogHeader() = default;

	bool Contains(const string&) const;
	string Get(const string&) const;
	void Set(const string&, const string&);
	bool Remove(const string&);

	const vector<pair<string, string>>& GetFields() const { return fields; }
	bool IsEmpty() const { return fields.empty(); }
	size_t GetSize() const { return fields.size(); }

	// Order is not relevant for equality
	bool operator==(const CatalogHeader&) const;
};

class Catalog
{
	vector<string> top_comments;

	// Flags of the header entry, e.g. "fuzzy" in a template
	set<string> header_flags;

	CatalogHeader header;

	vector<shared_ptr<Entry>> entries;

public:

	Catalog() = default;
	~Catalog() = default;
	Catalog(const Catalog&);
	Catalog& operator=(const Catalog&);
	Catalog(Catalog&&) = default;
	Catalog& operator=(Catalog&&) = default;

	const vector<string>& GetTopComments() const { return top_comments; }
	void SetTopComments(const vector<string>& c) { top_comments = c; }
	const set<string>& GetHeaderFlags() const { return header_flags; }
	void SetHeaderFlags(const set<string>& f) { header_flags = f; }
	const CatalogHeader& GetHeader() const { return header; }
	CatalogHeader& GetHeader() { return header; }
	void SetHeader(const CatalogHeader& h) { header = h; }

	const vector<shared_ptr<Entry>>& GetEntries() const { return entries; }
	void AddEntry(shared_ptr<Entry> entry) { entries.push_back(entry); }
	size_t GetSize() const { return entries.size(); }
	bool IsEmpty() const { return entries.empty(); }

	// Only searches live (non-obsolete) entries
	shared_ptr<Entry> Find(const entry_key&) const;
	shared_ptr<Entry> Find(const string& msgid) const { return Find(entry_key(nullopt, msgid)); }

	size_t CountObsolete() const;

	bool operator==(const Catalog&) const;
};
