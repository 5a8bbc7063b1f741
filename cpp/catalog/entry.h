//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// A single translatable unit of a catalog, either singular or plural
//
//---------------------------------------------------------------------------

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace std;

// The string literals a value was declared with, in declaration order
using fragments = vector<string>;

// msgctxt and concatenated msgid, an absent msgctxt is different from an empty one
using entry_key = pair<optional<string>, string>;

struct Reference
{
	string path;

	// 0 if the reference has no line number
	int line = 0;

	string ToString() const { return line ? path + ":" + to_string(line) : path; }

	bool operator==(const Reference&) const = default;
};

// The msgctxt/msgid/msgid_plural an entry had before a fuzzy match replaced them
struct PreviousMessage
{
	optional<string> msgctxt;
	fragments msgid;
	fragments msgid_plural;

	bool operator==(const PreviousMessage&) const = default;
};

class Entry
{
	optional<string> msgctxt;

	fragments msgid;

	// Translator comments, verbatim including the '#'
	vector<string> comments;

	vector<string> extracted_comments;

	vector<Reference> references;

	set<string> flags;

	bool obsolete = false;

	optional<PreviousMessage> previous;

	// Line of the msgid keyword, 0 for entries not created by the parser
	int line = 0;

public:

	static inline const string FLAG_FUZZY = "fuzzy";

	Entry() = default;
	virtual ~Entry() = default;

	virtual bool IsPlural() const = 0;
	virtual shared_ptr<Entry> Clone() const = 0;

	// Semantic equality, source lines are ignored
	virtual bool Equals(const Entry&) const;

	// True if at least one translated fragment is not empty
	virtual bool IsTranslated() const = 0;

	entry_key GetKey() const { return { msgctxt, GetMsgid() }; }

	const optional<string>& GetMsgctxt() const { return msgctxt; }
	void SetMsgctxt(const optional<string>& c) { msgctxt = c; }
	string GetMsgid() const { return Concat(msgid); }
	const fragments& GetMsgidFragments() const { return msgid; }
	void SetMsgid(const fragments& f) { msgid = f; }

	const vector<string>& GetComments() const { return comments; }
	void SetComments(const vector<string>& c) { comments = c; }
	void AddComment(const string& c) { comments.push_back(c); }
	const vector<string>& GetExtractedComments() const { return extracted_comments; }
	void SetExtractedComments(const vector<string>& c) { extracted_comments = c; }
	void AddExtractedComment(const string& c) { extracted_comments.push_back(c); }
	const vector<Reference>& GetReferences() const { return references; }
	void SetReferences(const vector<Reference>& r) { references = r; }
	void AddReference(const Reference& r) { references.push_back(r); }

	const set<string>& GetFlags() const { return flags; }
	void SetFlags(const set<string>& f) { flags = f; }
	bool HasFlag(const string& flag) const { return flags.contains(flag); }
	void AddFlag(const string& flag) { flags.insert(flag); }
	void RemoveFlag(const string& flag) { flags.erase(flag); }
	bool IsFuzzy() const { return HasFlag(FLAG_FUZZY); }

	bool IsObsolete() const { return obsolete; }
	void SetObsolete(bool o) { obsolete = o; }

	const optional<PreviousMessage>& GetPrevious() const { return previous; }
	void SetPrevious(const optional<PreviousMessage>& p) { previous = p; }

	int GetLine() const { return line; }
	void SetLine(int l) { line = l; }

	static string Concat(const fragments&);
};

class SingularEntry : public Entry
{
	fragments msgstr;

public:

	SingularEntry() = default;
	SingularEntry(const fragments& id, const fragments& str) : msgstr(str) { SetMsgid(id); }
	~SingularEntry() override = default;

	bool IsPlural() const override { return false; }
	shared_ptr<Entry> Clone() const override { return make_shared<SingularEntry>(*this); }
	bool Equals(const Entry&) const override;
	bool IsTranslated() const override;

	string GetMsgstr() const { return Concat(msgstr); }
	const fragments& GetMsgstrFragments() const { return msgstr; }
	void SetMsgstr(const fragments& f) { msgstr = f; }
};

class PluralEntry : public Entry
{
	fragments msgid_plural;

	map<int, fragments> msgstr;

public:

	PluralEntry() = default;
	PluralEntry(const fragments& id, const fragments& id_plural, const map<int, fragments>& str)
		: msgid_plural(id_plural), msgstr(str) { SetMsgid(id); }
	~PluralEntry() override = default;

	bool IsPlural() const override { return true; }
	shared_ptr<Entry> Clone() const override { return make_shared<PluralEntry>(*this); }
	bool Equals(const Entry&) const override;
	bool IsTranslated() const override;

	string GetMsgidPlural() const { return Concat(msgid_plural); }
	const fragments& GetMsgidPluralFragments() const { return msgid_plural; }
	void SetMsgidPlural(const fragments& f) { msgid_plural = f; }

	const map<int, fragments>& GetMsgstr() const { return msgstr; }
	void SetMsgstr(const map<int, fragments>& m) { msgstr = m; }
	bool HasForm(int index) const { return msgstr.contains(index); }
	string GetMsgstr(int index) const;

	// Returns false if the index is already in use
	bool AddForm(int index, const fragments& f) { return msgstr.try_emplace(index, f).second; }
};
