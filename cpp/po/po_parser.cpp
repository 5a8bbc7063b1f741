//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_exceptions.h"
#include "shared/posync_util.h"
#include "po_scanner.h"
#include "po_parser.h"
#include <spdlog/spdlog.h>
#include <map>
#include <sstream>
#include <algorithm>
#include <cctype>

using namespace std;
using namespace posync_util;

Catalog PoParser::Parse(string_view text)
{
	PoScanner scanner;
	const auto& t = scanner.Scan(text);

	return Parse(span<const PoToken>(t));
}

Catalog PoParser::Parse(span<const PoToken> t)
{
	tokens = t;
	pos = 0;
	last_line = tokens.empty() ? 1 : tokens.front().GetLine();

	Catalog catalog;

	// Line of each live key, for reporting duplicates
	map<entry_key, int> lines;

	bool is_first = true;
	while (pos < tokens.size()) {
		const auto& comments = ParseComments();

		if (pos == tokens.size()) {
			// A file consisting of comments only
			if (is_first) {
				vector<string> top_comments;
				ranges::transform(comments, back_inserter(top_comments), [] (const auto& c) { return c.text; });
				catalog.SetTopComments(top_comments);
				break;
			}

			ThrowUnexpected();
		}

		const auto& entry = ParseEntry();

		if (is_first && IsHeader(*entry)) {
			ApplyHeader(catalog, static_cast<const SingularEntry&>(*entry), comments);
			is_first = false;
			continue;
		}
		is_first = false;

		ApplyComments(*entry, comments);

		if (!entry->IsObsolete()) {
			if (const auto& it = lines.find(entry->GetKey()); it != lines.end()) {
				throw duplicate_key_exception(entry->GetLine(), it->second, entry->GetMsgid(),
						entry->IsPlural() ? static_cast<const PluralEntry&>(*entry).GetMsgidPlural() : "");
			}

			lines[entry->GetKey()] = entry->GetLine();
		}

		catalog.AddEntry(entry);
	}

	spdlog::debug("Parsed catalog with " + to_string(catalog.GetSize()) + " entries and "
			+ to_string(catalog.GetHeader().GetSize()) + " header fields");

	return catalog;
}

vector<PoParser::Comment> PoParser::ParseComments()
{
	vector<Comment> comments;

	while (HasMore(token_type::comment)) {
		const PoToken& token = Next();
		comments.push_back({ Classify(token.GetValue()), token.GetValue(), token.GetLine() });
	}

	return comments;
}

shared_ptr<Entry> PoParser::ParseEntry()
{
	const bool obsolete = tokens[pos].IsObsolete();

	optional<string> msgctxt;
	if (HasMore(token_type::msgctxt) && tokens[pos].IsObsolete() == obsolete) {
		Next();
		msgctxt = Entry::Concat(ParseStrings(obsolete));
	}

	const int line = Expect(token_type::msgid, obsolete).GetLine();
	const fragments msgid = ParseStrings(obsolete);

	shared_ptr<Entry> entry;

	if (HasMore(token_type::msgid_plural)) {
		Expect(token_type::msgid_plural, obsolete);
		auto plural_entry = make_shared<PluralEntry>(msgid, ParseStrings(obsolete), map<int, fragments>());

		do {
			const PoToken& token = Expect(token_type::plural_msgstr, obsolete);
			if (!plural_entry->AddForm(token.GetPluralIndex(), ParseStrings(obsolete))) {
				throw syntax_exception(token.GetLine(), "duplicate plural form " + to_string(token.GetPluralIndex()));
			}
		} while (HasMore(token_type::plural_msgstr));

		entry = plural_entry;
	}
	else {
		Expect(token_type::msgstr, obsolete);
		entry = make_shared<SingularEntry>(msgid, ParseStrings(obsolete));
	}

	entry->SetMsgctxt(msgctxt);
	entry->SetObsolete(obsolete);
	entry->SetLine(line);

	return entry;
}

fragments PoParser::ParseStrings(bool obsolete)
{
	fragments strings;

	do {
		strings.push_back(Expect(token_type::string_literal, obsolete).GetValue());
	} while (HasMore(token_type::string_literal) && tokens[pos].IsObsolete() == obsolete);

	return strings;
}

const PoToken& PoParser::Expect(token_type type, bool obsolete)
{
	if (!HasMore(type) || tokens[pos].IsObsolete() != obsolete) {
		ThrowUnexpected();
	}

	return Next();
}

const PoToken& PoParser::Next()
{
	const PoToken& token = tokens[pos++];
	last_line = token.GetLine();
	return token;
}

void PoParser::ThrowUnexpected() const
{
	if (pos == tokens.size()) {
		throw syntax_exception(last_line, "syntax error before: end of file");
	}

	throw syntax_exception(tokens[pos].GetLine(), "syntax error before: " + tokens[pos].ToLiteral());
}

PreviousMessage PoParser::ParsePreviousMessage()
{
	PreviousMessage previous;

	if (HasMore(token_type::msgctxt)) {
		Next();
		previous.msgctxt = Entry::Concat(ParseStrings(false));
	}

	Expect(token_type::msgid, false);
	previous.msgid = ParseStrings(false);

	if (HasMore(token_type::msgid_plural)) {
		Next();
		previous.msgid_plural = ParseStrings(false);
	}

	if (pos != tokens.size()) {
		ThrowUnexpected();
	}

	return previous;
}

void PoParser::ApplyComments(Entry& entry, const vector<Comment>& comments) const
{
	vector<PoToken> previous_tokens;
	int previous_line = 0;

	for (const auto& comment : comments) {
		const string_view content = string_view(comment.text).substr(comment.kind == comment_kind::translator ? 0 : 2);

		switch (comment.kind) {
			case comment_kind::translator:
				entry.AddComment(comment.text);
				break;

			case comment_kind::extracted:
				entry.AddExtractedComment(Trim(content));
				break;

			case comment_kind::reference:
				for (const auto& reference : ParseReferences(content)) {
					entry.AddReference(reference);
				}
				break;

			case comment_kind::flag:
				for (const auto& flag : ParseFlags(content)) {
					entry.AddFlag(flag);
				}
				break;

			case comment_kind::previous: {
				PoScanner scanner;
				const auto& t = scanner.Scan(content, comment.line);
				previous_tokens.insert(previous_tokens.end(), t.begin(), t.end());
				if (!previous_line) {
					previous_line = comment.line;
				}
				break;
			}
		}
	}

	if (previous_line) {
		PoParser parser;
		parser.tokens = previous_tokens;
		parser.last_line = previous_line;
		entry.SetPrevious(parser.ParsePreviousMessage());
	}
}

void PoParser::ApplyHeader(Catalog& catalog, const SingularEntry& entry, const vector<Comment>& comments)
{
	vector<string> top_comments;
	set<string> flags;
	for (const auto& comment : comments) {
		if (comment.kind == comment_kind::flag) {
			flags.merge(ParseFlags(string_view(comment.text).substr(2)));
		}
		else {
			top_comments.push_back(comment.text);
		}
	}
	catalog.SetTopComments(top_comments);
	catalog.SetHeaderFlags(flags);

	CatalogHeader header;
	stringstream s(entry.GetMsgstr());
	string line;
	while (getline(s, line)) {
		if (Trim(line).empty()) {
			continue;
		}

		const auto separator = line.find(':');
		if (separator == string::npos) {
			spdlog::warn("Skipping header line without ':' separator: '" + line + "'");
			continue;
		}

		header.Set(Trim(line.substr(0, separator)), Trim(line.substr(separator + 1)));
	}
	catalog.SetHeader(header);
}

vector<Reference> PoParser::ParseReferences(string_view s)
{
	vector<Reference> references;

	string rest = Trim(s);
	while (!rest.empty()) {
		bool found = false;

		// Find the first ":DIGITS" followed by whitespace or the end of the line
		for (size_t colon = rest.find(':'); colon != string::npos; colon = rest.find(':', colon + 1)) {
			size_t end = colon + 1;
			while (end < rest.size() && isdigit(static_cast<unsigned char>(rest[end]))) {
				end++;
			}

			int line;
			if (end == colon + 1 || (end < rest.size() && !isspace(static_cast<unsigned char>(rest[end])))
					|| !GetAsUnsignedInt(rest.substr(colon + 1, end - colon - 1), line)) {
				continue;
			}

			const string path = Trim(rest.substr(0, colon));
			if (path.empty()) {
				continue;
			}

			references.push_back({ path, line });
			rest = Trim(rest.substr(end));
			found = true;
			break;
		}

		if (!found) {
			stringstream words(rest);
			string word;
			while (words >> word) {
				references.push_back({ word, 0 });
			}
			break;
		}
	}

	return references;
}

set<string> PoParser::ParseFlags(string_view s)
{
	string text(s);
	ranges::replace(text, ',', ' ');

	set<string> flags;
	stringstream words(text);
	string flag;
	while (words >> flag) {
		flags.insert(flag);
	}

	return flags;
}

PoParser::comment_kind PoParser::Classify(const string& comment)
{
	if (comment.starts_with("#:")) {
		return comment_kind::reference;
	}

	if (comment.starts_with("#.")) {
		return comment_kind::extracted;
	}

	if (comment.starts_with("#,")) {
		return comment_kind::flag;
	}

	if (comment.starts_with("#|")) {
		return comment_kind::previous;
	}

	return comment_kind::translator;
}

bool PoParser::IsHeader(const Entry& entry)
{
	return !entry.IsPlural() && !entry.GetMsgctxt() && entry.GetMsgid().empty() && !entry.IsObsolete();
}
