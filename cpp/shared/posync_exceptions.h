//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#pragma once

#include <stdexcept>
#include <string>
#include <set>

using namespace std;

// Base class for all errors that refer to a line of catalog text
class parser_exception : public runtime_error
{
	int line;
	string reason;

public:

	parser_exception(int line, const string& reason) : runtime_error(to_string(line) + ": " + reason),
		line(line), reason(reason) {}
	~parser_exception() override = default;

	int get_line() const { return line; }
	const string& get_reason() const { return reason; }
};

class lex_exception : public parser_exception
{
	using parser_exception::parser_exception;
};

class syntax_exception : public parser_exception
{
	using parser_exception::parser_exception;
};

class duplicate_key_exception : public syntax_exception
{
	int original_line;
	string msgid;
	string msgid_plural;

public:

	duplicate_key_exception(int line, int original_line, const string& msgid, const string& msgid_plural = "")
		: syntax_exception(line, "found duplicate on line " + to_string(original_line) + " for msgid: '" + msgid + "'"
				+ (msgid_plural.empty() ? "" : " and msgid_plural: '" + msgid_plural + "'")),
		original_line(original_line), msgid(msgid), msgid_plural(msgid_plural) {}
	~duplicate_key_exception() override = default;

	int get_original_line() const { return original_line; }
	const string& get_msgid() const { return msgid; }
	const string& get_msgid_plural() const { return msgid_plural; }
};

class render_exception : public runtime_error
{
	set<string> missing_keys;

	// The text with all available bindings substituted
	string partial;

	static string CreateMessage(const set<string>& keys)
	{
		string msg = "missing interpolation keys: ";
		bool first = true;
		for (const auto& key : keys) {
			if (!first) {
				msg += ", ";
			}
			msg += key;
			first = false;
		}
		return msg;
	}

public:

	render_exception(const set<string>& missing_keys, const string& partial)
		: runtime_error(CreateMessage(missing_keys)), missing_keys(missing_keys), partial(partial) {}
	~render_exception() override = default;

	const set<string>& get_missing_keys() const { return missing_keys; }
	const string& get_partial() const { return partial; }
};

class policy_exception : public runtime_error
{
	using runtime_error::runtime_error;
};

class io_exception : public runtime_error
{
	using runtime_error::runtime_error;
};

class plural_forms_exception : public runtime_error
{
	using runtime_error::runtime_error;
};

class plural_form_exception : public runtime_error
{
	int form;
	string locale;
	int line;

public:

	plural_form_exception(int form, const string& locale, int line)
		: runtime_error("plural form " + to_string(form) + " is required for locale '" + locale
				+ "' but is missing for message on line " + to_string(line)),
		form(form), locale(locale), line(line) {}
	~plural_form_exception() override = default;

	int get_form() const { return form; }
	const string& get_locale() const { return locale; }
	int get_line() const { return line; }
};
