//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "catalog/catalog_logger.h"
#include "posync_util.h"
#include <spdlog/spdlog.h>
#include <cassert>

using namespace std;
using namespace spdlog;

vector<string> posync_util::Split(const string& s, char separator, int limit)
{
	assert(limit >= 0);

	string component;
	vector<string> result;
	stringstream str(s);

	while (--limit > 0 && getline(str, component, separator)) {
		result.push_back(component);
	}

	if (!str.eof()) {
		getline(str, component);
		result.push_back(component);
	}

	return result;
}

string posync_util::Trim(string_view s)
{
	const auto first = s.find_first_not_of(" \t\r\n");
	if (first == string_view::npos) {
		return "";
	}

	const auto last = s.find_last_not_of(" \t\r\n");

	return string(s.substr(first, last - first + 1));
}

bool posync_util::GetAsUnsignedInt(const string& value, int& result)
{
	if (value.empty() || value.find_first_not_of("0123456789") != string::npos) {
		return false;
	}

	try {
		const auto v = stoul(value);
		if (v > INT_MAX) {
			return false;
		}
		result = static_cast<int>(v);
	}
	catch(const invalid_argument&) {
		return false;
	}
	catch(const out_of_range&) {
		return false;
	}

	return true;
}

string posync_util::FormatError(const string& filename, const parser_exception& e)
{
	return filename + ":" + e.what();
}

bool posync_util::SetLogLevel(const string& log_level)
{
	string level = log_level;
	string locale;

	if (const auto& components = Split(log_level, COMPONENT_SEPARATOR, 2); !components.empty()) {
		level = components[0];

		if (components.size() > 1) {
			locale = components[1];
		}
	}

	const level::level_enum l = level::from_str(level);
	// Compensate for spdlog using 'off' for unknown levels
	if (to_string_view(l) != level) {
		spdlog::warn("Invalid log level '" + level + "'");
		return false;
	}

	set_level(l);
	CatalogLogger::SetLogLocale(locale);

	if (!locale.empty()) {
		spdlog::info("Set log level for catalog '" + locale + "' to '" + level + "'");
	}
	else {
		spdlog::info("Set log level to '" + level + "'");
	}

	return true;
}
