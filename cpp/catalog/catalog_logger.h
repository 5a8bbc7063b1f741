//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#pragma once

#include "spdlog/spdlog.h"
#include <string>

using namespace std;

class CatalogLogger
{

public:

	CatalogLogger() = default;
	explicit CatalogLogger(const string& l) : locale(l) {}
	~CatalogLogger() = default;

	void Trace(const string&) const;
	void Debug(const string&) const;
	void Info(const string&) const;
	void Warn(const string&) const;

	void Log(spdlog::level::level_enum, const string&) const;

	// An empty locale enables logging for all catalogs
	static void SetLogLocale(const string&);

private:

	string locale;

	static inline string log_locale;
};
