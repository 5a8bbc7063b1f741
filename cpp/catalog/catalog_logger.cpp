//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "catalog_logger.h"

using namespace std;
using namespace spdlog;

void CatalogLogger::Trace(const string& message) const
{
	Log(level::trace, message);
}

void CatalogLogger::Debug(const string& message) const
{
	Log(level::debug, message);
}

void CatalogLogger::Info(const string& message) const
{
	Log(level::info, message);
}

void CatalogLogger::Warn(const string& message) const
{
	Log(level::warn, message);
}

void CatalogLogger::Log(level::level_enum level, const string& message) const
{
	if (!log_locale.empty() && log_locale != locale) {
		return;
	}

	if (locale.empty()) {
		log(level, message);
	}
	else {
		log(level, "(" + locale + ") - " + message);
	}
}

void CatalogLogger::SetLogLocale(const string& l)
{
	log_locale = l;
}
