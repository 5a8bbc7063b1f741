//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "catalog/catalog_logger.h"
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace std;

class CatalogLoggerTest : public testing::Test
{
protected:

	void SetUp() override
	{
		default_logger = spdlog::default_logger();

		auto sink = make_shared<spdlog::sinks::ostream_sink_mt>(output);
		auto logger = make_shared<spdlog::logger>("catalog_logger_test", sink);
		logger->set_pattern("%v");
		logger->set_level(spdlog::level::trace);
		spdlog::set_default_logger(logger);
	}

	void TearDown() override
	{
		CatalogLogger::SetLogLocale("");
		spdlog::set_default_logger(default_logger);
	}

	ostringstream output;

private:

	shared_ptr<spdlog::logger> default_logger;
};

TEST_F(CatalogLoggerTest, Log)
{
	CatalogLogger logger("de");

	logger.Info("message");
	EXPECT_NE(string::npos, output.str().find("(de) - message"));

	output.str("");
	CatalogLogger().Warn("no locale");
	EXPECT_EQ("no locale\n", output.str());
}

TEST_F(CatalogLoggerTest, Levels)
{
	CatalogLogger logger("fr");

	logger.Trace("1");
	logger.Debug("2");
	logger.Info("3");
	logger.Warn("4");
	logger.Log(spdlog::level::err, "5");
	logger.Log(spdlog::level::critical, "6");

	const string s = output.str();
	for (const string& m : { "(fr) - 1", "(fr) - 2", "(fr) - 3", "(fr) - 4", "(fr) - 5", "(fr) - 6" }) {
		EXPECT_NE(string::npos, s.find(m)) << "Missing '" << m << "'";
	}
}

TEST_F(CatalogLoggerTest, SetLogLocale)
{
	CatalogLogger de("de");
	CatalogLogger fr("fr");

	CatalogLogger::SetLogLocale("fr");
	de.Info("german");
	fr.Info("french");
	EXPECT_EQ(string::npos, output.str().find("german"));
	EXPECT_NE(string::npos, output.str().find("(fr) - french"));

	CatalogLogger::SetLogLocale("");
	de.Info("german");
	EXPECT_NE(string::npos, output.str().find("(de) - german"));
}
