//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#pragma once

#include <gmock/gmock.h>

#include "test_shared.h"
#include "plural/plural_rules.h"

using namespace testing;

class MockPluralRules : public PluralRules
{
public:

	MOCK_METHOD(unique_ptr<PluralState>, Init, (const string&), (const, override));
	MOCK_METHOD(int, FormCount, (const PluralState&), (const, override));
	MOCK_METHOD(int, FormIndex, (const PluralState&, uint64_t), (const, override));
	MOCK_METHOD(string, GetPluralFormsHeader, (const PluralState&), (const, override));

	MockPluralRules() = default;
	~MockPluralRules() override = default;
};
