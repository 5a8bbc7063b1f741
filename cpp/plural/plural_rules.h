//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Interface for plural rule sources. Init() resolves a descriptor (a locale or a
// Plural-Forms header value, depending on the implementation) once, the resulting
// state is then used for any number of evaluations.
//
//---------------------------------------------------------------------------

#pragma once

#include <cstdint>
#include <memory>
#include <string>

using namespace std;

class PluralState
{
	string descriptor;

public:

	explicit PluralState(const string& d) : descriptor(d) {}
	virtual ~PluralState() = default;

	const string& GetDescriptor() const { return descriptor; }
};

class PluralRules
{

public:

	PluralRules() = default;
	virtual ~PluralRules() = default;

	virtual unique_ptr<PluralState> Init(const string&) const = 0;

	virtual int FormCount(const PluralState&) const = 0;

	// Total, the result is always in the range [0, FormCount)
	virtual int FormIndex(const PluralState&, uint64_t) const = 0;

	// The value of the matching Plural-Forms header
	virtual string GetPluralFormsHeader(const PluralState&) const = 0;

	int FormCountFor(const string& descriptor) const { return FormCount(*Init(descriptor)); }
	int FormIndexFor(const string& descriptor, uint64_t n) const { return FormIndex(*Init(descriptor), n); }
};
