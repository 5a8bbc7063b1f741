//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
// Plural rules defined by a Plural-Forms header value, e.g.
// "nplurals=3; plural=(n==1 ? 0 : n%10>=2 && n%10<=4 && (n%100<10 || n%100>=20) ? 1 : 2);"
//
//---------------------------------------------------------------------------

#pragma once

#include "plural_rules.h"
#include <array>
#include <memory>
#include <optional>
#include <string>

using namespace std;

class PluralExpression
{

public:

	enum class operation {
		number,
		n,
		logical_not,
		conditional,
		logical_or,
		logical_and,
		equal,
		not_equal,
		less,
		less_or_equal,
		greater,
		greater_or_equal,
		plus,
		minus,
		multiply,
		divide,
		remainder
	};

	explicit PluralExpression(operation op, uint64_t value = 0) : op(op), value(value) {}
	~PluralExpression() = default;

	void SetNode(int i, unique_ptr<PluralExpression> node) { nodes[i] = std::move(node); }

	// nullopt for a division by zero
	optional<uint64_t> Evaluate(uint64_t) const;

private:

	operation op;

	uint64_t value;

	array<unique_ptr<PluralExpression>, 3> nodes;
};

class PluralFormsRules : public PluralRules
{
	class PluralFormsState : public PluralState
	{
		int nplurals;

		unique_ptr<PluralExpression> plural;

	public:

		PluralFormsState(const string& header, int n, unique_ptr<PluralExpression> p)
			: PluralState(header), nplurals(n), plural(std::move(p)) {}
		~PluralFormsState() override = default;

		int GetNplurals() const { return nplurals; }
		const PluralExpression& GetPlural() const { return *plural; }
	};

public:

	PluralFormsRules() = default;
	~PluralFormsRules() override = default;

	// Throws plural_forms_exception
	unique_ptr<PluralState> Init(const string&) const override;

	int FormCount(const PluralState&) const override;
	int FormIndex(const PluralState&, uint64_t) const override;
	string GetPluralFormsHeader(const PluralState&) const override;
};
