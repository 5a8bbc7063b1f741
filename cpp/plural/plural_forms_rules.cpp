//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_exceptions.h"
#include "shared/posync_util.h"
#include "plural_forms_rules.h"
#include <cctype>

using namespace std;

namespace
{
	using operation = PluralExpression::operation;

	// Recursive descent compiler with the precedence of C
	class PluralFormsCompiler
	{
		static const uint64_t MAX_PLURAL_FORMS = 100;

		// Limit for parentheses, '!' and '?' nested in each other
		static const int MAX_DEPTH = 100;

		const string& header;

		size_t pos = 0;

		int depth = 0;

	public:

		explicit PluralFormsCompiler(const string& h) : header(h) {}
		~PluralFormsCompiler() = default;

		pair<int, unique_ptr<PluralExpression>> Compile()
		{
			Expect("nplurals");
			Expect("=");
			const uint64_t nplurals = Number();
			if (!nplurals || nplurals > MAX_PLURAL_FORMS) {
				Error("invalid number of plural forms");
			}
			Expect(";");

			Expect("plural");
			Expect("=");
			auto plural = Conditional();
			Accept(";");

			SkipWhitespace();
			if (pos != header.size()) {
				Error("unexpected input");
			}

			return { static_cast<int>(nplurals), std::move(plural) };
		}

	private:

		unique_ptr<PluralExpression> Conditional()
		{
			auto condition = LogicalOr();

			if (!Accept("?")) {
				return condition;
			}

			Enter();
			auto node = make_unique<PluralExpression>(operation::conditional);
			node->SetNode(0, std::move(condition));
			node->SetNode(1, Conditional());
			Expect(":");
			node->SetNode(2, Conditional());
			depth--;

			return node;
		}

		unique_ptr<PluralExpression> LogicalOr()
		{
			auto left = LogicalAnd();

			while (Accept("||")) {
				left = Combine(operation::logical_or, std::move(left), LogicalAnd());
			}

			return left;
		}

		unique_ptr<PluralExpression> LogicalAnd()
		{
			auto left = Equality();

			while (Accept("&&")) {
				left = Combine(operation::logical_and, std::move(left), Equality());
			}

			return left;
		}

		unique_ptr<PluralExpression> Equality()
		{
			auto left = Relational();

			while (true) {
				if (Accept("==")) {
					left = Combine(operation::equal, std::move(left), Relational());
				}
				else if (Accept("!=")) {
					left = Combine(operation::not_equal, std::move(left), Relational());
				}
				else {
					return left;
				}
			}
		}

		unique_ptr<PluralExpression> Relational()
		{
			auto left = Additive();

			while (true) {
				if (Accept("<=")) {
					left = Combine(operation::less_or_equal, std::move(left), Additive());
				}
				else if (Accept(">=")) {
					left = Combine(operation::greater_or_equal, std::move(left), Additive());
				}
				else if (Accept("<")) {
					left = Combine(operation::less, std::move(left), Additive());
				}
				else if (Accept(">")) {
					left = Combine(operation::greater, std::move(left), Additive());
				}
				else {
					return left;
				}
			}
		}

		unique_ptr<PluralExpression> Additive()
		{
			auto left = Multiplicative();

			while (true) {
				if (Accept("+")) {
					left = Combine(operation::plus, std::move(left), Multiplicative());
				}
				else if (Accept("-")) {
					left = Combine(operation::minus, std::move(left), Multiplicative());
				}
				else {
					return left;
				}
			}
		}

		unique_ptr<PluralExpression> Multiplicative()
		{
			auto left = Unary();

			while (true) {
				if (Accept("*")) {
					left = Combine(operation::multiply, std::move(left), Unary());
				}
				else if (Accept("/")) {
					left = Combine(operation::divide, std::move(left), Unary());
				}
				else if (Accept("%")) {
					left = Combine(operation::remainder, std::move(left), Unary());
				}
				else {
					return left;
				}
			}
		}

		unique_ptr<PluralExpression> Unary()
		{
			if (Accept("!")) {
				Enter();
				auto node = make_unique<PluralExpression>(operation::logical_not);
				node->SetNode(0, Unary());
				depth--;
				return node;
			}

			return Primary();
		}

		unique_ptr<PluralExpression> Primary()
		{
			if (Accept("(")) {
				Enter();
				auto node = Conditional();
				Expect(")");
				depth--;
				return node;
			}

			if (Accept("n")) {
				return make_unique<PluralExpression>(operation::n);
			}

			return make_unique<PluralExpression>(operation::number, Number());
		}

		uint64_t Number()
		{
			SkipWhitespace();

			const size_t start = pos;
			uint64_t value = 0;
			while (pos < header.size() && isdigit(static_cast<unsigned char>(header[pos]))) {
				const uint64_t digit = header[pos++] - '0';
				if (value > (UINT64_MAX - digit) / 10) {
					Error("number is too large");
				}
				value = value * 10 + digit;
			}

			if (pos == start) {
				Error("number or 'n' expected");
			}

			return value;
		}

		static unique_ptr<PluralExpression> Combine(operation op, unique_ptr<PluralExpression> left,
				unique_ptr<PluralExpression> right)
		{
			auto node = make_unique<PluralExpression>(op);
			node->SetNode(0, std::move(left));
			node->SetNode(1, std::move(right));
			return node;
		}

		bool Accept(string_view token)
		{
			SkipWhitespace();

			if (string_view(header).substr(pos).starts_with(token)) {
				const size_t end = pos + token.size();

				// Keep "!" from matching "!=" and identifiers from matching a longer identifier
				if (token == "!" && end < header.size() && header[end] == '=') {
					return false;
				}
				if (isalpha(static_cast<unsigned char>(token.front())) && end < header.size()
						&& (isalnum(static_cast<unsigned char>(header[end])) || header[end] == '_')) {
					return false;
				}

				pos = end;
				return true;
			}

			return false;
		}

		void Expect(string_view token)
		{
			if (!Accept(token)) {
				Error("'" + string(token) + "' expected");
			}
		}

		void Enter()
		{
			if (++depth > MAX_DEPTH) {
				Error("expression too deeply nested");
			}
		}

		void SkipWhitespace()
		{
			while (pos < header.size() && isspace(static_cast<unsigned char>(header[pos]))) {
				pos++;
			}
		}

		[[noreturn]] void Error(const string& reason) const
		{
			throw plural_forms_exception("Invalid Plural-Forms header '" + header + "': " + reason + " at position "
					+ to_string(pos));
		}
	};
}

optional<uint64_t> PluralExpression::Evaluate(uint64_t n) const
{
	if (op == operation::number) {
		return value;
	}

	if (op == operation::n) {
		return n;
	}

	const auto& left = nodes[0]->Evaluate(n);
	if (!left) {
		return nullopt;
	}

	// Operations with short-circuit evaluation
	switch (op) {
		case operation::logical_not:
			return !*left;

		case operation::conditional:
			return *left ? nodes[1]->Evaluate(n) : nodes[2]->Evaluate(n);

		case operation::logical_or:
			if (*left) {
				return 1;
			}
			break;

		case operation::logical_and:
			if (!*left) {
				return 0;
			}
			break;

		default:
			break;
	}

	const auto& right = nodes[1]->Evaluate(n);
	if (!right) {
		return nullopt;
	}

	switch (op) {
		case operation::logical_or:
		case operation::logical_and:
			return *right != 0;

		case operation::equal:
			return *left == *right;

		case operation::not_equal:
			return *left != *right;

		case operation::less:
			return *left < *right;

		case operation::less_or_equal:
			return *left <= *right;

		case operation::greater:
			return *left > *right;

		case operation::greater_or_equal:
			return *left >= *right;

		case operation::plus:
			return *left + *right;

		case operation::minus:
			return *left - *right;

		case operation::multiply:
			return *left * *right;

		case operation::divide:
			return *right ? optional<uint64_t>(*left / *right) : nullopt;

		case operation::remainder:
			return *right ? optional<uint64_t>(*left % *right) : nullopt;

		default:
			return nullopt;
	}
}

unique_ptr<PluralState> PluralFormsRules::Init(const string& header) const
{
	const string h = posync_util::Trim(header);

	PluralFormsCompiler compiler(h);
	auto [nplurals, plural] = compiler.Compile();

	return make_unique<PluralFormsState>(h, nplurals, std::move(plural));
}

int PluralFormsRules::FormCount(const PluralState& state) const
{
	return dynamic_cast<const PluralFormsState&>(state).GetNplurals();
}

int PluralFormsRules::FormIndex(const PluralState& state, uint64_t n) const
{
	const auto& s = dynamic_cast<const PluralFormsState&>(state);

	// Division by zero and results out of range select the first form
	const auto& index = s.GetPlural().Evaluate(n);
	if (!index || *index >= static_cast<uint64_t>(s.GetNplurals())) {
		return 0;
	}

	return static_cast<int>(*index);
}

string PluralFormsRules::GetPluralFormsHeader(const PluralState& state) const
{
	return state.GetDescriptor();
}
