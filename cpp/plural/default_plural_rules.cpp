//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "default_plural_rules.h"
#include <spdlog/spdlog.h>
#include <algorithm>

using namespace std;

namespace
{
	unordered_map<string, plural_family> CreateFamilies()
	{
		unordered_map<string, plural_family> f;

		for (const auto& l : { "ay", "bo", "cgg", "dz", "fa", "id", "ja", "jbo", "ka", "kk", "km", "ko", "ky",
				"lo", "ms", "my", "sah", "su", "th", "tt", "ug", "vi", "wo", "zh" }) {
			f[l] = plural_family::one_form;
		}

		for (const auto& l : { "af", "an", "anp", "as", "ast", "az", "bg", "bn", "brx", "ca", "da", "de", "doi",
				"el", "en", "eo", "es", "et", "eu", "ff", "fi", "fo", "fur", "fy", "gl", "gu", "ha", "he", "hi",
				"hne", "hy", "hu", "ia", "it", "kl", "kn", "ku", "lb", "mai", "ml", "mn", "mni", "mr", "nah", "nap",
				"nb", "ne", "nl", "se", "nn", "no", "nso", "or", "ps", "pa", "pap", "pms", "pt", "rm", "rw", "sat",
				"sco", "sd", "si", "so", "son", "sq", "sw", "sv", "ta", "te", "tk", "ur", "yo" }) {
			f[l] = plural_family::two_forms_1;
		}

		for (const auto& l : { "ach", "ak", "am", "arn", "br", "fil", "fr", "gun", "ln", "mfe", "mg", "mi", "oc",
				"tg", "ti", "tl", "tr", "uz", "wa" }) {
			f[l] = plural_family::two_forms_2;
		}

		for (const auto& l : { "be", "bs", "hr", "sr", "ru", "uk" }) {
			f[l] = plural_family::slavic;
		}

		f["cs"] = plural_family::slavic_alt;
		f["sk"] = plural_family::slavic_alt;

		f["ar"] = plural_family::ar;
		f["csb"] = plural_family::csb;
		f["cy"] = plural_family::cy;
		f["ga"] = plural_family::ga;
		f["gd"] = plural_family::gd;
		f["is"] = plural_family::is;
		f["jv"] = plural_family::jv;
		f["kw"] = plural_family::kw;
		f["lt"] = plural_family::lt;
		f["lv"] = plural_family::lv;
		f["mk"] = plural_family::mk;
		f["mnk"] = plural_family::mnk;
		f["mt"] = plural_family::mt;
		f["pl"] = plural_family::pl;
		f["pt_BR"] = plural_family::pt_br;
		f["ro"] = plural_family::ro;
		f["sl"] = plural_family::sl;

		return f;
	}
}

const unordered_map<string, plural_family> DefaultPluralRules::families = CreateFamilies();

const unordered_map<plural_family, string> DefaultPluralRules::headers = {
		{ plural_family::one_form, "nplurals=1; plural=0;" },
		{ plural_family::two_forms_1, "nplurals=2; plural=(n != 1);" },
		{ plural_family::two_forms_2, "nplurals=2; plural=(n > 1);" },
		{ plural_family::slavic, "nplurals=3; plural=(n%10==1 && n%100!=11 ? 0 : n%10>=2 && n%10<=4 && (n%100<10 || n%100>=20) ? 1 : 2);" },
		{ plural_family::slavic_alt, "nplurals=3; plural=(n==1) ? 0 : (n>=2 && n<=4) ? 1 : 2;" },
		{ plural_family::ar, "nplurals=6; plural=(n==0 ? 0 : n==1 ? 1 : n==2 ? 2 : n%100>=3 && n%100<=10 ? 3 : n%100>=11 ? 4 : 5);" },
		{ plural_family::csb, "nplurals=3; plural=(n==1 ? 0 : n%10>=2 && n%10<=4 && (n%100<10 || n%100>=20) ? 1 : 2);" },
		{ plural_family::cy, "nplurals=4; plural=(n==1) ? 0 : (n==2) ? 1 : (n != 8 && n != 11) ? 2 : 3;" },
		{ plural_family::ga, "nplurals=5; plural=(n==1 ? 0 : n==2 ? 1 : n>=3 && n<=6 ? 2 : n>=7 && n<=10 ? 3 : 4);" },
		{ plural_family::gd, "nplurals=4; plural=(n==1 || n==11) ? 0 : (n==2 || n==12) ? 1 : (n > 2 && n < 20) ? 2 : 3;" },
		{ plural_family::is, "nplurals=2; plural=(n%10!=1 || n%100==11);" },
		{ plural_family::jv, "nplurals=2; plural=(n != 0);" },
		{ plural_family::kw, "nplurals=4; plural=(n==1) ? 0 : (n==2) ? 1 : (n == 3) ? 2 : 3;" },
		{ plural_family::lt, "nplurals=3; plural=(n%10==1 && n%100!=11 ? 0 : n%10>=2 && (n%100<10 || n%100>=20) ? 1 : 2);" },
		{ plural_family::lv, "nplurals=3; plural=(n%10==1 && n%100!=11 ? 0 : n != 0 ? 1 : 2);" },
		{ plural_family::mk, "nplurals=3; plural=(n%10==1 ? 0 : n%10==2 ? 1 : 2);" },
		{ plural_family::mnk, "nplurals=3; plural=(n==0 ? 0 : n==1 ? 1 : 2);" },
		{ plural_family::mt, "nplurals=4; plural=(n==1 ? 0 : n==0 || (n%100>1 && n%100<11) ? 1 : (n%100>10 && n%100<20) ? 2 : 3);" },
		{ plural_family::pl, "nplurals=3; plural=(n==1 ? 0 : n%10>=2 && n%10<=4 && (n%100<10 || n%100>=20) ? 1 : 2);" },
		{ plural_family::pt_br, "nplurals=2; plural=(n > 1);" },
		{ plural_family::ro, "nplurals=3; plural=(n==1 ? 0 : (n==0 || (n%100 > 0 && n%100 < 20)) ? 1 : 2);" },
		{ plural_family::sl, "nplurals=4; plural=(n%100==1 ? 1 : n%100==2 ? 2 : n%100==3 ? 3 : 0);" }
};

unique_ptr<PluralState> DefaultPluralRules::Init(const string& locale) const
{
	return make_unique<DefaultPluralState>(locale, GetFamily(locale));
}

int DefaultPluralRules::FormCount(const PluralState& state) const
{
	return GetFormCount(dynamic_cast<const DefaultPluralState&>(state).GetFamily());
}

int DefaultPluralRules::FormIndex(const PluralState& state, uint64_t n) const
{
	return GetFormIndex(dynamic_cast<const DefaultPluralState&>(state).GetFamily(), n);
}

string DefaultPluralRules::GetPluralFormsHeader(const PluralState& state) const
{
	return headers.at(dynamic_cast<const DefaultPluralState&>(state).GetFamily());
}

plural_family DefaultPluralRules::GetFamily(const string& locale) const
{
	// Strip codeset and modifier, e.g. "sr_RS.UTF-8@latin", and accept "pt-BR" for "pt_BR"
	string l = locale.substr(0, locale.find_first_of(".@"));
	ranges::replace(l, '-', '_');

	if (const auto& it = families.find(l); it != families.end()) {
		return it->second;
	}

	// Language without territory
	if (const auto separator = l.find('_'); separator != string::npos) {
		if (const auto& it = families.find(l.substr(0, separator)); it != families.end()) {
			return it->second;
		}
	}

	spdlog::debug("No plural rules for locale '" + locale + "', using rules for 'en'");

	return plural_family::two_forms_1;
}

int DefaultPluralRules::GetFormCount(plural_family family)
{
	switch (family) {
		case plural_family::one_form:
			return 1;

		case plural_family::two_forms_1:
		case plural_family::two_forms_2:
		case plural_family::is:
		case plural_family::jv:
		case plural_family::pt_br:
			return 2;

		case plural_family::slavic:
		case plural_family::slavic_alt:
		case plural_family::csb:
		case plural_family::lt:
		case plural_family::lv:
		case plural_family::mk:
		case plural_family::mnk:
		case plural_family::pl:
		case plural_family::ro:
			return 3;

		case plural_family::cy:
		case plural_family::gd:
		case plural_family::kw:
		case plural_family::mt:
		case plural_family::sl:
			return 4;

		case plural_family::ga:
			return 5;

		case plural_family::ar:
			return 6;

		default:
			return 2;
	}
}

int DefaultPluralRules::GetFormIndex(plural_family family, uint64_t n)
{
	const uint64_t n10 = n % 10;
	const uint64_t n100 = n % 100;

	switch (family) {
		case plural_family::one_form:
			return 0;

		case plural_family::two_forms_1:
			return n == 1 ? 0 : 1;

		case plural_family::two_forms_2:
		case plural_family::pt_br:
			return n <= 1 ? 0 : 1;

		case plural_family::slavic:
			if (n10 == 1 && n100 != 11) {
				return 0;
			}
			return n10 >= 2 && n10 <= 4 && (n100 < 10 || n100 >= 20) ? 1 : 2;

		case plural_family::slavic_alt:
			if (n == 1) {
				return 0;
			}
			return n >= 2 && n <= 4 ? 1 : 2;

		case plural_family::ar:
			if (n <= 2) {
				return static_cast<int>(n);
			}
			if (n100 >= 3 && n100 <= 10) {
				return 3;
			}
			return n100 >= 11 ? 4 : 5;

		case plural_family::csb:
		case plural_family::pl:
			if (n == 1) {
				return 0;
			}
			return n10 >= 2 && n10 <= 4 && (n100 < 10 || n100 >= 20) ? 1 : 2;

		case plural_family::cy:
			if (n == 1 || n == 2) {
				return static_cast<int>(n) - 1;
			}
			return n != 8 && n != 11 ? 2 : 3;

		case plural_family::ga:
			if (n == 1 || n == 2) {
				return static_cast<int>(n) - 1;
			}
			if (n >= 3 && n <= 6) {
				return 2;
			}
			return n >= 7 && n <= 10 ? 3 : 4;

		case plural_family::gd:
			if (n == 1 || n == 11) {
				return 0;
			}
			if (n == 2 || n == 12) {
				return 1;
			}
			return n > 2 && n < 20 ? 2 : 3;

		case plural_family::is:
			return n10 == 1 && n100 != 11 ? 0 : 1;

		case plural_family::jv:
			return n ? 1 : 0;

		case plural_family::kw:
			return n >= 1 && n <= 3 ? static_cast<int>(n) - 1 : 3;

		case plural_family::lt:
			if (n10 == 1 && n100 != 11) {
				return 0;
			}
			return n10 >= 2 && (n100 < 10 || n100 >= 20) ? 1 : 2;

		case plural_family::lv:
			if (n10 == 1 && n100 != 11) {
				return 0;
			}
			return n ? 1 : 2;

		case plural_family::mk:
			if (n10 == 1) {
				return 0;
			}
			return n10 == 2 ? 1 : 2;

		case plural_family::mnk:
			return n <= 1 ? static_cast<int>(n) : 2;

		case plural_family::mt:
			if (n == 1) {
				return 0;
			}
			if (n == 0 || (n100 > 1 && n100 < 11)) {
				return 1;
			}
			return n100 > 10 && n100 < 20 ? 2 : 3;

		case plural_family::ro:
			if (n == 1) {
				return 0;
			}
			return n == 0 || (n100 > 0 && n100 < 20) ? 1 : 2;

		case plural_family::sl:
			return n100 >= 1 && n100 <= 3 ? static_cast<int>(n100) : 0;

		default:
			return n == 1 ? 0 : 1;
	}
}
