//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#include "shared/posync_exceptions.h"
#include "translation_table.h"
#include <spdlog/spdlog.h>

using namespace std;

void TranslationTable::Add(const string& locale, const string& domain, const Catalog& catalog)
{
	LocaleTable& table = locales[locale];
	if (!table.plural_state) {
		table.plural_state = plural_rules->Init(locale);
	}

	entries& e = table.domains[domain];

	for (const auto& entry : catalog.GetEntries()) {
		if (!entry->IsObsolete() && !entry->IsFuzzy() && entry->IsTranslated()) {
			e[entry->GetKey()] = entry->Clone();
		}
	}

	spdlog::debug("Translation table for locale '" + locale + "' and domain '" + domain + "' has "
			+ to_string(e.size()) + " entries");
}

string TranslationTable::Gettext(const string& locale, const string& domain, const optional<string>& msgctxt,
		const string& msgid, const interpolation::bindings& b) const
{
	const auto& [table, entry] = Find(locale, domain, entry_key(msgctxt, msgid));

	string message = msgid;
	if (entry) {
		const string translation = entry->IsPlural() ? static_cast<const PluralEntry&>(*entry).GetMsgstr(0)
				: static_cast<const SingularEntry&>(*entry).GetMsgstr();
		if (!translation.empty()) {
			message = translation;
		}
	}

	return interpolation::Render(message, b);
}

string TranslationTable::Ngettext(const string& locale, const string& domain, const optional<string>& msgctxt,
		const string& msgid, const string& msgid_plural, uint64_t count, const interpolation::bindings& b) const
{
	interpolation::bindings bindings_with_count = b;
	bindings_with_count["count"] = to_string(count);

	const auto& [table, entry] = Find(locale, domain, entry_key(msgctxt, msgid));

	string message = count == 1 ? msgid : msgid_plural;
	if (entry) {
		if (entry->IsPlural()) {
			const auto& plural_entry = static_cast<const PluralEntry&>(*entry);

			const int form = plural_rules->FormIndex(*table->plural_state, count);
			if (!plural_entry.HasForm(form)) {
				throw plural_form_exception(form, table->plural_state->GetDescriptor(), entry->GetLine());
			}

			if (const string translation = plural_entry.GetMsgstr(form); !translation.empty()) {
				message = translation;
			}
		}
		else if (const string translation = static_cast<const SingularEntry&>(*entry).GetMsgstr(); !translation.empty()) {
			message = translation;
		}
	}

	return interpolation::Render(message, bindings_with_count);
}

size_t TranslationTable::GetSize(const string& locale, const string& domain) const
{
	if (const auto& l = locales.find(locale); l != locales.end()) {
		if (const auto& d = l->second.domains.find(domain); d != l->second.domains.end()) {
			return d->second.size();
		}
	}

	return 0;
}

pair<const TranslationTable::LocaleTable *, shared_ptr<const Entry>> TranslationTable::Find(const string& locale,
		const string& domain, const entry_key& key) const
{
	vector<string> candidates = { locale };

	// Fall back to the language without territory (e.g. "de" instead of "de_AT")
	if (const auto separator = locale.find_first_of("_-.@"); separator != string::npos) {
		candidates.push_back(locale.substr(0, separator));
	}

	for (const auto& candidate : candidates) {
		const auto& l = locales.find(candidate);
		if (l == locales.end()) {
			continue;
		}

		if (const auto& d = l->second.domains.find(domain); d != l->second.domains.end()) {
			if (const auto& e = d->second.find(key); e != d->second.end()) {
				return { &l->second, e->second };
			}
		}
	}

	return { nullptr, nullptr };
}
