//---------------------------------------------------------------------------
//
// PO Catalog Synchronizer posync
//
// Copyright (C) 2026 Contributors to the posync project
//
//---------------------------------------------------------------------------

#pragma once

#include "catalog/catalog.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace std;

Catalog ParseCatalog(const string&);
string SerializeCatalog(const Catalog&);

shared_ptr<SingularEntry> CreateSingular(const string&, const string&, const optional<string>& = nullopt);
shared_ptr<PluralEntry> CreatePlural(const string&, const string&, const vector<string>&);

Catalog CreateCatalog(const vector<shared_ptr<Entry>>&);

const Entry& GetEntry(const Catalog&, size_t);
const SingularEntry& GetSingular(const Catalog&, size_t);
const PluralEntry& GetPlural(const Catalog&, size_t);
