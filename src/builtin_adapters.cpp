// SPDX-License-Identifier: MIT

#include <utility>

#include "dataport/formats/csv.hpp"
#include "dataport/formats/html.hpp"
#include "dataport/formats/json.hpp"
#include "dataport/formats/native.hpp"
#include "dataport/formats/parquet.hpp"
#include "dataport/formats/sql.hpp"
#include "dataport/formats/xml.hpp"
#include "dataport/registry.hpp"

namespace dataport {

namespace {

template <typename Kind>
void MustRegister(AdapterRegistry& registry, Kind kind) {
    if (auto ok = registry.Register(std::move(kind)); !ok) {
        throw AdapterException(std::move(ok.error()));
    }
}

}  // namespace

void RegisterBuiltinAdapters(AdapterRegistry& registry) {
    MustRegister(registry, MakeLoaderKind<CsvLoad>("CsvReader"));
    MustRegister(registry, MakeSaverKind<CsvSave>("CsvWriter"));
    MustRegister(registry, MakeLoaderKind<ParquetLoad>("ParquetReader"));
    MustRegister(registry, MakeSaverKind<ParquetSave>("ParquetWriter"));
    MustRegister(registry, MakeLoaderKind<JsonLoad>("JsonReader"));
    MustRegister(registry, MakeSaverKind<JsonSave>("JsonWriter"));
    MustRegister(registry, MakeLoaderKind<XmlLoad>("XmlReader"));
    MustRegister(registry, MakeSaverKind<XmlSave>("XmlWriter"));
    MustRegister(registry, MakeLoaderKind<HtmlLoad>("HtmlReader"));
    MustRegister(registry, MakeSaverKind<HtmlSave>("HtmlWriter"));
    MustRegister(registry, MakeLoaderKind<NativeLoad>("NativeReader"));
    MustRegister(registry, MakeSaverKind<NativeSave>("NativeWriter"));
    MustRegister(registry, MakeLoaderKind<SqlLoad>("SqlReader"));
    MustRegister(registry, MakeSaverKind<SqlSave>("SqlWriter"));
}

}  // namespace dataport
