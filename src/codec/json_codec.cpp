// SPDX-License-Identifier: MIT

#include "dataport/codec/json_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "dataport/dataset.hpp"

namespace dataport::codec {

namespace {

std::expected<std::string, std::string> ReadText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(fmt::format("cannot open '{}' for reading", path));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(fmt::format("error reading '{}'", path));
    }
    return ss.str();
}

std::expected<void, std::string> WriteText(const std::string& path, std::string_view text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(fmt::format("cannot open '{}' for writing", path));
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.close();
    if (!file) {
        return std::unexpected(fmt::format("error writing '{}'", path));
    }
    return {};
}

std::expected<void, std::string> Parse(rapidjson::Document& doc, std::string_view text) {
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format("JSON parse error at offset {}: {}",
                                           doc.GetErrorOffset(),
                                           rapidjson::GetParseError_En(doc.GetParseError())));
    }
    return {};
}

std::string_view AsView(const rapidjson::Value& v) {
    return {v.GetString(), v.GetStringLength()};
}

std::expected<Value, std::string> ToValue(const rapidjson::Value& v, std::string_view field) {
    if (v.IsNull()) return Value{};
    if (v.IsBool()) return Value{v.GetBool()};
    if (v.IsInt64()) return Value{v.GetInt64()};
    if (v.IsNumber()) return Value{v.GetDouble()};
    if (v.IsString()) return Value{std::string(AsView(v))};
    return std::unexpected(fmt::format("field '{}' holds a nested value", field));
}

std::expected<Record, std::string> ToRecord(const rapidjson::Value& obj) {
    if (!obj.IsObject()) {
        return std::unexpected(std::string("expected a JSON object per record"));
    }
    Record record;
    record.reserve(obj.MemberCount());
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        std::string name(AsView(it->name));
        auto value = ToValue(it->value, name);
        if (!value) return std::unexpected(value.error());
        record.emplace_back(std::move(name), std::move(*value));
    }
    return record;
}

std::expected<DataFrame, std::string> FromRecordsArray(const rapidjson::Value& doc) {
    if (!doc.IsArray()) {
        return std::unexpected(std::string("records orient expects a top-level array"));
    }
    RecordList records;
    records.reserve(doc.Size());
    for (const auto& item : doc.GetArray()) {
        auto record = ToRecord(item);
        if (!record) return std::unexpected(record.error());
        records.push_back(std::move(*record));
    }
    return FromRecords(records);
}

// {"col": {"<index>": value, ...}, ...}.  Rows follow the first appearance
// of each index label; a column without a label gets null there.
std::expected<DataFrame, std::string> FromColumnsObject(const rapidjson::Value& doc) {
    if (!doc.IsObject()) {
        return std::unexpected(std::string("columns orient expects a top-level object"));
    }
    std::vector<std::string> index;
    std::unordered_map<std::string, size_t> positions;
    std::vector<std::pair<std::string, std::vector<std::pair<size_t, Value>>>> cells;

    for (auto col = doc.MemberBegin(); col != doc.MemberEnd(); ++col) {
        std::string name(AsView(col->name));
        if (!col->value.IsObject()) {
            return std::unexpected(fmt::format("column '{}' must be an object of index labels",
                                               name));
        }
        std::vector<std::pair<size_t, Value>> entries;
        for (auto cell = col->value.MemberBegin(); cell != col->value.MemberEnd(); ++cell) {
            std::string label(AsView(cell->name));
            auto [pos, inserted] = positions.try_emplace(label, index.size());
            if (inserted) index.push_back(label);
            auto value = ToValue(cell->value, name);
            if (!value) return std::unexpected(value.error());
            entries.emplace_back(pos->second, std::move(*value));
        }
        cells.emplace_back(std::move(name), std::move(entries));
    }

    std::vector<std::pair<std::string, std::vector<Value>>> columns;
    columns.reserve(cells.size());
    for (auto& [name, entries] : cells) {
        std::vector<Value> values(index.size());
        for (auto& [row, value] : entries) {
            values[row] = std::move(value);
        }
        columns.emplace_back(std::move(name), std::move(values));
    }
    return DataFrame::FromValues(std::move(columns));
}

std::expected<DataFrame, std::string> FromSplitObject(const rapidjson::Value& doc) {
    if (!doc.IsObject() || !doc.HasMember("columns") || !doc.HasMember("data")) {
        return std::unexpected(
            std::string("split orient expects an object with 'columns' and 'data'"));
    }
    const auto& names = doc["columns"];
    const auto& data = doc["data"];
    if (!names.IsArray() || !data.IsArray()) {
        return std::unexpected(std::string("split orient: 'columns' and 'data' must be arrays"));
    }

    std::vector<std::pair<std::string, std::vector<Value>>> columns;
    for (const auto& name : names.GetArray()) {
        if (!name.IsString()) {
            return std::unexpected(std::string("split orient: column names must be strings"));
        }
        columns.emplace_back(std::string(AsView(name)), std::vector<Value>{});
    }
    size_t row = 0;
    for (const auto& values : data.GetArray()) {
        if (!values.IsArray() || values.Size() != columns.size()) {
            return std::unexpected(fmt::format("split orient: row {} must be an array of {} values",
                                               row, columns.size()));
        }
        for (rapidjson::SizeType c = 0; c < values.Size(); ++c) {
            auto value = ToValue(values[c], columns[c].first);
            if (!value) return std::unexpected(value.error());
            columns[c].second.push_back(std::move(*value));
        }
        ++row;
    }
    return DataFrame::FromValues(std::move(columns));
}

std::expected<DataFrame, std::string> FromLines(std::string_view text) {
    RecordList records;
    size_t line_no = 0;
    std::istringstream lines{std::string(text)};
    for (std::string line; std::getline(lines, line);) {
        ++line_no;
        if (std::ranges::all_of(line, [](unsigned char c) { return std::isspace(c); })) continue;
        rapidjson::Document doc;
        if (auto ok = Parse(doc, line); !ok) {
            return std::unexpected(fmt::format("line {}: {}", line_no, ok.error()));
        }
        auto record = ToRecord(doc);
        if (!record) return std::unexpected(fmt::format("line {}: {}", line_no, record.error()));
        records.push_back(std::move(*record));
    }
    return FromRecords(records);
}

template <typename Writer>
void WriteValue(Writer& w, const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        w.Int64(*i);
    } else if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) {
            w.Double(*d);
        } else {
            w.Null();
        }
    } else if (const auto* b = std::get_if<bool>(&value)) {
        w.Bool(*b);
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        w.String(s->data(), static_cast<rapidjson::SizeType>(s->size()));
    } else {
        w.Null();
    }
}

template <typename Writer>
void WriteKey(Writer& w, std::string_view key) {
    w.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
}

template <typename Writer>
void WriteRow(Writer& w, const DataFrame& frame, size_t row) {
    w.StartObject();
    for (const auto& col : frame.columns()) {
        WriteKey(w, col.name);
        WriteValue(w, col.values[row]);
    }
    w.EndObject();
}

template <typename Writer>
void WriteDocument(Writer& w, const DataFrame& frame, std::string_view orient) {
    if (orient == "records") {
        w.StartArray();
        for (size_t row = 0; row < frame.RowCount(); ++row) {
            WriteRow(w, frame, row);
        }
        w.EndArray();
    } else if (orient == "split") {
        w.StartObject();
        WriteKey(w, "columns");
        w.StartArray();
        for (const auto& col : frame.columns()) {
            w.String(col.name.data(), static_cast<rapidjson::SizeType>(col.name.size()));
        }
        w.EndArray();
        WriteKey(w, "index");
        w.StartArray();
        for (size_t row = 0; row < frame.RowCount(); ++row) {
            w.Uint64(row);
        }
        w.EndArray();
        WriteKey(w, "data");
        w.StartArray();
        for (size_t row = 0; row < frame.RowCount(); ++row) {
            w.StartArray();
            for (const auto& col : frame.columns()) {
                WriteValue(w, col.values[row]);
            }
            w.EndArray();
        }
        w.EndArray();
        w.EndObject();
    } else {
        w.StartObject();
        for (const auto& col : frame.columns()) {
            WriteKey(w, col.name);
            w.StartObject();
            for (size_t row = 0; row < col.values.size(); ++row) {
                WriteKey(w, std::to_string(row));
                WriteValue(w, col.values[row]);
            }
            w.EndObject();
        }
        w.EndObject();
    }
}

}  // namespace

bool IsUtf8Encoding(std::string_view encoding) {
    std::string lower;
    std::ranges::transform(encoding, std::back_inserter(lower),
                           [](unsigned char c) { return std::tolower(c); });
    return lower == "utf-8" || lower == "utf8";
}

std::expected<DataFrame, std::string> ReadJson(const std::string& path,
                                               const OptionMap& options) {
    OptionReader opts(options);
    auto orient = opts.GetOr<std::string>("orient", "columns");
    auto lines = opts.GetOr<bool>("lines", false);
    auto encoding = opts.GetOr<std::string>("encoding", "utf-8");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    if (std::ranges::find(kJsonOrients, orient) == std::end(kJsonOrients)) {
        return std::unexpected(fmt::format("unknown JSON orient '{}'", orient));
    }
    if (lines && orient != "records") {
        return std::unexpected(std::string("lines=true requires orient 'records'"));
    }
    if (!IsUtf8Encoding(encoding)) {
        return std::unexpected(fmt::format("unsupported JSON encoding '{}'", encoding));
    }

    auto text = ReadText(path);
    if (!text) return std::unexpected(text.error());
    if (lines) return FromLines(*text);

    rapidjson::Document doc;
    if (auto ok = Parse(doc, *text); !ok) return std::unexpected(ok.error());
    if (orient == "records") return FromRecordsArray(doc);
    if (orient == "split") return FromSplitObject(doc);
    return FromColumnsObject(doc);
}

std::expected<void, std::string> WriteJson(const DataFrame& frame, const std::string& path,
                                           const OptionMap& options) {
    OptionReader opts(options);
    auto orient = opts.GetOr<std::string>("orient", "columns");
    auto indent = opts.GetOr<int64_t>("indent", 0);
    auto lines = opts.GetOr<bool>("lines", false);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    if (std::ranges::find(kJsonOrients, orient) == std::end(kJsonOrients)) {
        return std::unexpected(fmt::format("unknown JSON orient '{}'", orient));
    }
    if (lines && orient != "records") {
        return std::unexpected(std::string("lines=true requires orient 'records'"));
    }
    if (indent < 0) {
        return std::unexpected(fmt::format("indent must be non-negative, got {}", indent));
    }

    std::string out;
    if (lines) {
        for (size_t row = 0; row < frame.RowCount(); ++row) {
            rapidjson::StringBuffer buf;
            rapidjson::Writer<rapidjson::StringBuffer> w(buf);
            WriteRow(w, frame, row);
            out.append(buf.GetString(), buf.GetSize());
            out += '\n';
        }
    } else if (indent > 0) {
        rapidjson::StringBuffer buf;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> w(buf);
        w.SetIndent(' ', static_cast<unsigned>(indent));
        WriteDocument(w, frame, orient);
        out.assign(buf.GetString(), buf.GetSize());
    } else {
        rapidjson::StringBuffer buf;
        rapidjson::Writer<rapidjson::StringBuffer> w(buf);
        WriteDocument(w, frame, orient);
        out.assign(buf.GetString(), buf.GetSize());
    }
    return WriteText(path, out);
}

}  // namespace dataport::codec
