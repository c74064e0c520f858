// SPDX-License-Identifier: MIT

#include "dataport/duckdb_connection.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iterator>

#include <fmt/format.h>

#include "dataport/codec/duckdb_frame.hpp"
#include "dataport/logging.hpp"

namespace dataport {

namespace {

constexpr std::string_view kIfExistsModes[] = {"fail", "replace", "append"};

// Rolls back an explicit transaction unless committed
class TransactionGuard {
public:
    explicit TransactionGuard(duckdb::Connection& conn) : conn_(conn) {
        conn_.BeginTransaction();
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    ~TransactionGuard() {
        if (active_) {
            try {
                conn_.Rollback();
            } catch (const std::exception& e) {
                Logger()->warn("rollback failed: {}", e.what());
            }
        }
    }

    void Commit() {
        conn_.Commit();
        active_ = false;
    }

private:
    duckdb::Connection& conn_;
    bool active_ = true;
};

}  // namespace

bool DuckDbConnection::IsBareIdentifier(std::string_view text) {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front()))) {
        return false;
    }
    for (char c : text) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::expected<bool, std::string> DuckDbConnection::TableExists(std::string_view table) {
    auto result = codec::RunQuery(
        conn_, fmt::format("SELECT count(*) FROM information_schema.tables WHERE table_name = '{}'",
                           codec::EscapeString(table)));
    if (!result) return std::unexpected(result.error());
    return (*result)->GetValue(0, 0).GetValue<int64_t>() > 0;
}

std::expected<DataFrame, std::string> DuckDbConnection::ReadSql(std::string_view query_or_table,
                                                                const OptionMap& options) {
    OptionReader opts(options);
    auto coerce_float = opts.GetOr<bool>("coerce_float", true);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    std::string sql = IsBareIdentifier(query_or_table)
                          ? fmt::format("SELECT * FROM {}", codec::QuoteIdentifier(query_or_table))
                          : std::string(query_or_table);
    try {
        auto result = codec::RunQuery(conn_, sql);
        if (!result) return std::unexpected(result.error());
        return codec::FrameFromResult(**result, coerce_float);
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::expected<int64_t, std::string> DuckDbConnection::WriteFrame(const DataFrame& frame,
                                                                 std::string_view table,
                                                                 const OptionMap& options) {
    OptionReader opts(options);
    auto if_exists = opts.GetOr<std::string>("if_exists", "fail");
    auto chunksize = opts.GetOr<int64_t>("chunksize", 0);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    if (std::ranges::find(kIfExistsModes, if_exists) == std::end(kIfExistsModes)) {
        return std::unexpected(fmt::format("unknown if_exists mode '{}'", if_exists));
    }
    if (chunksize < 0) {
        return std::unexpected(fmt::format("chunksize must be non-negative, got {}", chunksize));
    }

    try {
        auto exists = TableExists(table);
        if (!exists) return std::unexpected(exists.error());
        if (*exists && if_exists == "fail") {
            return std::unexpected(fmt::format("table '{}' already exists", table));
        }

        TransactionGuard txn(conn_);
        if (*exists && if_exists == "replace") {
            auto drop = codec::RunQuery(conn_, fmt::format("DROP TABLE {}",
                                                           codec::QuoteIdentifier(table)));
            if (!drop) return std::unexpected(drop.error());
        }
        if (!*exists || if_exists == "replace") {
            auto create = codec::CreateTableSql(table, frame);
            if (!create) return std::unexpected(create.error());
            if (auto r = codec::RunQuery(conn_, *create); !r) {
                return std::unexpected(r.error());
            }
        }
        if (auto ok = codec::AppendFrame(conn_, std::string(table), frame, chunksize); !ok) {
            return std::unexpected(ok.error());
        }
        txn.Commit();
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }

    Logger()->debug("wrote {} rows to '{}' (if_exists={})", frame.RowCount(), table, if_exists);
    return static_cast<int64_t>(frame.RowCount());
}

}  // namespace dataport
