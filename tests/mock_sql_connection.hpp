// SPDX-License-Identifier: MIT

// tests/mock_sql_connection.hpp
#pragma once

#include <gmock/gmock.h>

#include "dataport/sql_connection.hpp"

namespace dataport::test {

class MockSqlConnection : public ISqlConnection {
public:
    MOCK_METHOD((std::expected<DataFrame, std::string>), ReadSql,
                (std::string_view query_or_table, const OptionMap& options), (override));
    MOCK_METHOD((std::expected<int64_t, std::string>), WriteFrame,
                (const DataFrame& frame, std::string_view table, const OptionMap& options),
                (override));
};

}  // namespace dataport::test
