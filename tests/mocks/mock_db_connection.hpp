#pragma once

#include "db/idb_connection.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cypherbridge::testing {

/**
 * @brief Records every SQL string; results come from a handler
 *
 * Without a handler every statement succeeds as a command.
 */
class MockDbConnection : public IDbConnection {
public:
    using Handler = std::function<DbResultSet(const std::string& sql)>;

    [[nodiscard]] DbResultSet execute(const std::string& sql) override {
        executed_.push_back(sql);
        if (handler_) {
            return handler_(sql);
        }
        DbResultSet result;
        result.success = true;
        return result;
    }

    [[nodiscard]] bool is_connected() const override { return !closed_; }

    bool set_query_timeout(uint32_t timeout_ms) override {
        timeout_ms_ = timeout_ms;
        return true;
    }

    void close() override { closed_ = true; }

    void set_handler(Handler handler) { handler_ = std::move(handler); }

    [[nodiscard]] const std::vector<std::string>& executed() const { return executed_; }
    [[nodiscard]] uint32_t timeout_ms() const { return timeout_ms_; }

    static DbResultSet rows_result(std::vector<std::string> columns,
                                   std::vector<std::vector<std::optional<std::string>>> rows) {
        DbResultSet result;
        result.success = true;
        result.has_rows = true;
        result.column_names = std::move(columns);
        result.rows = std::move(rows);
        return result;
    }

    static DbResultSet error_result(std::string message) {
        DbResultSet result;
        result.success = false;
        result.error_message = std::move(message);
        return result;
    }

private:
    Handler handler_;
    std::vector<std::string> executed_;
    uint32_t timeout_ms_ = 0;
    bool closed_ = false;
};

} // namespace cypherbridge::testing
