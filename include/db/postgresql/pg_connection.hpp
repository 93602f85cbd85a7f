#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace cypherbridge {

/**
 * @brief libpq session that AgeBridge runs its SQL on
 *
 * Owns the PGconn*. Cells are copied out as text, NULL as nullopt.
 */
class PgConnection : public IDbConnection {
public:
    // Takes ownership
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    PGconn* conn_;
};

/**
 * @brief Opens a PgConnection from a conninfo string or URI
 *
 * Logs the first line of the libpq error and returns nullptr on failure.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace cypherbridge
