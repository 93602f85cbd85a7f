#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace cypherbridge {

namespace {

using ResultHandle = std::unique_ptr<PGresult, decltype(&PQclear)>;

// AGE returns agtype as text; SQL NULL stays distinguishable from "null"
DbResultSet read_rows(const PGresult* res) {
    DbResultSet out;
    out.success = true;
    out.has_rows = true;

    const int ncols = PQnfields(res);
    const int nrows = PQntuples(res);
    out.column_names.reserve(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        out.column_names.emplace_back(PQfname(res, c));
    }

    out.rows.reserve(static_cast<size_t>(nrows));
    for (int r = 0; r < nrows; ++r) {
        auto& cells = out.rows.emplace_back();
        cells.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            if (PQgetisnull(res, r, c)) {
                cells.emplace_back(std::nullopt);
            } else {
                cells.emplace_back(std::string(PQgetvalue(res, r, c),
                    static_cast<size_t>(PQgetlength(res, r, c))));
            }
        }
    }
    return out;
}

DbResultSet read_command(PGresult* res) {
    DbResultSet out;
    out.success = true;
    out.affected_rows = utils::parse_int<uint64_t>(PQcmdTuples(res), 0);
    return out;
}

} // anonymous namespace

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    DbResultSet failed;
    if (!conn_) {
        failed.error_message = "Connection is null";
        return failed;
    }

    ResultHandle res(PQexec(conn_, sql.c_str()), &PQclear);
    if (!res) {
        failed.error_message = PQerrorMessage(conn_);
        return failed;
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return read_rows(res.get());
        case PGRES_COMMAND_OK:
            return read_command(res.get());
        default:
            break;
    }

    // The result's own message survives later commands on the connection
    const char* res_error = PQresultErrorMessage(res.get());
    failed.error_message = (res_error && *res_error) ? res_error : PQerrorMessage(conn_);
    return failed;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    const auto result = execute(std::format("SET statement_timeout = {}", timeout_ms));
    if (!result.success) {
        utils::log::debug(std::format("SET statement_timeout failed: {}",
            utils::first_line(result.error_message)));
    }
    return result.success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}",
            utils::first_line(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    utils::log::debug(std::format("Connected to {}:{} as {}",
        PQhost(conn), PQport(conn), PQuser(conn)));
    return std::make_unique<PgConnection>(conn);
}

} // namespace cypherbridge
