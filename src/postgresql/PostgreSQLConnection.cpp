#include "PostgreSQLConnection.hpp"
#include <spdlog/spdlog.h>

namespace sqlpool {

PostgreSQLConnection::PostgreSQLConnection(PGconn* conn)
    : m_conn(conn) {
}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (m_conn) {
        PQfinish(m_conn);
    }
}

bool PostgreSQLConnection::validate() noexcept {
    if (!m_conn || PQstatus(m_conn) != CONNECTION_OK) return false;

    // Try a simple query to check connection
    PGresult* res = PQexec(m_conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) PQclear(res);
    if (!ok) {
        spdlog::debug("PostgreSQL validation failed: {}", PQerrorMessage(m_conn));
    }
    return ok;
}

void PostgreSQLConnection::close() {
    // PQfinish has no failure mode
    if (m_conn) {
        PQfinish(m_conn);
        m_conn = nullptr;
    }
}

bool PostgreSQLConnection::execute(const std::string& sql) {
    if (!m_conn) return false;

    PGresult* res = PQexec(m_conn, sql.c_str());
    ExecStatusType status = res ? PQresultStatus(res) : PGRES_FATAL_ERROR;
    bool ok = status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
    if (!ok) {
        spdlog::error("PostgreSQL exec failed: {}", PQerrorMessage(m_conn));
    }
    if (res) PQclear(res);
    return ok;
}

}  // namespace sqlpool
