#include "MySQLConnection.hpp"
#include <spdlog/spdlog.h>

namespace sqlpool {

MySQLConnection::MySQLConnection(MYSQL* conn)
    : m_conn(conn) {
}

MySQLConnection::~MySQLConnection() {
    if (m_conn) {
        mysql_close(m_conn);
    }
}

bool MySQLConnection::validate() noexcept {
    if (!m_conn) return false;

    // Quick ping to check if connection is alive
    if (mysql_ping(m_conn) != 0) {
        spdlog::debug("Connection validation failed: {}", mysql_error(m_conn));
        return false;
    }

    return true;
}

void MySQLConnection::close() {
    if (m_conn) {
        mysql_close(m_conn);
        m_conn = nullptr;
    }
}

bool MySQLConnection::execute(const std::string& sql) {
    if (!m_conn) return false;

    if (mysql_real_query(m_conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        spdlog::error("MySQL query failed: {}", mysql_error(m_conn));
        return false;
    }

    // Drain any result sets so the handle is ready for the next caller
    do {
        MYSQL_RES* result = mysql_store_result(m_conn);
        if (result) {
            mysql_free_result(result);
        }
    } while (mysql_next_result(m_conn) == 0);

    return mysql_errno(m_conn) == 0;
}

}  // namespace sqlpool
