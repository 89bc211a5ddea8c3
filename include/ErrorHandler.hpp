#pragma once

#include <string>
#include <stdexcept>

namespace sqlpool {

// Failure categories raised by the pool and its drivers
enum class PoolErrorCode {
    Config,
    Connect,
    Timeout,
    Closed
};

// Pool error codes to POSIX errno mapping
class ErrorHandler {
public:
    // Convert a pool error category to errno
    static int toErrno(PoolErrorCode code);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Base exception for every pool failure
class PoolException : public std::runtime_error {
public:
    PoolException(PoolErrorCode code, const std::string& message);

    PoolErrorCode code() const { return m_code; }
    int posixError() const { return ErrorHandler::toErrno(m_code); }

private:
    PoolErrorCode m_code;
};

// Bad construction parameters; not recoverable
class ConfigError : public PoolException {
public:
    explicit ConfigError(const std::string& message);
};

// Driver failure while creating or replacing a connection
class ConnectError : public PoolException {
public:
    explicit ConnectError(const std::string& message, int nativeError = 0);

    // Backend-specific error code (sqlite3 rc, mysql_errno), 0 if unknown
    int nativeError() const { return m_nativeError; }

private:
    int m_nativeError;
};

// acquire() did not obtain a connection before its deadline
class TimeoutError : public PoolException {
public:
    explicit TimeoutError(const std::string& message);
};

// The pool was closed before or while the caller waited
class PoolClosedError : public PoolException {
public:
    explicit PoolClosedError(const std::string& message = "Connection pool is closed");
};

}  // namespace sqlpool
