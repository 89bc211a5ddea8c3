#include "ErrorHandler.hpp"
#include <cerrno>

namespace sqlpool {

thread_local std::string ErrorContext::s_currentContext;

int ErrorHandler::toErrno(PoolErrorCode code) {
    switch (code) {
        case PoolErrorCode::Config:
            return EINVAL;
        case PoolErrorCode::Connect:
            return ECONNREFUSED;
        case PoolErrorCode::Timeout:
            return ETIMEDOUT;
        case PoolErrorCode::Closed:
            return ESHUTDOWN;
    }
    // Default to I/O error
    return EIO;
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

PoolException::PoolException(PoolErrorCode code, const std::string& message)
    : std::runtime_error(message)
    , m_code(code) {
}

ConfigError::ConfigError(const std::string& message)
    : PoolException(PoolErrorCode::Config, message) {
}

ConnectError::ConnectError(const std::string& message, int nativeError)
    : PoolException(PoolErrorCode::Connect, message)
    , m_nativeError(nativeError) {
}

TimeoutError::TimeoutError(const std::string& message)
    : PoolException(PoolErrorCode::Timeout, message) {
}

PoolClosedError::PoolClosedError(const std::string& message)
    : PoolException(PoolErrorCode::Closed, message) {
}

}  // namespace sqlpool
