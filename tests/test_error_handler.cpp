#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include <cerrno>

using namespace sqlpool;

class ErrorHandlerTest : public ::testing::Test {
};

// Error code to errno mapping tests
TEST_F(ErrorHandlerTest, ConfigMapsToEINVAL) {
    EXPECT_EQ(ErrorHandler::toErrno(PoolErrorCode::Config), EINVAL);
}

TEST_F(ErrorHandlerTest, ConnectMapsToECONNREFUSED) {
    EXPECT_EQ(ErrorHandler::toErrno(PoolErrorCode::Connect), ECONNREFUSED);
}

TEST_F(ErrorHandlerTest, TimeoutMapsToETIMEDOUT) {
    EXPECT_EQ(ErrorHandler::toErrno(PoolErrorCode::Timeout), ETIMEDOUT);
}

TEST_F(ErrorHandlerTest, ClosedMapsToESHUTDOWN) {
    EXPECT_EQ(ErrorHandler::toErrno(PoolErrorCode::Closed), ESHUTDOWN);
}

// ErrorContext tests
class ErrorContextTest : public ::testing::Test {
};

TEST_F(ErrorContextTest, SetAndGetContext) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx("connect sqlite");
        EXPECT_EQ(ErrorContext::current(), "connect sqlite");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, NestedContext) {
    {
        ErrorContext ctx1("level1");
        EXPECT_EQ(ErrorContext::current(), "level1");

        {
            ErrorContext ctx2("level2");
            EXPECT_EQ(ErrorContext::current(), "level1 > level2");

            {
                ErrorContext ctx3("level3");
                EXPECT_EQ(ErrorContext::current(), "level1 > level2 > level3");
            }

            EXPECT_EQ(ErrorContext::current(), "level1 > level2");
        }

        EXPECT_EQ(ErrorContext::current(), "level1");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, ContextRestoredOnException) {
    try {
        ErrorContext ctx1("outer");
        {
            ErrorContext ctx2("inner");
            throw std::runtime_error("test");
        }
    } catch (const std::runtime_error&) {
        // Context should be restored during unwinding
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

// Pool exception tests
class PoolExceptionTest : public ::testing::Test {
};

TEST_F(PoolExceptionTest, ConfigErrorCarriesCode) {
    ConfigError ex("max_size must be >= 1, got 0");

    EXPECT_EQ(ex.code(), PoolErrorCode::Config);
    EXPECT_EQ(ex.posixError(), EINVAL);
    EXPECT_STREQ(ex.what(), "max_size must be >= 1, got 0");
}

TEST_F(PoolExceptionTest, ConnectErrorKeepsNativeError) {
    ConnectError ex("Can't connect to MySQL server", 2003);

    EXPECT_EQ(ex.code(), PoolErrorCode::Connect);
    EXPECT_EQ(ex.posixError(), ECONNREFUSED);
    EXPECT_EQ(ex.nativeError(), 2003);

    ConnectError plain("refused");
    EXPECT_EQ(plain.nativeError(), 0);
}

TEST_F(PoolExceptionTest, PoolClosedErrorHasDefaultMessage) {
    PoolClosedError ex;

    EXPECT_EQ(ex.code(), PoolErrorCode::Closed);
    EXPECT_EQ(ex.posixError(), ESHUTDOWN);
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("closed"));
}

TEST_F(PoolExceptionTest, TimeoutErrorCanBeCaughtAsPoolException) {
    bool caught = false;

    try {
        throw TimeoutError("Connection acquisition timeout after 50ms");
    } catch (const PoolException& ex) {
        caught = true;
        EXPECT_EQ(ex.code(), PoolErrorCode::Timeout);
        EXPECT_EQ(ex.posixError(), ETIMEDOUT);
    }

    EXPECT_TRUE(caught);
}

TEST_F(PoolExceptionTest, CanBeCaughtAsRuntimeError) {
    bool caught = false;

    try {
        throw PoolClosedError();
    } catch (const std::runtime_error&) {
        caught = true;
    }

    EXPECT_TRUE(caught);
}
