#include <gtest/gtest.h>
#include "BenchOptions.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <vector>

using namespace sqlpool;

class BenchOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "sql_pool_bench_options_test";
        std::filesystem::create_directories(tempDir_);
        unsetenv("SQLPOOL_PASSWORD");
        unsetenv("PGPASSWORD");
        unsetenv("MYSQL_PWD");
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    BenchOptions parse(std::vector<std::string> args) {
        args.insert(args.begin(), "sqlpool-bench");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return BenchOptions::parseArgs(static_cast<int>(argv.size()), argv.data());
    }

    std::filesystem::path tempDir_;
};

TEST_F(BenchOptionsTest, Defaults) {
    auto options = parse({});

    EXPECT_EQ(options.scenario, "all");
    EXPECT_EQ(options.config.database_type, DatabaseType::SQLite);
    EXPECT_EQ(options.config.connection.database, ":memory:");
    EXPECT_FALSE(options.json);
    EXPECT_EQ(options.config.logging.level, "info");
}

TEST_F(BenchOptionsTest, CustomScenarioWorkload) {
    auto options = parse({"custom", "--threads", "8", "--ops", "100", "--hold-us", "0",
                          "--min-size", "0", "--max-size", "4", "--spin", "0", "--json"});

    EXPECT_EQ(options.scenario, "custom");
    EXPECT_EQ(options.threads, 8);
    EXPECT_EQ(options.opsPerThread, 100);
    EXPECT_EQ(options.holdMicros, 0);
    EXPECT_EQ(options.config.pool.min_size, 0);
    EXPECT_EQ(options.config.pool.max_size, 4);
    EXPECT_EQ(options.config.pool.spin_iterations, 0);
    EXPECT_TRUE(options.json);
}

TEST_F(BenchOptionsTest, ConnectionOptions) {
    auto options = parse({"churn", "-t", "postgresql", "-H", "db.internal", "-P", "6432",
                          "-u", "bench", "-p", "pw", "-D", "orders"});

    EXPECT_EQ(options.config.database_type, DatabaseType::PostgreSQL);
    EXPECT_EQ(options.config.connection.host, "db.internal");
    EXPECT_EQ(options.config.connection.port, 6432);
    EXPECT_EQ(options.config.connection.user, "bench");
    EXPECT_EQ(options.config.connection.password, "pw");
    EXPECT_EQ(options.config.connection.database, "orders");
}

TEST_F(BenchOptionsTest, DebugFlagRaisesLogLevel) {
    auto options = parse({"-d", "--log-file", "/tmp/bench.log"});

    EXPECT_TRUE(options.debug);
    EXPECT_EQ(options.config.logging.level, "debug");
    EXPECT_EQ(options.config.logging.file, "/tmp/bench.log");
}

TEST_F(BenchOptionsTest, CommandLineOverridesConfigFile) {
    auto path = tempDir_ / "bench.conf";
    {
        std::ofstream file(path);
        file << R"(
[connection]
type = postgresql
host = pg.example.com

[pool]
min_size = 2
max_size = 8
)";
    }

    auto options = parse({"-c", path.string(), "--max-size", "3"});

    EXPECT_EQ(options.config.database_type, DatabaseType::PostgreSQL);
    EXPECT_EQ(options.config.connection.host, "pg.example.com");
    EXPECT_EQ(options.config.pool.min_size, 2);
    EXPECT_EQ(options.config.pool.max_size, 3);
}

TEST_F(BenchOptionsTest, PasswordFromEnvironment) {
    setenv("SQLPOOL_PASSWORD", "from-env", 1);

    auto options = parse({"-t", "mysql"});

    EXPECT_EQ(options.config.connection.password, "from-env");
    unsetenv("SQLPOOL_PASSWORD");
}
