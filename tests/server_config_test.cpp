#include "schedule_errors.hpp"
#include "server_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <vector>

namespace {

ServerConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "schedule_server");
    return ServerConfig::from_args(static_cast<int>(args.size()), args.data());
}

TEST(ServerConfigTest, DefaultsMatchDocumentedValues) {
    ServerConfig config = parse({});
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.catalogue_file, "all_sections.json");
    EXPECT_EQ(config.default_cap, 50);
    EXPECT_EQ(config.max_cap, 500);
    EXPECT_EQ(config.max_courses, 30);
    EXPECT_EQ(config.reload_interval_seconds, 0);
    EXPECT_EQ(config.search_timeout_ms, 0);
}

TEST(ServerConfigTest, FlagsOverrideDefaults) {
    ServerConfig config = parse({"--port", "9090", "--cap", "20", "--catalogue", "spring.json",
                                 "--reload-interval", "60", "--timeout-ms", "2000", "--host", "127.0.0.1"});
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.default_cap, 20);
    EXPECT_EQ(config.catalogue_file, "spring.json");
    EXPECT_EQ(config.reload_interval_seconds, 60);
    EXPECT_EQ(config.search_timeout_ms, 2000);
    EXPECT_EQ(config.host, "127.0.0.1");
}

TEST(ServerConfigTest, MaxCoursesFromFileAndFlag) {
    ServerConfig config;
    config.apply_json(nlohmann::json::parse(R"({"maxCourses": 12})"));
    EXPECT_EQ(config.max_courses, 12);

    EXPECT_EQ(parse({"--max-courses", "8"}).max_courses, 8);
    EXPECT_THROW(parse({"--max-courses", "0"}), ConfigError);
    EXPECT_THROW(config.apply_json(nlohmann::json::parse(R"({"maxCourses": "12"})")), ConfigError);
}

TEST(ServerConfigTest, ConfigFileAppliesBeforeFlags) {
    const std::string path = ::testing::TempDir() + "server_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"port": 7000, "defaultCap": 10, "maxCap": 40, "catalogueFile": "fall.json"})";
    }

    ServerConfig config = parse({"--port", "7100", "--config", path.c_str()});
    EXPECT_EQ(config.port, 7100);
    EXPECT_EQ(config.default_cap, 10);
    EXPECT_EQ(config.max_cap, 40);
    EXPECT_EQ(config.catalogue_file, "fall.json");

    std::remove(path.c_str());
}

TEST(ServerConfigTest, RejectsBadInput) {
    EXPECT_THROW(parse({"--port"}), ConfigError);
    EXPECT_THROW(parse({"--port", "eighty"}), ConfigError);
    EXPECT_THROW(parse({"--port", "80x"}), ConfigError);
    EXPECT_THROW(parse({"--port", "70000"}), ConfigError);
    EXPECT_THROW(parse({"--cap", "0"}), ConfigError);
    EXPECT_THROW(parse({"--cap", "600"}), ConfigError);
    EXPECT_THROW(parse({"--verbose", "1"}), ConfigError);
    EXPECT_THROW(parse({"--config", "/nonexistent/schedule.json"}), ConfigError);
}

TEST(ServerConfigTest, RejectsWrongJsonTypes) {
    ServerConfig config;
    EXPECT_THROW(config.apply_json(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(config.apply_json(nlohmann::json::parse(R"({"port": "8080"})")), ConfigError);
    EXPECT_THROW(config.apply_json(nlohmann::json::parse(R"({"host": 12})")), ConfigError);

    config.apply_json(nlohmann::json::parse(R"({"searchTimeoutMs": 250})"));
    EXPECT_EQ(config.search_timeout_ms, 250);
}

}  // namespace
