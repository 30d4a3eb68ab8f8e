// test_config.cpp - Config persistence and server arguments
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "ftm_core.h"
#include "test_util.h"

TEST(ConfigTest, MissingFileGivesDefaults) {
    TempDir dir;
    Config config = load_config(dir.path() / "absent.json");
    EXPECT_EQ(config.server.host, DEFAULT_HOST);
    EXPECT_EQ(config.server.port, DEFAULT_PORT);
    EXPECT_EQ(config.server.user, DEFAULT_USER);
    EXPECT_EQ(config.server.password, DEFAULT_PASSWORD);
    EXPECT_EQ(config.config_file, dir.path() / "absent.json");
}

TEST(ConfigTest, ReadsHostPortAndCredentials) {
    TempDir dir;
    auto file = dir.write_file("config.json",
        R"({"host": "ftp.example.org", "port": 2121, "user": "alice", "password": "secret"})");
    Config config = load_config(file);
    EXPECT_EQ(config.server.host, "ftp.example.org");
    EXPECT_EQ(config.server.port, 2121);
    EXPECT_EQ(config.server.user, "alice");
    EXPECT_EQ(config.server.password, "secret");
}

TEST(ConfigTest, MalformedFileGivesDefaults) {
    TempDir dir;
    auto file = dir.write_file("config.json", "{ host: nope ");
    Config config = load_config(file);
    EXPECT_EQ(config.server.host, DEFAULT_HOST);
    EXPECT_EQ(config.server.port, DEFAULT_PORT);
}

TEST(ConfigTest, WrongValueTypesGiveDefaults) {
    TempDir dir;
    auto file = dir.write_file("config.json", R"({"host": "10.0.0.1", "port": "twenty-one"})");
    Config config = load_config(file);
    EXPECT_EQ(config.server.host, DEFAULT_HOST);
    EXPECT_EQ(config.server.port, DEFAULT_PORT);
}

TEST(ConfigTest, OutOfRangePortGivesDefaults) {
    TempDir dir;
    auto file = dir.write_file("config.json", R"({"host": "10.0.0.1", "port": 70000})");
    Config config = load_config(file);
    EXPECT_EQ(config.server.port, DEFAULT_PORT);
}

TEST(ConfigTest, SavePreservesUnknownKeys) {
    TempDir dir;
    auto file = dir.write_file("config.json", R"({"host": "old", "port": 21, "theme": "dark"})");
    Config config = load_config(file);
    config.server.host = "10.1.2.3";
    config.server.port = 2100;
    ASSERT_TRUE(save_config(config));

    auto json = nlohmann::json::parse(read_file(file));
    EXPECT_EQ(json["host"].get<std::string>(), "10.1.2.3");
    EXPECT_EQ(json["port"].get<int>(), 2100);
    EXPECT_EQ(json["theme"].get<std::string>(), "dark");

    Config reloaded = load_config(file);
    EXPECT_EQ(reloaded.server.host, "10.1.2.3");
    EXPECT_EQ(reloaded.server.port, 2100);
}

TEST(ConfigTest, SaveFailsForUnwritablePath) {
    TempDir dir;
    Config config;
    config.config_file = dir.path() / "missing" / "config.json";
    EXPECT_FALSE(save_config(config));
}

TEST(ServerArgumentTest, ParsesUrl) {
    ServerSettings server;
    ASSERT_TRUE(apply_server_argument("ftp://192.168.1.20:2121", server));
    EXPECT_EQ(server.host, "192.168.1.20");
    EXPECT_EQ(server.port, 2121);
}

TEST(ServerArgumentTest, ParsesBareHost) {
    ServerSettings server;
    server.port = 21;
    ASSERT_TRUE(apply_server_argument("files.local", server));
    EXPECT_EQ(server.host, "files.local");
    EXPECT_EQ(server.port, 21);

    ASSERT_TRUE(apply_server_argument("ftp://nas/pub/music", server));
    EXPECT_EQ(server.host, "nas");
}

TEST(ServerArgumentTest, NonNumericPortKeepsPreviousPort) {
    ServerSettings server;
    server.port = 2121;
    ASSERT_TRUE(apply_server_argument("ftp://host:abc", server));
    EXPECT_EQ(server.host, "host");
    EXPECT_EQ(server.port, 2121);
}

TEST(ServerArgumentTest, RejectsEmptyHost) {
    ServerSettings server;
    EXPECT_FALSE(apply_server_argument("ftp://", server));
    EXPECT_FALSE(apply_server_argument(":21", server));
    EXPECT_EQ(server.host, DEFAULT_HOST);
}

TEST(ServerArgumentTest, PortRange) {
    EXPECT_EQ(parse_port("21").value_or(0), 21);
    EXPECT_EQ(parse_port("65535").value_or(0), 65535);
    EXPECT_FALSE(parse_port("0").has_value());
    EXPECT_FALSE(parse_port("65536").has_value());
    EXPECT_FALSE(parse_port("-1").has_value());
    EXPECT_FALSE(parse_port("21a").has_value());
    EXPECT_FALSE(parse_port("").has_value());
}
