/**
 * Configuration loading tests: defaults, environment, flags and rejects.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "src/dualmeter/server/server_config.h"

#include <map>

using namespace dualmeter;
using namespace dualmeter::server;

namespace {

class ServerConfigTest : public DualmeterTest {
protected:
    core::result<ServerConfig> load(std::vector<std::string> args) {
        args.insert(args.begin(), "dualmeter");
        std::vector<const char*> argv;
        for (const auto& arg : args) argv.push_back(arg.c_str());
        error_.clear();
        return load_config(static_cast<int>(argv.size()), argv.data(),
                           [this](const char* name) -> const char* {
                               auto it = env_.find(name);
                               return it == env_.end() ? nullptr : it->second.c_str();
                           },
                           &error_);
    }

    std::map<std::string, std::string> env_;
    std::string error_;
};

} // namespace

TEST_F(ServerConfigTest, Defaults) {
    auto config = load({});
    ASSERT_TRUE(config.is_ok()) << error_;
    const ServerConfig& c = config.value();
    EXPECT_EQ(c.host, "0.0.0.0");
    EXPECT_EQ(c.http2_port, 8443);
    EXPECT_EQ(c.http3_port, 8444);
    EXPECT_EQ(c.cert_file, "certs/server.crt");
    EXPECT_EQ(c.key_file, "certs/server.key");
    EXPECT_EQ(c.content_root, "web");
    EXPECT_EQ(c.idle_timeout_s, 60u);
    EXPECT_EQ(c.grace_period_s, 5u);
    EXPECT_EQ(c.log_level, core::LogLevel::INFO);
    EXPECT_EQ(c.workers, 0);
    EXPECT_EQ(c.max_payload, 67108864u);
    EXPECT_TRUE(c.ready_file.empty());
    EXPECT_TRUE(c.log_file.empty());
    EXPECT_FALSE(c.show_help);
}

TEST_F(ServerConfigTest, EnvironmentOverridesDefaults) {
    env_["HTTP2_PORT"] = "9001";
    env_["HTTP3_PORT"] = "9002";
    env_["LOG_LEVEL"] = "debug";
    env_["DUALMETER_CONTENT_ROOT"] = "/srv/www";
    env_["DUALMETER_GRACE_PERIOD"] = "0";

    auto config = load({});
    ASSERT_TRUE(config.is_ok()) << error_;
    EXPECT_EQ(config.value().http2_port, 9001);
    EXPECT_EQ(config.value().http3_port, 9002);
    EXPECT_EQ(config.value().log_level, core::LogLevel::DEBUG);
    EXPECT_EQ(config.value().content_root, "/srv/www");
    EXPECT_EQ(config.value().grace_period_s, 0u);
}

TEST_F(ServerConfigTest, FlagsWinOverEnvironment) {
    env_["HTTP2_PORT"] = "9001";
    env_["DUALMETER_WORKERS"] = "2";

    auto config = load({"--http2-port", "9100", "--workers=4", "--ready-file", "/tmp/ready"});
    ASSERT_TRUE(config.is_ok()) << error_;
    EXPECT_EQ(config.value().http2_port, 9100);
    EXPECT_EQ(config.value().workers, 4);
    EXPECT_EQ(config.value().ready_file, "/tmp/ready");
}

TEST_F(ServerConfigTest, HelpStopsParsing) {
    auto config = load({"--help", "--bogus"});
    ASSERT_TRUE(config.is_ok());
    EXPECT_TRUE(config.value().show_help);

    auto short_form = load({"-h"});
    ASSERT_TRUE(short_form.is_ok());
    EXPECT_TRUE(short_form.value().show_help);

    std::string text = usage("dualmeter");
    EXPECT_THAT(text, ::testing::HasSubstr("--http3-port"));
    EXPECT_THAT(text, ::testing::HasSubstr("DUALMETER_GRACE_PERIOD"));
}

TEST_F(ServerConfigTest, UnknownFlagIsConfigError) {
    auto config = load({"--colour", "blue"});
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error(), core::error_code::config_error);
    EXPECT_THAT(error_, ::testing::HasSubstr("--colour"));
}

TEST_F(ServerConfigTest, PositionalArgumentIsConfigError) {
    auto config = load({"web"});
    ASSERT_TRUE(config.is_err());
    EXPECT_THAT(error_, ::testing::HasSubstr("web"));
}

TEST_F(ServerConfigTest, MissingValueIsConfigError) {
    auto config = load({"--cert"});
    ASSERT_TRUE(config.is_err());
    EXPECT_THAT(error_, ::testing::HasSubstr("needs a value"));
}

TEST_F(ServerConfigTest, PortsMustBeInRange) {
    const std::vector<std::string> bad = {"0", "65536", "-1", "80x", "", "99999999999999999999999"};
    for (const auto& port : bad) {
        auto config = load({"--http3-port=" + port});
        EXPECT_TRUE(config.is_err()) << port;
        EXPECT_THAT(error_, ::testing::HasSubstr("--http3-port")) << port;
    }
    EXPECT_TRUE(load({"--http2-port", "1", "--http3-port", "65535"}).is_ok());
}

TEST_F(ServerConfigTest, PortsMustDiffer) {
    auto config = load({"--http2-port", "9000", "--http3-port", "9000"});
    ASSERT_TRUE(config.is_err());
    EXPECT_THAT(error_, ::testing::HasSubstr("must differ"));
}

TEST_F(ServerConfigTest, MalformedEnvironmentNamesVariable) {
    env_["DUALMETER_IDLE_TIMEOUT"] = "forever";
    auto config = load({});
    ASSERT_TRUE(config.is_err());
    EXPECT_THAT(error_, ::testing::HasSubstr("DUALMETER_IDLE_TIMEOUT"));
}

TEST_F(ServerConfigTest, LogLevels) {
    EXPECT_EQ(load({"--log-level", "warn"}).value().log_level, core::LogLevel::WARN);
    EXPECT_EQ(load({"--log-level", "error"}).value().log_level, core::LogLevel::ERROR);
    EXPECT_TRUE(load({"--log-level", "loud"}).is_err());
}
