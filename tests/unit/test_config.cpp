#include <gtest/gtest.h>
#include "../../src/config.h"
#include "../../src/errors.h"
#include "../../src/util.h"

#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace agentrun;

class ServerConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"AGENTRUN_PORT", "AGENTRUN_BACKEND", "AGENTRUN_API_KEYS",
                                 "AGENTRUN_ALLOWED_GIT_HOSTS", "AGENTRUN_FANOUT"}) {
            unsetenv(name);
        }
        if (!config_path.empty()) unlink(config_path.c_str());
    }

    Json::Value parse(const std::string& text) {
        Json::Value root;
        EXPECT_TRUE(parse_json(text, root));
        return root;
    }

    std::string write_config(const std::string& text) {
        char path[] = "/tmp/agentrun_config_XXXXXX";
        int fd = mkstemp(path);
        EXPECT_GE(fd, 0);
        close(fd);
        std::ofstream(path) << text;
        config_path = path;
        return config_path;
    }

    std::string config_path;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ServerConfigTest, DefaultsAreValid) {
    // Given: A default configuration
    ServerConfig config;

    // Then: It passes validation with the documented defaults
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.backend, "local-container");
    EXPECT_EQ(config.relay_url, "memory");
    EXPECT_EQ(config.max_variations, 5);
    EXPECT_EQ(config.max_prompt_length, 2000u);
    EXPECT_TRUE(config.api_keys.empty());
    EXPECT_EQ(config.allowed_git_hosts, std::vector<std::string>{"github.com"});
}

// ============================================================================
// JSON File
// ============================================================================

TEST_F(ServerConfigTest, AppliesNestedSections) {
    // Given: A config touching every section
    ServerConfig config;
    config.apply_json(parse(R"({
        "server": {"port": 9000},
        "backend": {"type": "cluster-job",
                    "cluster_job": {"namespace": "agents", "image": "agent:2"}},
        "limits": {"memory_mb": 2048, "cpu_cores": 1.5},
        "timeouts": {"execution_seconds": 600},
        "orchestrator": {"max_variations": 3, "allowed_git_hosts": ["github.com", "gitlab.com"]},
        "relay": {"url": "http://127.0.0.1:6390", "retention": 50, "fanout": false},
        "delivery": {"heartbeat_interval_seconds": 10},
        "auth": {"api_keys": ["k1"]},
        "secrets": {"ANTHROPIC_API_KEY": "sk-test"}
    })"));

    // Then: Values land in their fields
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.backend, "cluster-job");
    EXPECT_EQ(config.cluster.namespace_name, "agents");
    EXPECT_EQ(config.cluster.image, "agent:2");
    EXPECT_EQ(config.limits.memory_mb, 2048u);
    EXPECT_DOUBLE_EQ(config.limits.cpu_cores, 1.5);
    EXPECT_EQ(config.limits.execution_timeout, std::chrono::seconds(600));
    EXPECT_EQ(config.max_variations, 3);
    EXPECT_EQ(config.allowed_git_hosts.size(), 2u);
    EXPECT_EQ(config.relay_url, "http://127.0.0.1:6390");
    EXPECT_EQ(config.stream_retention, 50u);
    EXPECT_FALSE(config.fanout_enabled);
    EXPECT_EQ(config.heartbeat_interval_seconds, 10);
    EXPECT_EQ(config.api_keys, std::vector<std::string>{"k1"});
    EXPECT_EQ(config.secrets["ANTHROPIC_API_KEY"], "sk-test");
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ServerConfigTest, RejectsWrongTypes) {
    ServerConfig config;
    EXPECT_THROW(config.apply_json(parse(R"({"server": {"port": "80"}})")), ConfigError);
    EXPECT_THROW(config.apply_json(parse(R"({"auth": {"api_keys": "k1"}})")), ConfigError);
    EXPECT_THROW(config.apply_json(parse(R"({"relay": {"fanout": 1}})")), ConfigError);
    EXPECT_THROW(config.apply_json(parse(R"({"secrets": {"A": 1}})")), ConfigError);
}

TEST_F(ServerConfigTest, ReadsConfigFile) {
    // Given: A config file on disk
    std::string path = write_config(R"({"server": {"port": 8123}})");

    // Then: It is parsed as an object
    EXPECT_EQ(read_config_file(path)["server"]["port"].asInt(), 8123);

    // And: Missing or malformed files are config errors
    EXPECT_THROW(read_config_file("/nonexistent/agentrun.json"), ConfigError);
    std::ofstream(path) << "[1, 2]";
    EXPECT_THROW(read_config_file(path), ConfigError);
}

// ============================================================================
// Environment And Flags
// ============================================================================

TEST_F(ServerConfigTest, EnvironmentOverridesFile) {
    // Given: A file and environment variables for the same settings
    std::string path = write_config(R"({"server": {"port": 8123}, "backend": {"type": "module-call"}})");
    setenv("AGENTRUN_PORT", "8200", 1);
    setenv("AGENTRUN_API_KEYS", "a, b,,c", 1);
    setenv("AGENTRUN_FANOUT", "off", 1);

    // When: Loading
    std::string config_flag = "--config";
    char* argv[] = {const_cast<char*>("agentrun-server"), &config_flag[0], &path[0]};
    ServerConfig config = ServerConfig::load(3, argv);

    // Then: Environment wins, unset keys keep the file's value
    EXPECT_EQ(config.port, 8200);
    EXPECT_EQ(config.backend, "module-call");
    EXPECT_EQ(config.api_keys, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_FALSE(config.fanout_enabled);
}

TEST_F(ServerConfigTest, FlagsOverrideEnvironment) {
    setenv("AGENTRUN_BACKEND", "cluster-job", 1);

    std::string flag = "--backend";
    std::string value = "module-call";
    std::string port_flag = "--port";
    std::string port = "8300";
    char* argv[] = {const_cast<char*>("agentrun-server"), &flag[0], &value[0], &port_flag[0], &port[0]};
    ServerConfig config = ServerConfig::load(5, argv);

    EXPECT_EQ(config.backend, "module-call");
    EXPECT_EQ(config.port, 8300);
}

TEST_F(ServerConfigTest, UnknownFlagsAndBadNumbersFail) {
    std::string flag = "--verbose";
    char* argv[] = {const_cast<char*>("agentrun-server"), &flag[0]};
    EXPECT_THROW(ServerConfig::load(2, argv), ConfigError);

    setenv("AGENTRUN_PORT", "80x", 1);
    char* plain[] = {const_cast<char*>("agentrun-server")};
    EXPECT_THROW(ServerConfig::load(1, plain), ConfigError);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ServerConfigTest, ValidationRejectsInconsistentSettings) {
    auto invalid = [](auto mutate) {
        ServerConfig config;
        mutate(config);
        EXPECT_THROW(config.validate(), ConfigError);
    };

    invalid([](ServerConfig& c) { c.port = 70000; });
    invalid([](ServerConfig& c) { c.backend = "docker"; });
    invalid([](ServerConfig& c) { c.min_variations = 0; });
    invalid([](ServerConfig& c) { c.max_variations = 0; });
    invalid([](ServerConfig& c) { c.provision_attempts = 0; });
    invalid([](ServerConfig& c) { c.max_concurrent_sandboxes = 2; });
    invalid([](ServerConfig& c) { c.relay_url = "redis://localhost"; });
    invalid([](ServerConfig& c) { c.queue_capacity = 0; });
    invalid([](ServerConfig& c) { c.allowed_git_hosts.clear(); });
    invalid([](ServerConfig& c) { c.local.entrypoint.clear(); });
}
