//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: GoogleTests for command line parsing, .env loading, and configuration precedence
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <unistd.h>

#include "dorismcp/Config.h"

using namespace dorismcp;

namespace {

CommandLine parse(std::vector<std::string> args) {
    args.insert(args.begin(), "doris-mcp-server");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return ParseCommandLine(static_cast<int>(argv.size()), argv.data());
}

EnvLookup envFrom(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& key) -> std::optional<std::string> {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST(ConfigCommandLine, AcceptsBothFlagForms) {
    CommandLine cl = parse({"--transport", "http", "--port=8080", "--db-host", "fe.local"});
    EXPECT_EQ(cl.Get("transport").value_or(""), "http");
    EXPECT_EQ(cl.Get("port").value_or(""), "8080");
    EXPECT_EQ(cl.Get("db-host").value_or(""), "fe.local");
    EXPECT_FALSE(cl.Get("host").has_value());
    EXPECT_FALSE(cl.helpRequested);
    EXPECT_TRUE(parse({"--help"}).helpRequested);
}

TEST(ConfigCommandLine, RejectsUnknownOrIncompleteFlags) {
    EXPECT_THROW(parse({"--bogus", "1"}), ConfigError);
    EXPECT_THROW(parse({"--port"}), ConfigError);
    EXPECT_THROW(parse({"stdio"}), ConfigError);
}

TEST(ConfigTransport, ParsesKindsCaseInsensitively) {
    EXPECT_EQ(ParseTransportKind(" HTTP ").value(), TransportKind::Http);
    EXPECT_EQ(ParseTransportKind("stdio").value(), TransportKind::Stdio);
    EXPECT_FALSE(ParseTransportKind("websocket").has_value());
    EXPECT_STREQ(TransportKindName(TransportKind::Http), "http");
}

TEST(ConfigResolve, DefaultsWhenNothingIsSet) {
    ServerConfig cfg = ResolveConfig(ServerConfig{}, envFrom({}), CommandLine{});
    EXPECT_EQ(cfg.transport, "stdio");
    EXPECT_EQ(cfg.serverHost, "localhost");
    EXPECT_EQ(cfg.serverPort, 3000);
    EXPECT_EQ(cfg.database.port, 9030);
    EXPECT_EQ(cfg.database.user, "root");
    EXPECT_EQ(cfg.logLevel, "INFO");
    EXPECT_EQ(cfg.stdioFraming, StdioFraming::Newline);
    EXPECT_FALSE(cfg.httpStateless);
}

TEST(ConfigResolve, CommandLineBeatsEnvironment) {
    auto env = envFrom({{"TRANSPORT", "stdio"}, {"SERVER_PORT", "4000"}, {"DB_USER", "analyst"},
                        {"LOG_LEVEL", "debug"}});
    ServerConfig cfg = ResolveConfig(ServerConfig{}, env, parse({"--transport", "http", "--port", "5000"}));
    EXPECT_EQ(cfg.transport, "http");
    EXPECT_EQ(cfg.serverPort, 5000);
    EXPECT_EQ(cfg.database.user, "analyst");
    EXPECT_EQ(cfg.logLevel, "DEBUG");
}

TEST(ConfigResolve, UnsupportedTransportIsKeptForTheRunPolicy) {
    ServerConfig cfg = ResolveConfig(ServerConfig{}, envFrom({}), parse({"--transport", "websocket"}));
    EXPECT_EQ(cfg.transport, "websocket");
}

TEST(ConfigResolve, RejectsInvalidValues) {
    EXPECT_THROW(ResolveConfig(ServerConfig{}, envFrom({{"SERVER_PORT", "70000"}}), CommandLine{}), ConfigError);
    EXPECT_THROW(ResolveConfig(ServerConfig{}, envFrom({{"DB_PORT", "abc"}}), CommandLine{}), ConfigError);
    EXPECT_THROW(ResolveConfig(ServerConfig{}, envFrom({{"LOG_LEVEL", "chatty"}}), CommandLine{}), ConfigError);
    EXPECT_THROW(ResolveConfig(ServerConfig{}, envFrom({{"MCP_STDIO_FRAMING", "xml"}}), CommandLine{}), ConfigError);
    EXPECT_THROW(ResolveConfig(ServerConfig{}, envFrom({{"MCP_HTTP_STATELESS", "maybe"}}), CommandLine{}),
                 ConfigError);
    EXPECT_THROW(ResolveConfig(ServerConfig{}, envFrom({{"MCP_TLS_CERT", "/certs/cert.pem"}}), CommandLine{}),
                 ConfigError);
}

TEST(ConfigResolve, TransportTuning) {
    auto env = envFrom({{"MCP_STDIO_FRAMING", "content-length"}, {"MCP_HTTP_STATELESS", "yes"},
                        {"MCP_HTTP_KEEPALIVE_SECONDS", "5"}, {"MCP_HTTP_WORKERS", "8"},
                        {"MCP_TLS_CERT", "/certs/cert.pem"}, {"MCP_TLS_KEY", "/certs/key.pem"}});
    ServerConfig cfg = ResolveConfig(ServerConfig{}, env, CommandLine{});
    EXPECT_EQ(cfg.stdioFraming, StdioFraming::ContentLength);
    EXPECT_TRUE(cfg.httpStateless);
    EXPECT_EQ(cfg.httpKeepaliveSeconds, 5);
    EXPECT_EQ(cfg.httpWorkerThreads, 8);
    EXPECT_EQ(cfg.tlsKeyFile, "/certs/key.pem");
}

TEST(ConfigDotEnv, ParsesCommentsQuotesAndExports) {
    char path[] = "/tmp/doris_mcp_envXXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "# Doris settings\n"
            << "DB_HOST=fe.example.com\n"
            << "export DB_USER = analyst\n"
            << "DB_PASSWORD=\"p#ss word\"\n"
            << "DB_DATABASE=sales # default schema\n"
            << "not a setting\n"
            << "\n";
    }
    auto values = LoadDotEnvFile(path);
    std::remove(path);

    EXPECT_EQ(values["DB_HOST"], "fe.example.com");
    EXPECT_EQ(values["DB_USER"], "analyst");
    EXPECT_EQ(values["DB_PASSWORD"], "p#ss word");
    EXPECT_EQ(values["DB_DATABASE"], "sales");
    EXPECT_EQ(values.size(), 4u);

    EXPECT_TRUE(LoadDotEnvFile("/nonexistent/doris.env").empty());
}

TEST(ConfigDotEnv, ProcessEnvironmentBeatsDotEnv) {
    ::setenv("DORIS_MCP_TEST_KEY", "from-env", 1);
    EnvLookup lookup = MakeEnvironmentLookup({{"DORIS_MCP_TEST_KEY", "from-file"}, {"DORIS_MCP_FILE_ONLY", "file"}});
    EXPECT_EQ(lookup("DORIS_MCP_TEST_KEY").value_or(""), "from-env");
    EXPECT_EQ(lookup("DORIS_MCP_FILE_ONLY").value_or(""), "file");
    EXPECT_FALSE(lookup("DORIS_MCP_UNSET_KEY").has_value());
    ::unsetenv("DORIS_MCP_TEST_KEY");
}

TEST(ConfigUsage, MentionsEveryFlag) {
    std::string usage = UsageText("doris-mcp-server");
    for (const char* flag : {"--transport", "--host", "--port", "--db-host", "--db-port", "--db-user",
                             "--db-password", "--db-database", "--log-level", "--log-file", "--env-file", "--help"}) {
        EXPECT_NE(usage.find(flag), std::string::npos) << flag;
    }
}
