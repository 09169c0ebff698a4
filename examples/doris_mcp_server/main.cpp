//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Apache Doris MCP server executable (stdio or streamable HTTP)
//==========================================================================================================

#include <iostream>
#include <optional>
#include <string>

#include "dorismcp/Config.h"
#include "dorismcp/DorisServer.h"
#include "logging/Logger.h"

using namespace dorismcp;

int main(int argc, char** argv) {
    const std::string program = (argc > 0 && argv[0] != nullptr) ? argv[0] : "doris_mcp_server";

    ServerConfig config;
    try {
        CommandLine cli = ParseCommandLine(argc, argv);
        if (cli.helpRequested) {
            std::cout << UsageText(program);
            return 0;
        }
        const std::string envFile = cli.Get("env-file").value_or(".env");
        EnvLookup env = MakeEnvironmentLookup(LoadDotEnvFile(envFile));
        config = ResolveConfig(ServerConfig{}, env, cli);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n\n" << UsageText(program);
        return 1;
    }

    // stdout belongs to the protocol in stdio mode
    const std::optional<TransportKind> transport = ParseTransportKind(config.transport);
    if (transport == TransportKind::Stdio) {
        Logger::setConsoleToStderr(true);
    }
    if (!Logger::setLogLevelFromString(config.logLevel)) {
        LOG_WARN("Unknown log level '{}', keeping INFO", config.logLevel);
    }
    if (!config.logFile.empty() && !Logger::setLogFile(config.logFile)) {
        LOG_WARN("Logging to console only");
    }
    FUNC_SCOPE();

    LOG_INFO("{} {} starting; database {}@{}:{}/{}", config.serverName, config.serverVersion,
             config.database.user, config.database.host, config.database.port, config.database.database);

    try {
        DorisServer server(config, MakeDefaultComponents(config));
        if (transport == TransportKind::Http) {
            server.SetListeningCallback([&config](unsigned short port) {
                LOG_INFO("MCP endpoint: http://{}:{}/mcp (health: /health)", config.serverHost, port);
            });
        }
        return RunServer(server);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create server: {}", e.what());
        return 1;
    }
}
