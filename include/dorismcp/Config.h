//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration value and its resolution from defaults, .env, environment, and CLI
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace dorismcp {

// Transports the server can be started on
enum class TransportKind {
    Stdio,
    Http
};

std::optional<TransportKind> ParseTransportKind(const std::string& name);
const char* TransportKindName(TransportKind kind);

// Frame format used on the stdio byte stream
enum class StdioFraming {
    Newline,        // one JSON message per line (MCP stdio framing)
    ContentLength   // Content-Length header framing
};

//==========================================================================================================
// DatabaseConfig
// Purpose: Connection settings for the Doris frontend (MySQL protocol port).
//==========================================================================================================
struct DatabaseConfig {
    std::string host{"localhost"};
    int port{9030};
    std::string user{"root"};
    std::string password;
    std::string database{"information_schema"};
    int connectTimeoutSeconds{5};   // 0 disables the startup probe
};

//==========================================================================================================
// ServerConfig
// Purpose: Immutable-after-resolution configuration threaded into the server facade.
// Notes:
//   transport is kept as text so that unsupported names reach the run policy and are reported there.
//==========================================================================================================
struct ServerConfig {
    std::string transport{"stdio"};
    std::string serverHost{"localhost"};
    int serverPort{3000};
    std::string serverName{"doris-mcp-server"};
    std::string serverVersion{"0.3.0"};

    DatabaseConfig database;

    std::string logLevel{"INFO"};
    std::string logFile;

    StdioFraming stdioFraming{StdioFraming::Newline};
    std::size_t stdioMaxFrameBytes{4 * 1024 * 1024};

    bool httpStateless{false};
    int httpKeepaliveSeconds{15};
    int httpWorkerThreads{4};
    std::string tlsCertFile;
    std::string tlsKeyFile;
};

//==========================================================================================================
// ConfigError
// Purpose: Invalid configuration input (unknown flag, malformed number, out-of-range value).
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Environment-style lookup: returns the value for a key, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

//==========================================================================================================
// CommandLine
// Purpose: Parsed command-line flags keyed by flag name without leading dashes (e.g. "db-host").
//==========================================================================================================
struct CommandLine {
    std::map<std::string, std::string> values;
    bool helpRequested = false;

    std::optional<std::string> Get(const std::string& flag) const;
};

//==========================================================================================================
// ParseCommandLine
// Purpose: Parse "--flag value" and "--flag=value" arguments.
// Args:
//   argc/argv: Process arguments; argv[0] is skipped.
// Returns:
//   CommandLine. Throws ConfigError on unknown flags or a flag missing its value.
//==========================================================================================================
CommandLine ParseCommandLine(int argc, char** argv);

//==========================================================================================================
// LoadDotEnvFile
// Purpose: Read KEY=VALUE lines from a .env file. Blank lines and '#' comments are skipped, an optional
//          leading "export " is accepted, and matching single or double quotes around values are removed.
// Returns:
//   Key/value map; empty when the file does not exist.
//==========================================================================================================
std::map<std::string, std::string> LoadDotEnvFile(const std::string& path);

//==========================================================================================================
// MakeEnvironmentLookup
// Purpose: Lookup that consults the process environment first and falls back to the given .env values.
//==========================================================================================================
EnvLookup MakeEnvironmentLookup(std::map<std::string, std::string> dotEnv);

//==========================================================================================================
// ResolveConfig
// Purpose: Combine configuration sources. Precedence per setting: command line, then environment lookup,
//          then the supplied defaults.
// Returns:
//   Resolved ServerConfig. Throws ConfigError for malformed or out-of-range values.
//==========================================================================================================
ServerConfig ResolveConfig(const ServerConfig& defaults, const EnvLookup& env, const CommandLine& cli);

// Help text printed for --help.
std::string UsageText(const std::string& program);

} // namespace dorismcp
