//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Command-line parsing, .env loading, and configuration resolution
//==========================================================================================================

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

#include "dorismcp/Config.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace dorismcp {

namespace {

// Recognized command-line flags
struct FlagSpec {
    const char* flag;
    bool takesValue;
};

constexpr std::array<FlagSpec, 12> kFlags = {{
    {"transport", true},
    {"host", true},
    {"port", true},
    {"db-host", true},
    {"db-port", true},
    {"db-user", true},
    {"db-password", true},
    {"db-database", true},
    {"log-level", true},
    {"log-file", true},
    {"env-file", true},
    {"help", false},
}};

const FlagSpec* findFlag(const std::string& name) {
    for (const auto& f : kFlags) {
        if (name == f.flag) return &f;
    }
    return nullptr;
}

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (b < e) ? std::string(b, e) : std::string();
}

int parseInt(const std::string& key, const std::string& text, int minValue, int maxValue) {
    const std::string t = trim(text);
    if (t.empty() || !std::all_of(t.begin(), t.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        throw ConfigError(std::format("{} must be an integer (got '{}')", key, text));
    }
    long long v = 0;
    try {
        v = std::stoll(t);
    } catch (const std::out_of_range&) {
        throw ConfigError(std::format("{} is out of range (got '{}')", key, text));
    }
    if (v < minValue || v > maxValue) {
        throw ConfigError(std::format("{} must be between {} and {} (got {})", key, minValue, maxValue, v));
    }
    return static_cast<int>(v);
}

bool parseBool(const std::string& key, const std::string& text) {
    std::string s = trim(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off" || s.empty()) return false;
    throw ConfigError(std::format("{} must be a boolean (got '{}')", key, text));
}

// Setting resolution helper: CLI flag first, then env key.
class Resolver {
public:
    Resolver(const EnvLookup& e, const CommandLine& c) : env(e), cli(c) {}

    std::optional<std::string> lookup(const char* flag, const char* envKey) const {
        if (flag != nullptr) {
            if (auto v = cli.Get(flag); v.has_value()) return v;
        }
        if (envKey != nullptr && env) {
            return env(envKey);
        }
        return std::nullopt;
    }

    void str(std::string& out, const char* flag, const char* envKey) const {
        if (auto v = lookup(flag, envKey); v.has_value()) out = v.value();
    }

    void integer(int& out, const char* flag, const char* envKey, int minValue, int maxValue) const {
        if (auto v = lookup(flag, envKey); v.has_value()) {
            out = parseInt(envKey ? envKey : flag, v.value(), minValue, maxValue);
        }
    }

    void boolean(bool& out, const char* envKey) const {
        if (auto v = lookup(nullptr, envKey); v.has_value()) out = parseBool(envKey, v.value());
    }

private:
    const EnvLookup& env;
    const CommandLine& cli;
};

} // namespace

std::optional<TransportKind> ParseTransportKind(const std::string& name) {
    std::string s = trim(name);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "stdio") return TransportKind::Stdio;
    if (s == "http") return TransportKind::Http;
    return std::nullopt;
}

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
    }
    return "unknown";
}

std::optional<std::string> CommandLine::Get(const std::string& flag) const {
    auto it = values.find(flag);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

CommandLine ParseCommandLine(int argc, char** argv) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) {
            throw ConfigError(std::format("Unexpected argument: {}", a));
        }
        std::string name = a.substr(2);
        std::optional<std::string> inlineValue;
        std::size_t eq = name.find('=');
        if (eq != std::string::npos) {
            inlineValue = name.substr(eq + 1);
            name = name.substr(0, eq);
        }
        const FlagSpec* spec = findFlag(name);
        if (spec == nullptr) {
            throw ConfigError(std::format("Unknown option: --{}", name));
        }
        if (!spec->takesValue) {
            if (name == "help") cl.helpRequested = true;
            continue;
        }
        if (inlineValue.has_value()) {
            cl.values[name] = inlineValue.value();
        } else if (i + 1 < argc && argv[i + 1] != nullptr) {
            cl.values[name] = argv[++i];
        } else {
            throw ConfigError(std::format("Option --{} requires a value", name));
        }
    }
    return cl;
}

std::map<std::string, std::string> LoadDotEnvFile(const std::string& path) {
    std::map<std::string, std::string> out;
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_DEBUG("No .env file at {}", path);
        return out;
    }
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string t = trim(line);
        if (t.empty() || t.front() == '#') continue;
        if (t.rfind("export ", 0) == 0) t = trim(t.substr(7));
        std::size_t eq = t.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Ignoring malformed line {} in {}", lineNo, path);
            continue;
        }
        std::string key = trim(t.substr(0, eq));
        std::string value = trim(t.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing " # comment"
            std::size_t hash = value.find(" #");
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }
        if (!key.empty()) out[key] = value;
    }
    LOG_DEBUG("Loaded {} entries from {}", out.size(), path);
    return out;
}

EnvLookup MakeEnvironmentLookup(std::map<std::string, std::string> dotEnv) {
    return [dotEnv = std::move(dotEnv)](const std::string& key) -> std::optional<std::string> {
        if (auto v = GetEnv(key); v.has_value()) return v;
        auto it = dotEnv.find(key);
        if (it != dotEnv.end()) return it->second;
        return std::nullopt;
    };
}

ServerConfig ResolveConfig(const ServerConfig& defaults, const EnvLookup& env, const CommandLine& cli) {
    ServerConfig cfg = defaults;
    Resolver r(env, cli);

    r.str(cfg.transport, "transport", "TRANSPORT");
    r.str(cfg.serverHost, "host", "SERVER_HOST");
    r.integer(cfg.serverPort, "port", "SERVER_PORT", 0, 65535);
    r.str(cfg.serverVersion, nullptr, "SERVER_VERSION");

    r.str(cfg.database.host, "db-host", "DB_HOST");
    r.integer(cfg.database.port, "db-port", "DB_PORT", 1, 65535);
    r.str(cfg.database.user, "db-user", "DB_USER");
    r.str(cfg.database.password, "db-password", "DB_PASSWORD");
    r.str(cfg.database.database, "db-database", "DB_DATABASE");
    r.integer(cfg.database.connectTimeoutSeconds, nullptr, "DB_CONNECT_TIMEOUT", 0, 3600);

    r.str(cfg.logLevel, "log-level", "LOG_LEVEL");
    r.str(cfg.logFile, "log-file", "LOG_FILE");
    {
        std::string lvl = cfg.logLevel;
        std::transform(lvl.begin(), lvl.end(), lvl.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        if (lvl != "DEBUG" && lvl != "INFO" && lvl != "WARN" && lvl != "WARNING" && lvl != "ERROR") {
            throw ConfigError(std::format("LOG_LEVEL must be one of DEBUG, INFO, WARNING, ERROR (got '{}')", cfg.logLevel));
        }
        cfg.logLevel = lvl;
    }

    if (auto framing = r.lookup(nullptr, "MCP_STDIO_FRAMING"); framing.has_value()) {
        const std::string f = trim(framing.value());
        if (f == "newline" || f == "ndjson") {
            cfg.stdioFraming = StdioFraming::Newline;
        } else if (f == "content-length") {
            cfg.stdioFraming = StdioFraming::ContentLength;
        } else {
            throw ConfigError(std::format("MCP_STDIO_FRAMING must be 'newline' or 'content-length' (got '{}')", f));
        }
    }

    r.boolean(cfg.httpStateless, "MCP_HTTP_STATELESS");
    r.integer(cfg.httpKeepaliveSeconds, nullptr, "MCP_HTTP_KEEPALIVE_SECONDS", 0, 3600);
    r.integer(cfg.httpWorkerThreads, nullptr, "MCP_HTTP_WORKERS", 1, 256);
    r.str(cfg.tlsCertFile, nullptr, "MCP_TLS_CERT");
    r.str(cfg.tlsKeyFile, nullptr, "MCP_TLS_KEY");
    if (cfg.tlsCertFile.empty() != cfg.tlsKeyFile.empty()) {
        throw ConfigError("MCP_TLS_CERT and MCP_TLS_KEY must be set together");
    }

    return cfg;
}

std::string UsageText(const std::string& program) {
    std::ostringstream oss;
    oss << "Apache Doris MCP Server\n\n"
        << "Usage: " << program << " [options]\n\n"
        << "Options (--flag value or --flag=value):\n"
        << "  --transport {stdio|http}  Transport protocol (env TRANSPORT, default stdio)\n"
        << "  --host HOST               HTTP bind host (env SERVER_HOST, default localhost)\n"
        << "  --port PORT               HTTP port (env SERVER_PORT, default 3000)\n"
        << "  --db-host HOST            Doris FE host (env DB_HOST, default localhost)\n"
        << "  --db-port PORT            Doris FE query port (env DB_PORT, default 9030)\n"
        << "  --db-user USER            Doris user (env DB_USER, default root)\n"
        << "  --db-password PASSWORD    Doris password (env DB_PASSWORD)\n"
        << "  --db-database NAME        Default database (env DB_DATABASE, default information_schema)\n"
        << "  --log-level LEVEL         DEBUG, INFO, WARNING or ERROR (env LOG_LEVEL, default INFO)\n"
        << "  --log-file PATH           Also append logs to PATH (env LOG_FILE)\n"
        << "  --env-file PATH           Settings file read before the environment (default .env)\n"
        << "  --help                    Show this message\n\n"
        << "Examples:\n"
        << "  " << program << " --transport stdio\n"
        << "  " << program << " --transport http --host 0.0.0.0 --port 3000\n";
    return oss.str();
}

} // namespace dorismcp
