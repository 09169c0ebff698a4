//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the Doris MCP server
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dorismcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Latest MCP protocol revision spoken by this server
constexpr const char* LATEST_PROTOCOL_VERSION = "2025-06-18";

// Revisions accepted during initialize and in the Mcp-Protocol-Version header
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18"
};

// Default revision assumed for HTTP requests that omit Mcp-Protocol-Version
constexpr const char* DEFAULT_NEGOTIATED_VERSION = "2025-03-26";

bool IsSupportedProtocolVersion(const std::string& version);

//==========================================================================================================
// NegotiateProtocolVersion
// Purpose: Echo the client's requested revision when supported, otherwise the latest supported revision.
//==========================================================================================================
std::string NegotiateProtocolVersion(const std::optional<std::string>& requested);

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Capabilities structures
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::map<std::string, JSONValue> experimental;
};

// Change-notification flags advertised to clients
struct NotificationOptions {
    bool promptsChanged = false;
    bool resourcesChanged = false;
    bool toolsChanged = false;
};

//==========================================================================================================
// MakeServerCapabilities
// Purpose: Build the capability snapshot from change-notification flags and experimental extensions.
//          Tools, resources, and prompts are always advertised; only their listChanged flags vary.
//==========================================================================================================
ServerCapabilities MakeServerCapabilities(const NotificationOptions& notifications,
                                          const std::map<std::string, JSONValue>& experimental);

JSONValue SerializeServerCapabilities(const ServerCapabilities& caps);

//==========================================================================================================
// InitializationOptions
// Purpose: Server identity plus the capability snapshot sent once per stream or session.
//==========================================================================================================
struct InitializationOptions {
    std::string serverName;
    std::string serverVersion;
    ServerCapabilities capabilities;
};

// Result object of the initialize request
JSONValue MakeInitializeResult(const InitializationOptions& options, const std::string& protocolVersion);

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    Prompt() = default;
    Prompt(std::string name, std::optional<std::string> description = std::nullopt,
           std::vector<PromptArgument> arguments = {})
        : name(std::move(name)), description(std::move(description)), arguments(std::move(arguments)) {}
};

///////////////////////////////////////// Content ///////////////////////////////////////////
// Text content item { type: "text", text }
struct TextContent {
    std::string type{"text"};
    std::string text;

    TextContent() = default;
    explicit TextContent(std::string text) : text(std::move(text)) {}
};

// Wire encodings of the descriptors above
JSONValue ToJSON(const Tool& tool);
JSONValue ToJSON(const Resource& resource);
JSONValue ToJSON(const Prompt& prompt);
JSONValue ToJSON(const TextContent& content);

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Progress = "notifications/progress";
}

} // namespace dorismcp
