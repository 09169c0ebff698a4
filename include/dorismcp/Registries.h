//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.h
// Purpose: In-memory resource, tool, and prompt managers backed by registered handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "dorismcp/Collaborators.h"
#include "dorismcp/Config.h"

namespace dorismcp {

using ResourceHandler = std::function<std::future<std::string>(const std::string& uri)>;
using ToolHandler = std::function<std::future<std::string>(const JSONValue& arguments)>;
using PromptHandler = std::function<std::string(const JSONValue& arguments)>;

//==========================================================================================================
// NotFoundError
// Purpose: Raised when a resource URI, tool name, or prompt name has no registration.
//==========================================================================================================
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ResourceRegistry
// Purpose: IResourcesManager over registered (descriptor, handler) pairs. Listing preserves registration
//          order; registering an existing URI replaces it in place. Thread-safe.
//==========================================================================================================
class ResourceRegistry : public IResourcesManager {
public:
    void RegisterResource(const Resource& resource, ResourceHandler handler);

    std::future<std::vector<Resource>> ListResources() override;
    std::future<std::string> ReadResource(const std::string& uri) override;

private:
    std::mutex registryMutex;
    std::vector<std::pair<Resource, ResourceHandler>> entries;
};

//==========================================================================================================
// ToolRegistry
// Purpose: IToolsManager over registered (descriptor, handler) pairs. Thread-safe.
//==========================================================================================================
class ToolRegistry : public IToolsManager {
public:
    void RegisterTool(const Tool& tool, ToolHandler handler);

    std::future<std::vector<Tool>> ListTools() override;
    std::future<std::string> CallTool(const std::string& name, const JSONValue& arguments) override;

private:
    std::mutex registryMutex;
    std::vector<std::pair<Tool, ToolHandler>> entries;
};

//==========================================================================================================
// PromptRegistry
// Purpose: IPromptsManager over registered (descriptor, renderer) pairs. Required arguments declared in
//          the descriptor are checked before the renderer runs. Thread-safe.
//==========================================================================================================
class PromptRegistry : public IPromptsManager {
public:
    void RegisterPrompt(const Prompt& prompt, PromptHandler handler);

    std::future<std::vector<Prompt>> ListPrompts() override;
    std::future<std::string> GetPrompt(const std::string& name, const JSONValue& arguments) override;

private:
    std::mutex registryMutex;
    std::vector<std::pair<Prompt, PromptHandler>> entries;
};

//==========================================================================================================
// RegisterBuiltinCatalog
// Purpose: Populate the registries with the server's built-in entries:
//   resource doris://server/config  connection settings with the password redacted
//   tool get_server_info            server name, version, and transport
//   prompt doris_query_assistant    SQL assistance prompt taking a "question" argument
//==========================================================================================================
void RegisterBuiltinCatalog(const ServerConfig& config,
                            ResourceRegistry& resources,
                            ToolRegistry& tools,
                            PromptRegistry& prompts);

} // namespace dorismcp
