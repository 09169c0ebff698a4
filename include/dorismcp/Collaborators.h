//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Collaborators.h
// Purpose: Interfaces of the backend managers the server dispatches into
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "dorismcp/JSONRPCTypes.h"
#include "dorismcp/Protocol.h"

namespace dorismcp {

//==========================================================================================================
// IConnectionManager
// Purpose: Owns the database connection resources shared by all operations.
// Methods:
//   Initialize(): Prepare connections; the future carries any failure. Called once before serving.
//   Close(): Release resources; must tolerate repeated calls.
//==========================================================================================================
class IConnectionManager {
public:
    virtual ~IConnectionManager() = default;
    virtual std::future<void> Initialize() = 0;
    virtual std::future<void> Close() = 0;
};

//==========================================================================================================
// IResourcesManager
// Purpose: Resource discovery and reads. ReadResource returns the resource body as text.
//==========================================================================================================
class IResourcesManager {
public:
    virtual ~IResourcesManager() = default;
    virtual std::future<std::vector<Resource>> ListResources() = 0;
    virtual std::future<std::string> ReadResource(const std::string& uri) = 0;
};

//==========================================================================================================
// IToolsManager
// Purpose: Tool discovery and invocation. CallTool returns the tool's textual result.
//==========================================================================================================
class IToolsManager {
public:
    virtual ~IToolsManager() = default;
    virtual std::future<std::vector<Tool>> ListTools() = 0;
    virtual std::future<std::string> CallTool(const std::string& name, const JSONValue& arguments) = 0;
};

//==========================================================================================================
// IPromptsManager
// Purpose: Prompt discovery and rendering. GetPrompt returns the rendered prompt text.
//==========================================================================================================
class IPromptsManager {
public:
    virtual ~IPromptsManager() = default;
    virtual std::future<std::vector<Prompt>> ListPrompts() = 0;
    virtual std::future<std::string> GetPrompt(const std::string& name, const JSONValue& arguments) = 0;
};

//==========================================================================================================
// ServerComponents
// Purpose: The collaborator set handed to the server facade. All members must be non-null.
//==========================================================================================================
struct ServerComponents {
    std::shared_ptr<IConnectionManager> connections;
    std::shared_ptr<IResourcesManager> resources;
    std::shared_ptr<IToolsManager> tools;
    std::shared_ptr<IPromptsManager> prompts;
};

} // namespace dorismcp
