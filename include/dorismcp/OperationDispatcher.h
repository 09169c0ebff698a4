//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OperationDispatcher.h
// Purpose: Binds the six catalogue operations to the backend managers and normalizes their failures
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dorismcp/Collaborators.h"
#include "dorismcp/JSONRPCTypes.h"
#include "dorismcp/Protocol.h"

namespace dorismcp {

// The catalogue operations exposed to clients
enum class Operation {
    ListResources,
    ReadResource,
    ListTools,
    CallTool,
    ListPrompts,
    GetPrompt
};

// Operation name (e.g. "call_tool") and its JSON-RPC method (e.g. "tools/call")
const char* OperationName(Operation op);
const char* OperationMethod(Operation op);
std::optional<Operation> OperationFromMethod(const std::string& method);

class OperationDispatcher {
public:
    //==========================================================================================================
    // Constructs the dispatcher and builds its handler table (one handler per Operation).
    // Args:
    //   resources/tools/prompts: Backend managers; must be non-null.
    //==========================================================================================================
    OperationDispatcher(std::shared_ptr<IResourcesManager> resources,
                        std::shared_ptr<IToolsManager> tools,
                        std::shared_ptr<IPromptsManager> prompts);
    ~OperationDispatcher();

    OperationDispatcher(const OperationDispatcher&) = delete;
    OperationDispatcher& operator=(const OperationDispatcher&) = delete;

    //==========================================================================================================
    // Discovery operations. A manager failure is logged and yields an empty list.
    //==========================================================================================================
    std::future<std::vector<Resource>> ListResources();
    std::future<std::vector<Tool>> ListTools();
    std::future<std::vector<Prompt>> ListPrompts();

    //==========================================================================================================
    // ReadResource
    // Purpose: Resource body as text, or on failure the 2-space JSON envelope
    //          {"error": "Failed to read resource: <what>", "uri": uri}.
    //==========================================================================================================
    std::future<std::string> ReadResource(const std::string& uri);

    //==========================================================================================================
    // CallTool
    // Purpose: Exactly one text content item holding the tool result, or on failure the envelope
    //          {"error": "Tool call failed: <what>", "tool_name": name, "arguments": arguments}.
    //==========================================================================================================
    std::future<std::vector<TextContent>> CallTool(const std::string& name, const JSONValue& arguments);

    //==========================================================================================================
    // GetPrompt
    // Purpose: Prompt text, or on failure the envelope
    //          {"error": "Failed to get prompt: <what>", "prompt_name": name, "arguments": arguments}.
    //==========================================================================================================
    std::future<std::string> GetPrompt(const std::string& name, const JSONValue& arguments);

    // True when method names one of the catalogue operations.
    bool Handles(const std::string& method) const;

    //==========================================================================================================
    // Dispatch
    // Purpose: Run the handler bound to a JSON-RPC method and return its wire result object.
    // Args:
    //   method: JSON-RPC method (e.g. "tools/call").
    //   params: Request params, if any.
    // Returns:
    //   Result object. Throws errors::ProtocolError (InvalidParams) for malformed params and
    //   (MethodNotFound) for methods outside the catalogue. Manager failures never throw.
    //==========================================================================================================
    JSONValue Dispatch(const std::string& method, const std::optional<JSONValue>& params);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dorismcp
