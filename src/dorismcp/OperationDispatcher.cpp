//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OperationDispatcher.cpp
// Purpose: Coroutine handlers for the catalogue operations and their JSON-RPC wire mapping
//==========================================================================================================

#include <array>
#include <format>
#include <functional>
#include <map>
#include <stdexcept>

#include "dorismcp/OperationDispatcher.h"
#include "dorismcp/async/FutureAwaitable.h"
#include "dorismcp/async/Task.h"
#include "dorismcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dorismcp {

namespace {
struct OperationInfo {
    Operation op;
    const char* name;
    const char* method;
};

constexpr std::array<OperationInfo, 6> kOperations = {{
    {Operation::ListResources, "list_resources", Methods::ListResources},
    {Operation::ReadResource, "read_resource", Methods::ReadResource},
    {Operation::ListTools, "list_tools", Methods::ListTools},
    {Operation::CallTool, "call_tool", Methods::CallTool},
    {Operation::ListPrompts, "list_prompts", Methods::ListPrompts},
    {Operation::GetPrompt, "get_prompt", Methods::GetPrompt},
}};

const OperationInfo& infoOf(Operation op) {
    for (const auto& info : kOperations) {
        if (info.op == op) return info;
    }
    throw std::logic_error("Unknown operation");
}

// Message of the in-flight exception for envelopes and logs
std::string currentExceptionMessage() {
    try {
        throw;
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

std::string envelope(JSONValue::Object fields) {
    return SerializeJSON(JSONValue(std::move(fields)), 2);
}

[[noreturn]] void invalidParams(const std::string& message) {
    throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, message);
}

const JSONValue& requireParamsObject(const std::optional<JSONValue>& params, const char* method) {
    if (!params.has_value() || !params->isObject()) {
        invalidParams(std::format("{} requires an object of params", method));
    }
    return params.value();
}

std::string requireString(const JSONValue& params, const char* key, const char* method) {
    auto v = GetStringMember(params, key);
    if (!v.has_value()) {
        invalidParams(std::format("{} requires string param '{}'", method, key));
    }
    return v.value();
}

// Absent or null arguments mean an empty mapping
JSONValue argumentsOf(const JSONValue& params, const char* method) {
    const JSONValue* args = FindMember(params, "arguments");
    if (args == nullptr || args->isNull()) {
        return JSONValue(JSONValue::Object{});
    }
    if (!args->isObject()) {
        invalidParams(std::format("{} param 'arguments' must be an object", method));
    }
    return *args;
}

template <typename T>
JSONValue arrayOf(const std::vector<T>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(ToJSON(item)));
    }
    return JSONValue(std::move(arr));
}
} // namespace

const char* OperationName(Operation op) { return infoOf(op).name; }
const char* OperationMethod(Operation op) { return infoOf(op).method; }

std::optional<Operation> OperationFromMethod(const std::string& method) {
    for (const auto& info : kOperations) {
        if (method == info.method) return info.op;
    }
    return std::nullopt;
}

class OperationDispatcher::Impl {
public:
    using Handler = std::function<JSONValue(const std::optional<JSONValue>&)>;

    std::shared_ptr<IResourcesManager> resources;
    std::shared_ptr<IToolsManager> tools;
    std::shared_ptr<IPromptsManager> prompts;
    std::map<std::string, Handler> handlers;

    Impl(std::shared_ptr<IResourcesManager> r, std::shared_ptr<IToolsManager> t, std::shared_ptr<IPromptsManager> p)
        : resources(std::move(r)), tools(std::move(t)), prompts(std::move(p)) {
        if (!resources || !tools || !prompts) {
            throw std::invalid_argument("OperationDispatcher requires resources, tools, and prompts managers");
        }
        registerHandlers();
    }

    async::Task<std::vector<Resource>> coListResources();
    async::Task<std::string> coReadResource(std::string uri);
    async::Task<std::vector<Tool>> coListTools();
    async::Task<std::vector<TextContent>> coCallTool(std::string name, JSONValue arguments);
    async::Task<std::vector<Prompt>> coListPrompts();
    async::Task<std::string> coGetPrompt(std::string name, JSONValue arguments);

private:
    void bind(Operation op, Handler h) {
        handlers.emplace(OperationMethod(op), std::move(h));
    }

    void registerHandlers();
};

//============================ Impl coroutine definitions ============================
async::Task<std::vector<Resource>> OperationDispatcher::Impl::coListResources() {
    LOG_DEBUG("Handling list_resources");
    try {
        auto out = co_await async::makeFutureAwaitable(resources->ListResources());
        LOG_INFO("Returning {} resources", out.size());
        co_return out;
    } catch (...) {
        LOG_ERROR("Failed to list resources: {}", currentExceptionMessage());
    }
    co_return std::vector<Resource>{};
}

async::Task<std::string> OperationDispatcher::Impl::coReadResource(std::string uri) {
    LOG_DEBUG("Handling read_resource uri={}", uri);
    std::string message;
    try {
        auto text = co_await async::makeFutureAwaitable(resources->ReadResource(uri));
        LOG_INFO("Read resource {} ({} bytes)", uri, text.size());
        co_return text;
    } catch (...) {
        message = currentExceptionMessage();
    }
    LOG_ERROR("Failed to read resource {}: {}", uri, message);
    JSONValue::Object fields;
    fields["error"] = std::make_shared<JSONValue>(std::format("Failed to read resource: {}", message));
    fields["uri"] = std::make_shared<JSONValue>(uri);
    co_return envelope(std::move(fields));
}

async::Task<std::vector<Tool>> OperationDispatcher::Impl::coListTools() {
    LOG_DEBUG("Handling list_tools");
    try {
        auto out = co_await async::makeFutureAwaitable(tools->ListTools());
        LOG_INFO("Returning {} tools", out.size());
        co_return out;
    } catch (...) {
        LOG_ERROR("Failed to list tools: {}", currentExceptionMessage());
    }
    co_return std::vector<Tool>{};
}

async::Task<std::vector<TextContent>> OperationDispatcher::Impl::coCallTool(std::string name, JSONValue arguments) {
    LOG_INFO("Calling tool {}", name);
    std::string message;
    try {
        auto text = co_await async::makeFutureAwaitable(tools->CallTool(name, arguments));
        co_return std::vector<TextContent>{TextContent(std::move(text))};
    } catch (...) {
        message = currentExceptionMessage();
    }
    LOG_ERROR("Tool call failed for {}: {}", name, message);
    JSONValue::Object fields;
    fields["error"] = std::make_shared<JSONValue>(std::format("Tool call failed: {}", message));
    fields["tool_name"] = std::make_shared<JSONValue>(name);
    fields["arguments"] = std::make_shared<JSONValue>(arguments);
    co_return std::vector<TextContent>{TextContent(envelope(std::move(fields)))};
}

async::Task<std::vector<Prompt>> OperationDispatcher::Impl::coListPrompts() {
    LOG_DEBUG("Handling list_prompts");
    try {
        auto out = co_await async::makeFutureAwaitable(prompts->ListPrompts());
        LOG_INFO("Returning {} prompts", out.size());
        co_return out;
    } catch (...) {
        LOG_ERROR("Failed to list prompts: {}", currentExceptionMessage());
    }
    co_return std::vector<Prompt>{};
}

async::Task<std::string> OperationDispatcher::Impl::coGetPrompt(std::string name, JSONValue arguments) {
    LOG_DEBUG("Handling get_prompt name={}", name);
    std::string message;
    try {
        auto text = co_await async::makeFutureAwaitable(prompts->GetPrompt(name, arguments));
        co_return text;
    } catch (...) {
        message = currentExceptionMessage();
    }
    LOG_ERROR("Failed to get prompt {}: {}", name, message);
    JSONValue::Object fields;
    fields["error"] = std::make_shared<JSONValue>(std::format("Failed to get prompt: {}", message));
    fields["prompt_name"] = std::make_shared<JSONValue>(name);
    fields["arguments"] = std::make_shared<JSONValue>(arguments);
    co_return envelope(std::move(fields));
}

//============================ Handler table ============================
void OperationDispatcher::Impl::registerHandlers() {
    bind(Operation::ListResources, [this](const std::optional<JSONValue>&) {
        auto items = coListResources().toFuture().get();
        return MakeObject({{"resources", arrayOf(items)}});
    });

    bind(Operation::ReadResource, [this](const std::optional<JSONValue>& params) {
        const JSONValue& p = requireParamsObject(params, Methods::ReadResource);
        std::string uri = requireString(p, "uri", Methods::ReadResource);
        std::string text = coReadResource(uri).toFuture().get();
        JSONValue content = MakeObject({
            {"uri", JSONValue(uri)},
            {"mimeType", JSONValue("text/plain")},
            {"text", JSONValue(std::move(text))},
        });
        JSONValue::Array contents{std::make_shared<JSONValue>(std::move(content))};
        return MakeObject({{"contents", JSONValue(std::move(contents))}});
    });

    bind(Operation::ListTools, [this](const std::optional<JSONValue>&) {
        auto items = coListTools().toFuture().get();
        return MakeObject({{"tools", arrayOf(items)}});
    });

    bind(Operation::CallTool, [this](const std::optional<JSONValue>& params) {
        const JSONValue& p = requireParamsObject(params, Methods::CallTool);
        std::string name = requireString(p, "name", Methods::CallTool);
        JSONValue arguments = argumentsOf(p, Methods::CallTool);
        auto content = coCallTool(std::move(name), std::move(arguments)).toFuture().get();
        return MakeObject({
            {"content", arrayOf(content)},
            {"isError", JSONValue(false)},
        });
    });

    bind(Operation::ListPrompts, [this](const std::optional<JSONValue>&) {
        auto items = coListPrompts().toFuture().get();
        return MakeObject({{"prompts", arrayOf(items)}});
    });

    bind(Operation::GetPrompt, [this](const std::optional<JSONValue>& params) {
        const JSONValue& p = requireParamsObject(params, Methods::GetPrompt);
        std::string name = requireString(p, "name", Methods::GetPrompt);
        JSONValue arguments = argumentsOf(p, Methods::GetPrompt);
        std::string text = coGetPrompt(name, std::move(arguments)).toFuture().get();
        JSONValue message = MakeObject({
            {"role", JSONValue("user")},
            {"content", MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(std::move(text))}})},
        });
        JSONValue::Array messages{std::make_shared<JSONValue>(std::move(message))};
        return MakeObject({{"messages", JSONValue(std::move(messages))}});
    });
}

//============================ Public API ============================
OperationDispatcher::OperationDispatcher(std::shared_ptr<IResourcesManager> resources,
                                         std::shared_ptr<IToolsManager> tools,
                                         std::shared_ptr<IPromptsManager> prompts)
    : pImpl(std::make_unique<Impl>(std::move(resources), std::move(tools), std::move(prompts))) {}

OperationDispatcher::~OperationDispatcher() = default;

std::future<std::vector<Resource>> OperationDispatcher::ListResources() {
    return pImpl->coListResources().toFuture();
}

std::future<std::string> OperationDispatcher::ReadResource(const std::string& uri) {
    return pImpl->coReadResource(uri).toFuture();
}

std::future<std::vector<Tool>> OperationDispatcher::ListTools() {
    return pImpl->coListTools().toFuture();
}

std::future<std::vector<TextContent>> OperationDispatcher::CallTool(const std::string& name, const JSONValue& arguments) {
    return pImpl->coCallTool(name, arguments).toFuture();
}

std::future<std::vector<Prompt>> OperationDispatcher::ListPrompts() {
    return pImpl->coListPrompts().toFuture();
}

std::future<std::string> OperationDispatcher::GetPrompt(const std::string& name, const JSONValue& arguments) {
    return pImpl->coGetPrompt(name, arguments).toFuture();
}

bool OperationDispatcher::Handles(const std::string& method) const {
    return pImpl->handlers.find(method) != pImpl->handlers.end();
}

JSONValue OperationDispatcher::Dispatch(const std::string& method, const std::optional<JSONValue>& params) {
    auto it = pImpl->handlers.find(method);
    if (it == pImpl->handlers.end()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::MethodNotFound, std::format("Method not found: {}", method));
    }
    return it->second(params);
}

} // namespace dorismcp
