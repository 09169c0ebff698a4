//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registries.cpp
// Purpose: In-memory managers and the built-in catalogue
//==========================================================================================================

#include <algorithm>
#include <format>

#include "dorismcp/Registries.h"
#include "logging/Logger.h"

namespace dorismcp {

namespace {
template <typename T>
std::future<T> readyFuture(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

template <typename T>
std::future<T> failedFuture(std::exception_ptr ep) {
    std::promise<T> p;
    p.set_exception(std::move(ep));
    return p.get_future();
}

// Invoke a handler, turning a synchronous throw into a failed future.
template <typename F, typename... Args>
std::future<std::string> invokeHandler(const F& handler, Args&&... args) {
    try {
        return handler(std::forward<Args>(args)...);
    } catch (...) {
        return failedFuture<std::string>(std::current_exception());
    }
}

template <typename Entry, typename Key>
void upsert(std::vector<Entry>& entries, const Key& key, Entry entry, Key (*keyOf)(const Entry&)) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const Entry& e){ return keyOf(e) == key; });
    if (it != entries.end()) {
        *it = std::move(entry);
    } else {
        entries.push_back(std::move(entry));
    }
}
} // namespace

//================================== ResourceRegistry ==================================
void ResourceRegistry::RegisterResource(const Resource& resource, ResourceHandler handler) {
    LOG_DEBUG("Registering resource: {}", resource.uri);
    std::lock_guard<std::mutex> lock(registryMutex);
    using Entry = std::pair<Resource, ResourceHandler>;
    upsert<Entry, std::string>(entries, resource.uri, Entry{resource, std::move(handler)},
                               [](const Entry& e) { return e.first.uri; });
}

std::future<std::vector<Resource>> ResourceRegistry::ListResources() {
    std::vector<Resource> out;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        out.reserve(entries.size());
        for (const auto& e : entries) out.push_back(e.first);
    }
    return readyFuture(std::move(out));
}

std::future<std::string> ResourceRegistry::ReadResource(const std::string& uri) {
    ResourceHandler handler;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e){ return e.first.uri == uri; });
        if (it == entries.end()) {
            return failedFuture<std::string>(std::make_exception_ptr(NotFoundError("Unknown resource: " + uri)));
        }
        handler = it->second;
    }
    return invokeHandler(handler, uri);
}

//==================================== ToolRegistry ====================================
void ToolRegistry::RegisterTool(const Tool& tool, ToolHandler handler) {
    LOG_DEBUG("Registering tool: {}", tool.name);
    std::lock_guard<std::mutex> lock(registryMutex);
    using Entry = std::pair<Tool, ToolHandler>;
    upsert<Entry, std::string>(entries, tool.name, Entry{tool, std::move(handler)},
                               [](const Entry& e) { return e.first.name; });
}

std::future<std::vector<Tool>> ToolRegistry::ListTools() {
    std::vector<Tool> out;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        out.reserve(entries.size());
        for (const auto& e : entries) out.push_back(e.first);
    }
    return readyFuture(std::move(out));
}

std::future<std::string> ToolRegistry::CallTool(const std::string& name, const JSONValue& arguments) {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e){ return e.first.name == name; });
        if (it == entries.end()) {
            return failedFuture<std::string>(std::make_exception_ptr(NotFoundError("Unknown tool: " + name)));
        }
        handler = it->second;
    }
    return invokeHandler(handler, arguments);
}

//=================================== PromptRegistry ===================================
void PromptRegistry::RegisterPrompt(const Prompt& prompt, PromptHandler handler) {
    LOG_DEBUG("Registering prompt: {}", prompt.name);
    std::lock_guard<std::mutex> lock(registryMutex);
    using Entry = std::pair<Prompt, PromptHandler>;
    upsert<Entry, std::string>(entries, prompt.name, Entry{prompt, std::move(handler)},
                               [](const Entry& e) { return e.first.name; });
}

std::future<std::vector<Prompt>> PromptRegistry::ListPrompts() {
    std::vector<Prompt> out;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        out.reserve(entries.size());
        for (const auto& e : entries) out.push_back(e.first);
    }
    return readyFuture(std::move(out));
}

std::future<std::string> PromptRegistry::GetPrompt(const std::string& name, const JSONValue& arguments) {
    Prompt prompt;
    PromptHandler handler;
    {
        std::lock_guard<std::mutex> lock(registryMutex);
        auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e){ return e.first.name == name; });
        if (it == entries.end()) {
            return failedFuture<std::string>(std::make_exception_ptr(NotFoundError("Unknown prompt: " + name)));
        }
        prompt = it->first;
        handler = it->second;
    }
    for (const auto& arg : prompt.arguments) {
        if (arg.required && FindMember(arguments, arg.name) == nullptr) {
            return failedFuture<std::string>(std::make_exception_ptr(
                std::invalid_argument(std::format("Missing required argument '{}' for prompt {}", arg.name, name))));
        }
    }
    try {
        return readyFuture(handler(arguments));
    } catch (...) {
        return failedFuture<std::string>(std::current_exception());
    }
}

//================================== Built-in catalogue ==================================
void RegisterBuiltinCatalog(const ServerConfig& config,
                            ResourceRegistry& resources,
                            ToolRegistry& tools,
                            PromptRegistry& prompts) {
    const ServerConfig snapshot = config;

    resources.RegisterResource(
        Resource{"doris://server/config", "Server configuration",
                 std::string("Doris connection settings in use (password redacted)"),
                 std::string("application/json")},
        [snapshot](const std::string&) {
            JSONValue::Object db;
            db["host"] = std::make_shared<JSONValue>(snapshot.database.host);
            db["port"] = std::make_shared<JSONValue>(static_cast<int64_t>(snapshot.database.port));
            db["user"] = std::make_shared<JSONValue>(snapshot.database.user);
            db["password"] = std::make_shared<JSONValue>(snapshot.database.password.empty() ? "" : "******");
            db["database"] = std::make_shared<JSONValue>(snapshot.database.database);
            JSONValue::Object root;
            root["server_name"] = std::make_shared<JSONValue>(snapshot.serverName);
            root["server_version"] = std::make_shared<JSONValue>(snapshot.serverVersion);
            root["database"] = std::make_shared<JSONValue>(std::move(db));
            return readyFuture(SerializeJSON(JSONValue(std::move(root)), 2));
        });

    tools.RegisterTool(
        Tool{"get_server_info", "Return the MCP server name, version, and configured transport",
             MakeObject({{"type", JSONValue("object")}, {"properties", JSONValue(JSONValue::Object{})}})},
        [snapshot](const JSONValue&) {
            JSONValue info = MakeObject({
                {"name", JSONValue(snapshot.serverName)},
                {"version", JSONValue(snapshot.serverVersion)},
                {"transport", JSONValue(snapshot.transport)},
            });
            return readyFuture(SerializeJSON(info, 2));
        });

    prompts.RegisterPrompt(
        Prompt{"doris_query_assistant",
               std::string("Help formulate an Apache Doris SQL query for a question"),
               {PromptArgument{"question", std::string("What you want to find out from the data"), true}}},
        [snapshot](const JSONValue& arguments) {
            const std::string question = GetStringMember(arguments, "question").value_or("");
            return std::format(
                "You are an Apache Doris SQL expert. The default database is '{}'.\n"
                "Write an efficient Doris SQL query that answers the following question, "
                "and explain any assumptions about table or column names.\n\n"
                "Question: {}",
                snapshot.database.database, question);
        });
}

} // namespace dorismcp
