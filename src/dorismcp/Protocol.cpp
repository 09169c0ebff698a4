//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Capability snapshot, initialize result, and descriptor serialization
//==========================================================================================================

#include "dorismcp/Protocol.h"

namespace dorismcp {

bool IsSupportedProtocolVersion(const std::string& version) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (version == v) return true;
    }
    return false;
}

std::string NegotiateProtocolVersion(const std::optional<std::string>& requested) {
    if (requested.has_value() && IsSupportedProtocolVersion(requested.value())) {
        return requested.value();
    }
    return LATEST_PROTOCOL_VERSION;
}

ServerCapabilities MakeServerCapabilities(const NotificationOptions& notifications,
                                          const std::map<std::string, JSONValue>& experimental) {
    ServerCapabilities caps;
    caps.prompts = PromptsCapability{notifications.promptsChanged};
    caps.resources = ResourcesCapability{false, notifications.resourcesChanged};
    caps.tools = ToolsCapability{notifications.toolsChanged};
    caps.experimental = experimental;
    return caps;
}

JSONValue SerializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object obj;

    JSONValue::Object experimentalObj;
    for (const auto& [key, val] : caps.experimental) {
        experimentalObj[key] = std::make_shared<JSONValue>(val);
    }
    obj["experimental"] = std::make_shared<JSONValue>(std::move(experimentalObj));

    if (caps.prompts.has_value()) {
        JSONValue::Object promptsObj;
        promptsObj["listChanged"] = std::make_shared<JSONValue>(caps.prompts->listChanged);
        obj["prompts"] = std::make_shared<JSONValue>(std::move(promptsObj));
    }

    if (caps.resources.has_value()) {
        JSONValue::Object resourcesObj;
        resourcesObj["subscribe"] = std::make_shared<JSONValue>(caps.resources->subscribe);
        resourcesObj["listChanged"] = std::make_shared<JSONValue>(caps.resources->listChanged);
        obj["resources"] = std::make_shared<JSONValue>(std::move(resourcesObj));
    }

    if (caps.tools.has_value()) {
        JSONValue::Object toolsObj;
        toolsObj["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = std::make_shared<JSONValue>(std::move(toolsObj));
    }

    return JSONValue(std::move(obj));
}

JSONValue MakeInitializeResult(const InitializationOptions& options, const std::string& protocolVersion) {
    JSONValue::Object resultObj;
    resultObj["protocolVersion"] = std::make_shared<JSONValue>(protocolVersion);
    resultObj["capabilities"] = std::make_shared<JSONValue>(SerializeServerCapabilities(options.capabilities));
    JSONValue::Object serverInfoObj;
    serverInfoObj["name"] = std::make_shared<JSONValue>(options.serverName);
    serverInfoObj["version"] = std::make_shared<JSONValue>(options.serverVersion);
    resultObj["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfoObj));
    return JSONValue(std::move(resultObj));
}

JSONValue ToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    // Clients expect an object schema even when a tool declares none
    if (tool.inputSchema.isObject()) {
        obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    } else {
        obj["inputSchema"] = std::make_shared<JSONValue>(MakeObject({{"type", JSONValue("object")}}));
    }
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Resource& resource) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(resource.uri);
    obj["name"] = std::make_shared<JSONValue>(resource.name);
    if (resource.description.has_value()) {
        obj["description"] = std::make_shared<JSONValue>(resource.description.value());
    }
    if (resource.mimeType.has_value()) {
        obj["mimeType"] = std::make_shared<JSONValue>(resource.mimeType.value());
    }
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Prompt& prompt) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(prompt.name);
    if (prompt.description.has_value()) {
        obj["description"] = std::make_shared<JSONValue>(prompt.description.value());
    }
    JSONValue::Array args;
    for (const auto& a : prompt.arguments) {
        JSONValue::Object argObj;
        argObj["name"] = std::make_shared<JSONValue>(a.name);
        if (a.description.has_value()) {
            argObj["description"] = std::make_shared<JSONValue>(a.description.value());
        }
        argObj["required"] = std::make_shared<JSONValue>(a.required);
        args.push_back(std::make_shared<JSONValue>(std::move(argObj)));
    }
    obj["arguments"] = std::make_shared<JSONValue>(std::move(args));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const TextContent& content) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(content.type);
    obj["text"] = std::make_shared<JSONValue>(content.text);
    return JSONValue(std::move(obj));
}

} // namespace dorismcp
