//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPSessionManager.h
// Purpose: Streamable HTTP session table (JSON response mode) over the MCP server session
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "dorismcp/HTTPMessages.h"
#include "dorismcp/OperationDispatcher.h"
#include "dorismcp/Protocol.h"

namespace dorismcp {

struct HttpSessionOptions {
    bool stateless = false;   // fresh pre-initialized session per POST, no session ids
};

class HTTPSessionManager {
public:
    using OptionsFactory = std::function<InitializationOptions()>;

    //==========================================================================================================
    // RunScope
    // Purpose: Requests are served only while a scope is alive. Destroying it terminates every session.
    //==========================================================================================================
    class RunScope {
    public:
        RunScope(RunScope&& other) noexcept;
        RunScope& operator=(RunScope&&) = delete;
        RunScope(const RunScope&) = delete;
        RunScope& operator=(const RunScope&) = delete;
        ~RunScope();

    private:
        friend class HTTPSessionManager;
        explicit RunScope(HTTPSessionManager* owner) : owner(owner) {}
        HTTPSessionManager* owner;
    };

    HTTPSessionManager(OperationDispatcher& dispatcher, OptionsFactory makeOptions, HttpSessionOptions options = {});
    ~HTTPSessionManager();

    HTTPSessionManager(const HTTPSessionManager&) = delete;
    HTTPSessionManager& operator=(const HTTPSessionManager&) = delete;

    // Throws std::logic_error when a scope is already active.
    RunScope Run();

    //==========================================================================================================
    // HandleRequest
    // Purpose: Serve one request to the MCP endpoint (POST/GET/DELETE).
    // Returns:
    //   The rendered reply; for an accepted GET the reply carries the session's event stream.
    // Notes:
    //   Throws std::logic_error outside of a RunScope. Safe to call concurrently.
    //==========================================================================================================
    HttpReply HandleRequest(const HttpRequest& req);

    bool IsRunning() const;
    std::size_t SessionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dorismcp
