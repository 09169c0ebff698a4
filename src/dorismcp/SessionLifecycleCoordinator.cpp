//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionLifecycleCoordinator.cpp
// Purpose: Runs the HTTP listener inside the session manager's run scope
//==========================================================================================================

#include "dorismcp/SessionLifecycleCoordinator.h"
#include "dorismcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dorismcp {

SessionLifecycleCoordinator::SessionLifecycleCoordinator(HTTPSessionManager& manager, ServeLoop serve, StopLoop stop)
    : manager(manager), serveLoop(std::move(serve)), stopLoop(std::move(stop)) {}

void SessionLifecycleCoordinator::Serve() {
    try {
        HTTPSessionManager::RunScope scope = manager.Run();
        LOG_INFO("Streamable HTTP session manager running");
        serveLoop();
    } catch (...) {
        errors::LogFailureDetail("Streamable HTTP server startup failed", std::current_exception());
        throw;
    }
}

void SessionLifecycleCoordinator::Stop() {
    stopLoop();
}

} // namespace dorismcp
