//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionLifecycleCoordinator.h
// Purpose: Runs the HTTP listener inside the session manager's run scope
//==========================================================================================================

#pragma once

#include <functional>

#include "dorismcp/HTTPSessionManager.h"

namespace dorismcp {

//==========================================================================================================
// SessionLifecycleCoordinator
// Purpose: Nests the session manager's RunScope around a blocking listener loop so both unwind together.
// Notes:
//   The listener is a pair of callables (serve/stop) so any blocking loop can be driven; HTTPServer is
//   the production listener.
//==========================================================================================================
class SessionLifecycleCoordinator {
public:
    using ServeLoop = std::function<void()>;
    using StopLoop = std::function<void()>;

    SessionLifecycleCoordinator(HTTPSessionManager& manager, ServeLoop serve, StopLoop stop);

    // Blocks until the listener returns. Failures are logged with full detail and rethrown.
    void Serve();

    // Thread-safe.
    void Stop();

private:
    HTTPSessionManager& manager;
    ServeLoop serveLoop;
    StopLoop stopLoop;
};

} // namespace dorismcp
