//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed protocol errors, aggregate failures, and diagnostic logging helpers
//==========================================================================================================

#pragma once

#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "dorismcp/JSONRPCTypes.h"

namespace dorismcp {
namespace errors {

// Typed JSON-RPC error representation.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// ProtocolError
// Purpose: Exception carrying a JSON-RPC error; the session layer turns it into an error response.
//==========================================================================================================
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(McpError err)
        : std::runtime_error(err.message), error(std::move(err)) {}
    ProtocolError(int code, const std::string& message)
        : ProtocolError(McpError{code, message, std::nullopt}) {}

    const McpError& Error() const noexcept { return error; }

private:
    McpError error;
};

// Create a JSONValue error object from a typed McpError.
//
// Args:
//   err: The McpError to serialize.
//
// Returns:
//   JSONValue of Object type with code/message and optional data.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// AggregateError
// Purpose: A failure composed of several concurrent failures. what() summarizes the count; Causes()
//          exposes each underlying exception for diagnostics.
//==========================================================================================================
class AggregateError : public std::runtime_error {
public:
    AggregateError(const std::string& message, std::vector<std::exception_ptr> causes);

    const std::vector<std::exception_ptr>& Causes() const noexcept { return causes; }

private:
    std::vector<std::exception_ptr> causes;
};

//==========================================================================================================
// FailureCollector
// Purpose: Thread-safe sink for failures raised by concurrently running tasks.
// Methods:
//   Add(ep): Record a failure (null pointers are ignored).
//   Empty(): True when nothing was recorded.
//   RethrowIfAny(message): No-op when empty; rethrows a single failure unchanged; throws
//                          AggregateError(message, all) when several were recorded.
//==========================================================================================================
class FailureCollector {
public:
    void Add(std::exception_ptr ep);
    bool Empty() const;
    std::size_t Size() const;
    void RethrowIfAny(const std::string& message);

private:
    mutable std::mutex mutex;
    std::vector<std::exception_ptr> failures;
};

//==========================================================================================================
// DescribeException
// Purpose: "<demangled type>: <what()>" for an exception pointer; "unknown exception" for non-std types.
//==========================================================================================================
std::string DescribeException(const std::exception_ptr& ep);

//==========================================================================================================
// LogFailureDetail
// Purpose: Log a failure with its type and message. For AggregateError, logs the count and then every
//          sub-exception (recursively) so no cause is lost.
// Args:
//   context: Short description of what was being attempted (e.g. "Streamable HTTP server startup failed").
//   ep: The failure.
//==========================================================================================================
void LogFailureDetail(const std::string& context, const std::exception_ptr& ep);

} // namespace errors
} // namespace dorismcp
