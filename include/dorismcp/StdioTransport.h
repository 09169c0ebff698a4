//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.h
// Purpose: Serves one MCP peer over a duplex byte-stream pair (stdin/stdout by default)
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "dorismcp/Config.h"
#include "dorismcp/OperationDispatcher.h"
#include "dorismcp/Protocol.h"

namespace dorismcp {

struct StdioOptions {
    int inputFd = STDIN_FILENO;
    int outputFd = STDOUT_FILENO;
    StdioFraming framing = StdioFraming::Newline;
    std::size_t maxFrameBytes = 4 * 1024 * 1024;
};

StdioOptions MakeStdioOptions(const ServerConfig& config);

//==========================================================================================================
// StdioStreams
// Purpose: Scoped ownership of a duplicated descriptor pair wrapped as asio stream descriptors. Console
//          logging is redirected to stderr for the lifetime of the scope so the output stream carries
//          protocol frames only.
//==========================================================================================================
class StdioStreams {
public:
    // Throws std::system_error when a descriptor cannot be duplicated or registered.
    StdioStreams(boost::asio::io_context& ioc, int inputFd, int outputFd);
    ~StdioStreams();

    StdioStreams(const StdioStreams&) = delete;
    StdioStreams& operator=(const StdioStreams&) = delete;

    boost::asio::posix::stream_descriptor& Input() { return input; }
    boost::asio::posix::stream_descriptor& Output() { return output; }

    // Close both descriptors, cancelling pending operations. Idempotent.
    void Close();

private:
    boost::asio::posix::stream_descriptor input;
    boost::asio::posix::stream_descriptor output;
    bool previousConsoleStderr{false};
};

class StdioTransport {
public:
    enum class State {
        Unstarted,
        StreamsOpen,
        CapabilitiesNegotiated,
        Serving,
        Closed
    };

    using OptionsFactory = std::function<InitializationOptions()>;

    explicit StdioTransport(StdioOptions options = {});
    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    //==========================================================================================================
    // Serve
    // Purpose: Acquire the streams, build the initialization descriptor, and run the read-dispatch-write
    //          loop until EOF or Stop(). Blocks the calling thread.
    // Args:
    //   dispatcher: Operation dispatcher for the session.
    //   makeOptions: Called once after the streams are open to snapshot capabilities.
    // Notes:
    //   Failures are logged with full detail (aggregate causes included) and rethrown after the streams
    //   are released. A transport may be served only once.
    //==========================================================================================================
    void Serve(OperationDispatcher& dispatcher, const OptionsFactory& makeOptions);

    // Thread-safe; makes Serve() return.
    void Stop();

    State GetState() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dorismcp
