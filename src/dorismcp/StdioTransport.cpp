//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation (single peer, asio event loop on the calling thread)
//==========================================================================================================

#include <array>
#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include "dorismcp/ContentFramer.h"
#include "dorismcp/ServerSession.h"
#include "dorismcp/StdioTransport.h"
#include "dorismcp/errors/Errors.h"
#include "logging/Logger.h"

namespace dorismcp {

namespace net = boost::asio;

namespace {

int duplicateDescriptor(int fd, const char* role) {
    int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0) {
        throw std::system_error(errno, std::generic_category(),
                                std::format("StdioTransport: cannot duplicate {} descriptor {}", role, fd));
    }
    return copy;
}

void assignDescriptor(net::posix::stream_descriptor& stream, int fd, const char* role) {
    int copy = duplicateDescriptor(fd, role);
    boost::system::error_code ec;
    stream.assign(copy, ec);
    if (ec) {
        ::close(copy);
        throw std::system_error(ec.value(), std::generic_category(),
                                std::format("StdioTransport: cannot register {} descriptor {}", role, fd));
    }
}

} // namespace

StdioOptions MakeStdioOptions(const ServerConfig& config) {
    StdioOptions options;
    options.framing = config.stdioFraming;
    options.maxFrameBytes = config.stdioMaxFrameBytes;
    return options;
}

////////////////////////////////////////// StdioStreams //////////////////////////////////////////

StdioStreams::StdioStreams(net::io_context& ioc, int inputFd, int outputFd)
    : input(ioc), output(ioc) {
    assignDescriptor(input, inputFd, "input");
    assignDescriptor(output, outputFd, "output");
    previousConsoleStderr = Logger::consoleToStderr();
    Logger::setConsoleToStderr(true);
}

StdioStreams::~StdioStreams() {
    Close();
    Logger::setConsoleToStderr(previousConsoleStderr);
}

void StdioStreams::Close() {
    boost::system::error_code ec;
    if (input.is_open()) {
        input.close(ec);
        if (ec) {
            LOG_WARN("StdioTransport: closing input failed: {}", ec.message());
        }
    }
    if (output.is_open()) {
        output.close(ec);
        if (ec) {
            LOG_WARN("StdioTransport: closing output failed: {}", ec.message());
        }
    }
}

///////////////////////////////////////// StdioTransport /////////////////////////////////////////

class StdioTransport::Impl {
public:
    StdioOptions options;
    net::io_context ioc;
    std::atomic<State> state{State::Unstarted};
    std::atomic<bool> stopRequested{false};

    explicit Impl(StdioOptions o) : options(std::move(o)) {}

    static net::awaitable<void> writeFrame(net::posix::stream_descriptor& output, std::string frame) {
        co_await net::async_write(output, net::buffer(frame), net::use_awaitable);
    }

    // Decode and answer every complete frame at the front of buffer.
    static net::awaitable<void> drainFrames(std::string& buffer, IContentFramer& framer,
                                            ServerSession& session, net::posix::stream_descriptor& output) {
        for (;;) {
            IContentFramer::DecodeResult r = framer.tryDecodeEx(buffer);
            if (r.status == IContentFramer::DecodeStatus::Incomplete) {
                co_return;
            }
            buffer.erase(0, r.bytesConsumed);
            if (r.status == IContentFramer::DecodeStatus::Ok) {
                std::optional<std::string> reply = session.HandleText(r.payload.value());
                if (reply.has_value()) {
                    co_await writeFrame(output, framer.encode(reply.value()));
                }
                continue;
            }
            LOG_WARN("StdioTransport: dropped malformed frame ({} bytes)", r.bytesConsumed);
            const std::string parseError =
                CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
            co_await writeFrame(output, framer.encode(parseError));
        }
    }

    static net::awaitable<void> serveLoop(StdioStreams& streams, IContentFramer& framer, ServerSession& session) {
        std::string buffer;
        std::array<char, 8192> chunk{};
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = co_await streams.Input().async_read_some(
                net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
            if (n > 0) {
                buffer.append(chunk.data(), n);
                co_await drainFrames(buffer, framer, session, streams.Output());
            }
            if (ec == net::error::eof) {
                if (!buffer.empty()) {
                    LOG_WARN("StdioTransport: discarding {} bytes of incomplete frame at EOF", buffer.size());
                }
                LOG_INFO("StdioTransport: input closed by peer");
                co_return;
            }
            if (ec == net::error::operation_aborted || ec == net::error::bad_descriptor) {
                LOG_DEBUG("StdioTransport: read cancelled");
                co_return;
            }
            if (ec) {
                throw boost::system::system_error(ec, "StdioTransport: read failed");
            }
        }
    }
};

StdioTransport::StdioTransport(StdioOptions options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {}

StdioTransport::~StdioTransport() = default;

void StdioTransport::Serve(OperationDispatcher& dispatcher, const OptionsFactory& makeOptions) {
    State expected = State::Unstarted;
    if (!pImpl->state.compare_exchange_strong(expected, State::StreamsOpen)) {
        throw std::logic_error("StdioTransport: Serve() may only be called once");
    }
    try {
        StdioStreams streams(pImpl->ioc, pImpl->options.inputFd, pImpl->options.outputFd);
        LOG_INFO("StdioTransport: streams open (framing={})",
                 pImpl->options.framing == StdioFraming::ContentLength ? "content-length" : "newline");

        InitializationOptions init = makeOptions();
        pImpl->state = State::CapabilitiesNegotiated;
        LOG_DEBUG("StdioTransport: initialization descriptor ready for {} {}", init.serverName, init.serverVersion);

        ServerSession session(dispatcher, std::move(init));
        auto framer = MakeFramer(pImpl->options.framing, pImpl->options.maxFrameBytes);

        std::exception_ptr loopFailure;
        net::co_spawn(pImpl->ioc, Impl::serveLoop(streams, *framer, session),
                      [&loopFailure](std::exception_ptr ep) { loopFailure = ep; });
        pImpl->state = State::Serving;
        pImpl->ioc.run();

        // Stop() leaves the read pending; close and let the loop observe the cancellation
        streams.Close();
        pImpl->ioc.restart();
        pImpl->ioc.poll();

        if (loopFailure && pImpl->stopRequested.load()) {
            LOG_DEBUG("StdioTransport: write interrupted by stop: {}", errors::DescribeException(loopFailure));
        } else if (loopFailure) {
            std::rethrow_exception(loopFailure);
        }
        pImpl->state = State::Closed;
        LOG_INFO("StdioTransport: closed");
    } catch (...) {
        pImpl->state = State::Closed;
        errors::LogFailureDetail("Stdio transport failed", std::current_exception());
        throw;
    }
}

void StdioTransport::Stop() {
    LOG_DEBUG("StdioTransport: stop requested");
    pImpl->stopRequested = true;
    pImpl->ioc.stop();
}

StdioTransport::State StdioTransport::GetState() const {
    return pImpl->state.load();
}

} // namespace dorismcp
