//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: Tests for the stdio transport over OS pipes (ordering, EOF, malformed frames, stop)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "dorismcp/ContentFramer.h"
#include "dorismcp/StdioTransport.h"
#include "logging/Logger.h"
#include "FakeCollaborators.h"

using namespace dorismcp;

namespace {

class PipePair {
public:
    PipePair() {
        EXPECT_EQ(::pipe(toServer), 0);
        EXPECT_EQ(::pipe(fromServer), 0);
    }
    ~PipePair() {
        for (int fd : {toServer[0], toServer[1], fromServer[0], fromServer[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    StdioOptions Options(StdioFraming framing = StdioFraming::Newline) const {
        StdioOptions options;
        options.inputFd = toServer[0];
        options.outputFd = fromServer[1];
        options.framing = framing;
        options.maxFrameBytes = 64 * 1024;
        return options;
    }

    void Write(const std::string& data) {
        ASSERT_EQ(::write(toServer[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void CloseInput() {
        ::close(toServer[1]);
        toServer[1] = -1;
    }

    // Everything the server wrote; call after Serve() returned
    std::string ReadAll() {
        ::close(fromServer[1]);
        fromServer[1] = -1;
        std::string out;
        char buf[4096];
        ssize_t n = 0;
        while ((n = ::read(fromServer[0], buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }

private:
    int toServer[2]{-1, -1};
    int fromServer[2]{-1, -1};
};

InitializationOptions testOptions() {
    InitializationOptions options;
    options.serverName = "doris-mcp-server";
    options.serverVersion = "0.3.0";
    options.capabilities = MakeServerCapabilities(NotificationOptions{}, {});
    return options;
}

std::vector<JSONValue> parseLines(const std::string& text) {
    std::vector<JSONValue> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(ParseJSON(line));
    }
    return out;
}

const std::string InitializeLine =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})"
    "\n";
const std::string InitializedLine = R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n";

} // namespace

TEST(StdioTransportTest, AnswersFramesInOrderAndClosesOnEof) {
    fakes::FakeComponents parts;
    parts.tools->tools = {Tool("get_server_info", "info")};
    OperationDispatcher dispatcher(parts.resources, parts.tools, parts.prompts);
    PipePair pipes;
    StdioTransport transport(pipes.Options());

    pipes.Write(InitializeLine);
    pipes.Write(InitializedLine);
    pipes.Write(R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\n");
    pipes.Write(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})" "\n");
    pipes.CloseInput();

    ASSERT_NO_THROW(transport.Serve(dispatcher, testOptions));
    EXPECT_EQ(transport.GetState(), StdioTransport::State::Closed);

    auto replies = parseLines(pipes.ReadAll());
    ASSERT_EQ(replies.size(), 3u);
    for (std::size_t i = 0; i < replies.size(); ++i) {
        const JSONValue* id = FindMember(replies[i], "id");
        ASSERT_NE(id, nullptr);
        EXPECT_EQ(*id, JSONValue(static_cast<int64_t>(i + 1)));
        EXPECT_NE(FindMember(replies[i], "result"), nullptr);
    }
}

TEST(StdioTransportTest, MalformedFrameDoesNotStopTheLoop) {
    fakes::FakeComponents parts;
    OperationDispatcher dispatcher(parts.resources, parts.tools, parts.prompts);
    PipePair pipes;
    StdioTransport transport(pipes.Options());

    pipes.Write("{this is not json\n");
    pipes.Write(R"({"jsonrpc":"2.0","id":9,"method":"ping"})" "\n");
    pipes.CloseInput();

    ASSERT_NO_THROW(transport.Serve(dispatcher, testOptions));
    auto replies = parseLines(pipes.ReadAll());
    ASSERT_EQ(replies.size(), 2u);
    const JSONValue* error = FindMember(replies[0], "error");
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(*FindMember(*error, "code"), JSONValue(static_cast<int64_t>(JSONRPCErrorCodes::ParseError)));
    EXPECT_EQ(*FindMember(replies[1], "id"), JSONValue(static_cast<int64_t>(9)));
}

TEST(StdioTransportTest, ContentLengthFraming) {
    fakes::FakeComponents parts;
    OperationDispatcher dispatcher(parts.resources, parts.tools, parts.prompts);
    PipePair pipes;
    StdioTransport transport(pipes.Options(StdioFraming::ContentLength));

    auto framer = MakeContentLengthFramer(1024);
    pipes.Write(framer->encode(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
    pipes.Write("Content-Length: nope\r\n\r\n");
    pipes.Write(framer->encode(R"({"jsonrpc":"2.0","id":2,"method":"ping"})"));
    pipes.CloseInput();

    ASSERT_NO_THROW(transport.Serve(dispatcher, testOptions));
    std::string out = pipes.ReadAll();
    auto first = framer->tryDecode(out);
    auto second = framer->tryDecode(out);
    auto third = framer->tryDecode(out);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(*FindMember(ParseJSON(first.value()), "id"), JSONValue(static_cast<int64_t>(1)));
    EXPECT_NE(FindMember(ParseJSON(second.value()), "error"), nullptr);
    EXPECT_EQ(*FindMember(ParseJSON(third.value()), "id"), JSONValue(static_cast<int64_t>(2)));
    EXPECT_TRUE(out.empty());
}

TEST(StdioTransportTest, StopFromAnotherThreadEndsServe) {
    fakes::FakeComponents parts;
    OperationDispatcher dispatcher(parts.resources, parts.tools, parts.prompts);
    PipePair pipes;
    StdioTransport transport(pipes.Options());

    std::promise<void> negotiated;
    auto negotiatedFuture = negotiated.get_future();
    auto serving = std::async(std::launch::async, [&]() {
        transport.Serve(dispatcher, [&]() {
            negotiated.set_value();
            return testOptions();
        });
    });
    ASSERT_EQ(negotiatedFuture.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    // Give the loop a moment to block in its first read
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    transport.Stop();
    ASSERT_EQ(serving.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_NO_THROW(serving.get());
    EXPECT_EQ(transport.GetState(), StdioTransport::State::Closed);
}

TEST(StdioTransportTest, ConsoleLoggingMovesToStderrWhileStreamsAreHeld) {
    fakes::FakeComponents parts;
    OperationDispatcher dispatcher(parts.resources, parts.tools, parts.prompts);
    PipePair pipes;
    StdioTransport transport(pipes.Options());
    pipes.CloseInput();

    Logger::setConsoleToStderr(false);
    bool redirectedDuringServe = false;
    transport.Serve(dispatcher, [&]() {
        redirectedDuringServe = Logger::consoleToStderr();
        return testOptions();
    });
    EXPECT_TRUE(redirectedDuringServe);
    EXPECT_FALSE(Logger::consoleToStderr());
}

TEST(StdioTransportTest, StreamFailureIsPropagatedAndServeRunsOnce) {
    fakes::FakeComponents parts;
    OperationDispatcher dispatcher(parts.resources, parts.tools, parts.prompts);
    StdioOptions options;
    options.inputFd = -1;
    options.outputFd = -1;
    StdioTransport transport(options);
    EXPECT_THROW(transport.Serve(dispatcher, testOptions), std::system_error);
    EXPECT_EQ(transport.GetState(), StdioTransport::State::Closed);
    EXPECT_THROW(transport.Serve(dispatcher, testOptions), std::logic_error);
}
