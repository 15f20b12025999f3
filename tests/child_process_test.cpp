#include <catch2/catch_test_macros.hpp>

#include "mcplink/process/child_process.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <string>
#include <thread>

using namespace mcplink;
using namespace std::chrono_literals;

#ifndef FAKE_MCP_SERVER_PATH
#error "FAKE_MCP_SERVER_PATH must point at the fake_mcp_server fixture"
#endif

namespace {

bool process_exists(pid_t pid) {
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

}  // namespace

TEST_CASE("Spawning a missing program fails synchronously", "[process]") {
    ProcessSpec spec;
    spec.program = "/nonexistent/mcp-server-binary";

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value() == false);
    REQUIRE(child.error().error_number == ENOENT);
    REQUIRE(child.error().message.find("/nonexistent/mcp-server-binary") != std::string::npos);
}

TEST_CASE("Child stdio is connected to the parent", "[process]") {
    ProcessSpec spec;
    spec.program = "cat";

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value());
    auto& process = *child;

    const int in = process->release_stdin_fd();
    const int out = process->release_stdout_fd();
    REQUIRE(in >= 0);
    REQUIRE(out >= 0);
    REQUIRE(process->release_stdin_fd() == -1);

    const std::string line = "hello\n";
    REQUIRE(::write(in, line.data(), line.size()) == static_cast<ssize_t>(line.size()));
    ::close(in);

    std::string echoed;
    char buffer[64];
    ssize_t n = 0;
    while ((n = ::read(out, buffer, sizeof(buffer))) > 0) {
        echoed.append(buffer, static_cast<std::size_t>(n));
    }
    ::close(out);

    REQUIRE(echoed == line);

    for (int i = 0; i < 200 && process->is_alive(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    auto code = process->terminate(1s);
    REQUIRE(code.has_value());
    REQUIRE(*code == 0);
}

TEST_CASE("Exit code of a finished child is recorded", "[process]") {
    ProcessSpec spec;
    spec.program = "sh";
    spec.args = {"-c", "exit 5"};

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value());

    for (int i = 0; i < 200 && (*child)->is_alive(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE((*child)->is_alive() == false);
    REQUIRE((*child)->exit_code() == 5);

    auto again = (*child)->terminate(100ms);
    REQUIRE(again.has_value());
    REQUIRE(*again == 5);
}

TEST_CASE("terminate interrupts a running child", "[process]") {
    ProcessSpec spec;
    spec.program = "sleep";
    spec.args = {"30"};

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value());
    const pid_t pid = (*child)->pid();
    REQUIRE((*child)->is_alive());

    auto code = (*child)->terminate(2s);
    REQUIRE(code.has_value());
    REQUIRE(*code == -SIGINT);
    REQUIRE(process_exists(pid) == false);
}

TEST_CASE("terminate escalates to SIGKILL after the grace period", "[process]") {
    ProcessSpec spec;
    spec.program = FAKE_MCP_SERVER_PATH;
    spec.args = {"stubborn"};
    spec.stderr_mode = StderrMode::Discard;

    auto child = ChildProcess::spawn(spec);
    REQUIRE(child.has_value());

    // Give the child time to install its SIGINT handler
    std::this_thread::sleep_for(100ms);

    const auto started = std::chrono::steady_clock::now();
    auto code = (*child)->terminate(100ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(code.has_value());
    REQUIRE(*code == -SIGKILL);
    REQUIRE(elapsed >= 100ms);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("Destructor reaps the child", "[process]") {
    pid_t pid = -1;
    {
        ProcessSpec spec;
        spec.program = "sleep";
        spec.args = {"30"};
        auto child = ChildProcess::spawn(spec);
        REQUIRE(child.has_value());
        pid = (*child)->pid();
    }
    REQUIRE(process_exists(pid) == false);
}
