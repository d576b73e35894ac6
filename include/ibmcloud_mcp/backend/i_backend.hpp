#pragma once

#include <ibmcloud_mcp/core/result.hpp>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace ibmcloud_mcp {

// ---------------------------------------------------------------------------
// CommandLine — one backend invocation: the arguments that follow the CLI
// executable, plus environment variables set only for the child.
// Arguments are passed to the process verbatim, never through a shell.
// ---------------------------------------------------------------------------
struct CommandLine {
    std::vector<std::string> args;
    std::map<std::string, std::string> env_overrides;

    // Space-joined arguments for log lines. Environment values are omitted.
    [[nodiscard]] std::string ToString() const;
};

// ---------------------------------------------------------------------------
// InvocationResult — a process that ran to completion. stdout and stderr
// are merged in arrival order; trailing newlines are stripped.
// ---------------------------------------------------------------------------
struct InvocationResult {
    std::string output;
    int exit_code = 0;

    [[nodiscard]] bool Succeeded() const noexcept { return exit_code == 0; }
};

// ---------------------------------------------------------------------------
// IBackend — abstract interface to the cloud CLI.
//
// Tool handlers and the session gate depend on this interface rather than
// on a concrete process runner, so they can be tested with MockBackend.
//
// Invoke returns Ok for any completed process, whatever its exit code, and
// Err only when the process could not be started or ran past the timeout
// (ErrorCategory::Timeout). Nothing is retried.
// ---------------------------------------------------------------------------
class IBackend {
public:
    virtual ~IBackend() = default;

    // Non-copyable, non-movable (polymorphic base).
    IBackend(const IBackend&) = delete;
    IBackend& operator=(const IBackend&) = delete;
    IBackend(IBackend&&) = delete;
    IBackend& operator=(IBackend&&) = delete;

    [[nodiscard]] virtual Result<InvocationResult, Error> Invoke(
        const CommandLine& command,
        std::chrono::milliseconds timeout) = 0;

    // Default timeout for callers that do not pick their own.
    [[nodiscard]] virtual std::chrono::milliseconds DefaultTimeout() const = 0;

protected:
    IBackend() = default;
};

} // namespace ibmcloud_mcp
