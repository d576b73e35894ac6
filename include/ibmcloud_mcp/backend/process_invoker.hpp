#pragma once

#include <ibmcloud_mcp/backend/i_backend.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ibmcloud_mcp {

// ---------------------------------------------------------------------------
// ProcessInvoker — runs the CLI as a child process (POSIX fork/exec).
//
// - No shell: argv is built from CommandLine::args.
// - stdin is /dev/null, so an interactive prompt sees EOF instead of hanging.
// - stdout and stderr share one pipe.
// - On timeout the child's process group gets SIGTERM, then SIGKILL after a
//   short grace period, and is always reaped.
// ---------------------------------------------------------------------------
class ProcessInvoker : public IBackend {
public:
    explicit ProcessInvoker(std::string executable,
                            std::chrono::milliseconds default_timeout =
                                std::chrono::seconds(30));

    [[nodiscard]] Result<InvocationResult, Error> Invoke(
        const CommandLine& command,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::chrono::milliseconds DefaultTimeout() const override {
        return default_timeout_;
    }

    [[nodiscard]] const std::string& Executable() const noexcept {
        return executable_;
    }

private:
    std::string executable_;
    std::chrono::milliseconds default_timeout_;
};

// Locate an executable: a name containing '/' is checked directly, any
// other name is searched for in $PATH. Returns the resolved path.
std::optional<std::string> FindExecutable(const std::string& name);

// Split a free-form command string into arguments on whitespace. Single
// and double quotes group words and are removed; nothing is expanded.
std::vector<std::string> SplitCommandWords(const std::string& command);

// poll() wait for the time left before a deadline, capped at INT_MAX ms.
int ClampPollTimeout(std::chrono::milliseconds remaining) noexcept;

// Strip trailing '\n' and '\r' characters.
std::string TrimTrailingNewlines(std::string text);

} // namespace ibmcloud_mcp
