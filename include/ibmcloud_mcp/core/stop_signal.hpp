#pragma once

#include <ibmcloud_mcp/core/result.hpp>

#include <csignal>

namespace ibmcloud_mcp {

// ---------------------------------------------------------------------------
// Stop signals — SIGINT/SIGTERM end the request loop, SIGPIPE is ignored.
//
// The handler sets the stop flag and redirects input_fd to /dev/null, so a
// read that starts after the loop checked the flag sees end of input rather
// than blocking. A read already blocked returns EINTR (no SA_RESTART).
// ---------------------------------------------------------------------------
[[nodiscard]] Result<void, Error> InstallStopSignalHandlers(int input_fd);

// Flag for McpServer::SetStopFlag. Non-zero once a stop signal arrived.
const volatile std::sig_atomic_t* StopFlag() noexcept;

void ClearStopRequest() noexcept;

} // namespace ibmcloud_mcp
