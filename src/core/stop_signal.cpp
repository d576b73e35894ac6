#include <ibmcloud_mcp/core/stop_signal.hpp>

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace ibmcloud_mcp {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;
volatile std::sig_atomic_t g_input_fd = -1;
volatile std::sig_atomic_t g_null_fd = -1;

extern "C" void HandleStopSignal(int) {
    const int saved_errno = errno;
    g_stop_requested = 1;
    if (g_input_fd >= 0 && g_null_fd >= 0) {
        // dup2 is async-signal-safe.
        (void)dup2(g_null_fd, g_input_fd);
    }
    errno = saved_errno;
}

Error SignalError(const std::string& message) {
    Error error;
    error.operation = "InstallStopSignalHandlers";
    error.message = message + ": " + std::strerror(errno);
    error.category = ErrorCategory::Internal;
    return error;
}

} // anonymous namespace

Result<void, Error> InstallStopSignalHandlers(int input_fd) {
    if (g_null_fd < 0) {
        const int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd < 0) {
            return Result<void, Error>::Err(SignalError("cannot open /dev/null"));
        }
        g_null_fd = null_fd;
    }
    g_input_fd = input_fd;

    struct sigaction action {};
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 ||
        sigaction(SIGTERM, &action, nullptr) != 0) {
        return Result<void, Error>::Err(SignalError("sigaction failed"));
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        return Result<void, Error>::Err(SignalError("sigaction failed"));
    }
    return Result<void, Error>::Ok();
}

const volatile std::sig_atomic_t* StopFlag() noexcept {
    return &g_stop_requested;
}

void ClearStopRequest() noexcept {
    g_stop_requested = 0;
}

} // namespace ibmcloud_mcp
