#include <ibmcloud_mcp/core/result.hpp>

namespace ibmcloud_mcp {

Error Error::FromExitStatus(const std::string& operation,
                            int exit_code,
                            const std::string& output) {
    Error error;
    error.operation = operation;
    error.exit_code = exit_code;
    error.category = ErrorCategory::Backend;
    if (exit_code == 127) {
        error.message = "Backend executable could not be started";
    } else if (exit_code < 0) {
        error.message = "Backend terminated by signal " +
                        std::to_string(-exit_code);
    } else {
        error.message = "Backend exited with status " +
                        std::to_string(exit_code);
    }
    if (!output.empty()) {
        error.detail = output;
    }
    return error;
}

} // namespace ibmcloud_mcp
