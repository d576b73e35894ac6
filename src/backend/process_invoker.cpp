#include <ibmcloud_mcp/backend/process_invoker.hpp>

#include <ibmcloud_mcp/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ibmcloud_mcp {

namespace {

constexpr auto kKillGrace = std::chrono::milliseconds(500);
constexpr int kExecFailedStatus = 127;

Error MakeInvokeError(const std::string& message, ErrorCategory category) {
    Error error;
    error.operation = "ProcessInvoker";
    error.message = message;
    error.category = category;
    return error;
}

bool IsExecutableFile(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

// Environment for the child: the parent's environment with overrides
// replacing (or adding) entries.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        auto key = kv.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(kv));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToCharPointers(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

// Wait for the child without blocking forever. Returns the exit code, or
// nullopt if it is still running after `limit`.
std::optional<int> WaitWithLimit(pid_t pid, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (true) {
        int status = 0;
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) return DecodeWaitStatus(status);
        if (w == -1 && errno != EINTR) return -1;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void TerminateGroup(pid_t pid) {
    ::kill(-pid, SIGTERM);
    if (WaitWithLimit(pid, kKillGrace).has_value()) return;
    ::kill(-pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

} // anonymous namespace

std::string CommandLine::ToString() const {
    std::ostringstream oss;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << args[i];
    }
    return oss.str();
}

ProcessInvoker::ProcessInvoker(std::string executable,
                               std::chrono::milliseconds default_timeout)
    : executable_(std::move(executable)), default_timeout_(default_timeout) {}

Result<InvocationResult, Error> ProcessInvoker::Invoke(
    const CommandLine& command, std::chrono::milliseconds timeout) {
    auto resolved = FindExecutable(executable_);
    if (!resolved) {
        return Result<InvocationResult, Error>::Err(MakeInvokeError(
            "Executable not found: " + executable_, ErrorCategory::Dependency));
    }

    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_);
    argv_strings.insert(argv_strings.end(), command.args.begin(),
                        command.args.end());
    auto env_strings = BuildEnvironment(command.env_overrides);
    auto argv_ptrs = ToCharPointers(argv_strings);
    auto env_ptrs = ToCharPointers(env_strings);

    int out_pipe[2];
    if (::pipe(out_pipe) != 0) {
        return Result<InvocationResult, Error>::Err(MakeInvokeError(
            std::string("pipe failed: ") + std::strerror(errno),
            ErrorCategory::Internal));
    }
    ::fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);

    LogDebug("backend", "exec " + executable_ + " " + command.ToString());
    const auto started = std::chrono::steady_clock::now();

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return Result<InvocationResult, Error>::Err(MakeInvokeError(
            std::string("fork failed: ") + std::strerror(err),
            ErrorCategory::Internal));
    }

    if (child == 0) {
        // Own process group so a timeout can take down grandchildren too.
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::signal(SIGPIPE, SIG_DFL);
        ::execve(resolved->c_str(), argv_ptrs.data(), env_ptrs.data());
        ::_exit(kExecFailedStatus);
    }

    ::setpgid(child, child);
    ::close(out_pipe[1]);
    const int read_fd = out_pipe[0];

    std::string output;
    bool timed_out = false;
    const auto deadline = started + timeout;
    char buf[8192];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd pfd {};
        pfd.fd = read_fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, ClampPollTimeout(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            continue;  // deadline check at the top of the loop
        }

        ssize_t n = ::read(read_fd, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) break;  // EOF: every writer closed the pipe
        if (errno == EINTR || errno == EAGAIN) continue;
        break;
    }
    ::close(read_fd);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (timed_out) {
        TerminateGroup(child);
        LogWarn("backend", "timed out after " + std::to_string(elapsed.count()) +
                               "ms: " + command.ToString());
        auto error = MakeInvokeError(
            "Command timed out after " + std::to_string(timeout.count()) +
                "ms: " +
                command.ToString(),
            ErrorCategory::Timeout);
        auto partial = TrimTrailingNewlines(std::move(output));
        if (!partial.empty()) error.detail = partial;
        return Result<InvocationResult, Error>::Err(std::move(error));
    }

    // Output is closed; the child is exiting or has exited. Grant it the
    // rest of the deadline (at least the kill grace) before forcing it.
    auto wait_budget = std::max(
        kKillGrace, std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now()));
    auto exit_code = WaitWithLimit(child, wait_budget);
    if (!exit_code) {
        TerminateGroup(child);
        return Result<InvocationResult, Error>::Err(MakeInvokeError(
            "Command did not exit after closing its output: " +
                command.ToString(),
            ErrorCategory::Timeout));
    }

    LogDebug("backend", "exit " + std::to_string(*exit_code) + " after " +
                            std::to_string(elapsed.count()) + "ms");

    return Result<InvocationResult, Error>::Ok(
        InvocationResult{TrimTrailingNewlines(std::move(output)), *exit_code});
}

int ClampPollTimeout(std::chrono::milliseconds remaining) noexcept {
    constexpr auto kMaxWait = std::numeric_limits<int>::max();
    if (remaining.count() <= 0) return 0;
    if (remaining.count() > kMaxWait) return kMaxWait;
    return static_cast<int>(remaining.count());
}

std::optional<std::string> FindExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = dir + "/" + name;
        if (IsExecutableFile(candidate)) return candidate;
    }
    return std::nullopt;
}

std::vector<std::string> SplitCommandWords(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = '\0';

    for (char c : command) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            continue;
        }
        current += c;
        in_word = true;
    }
    // An unterminated quote runs to the end of the string.
    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string TrimTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace ibmcloud_mcp
