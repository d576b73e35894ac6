#pragma once

#include <ibmcloud_mcp/backend/i_backend.hpp>
#include <ibmcloud_mcp/core/result.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace ibmcloud_mcp {

// ---------------------------------------------------------------------------
// Credential lookup: process environment first, then a dotenv file.
// ---------------------------------------------------------------------------
enum class CredentialSource {
    Environment,
    DotenvFile,
};

struct Credential {
    std::string value;
    CredentialSource source = CredentialSource::Environment;
};

class CredentialResolver {
public:
    CredentialResolver(std::string variable, std::string dotenv_path);

    // Empty values count as absent.
    [[nodiscard]] std::optional<Credential> Resolve() const;

    [[nodiscard]] const std::string& Variable() const noexcept {
        return variable_;
    }
    [[nodiscard]] const std::string& DotenvPath() const noexcept {
        return dotenv_path_;
    }

private:
    std::string variable_;
    std::string dotenv_path_;
};

// ---------------------------------------------------------------------------
// SessionState — last known authentication status. Lives for one process.
// ---------------------------------------------------------------------------
struct SessionState {
    bool authenticated = false;
    std::optional<std::chrono::steady_clock::time_point> last_checked;
};

// ---------------------------------------------------------------------------
// ISessionGate — runs before every backend-touching tool call.
// ---------------------------------------------------------------------------
class ISessionGate {
public:
    virtual ~ISessionGate() = default;

    // Ok when the backend is usable. Err(Authentication) when no path to an
    // authenticated session worked; the tool call must not proceed.
    [[nodiscard]] virtual Result<void, Error> EnsureAuthenticated() = 0;
};

struct SessionOptions {
    std::optional<std::string> region;  // passed to login as -r
    std::chrono::seconds status_cache{0};
};

// ---------------------------------------------------------------------------
// SessionContext — the gate against the real CLI.
//
//   1. Probe `target`; exit 0 means logged in.
//   2. Otherwise resolve a credential and run a non-interactive
//      `login` with the key handed over in the child's environment.
//   3. Probe again.
//
// A positive status may be reused for `status_cache`; negative results are
// never cached. The sequence is serialised so concurrent callers never
// race two logins.
// ---------------------------------------------------------------------------
class SessionContext : public ISessionGate {
public:
    SessionContext(IBackend& backend, CredentialResolver resolver,
                   SessionOptions options = {});

    [[nodiscard]] Result<void, Error> EnsureAuthenticated() override;

    [[nodiscard]] SessionState State() const;

    // Forget the cached status; the next check probes again.
    void Invalidate();

private:
    bool ProbeStatus();
    bool CacheIsFresh() const;
    Result<InvocationResult, Error> Login(const Credential& credential);

    IBackend& backend_;
    CredentialResolver resolver_;
    SessionOptions options_;
    SessionState state_;
    mutable std::mutex mutex_;
};

// Environment variable the CLI reads its API key from during login.
inline constexpr const char* kCliApiKeyVariable = "IBMCLOUD_API_KEY";

} // namespace ibmcloud_mcp
