#include <ibmcloud_mcp/session/session_gate.hpp>

#include <ibmcloud_mcp/core/log.hpp>
#include <ibmcloud_mcp/session/dotenv.hpp>

#include <cstdlib>

namespace ibmcloud_mcp {

namespace {

const char* SourceName(CredentialSource source) {
    switch (source) {
        case CredentialSource::Environment: return "environment";
        case CredentialSource::DotenvFile:  return "dotenv file";
    }
    return "unknown";
}

Error MakeAuthError(const std::string& variable, const std::string& detail) {
    Error error;
    error.operation = "SessionGate";
    error.message = "Not logged in to IBM Cloud. Please run 'ibmcloud login' "
                    "or set " + variable;
    error.category = ErrorCategory::Authentication;
    if (!detail.empty()) {
        error.detail = detail;
    }
    return error;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CredentialResolver
// ---------------------------------------------------------------------------
CredentialResolver::CredentialResolver(std::string variable,
                                       std::string dotenv_path)
    : variable_(std::move(variable)), dotenv_path_(std::move(dotenv_path)) {}

std::optional<Credential> CredentialResolver::Resolve() const {
    const char* env_val = std::getenv(variable_.c_str());
    if (env_val != nullptr && *env_val != '\0') {
        return Credential{env_val, CredentialSource::Environment};
    }

    if (dotenv_path_.empty()) {
        return std::nullopt;
    }
    auto vars = LoadDotenvFile(dotenv_path_);
    if (!vars) {
        LogDebug("session", "no dotenv file at " + dotenv_path_);
        return std::nullopt;
    }
    auto it = vars->find(variable_);
    if (it == vars->end() || it->second.empty()) {
        LogDebug("session", variable_ + " not present in " + dotenv_path_);
        return std::nullopt;
    }
    return Credential{it->second, CredentialSource::DotenvFile};
}

// ---------------------------------------------------------------------------
// SessionContext
// ---------------------------------------------------------------------------
SessionContext::SessionContext(IBackend& backend, CredentialResolver resolver,
                               SessionOptions options)
    : backend_(backend),
      resolver_(std::move(resolver)),
      options_(std::move(options)) {}

Result<void, Error> SessionContext::EnsureAuthenticated() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (CacheIsFresh()) {
        return Result<void, Error>::Ok();
    }

    if (ProbeStatus()) {
        return Result<void, Error>::Ok();
    }

    auto credential = resolver_.Resolve();
    if (!credential) {
        LogWarn("session", "not authenticated and no " + resolver_.Variable() +
                               " in environment or " + resolver_.DotenvPath());
        return Result<void, Error>::Err(MakeAuthError(resolver_.Variable(), ""));
    }

    LogInfo("session", "logging in with API key from " +
                           std::string(SourceName(credential->source)) + " " +
                           MaskSecret(credential->value));

    std::string login_detail;
    auto login = Login(*credential);
    if (login.IsErr()) {
        login_detail = login.Error().ToString();
        LogWarn("session", "login failed: " + login_detail);
    } else if (!login.Value().Succeeded()) {
        login_detail = Error::FromExitStatus("Login", login.Value().exit_code,
                                             login.Value().output)
                           .ToString();
        LogWarn("session", "login exited with status " +
                               std::to_string(login.Value().exit_code));
    }

    if (ProbeStatus()) {
        LogInfo("session", "authenticated");
        return Result<void, Error>::Ok();
    }
    return Result<void, Error>::Err(
        MakeAuthError(resolver_.Variable(), login_detail));
}

SessionState SessionContext::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void SessionContext::Invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState{};
}

bool SessionContext::CacheIsFresh() const {
    if (options_.status_cache.count() <= 0 || !state_.authenticated ||
        !state_.last_checked) {
        return false;
    }
    return std::chrono::steady_clock::now() - *state_.last_checked <
           options_.status_cache;
}

bool SessionContext::ProbeStatus() {
    auto result = backend_.Invoke(CommandLine{{"target"}, {}},
                                  backend_.DefaultTimeout());
    state_.last_checked = std::chrono::steady_clock::now();
    if (result.IsErr()) {
        LogWarn("session", "status probe failed: " + result.Error().ToString());
        state_.authenticated = false;
        return false;
    }
    state_.authenticated = result.Value().Succeeded();
    LogDebug("session", state_.authenticated ? "status probe: logged in"
                                             : "status probe: not logged in");
    return state_.authenticated;
}

Result<InvocationResult, Error> SessionContext::Login(
    const Credential& credential) {
    CommandLine login;
    login.args = {"login"};
    if (options_.region && !options_.region->empty()) {
        login.args.push_back("-r");
        login.args.push_back(*options_.region);
    } else {
        login.args.push_back("--no-region");
    }
    // The CLI picks the key up from its environment.
    login.env_overrides[kCliApiKeyVariable] = credential.value;
    return backend_.Invoke(login, backend_.DefaultTimeout());
}

} // namespace ibmcloud_mcp
