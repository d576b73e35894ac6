#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ibmcloud_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// Abstract log sink — implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Console sink — human-readable output to stderr. Never stdout: stdout
// carries the JSON-RPC stream.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// JSON sink — machine-readable JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// File sink — appends timestamped lines to a log file. Parent directories
// are created on open. A file that cannot be opened turns the sink into a
// no-op; IsOpen() reports which.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

private:
    std::string path_;
    std::ofstream file_;
};

// Tee sink — forwards every record to each child sink in order. A child
// that throws does not stop the others.
class TeeSink : public ILogSink {
public:
    void Add(std::unique_ptr<ILogSink> sink);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

    [[nodiscard]] size_t Size() const noexcept { return sinks_.size(); }

private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

// Thread-safe logger that dispatches to a sink. Sink failures are counted,
// never propagated to the caller.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

    [[nodiscard]] size_t DroppedCount() const noexcept {
        return dropped_.load();
    }

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
    std::atomic<size_t> dropped_{0};
};

// ---------------------------------------------------------------------------
// Global logger — set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

/// Convenience free functions that forward to GlobalLogger().
void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

/// Render a secret for diagnostics: its length and the first few
/// characters, e.g. "[40 chars] abcd...". Short secrets show no prefix.
std::string MaskSecret(std::string_view secret, size_t prefix_len = 4);

} // namespace ibmcloud_mcp
