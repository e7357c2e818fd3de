#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace toolhub::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Non-empty, trimmed value of an environment variable
inline std::optional<std::string> env_value(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) {
        return std::nullopt;
    }
    std::string value(raw);
    trim(value);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// Environment variables understood by the daemon and CLI
inline constexpr const char* kEnvSocket = "TOOLHUB_SOCKET";
inline constexpr const char* kEnvConfig = "TOOLHUB_CONFIG";
inline constexpr const char* kEnvRuntimeDir = "TOOLHUB_RUNTIME_DIR";
inline constexpr const char* kEnvIdleTimeoutMs = "TOOLHUB_DAEMON_IDLE_TIMEOUT_MS";
inline constexpr const char* kEnvLogLevel = "TOOLHUB_DAEMON_LOG_LEVEL";
inline constexpr const char* kEnvLogPath = "TOOLHUB_DAEMON_LOG_PATH";
inline constexpr const char* kEnvDaemonBin = "TOOLHUB_DAEMON_BIN";
inline constexpr const char* kEnvShutdownForceExitMs = "TOOLHUB_SHUTDOWN_FORCE_EXIT_MS";

inline constexpr std::chrono::milliseconds kDefaultIdleTimeout{10 * 60 * 1000};
inline constexpr std::chrono::milliseconds kDefaultIdleCheckInterval{30 * 1000};
inline constexpr std::chrono::milliseconds kDefaultStartupTimeout{5000};
inline constexpr std::chrono::milliseconds kDefaultShutdownGrace{5000};

// Parse a value from TOML config file. Returns an empty string when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/toolhub or ~/.config/toolhub
std::filesystem::path get_config_dir();

/// Config file: override, then $TOOLHUB_CONFIG, then <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the runtime directory (sockets, registry, logs):
/// $TOOLHUB_RUNTIME_DIR, $XDG_RUNTIME_DIR/toolhub, or /tmp/toolhub-$UID
std::filesystem::path get_runtime_dir();

// Environment first, then [section] key in the config file
std::optional<std::string> resolve_setting(const char* env_name, const std::string& section,
                                           const std::string& key);

struct IdleTimeoutSetting {
    std::chrono::milliseconds timeout = kDefaultIdleTimeout;
    // Raw configured value that could not be used (negative or not a number)
    std::optional<std::string> rejectedValue;

    [[nodiscard]] bool disabled() const noexcept { return timeout.count() == 0; }
};

// Parses an idle timeout in milliseconds; invalid or negative input yields the default and
// records the rejected value so the caller can warn.
IdleTimeoutSetting parse_idle_timeout(const std::optional<std::string>& raw);

// TOOLHUB_DAEMON_IDLE_TIMEOUT_MS, then [daemon] idle_timeout_ms
IdleTimeoutSetting resolve_idle_timeout();

// TOOLHUB_SOCKET, then [daemon] socket_path. Empty when neither is set.
std::filesystem::path resolve_socket_path_from_config();

// [daemon] startup_timeout_ms, falling back to the default
std::chrono::milliseconds resolve_startup_timeout();

} // namespace toolhub::config
