#include <toolhub/config/config_helpers.h>

#include <charconv>
#include <fstream>

#include <unistd.h>

namespace toolhub::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "daemon.socket_path" and "[daemon] socket_path"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "toolhub";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "toolhub";
    }
    return std::filesystem::path("~/.config") / "toolhub";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value(kEnvConfig)) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_runtime_dir() {
    if (auto env = env_value(kEnvRuntimeDir)) {
        return expand_tilde(*env);
    }
    if (auto xdg = env_value("XDG_RUNTIME_DIR")) {
        return std::filesystem::path(*xdg) / "toolhub";
    }
    return std::filesystem::path("/tmp") / ("toolhub-" + std::to_string(::getuid()));
}

std::optional<std::string> resolve_setting(const char* env_name, const std::string& section,
                                           const std::string& key) {
    if (env_name != nullptr) {
        if (auto env = env_value(env_name)) {
            return env;
        }
    }

    auto config_path = get_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return std::nullopt;
    }
    auto value = parse_config_value(config_path, section, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

IdleTimeoutSetting parse_idle_timeout(const std::optional<std::string>& raw) {
    IdleTimeoutSetting setting;
    if (!raw) {
        return setting;
    }

    std::string value = *raw;
    trim(value);
    int64_t ms = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, ms);
    if (value.empty() || ec != std::errc{} || ptr != last || ms < 0) {
        setting.rejectedValue = *raw;
        return setting;
    }

    setting.timeout = std::chrono::milliseconds(ms);
    return setting;
}

IdleTimeoutSetting resolve_idle_timeout() {
    return parse_idle_timeout(resolve_setting(kEnvIdleTimeoutMs, "daemon", "idle_timeout_ms"));
}

std::filesystem::path resolve_socket_path_from_config() {
    if (auto value = resolve_setting(kEnvSocket, "daemon", "socket_path")) {
        return expand_tilde(*value);
    }
    return {};
}

std::chrono::milliseconds resolve_startup_timeout() {
    auto raw = resolve_setting(nullptr, "daemon", "startup_timeout_ms");
    if (!raw) {
        return kDefaultStartupTimeout;
    }
    int64_t ms = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), ms);
    if (ec != std::errc{} || ptr != raw->data() + raw->size() || ms <= 0) {
        return kDefaultStartupTimeout;
    }
    return std::chrono::milliseconds(ms);
}

} // namespace toolhub::config
