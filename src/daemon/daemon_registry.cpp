#include <toolhub/daemon/daemon_registry.h>
#include <toolhub/daemon/ipc/socket_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <fstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace toolhub::daemon {

namespace fs = std::filesystem;

void to_json(nlohmann::json& j, const DaemonRegistryEntry& e) {
    j = nlohmann::json{{"workspaceKey", e.workspaceKey},
                       {"workspaceRoot", e.workspaceRoot},
                       {"socketPath", e.socketPath},
                       {"pid", e.pid},
                       {"startedAt", e.startedAt},
                       {"enabledOperations", e.enabledOperations},
                       {"version", e.version}};
    if (e.logPath) {
        j["logPath"] = *e.logPath;
    }
}

void from_json(const nlohmann::json& j, DaemonRegistryEntry& e) {
    e.workspaceKey = j.at("workspaceKey").get<std::string>();
    e.workspaceRoot = j.value("workspaceRoot", std::string{});
    e.socketPath = j.at("socketPath").get<std::string>();
    if (auto it = j.find("logPath"); it != j.end() && it->is_string()) {
        e.logPath = it->get<std::string>();
    }
    e.pid = j.value("pid", int64_t{0});
    e.startedAt = j.value("startedAt", std::string{});
    e.enabledOperations = j.value("enabledOperations", std::vector<std::string>{});
    e.version = j.value("version", std::string{});
}

std::string currentIsoTimestamp() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}

DaemonRegistry::DaemonRegistry() : baseDir_(socket_utils::daemons_dir()) {}

DaemonRegistry::DaemonRegistry(fs::path baseDir) : baseDir_(std::move(baseDir)) {}

fs::path DaemonRegistry::entryPath(const std::string& workspaceKey) const {
    return baseDir_ / workspaceKey / kEntryFileName;
}

Result<void> DaemonRegistry::write(const DaemonRegistryEntry& entry) const {
    if (entry.workspaceKey.empty()) {
        return Error{ErrorCode::InvalidArgument, "Registry entry requires a workspace key"};
    }

    const auto target = entryPath(entry.workspaceKey);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to create registry directory " +
                                             target.parent_path().string() + ": " + ec.message()};
    }
    fs::permissions(target.parent_path(), fs::perms::owner_all, fs::perm_options::replace, ec);

    std::string payload;
    try {
        payload = nlohmann::json(entry).dump(2);
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::SerializationError, e.what()};
    }

    auto tmp = target;
    tmp += ".tmp-" + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return Error{ErrorCode::IOError,
                     "Failed to open " + tmp.string() + ": " + std::strerror(errno)};
    }
    size_t written = 0;
    while (written < payload.size()) {
        auto n = ::write(fd, payload.data() + written, payload.size() - written);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            int err = errno;
            ::close(fd);
            fs::remove(tmp, ec);
            return Error{ErrorCode::IOError,
                         "Failed to write " + tmp.string() + ": " + std::strerror(err)};
        }
        written += static_cast<size_t>(n);
    }
    // A leftover temp file keeps its previous mode
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        spdlog::warn("Failed to restrict permissions on {}: {}", tmp.string(),
                     std::strerror(errno));
    }
    ::close(fd);

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::IOError, "Failed to publish registry entry " + target.string()};
    }
    spdlog::debug("Registry entry written: {}", target.string());
    return Result<void>();
}

std::optional<DaemonRegistryEntry> DaemonRegistry::read(const std::string& workspaceKey) const {
    std::ifstream in(entryPath(workspaceKey));
    if (!in) {
        return std::nullopt;
    }
    try {
        auto j = nlohmann::json::parse(in);
        return j.get<DaemonRegistryEntry>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Ignoring unreadable registry entry for {}: {}", workspaceKey, e.what());
        return std::nullopt;
    }
}

Result<void> DaemonRegistry::remove(const std::string& workspaceKey) const {
    std::error_code ec;
    fs::remove(entryPath(workspaceKey), ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to remove registry entry for " + workspaceKey +
                                             ": " + ec.message()};
    }
    return Result<void>();
}

std::vector<DaemonRegistryEntry> DaemonRegistry::list() const {
    std::vector<DaemonRegistryEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(baseDir_, ec)) {
        return entries;
    }
    for (const auto& dirent : fs::directory_iterator(baseDir_, ec)) {
        if (!dirent.is_directory(ec)) {
            continue;
        }
        if (auto entry = read(dirent.path().filename().string())) {
            entries.push_back(std::move(*entry));
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.workspaceKey < b.workspaceKey; });
    return entries;
}

void DaemonRegistry::cleanupWorkspaceFiles(const std::string& workspaceKey) const noexcept {
    try {
        if (auto entry = read(workspaceKey); entry && !entry->socketPath.empty()) {
            socket_utils::remove_stale_socket(entry->socketPath);
        }
        socket_utils::remove_stale_socket(baseDir_ / workspaceKey / "daemon.sock");
        std::error_code ec;
        fs::remove(entryPath(workspaceKey), ec);
    } catch (const std::exception& e) {
        spdlog::warn("Registry cleanup for {} failed: {}", workspaceKey, e.what());
    }
}

} // namespace toolhub::daemon
