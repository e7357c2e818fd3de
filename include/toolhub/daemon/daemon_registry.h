#pragma once

#include <toolhub/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolhub::daemon {

// Persisted record of a daemon serving one workspace. Presence of the file does not imply the
// daemon is alive; readers must probe socketPath before reporting it as running.
struct DaemonRegistryEntry {
    std::string workspaceKey;
    std::string workspaceRoot;
    std::string socketPath;
    std::optional<std::string> logPath;
    int64_t pid = 0;
    std::string startedAt;
    std::vector<std::string> enabledOperations;
    std::string version;
};

void to_json(nlohmann::json& j, const DaemonRegistryEntry& e);
void from_json(const nlohmann::json& j, DaemonRegistryEntry& e);

// UTC timestamp with millisecond precision, e.g. 2026-01-02T03:04:05.678Z
std::string currentIsoTimestamp();

class DaemonRegistry {
public:
    static constexpr const char* kEntryFileName = "daemon.json";

    // Defaults to <runtime dir>/daemons
    DaemonRegistry();
    explicit DaemonRegistry(std::filesystem::path baseDir);

    // Atomically writes <base>/<key>/daemon.json with owner-only permissions
    Result<void> write(const DaemonRegistryEntry& entry) const;

    std::optional<DaemonRegistryEntry> read(const std::string& workspaceKey) const;

    // Removes the entry file only. Missing entries are not an error.
    Result<void> remove(const std::string& workspaceKey) const;

    // Every parseable entry under the base directory, sorted by workspace key
    std::vector<DaemonRegistryEntry> list() const;

    // Best-effort removal of the entry, its recorded socket and the default socket file
    void cleanupWorkspaceFiles(const std::string& workspaceKey) const noexcept;

    std::filesystem::path entryPath(const std::string& workspaceKey) const;
    const std::filesystem::path& baseDir() const noexcept { return baseDir_; }

private:
    std::filesystem::path baseDir_;
};

} // namespace toolhub::daemon
