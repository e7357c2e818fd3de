#pragma once

#include <toolhub/core/types.h>

#include <filesystem>
#include <string>

namespace toolhub::daemon::socket_utils {

// Directory marker that pins a workspace root
inline constexpr const char* kWorkspaceMarker = ".toolhub";

struct WorkspaceIdentity {
    std::filesystem::path root;
    std::string key;
};

// Nearest ancestor of cwd (inclusive) that contains a .toolhub directory; cwd itself otherwise.
std::filesystem::path resolve_workspace_root(const std::filesystem::path& cwd);

// Stable key for a workspace root: "<sanitized basename>-<first 12 hex of sha256(root)>"
Result<std::string> workspace_key(const std::filesystem::path& root);

Result<WorkspaceIdentity> resolve_workspace(const std::filesystem::path& cwd);

// <runtime dir>/daemons
std::filesystem::path daemons_dir();
std::filesystem::path daemon_dir_for_key(const std::string& workspaceKey);
std::filesystem::path socket_path_for_key(const std::string& workspaceKey);
std::filesystem::path log_path_for_key(const std::string& workspaceKey);

// TOOLHUB_SOCKET, then [daemon] socket_path, then the workspace-derived default.
std::filesystem::path resolve_socket_path(const std::string& workspaceKey);

// Create the socket's parent directory with owner-only permissions
Result<void> ensure_socket_dir(const std::filesystem::path& socketPath);

// Remove a leftover socket file; never fails
void remove_stale_socket(const std::filesystem::path& socketPath) noexcept;

// Whether the path fits in sockaddr_un::sun_path
bool fits_sun_path(const std::filesystem::path& socketPath) noexcept;

} // namespace toolhub::daemon::socket_utils
