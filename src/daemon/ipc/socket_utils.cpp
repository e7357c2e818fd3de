#include <toolhub/config/config_helpers.h>
#include <toolhub/crypto/sha256.h>
#include <toolhub/daemon/ipc/socket_utils.h>

#include <spdlog/spdlog.h>

#include <sys/un.h>
#include <algorithm>
#include <cctype>

namespace toolhub::daemon::socket_utils {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxKeyNameLength = 32;
constexpr size_t kKeyHashLength = 12;

std::string sanitize_key_name(const std::string& name) {
    std::string out;
    out.reserve(std::min(name.size(), kMaxKeyNameLength));
    for (unsigned char c : name) {
        if (out.size() >= kMaxKeyNameLength) {
            break;
        }
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            out.push_back('-');
        }
    }
    if (out.empty()) {
        out = "workspace";
    }
    return out;
}

} // namespace

fs::path resolve_workspace_root(const fs::path& cwd) {
    std::error_code ec;
    fs::path start = fs::weakly_canonical(cwd, ec);
    if (ec) {
        start = fs::absolute(cwd, ec);
    }

    for (fs::path dir = start; !dir.empty(); dir = dir.parent_path()) {
        if (fs::is_directory(dir / kWorkspaceMarker, ec)) {
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
    }
    return start;
}

Result<std::string> workspace_key(const fs::path& root) {
    auto digest = crypto::sha256Hex(root.string());
    if (!digest) {
        return digest.error();
    }
    auto name = root.filename().string();
    if (name.empty()) {
        name = root.parent_path().filename().string();
    }
    return sanitize_key_name(name) + "-" + digest.value().substr(0, kKeyHashLength);
}

Result<WorkspaceIdentity> resolve_workspace(const fs::path& cwd) {
    WorkspaceIdentity identity;
    identity.root = resolve_workspace_root(cwd);
    auto key = workspace_key(identity.root);
    if (!key) {
        return key.error();
    }
    identity.key = std::move(key).value();
    return identity;
}

fs::path daemons_dir() {
    return config::get_runtime_dir() / "daemons";
}

fs::path daemon_dir_for_key(const std::string& workspaceKey) {
    return daemons_dir() / workspaceKey;
}

fs::path socket_path_for_key(const std::string& workspaceKey) {
    return daemon_dir_for_key(workspaceKey) / "daemon.sock";
}

fs::path log_path_for_key(const std::string& workspaceKey) {
    return daemon_dir_for_key(workspaceKey) / "daemon.log";
}

fs::path resolve_socket_path(const std::string& workspaceKey) {
    if (auto configured = config::resolve_socket_path_from_config(); !configured.empty()) {
        return configured;
    }
    return socket_path_for_key(workspaceKey);
}

Result<void> ensure_socket_dir(const fs::path& socketPath) {
    auto dir = socketPath.parent_path();
    if (dir.empty()) {
        return Result<void>();
    }
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Failed to create socket directory " + dir.string() + ": " + ec.message()};
        }
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) {
            spdlog::debug("Could not restrict permissions on {}: {}", dir.string(), ec.message());
        }
    }
    return Result<void>();
}

void remove_stale_socket(const fs::path& socketPath) noexcept {
    std::error_code ec;
    if (fs::exists(socketPath, ec) || fs::is_symlink(socketPath, ec)) {
        fs::remove(socketPath, ec);
        if (ec) {
            spdlog::warn("Failed to remove stale socket {}: {}", socketPath.string(), ec.message());
        }
    }
}

bool fits_sun_path(const fs::path& socketPath) noexcept {
    return socketPath.native().size() < sizeof(sockaddr_un{}.sun_path);
}

} // namespace toolhub::daemon::socket_utils
