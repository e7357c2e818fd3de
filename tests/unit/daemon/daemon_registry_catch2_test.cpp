// Persisted per-workspace daemon records

#include <catch2/catch_test_macros.hpp>

#include "common/test_helpers_catch2.h"

#include <toolhub/daemon/daemon_registry.h>

#include <filesystem>

#include <sys/stat.h>

using namespace toolhub::daemon;
namespace fs = std::filesystem;

namespace {

DaemonRegistryEntry makeEntry(const std::string& key) {
    DaemonRegistryEntry e;
    e.workspaceKey = key;
    e.workspaceRoot = "/work/" + key;
    e.socketPath = "/tmp/" + key + ".sock";
    e.logPath = "/tmp/" + key + ".log";
    e.pid = 4242;
    e.startedAt = currentIsoTimestamp();
    e.enabledOperations = {"background", "diagnostics"};
    e.version = "0.1.0";
    return e;
}

} // namespace

TEST_CASE("Registry entries are written and read back", "[daemon][registry][catch2]") {
    auto base = toolhub::test::make_temp_dir("toolhub_registry_");
    DaemonRegistry registry(base);

    auto entry = makeEntry("app-aaaaaaaaaaaa");
    REQUIRE(registry.write(entry));

    auto path = registry.entryPath(entry.workspaceKey);
    CHECK(path == base / "app-aaaaaaaaaaaa" / "daemon.json");
    struct stat st {};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    auto back = registry.read(entry.workspaceKey);
    REQUIRE(back.has_value());
    CHECK(back->workspaceRoot == entry.workspaceRoot);
    CHECK(back->socketPath == entry.socketPath);
    CHECK(back->logPath == entry.logPath);
    CHECK(back->pid == 4242);
    CHECK(back->enabledOperations == entry.enabledOperations);
    CHECK(back->version == "0.1.0");

    fs::remove_all(base);
}

TEST_CASE("Listing returns parseable entries sorted by key", "[daemon][registry][catch2]") {
    auto base = toolhub::test::make_temp_dir("toolhub_registry_");
    DaemonRegistry registry(base);

    REQUIRE(registry.write(makeEntry("zeta-000000000000")));
    REQUIRE(registry.write(makeEntry("alpha-000000000000")));
    toolhub::test::write_file(base / "broken" / "daemon.json", "{not json");

    auto entries = registry.list();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].workspaceKey == "alpha-000000000000");
    CHECK(entries[1].workspaceKey == "zeta-000000000000");

    fs::remove_all(base);
}

TEST_CASE("Removing entries is idempotent", "[daemon][registry][catch2]") {
    auto base = toolhub::test::make_temp_dir("toolhub_registry_");
    DaemonRegistry registry(base);

    auto entry = makeEntry("gone-111111111111");
    REQUIRE(registry.write(entry));
    REQUIRE(registry.remove(entry.workspaceKey));
    CHECK_FALSE(registry.read(entry.workspaceKey).has_value());
    CHECK(registry.remove(entry.workspaceKey));
    CHECK(registry.list().empty());

    fs::remove_all(base);
}

TEST_CASE("Entries need a workspace key", "[daemon][registry][catch2]") {
    auto base = toolhub::test::make_temp_dir("toolhub_registry_");
    DaemonRegistry registry(base);
    auto entry = makeEntry("");
    auto written = registry.write(entry);
    REQUIRE_FALSE(written);
    CHECK(written.error().code == toolhub::ErrorCode::InvalidArgument);
    fs::remove_all(base);
}

TEST_CASE("Workspace cleanup removes the entry and its socket", "[daemon][registry][catch2]") {
    auto base = toolhub::test::make_temp_dir("toolhub_registry_");
    DaemonRegistry registry(base);

    auto entry = makeEntry("clean-222222222222");
    entry.socketPath = (base / "clean.sock").string();
    toolhub::test::write_file(entry.socketPath, "");
    REQUIRE(registry.write(entry));

    registry.cleanupWorkspaceFiles(entry.workspaceKey);
    CHECK_FALSE(fs::exists(registry.entryPath(entry.workspaceKey)));
    CHECK_FALSE(fs::exists(entry.socketPath));

    fs::remove_all(base);
}

TEST_CASE("Timestamps are UTC with millisecond precision", "[daemon][registry][catch2]") {
    auto ts = currentIsoTimestamp();
    REQUIRE(ts.size() == 24);
    CHECK(ts[10] == 'T');
    CHECK(ts[19] == '.');
    CHECK(ts.back() == 'Z');
}
