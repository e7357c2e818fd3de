// Shared helpers for Catch2 tests

#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include <unistd.h>

namespace toolhub::test {

/**
 * @brief Creates a unique temporary directory with the given prefix.
 */
inline std::filesystem::path make_temp_dir(std::string_view prefix = "toolhub_test_") {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();
    std::uniform_int_distribution<int> dist(0, 9999);
    thread_local std::mt19937_64 rng{std::random_device{}()};
    for (int attempt = 0; attempt < 512; ++attempt) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto candidate =
            base / (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(dist(rng)));
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            return candidate;
        }
    }
    return base;
}

/**
 * @brief Short socket path under /tmp; sun_path only holds 108 bytes.
 */
inline std::filesystem::path make_socket_path(std::string_view tag) {
    static int counter = 0;
    return std::filesystem::path("/tmp") /
           ("th-" + std::string(tag) + "-" + std::to_string(::getpid()) + "-" +
            std::to_string(++counter) + ".sock");
}

/**
 * @brief Write data to a file, creating parent directories as needed.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    stream.close();
    return path;
}

/**
 * @brief Run an awaitable to completion on a private io_context and return its value.
 */
template <typename T> T run_awaitable(boost::asio::awaitable<T> aw) {
    boost::asio::io_context io;
    auto fut = boost::asio::co_spawn(io, std::move(aw), boost::asio::use_future);
    io.run();
    return fut.get();
}

/**
 * @brief RAII helper to set an environment variable and restore it on scope exit.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(get_env(key_)) {
        set_env(key_, std::move(value));
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { set_env(key_, previous_); }

private:
    static std::optional<std::string> get_env(const std::string& key) {
        if (const auto* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static void set_env(const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            ::setenv(key.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

using EnvGuard = ScopedEnvVar;

} // namespace toolhub::test
