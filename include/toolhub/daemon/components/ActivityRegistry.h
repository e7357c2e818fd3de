#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace toolhub::daemon {

/**
 * Reference counts of long-running background work, keyed by an arbitrary activity kind
 * (e.g. "background-process", "log-capture").
 *
 * A non-zero total blocks idle shutdown. One instance lives per daemon process and is passed
 * explicitly to the components that need it. All operations are thread-safe.
 */
class ActivityRegistry {
public:
    // Handle for one acquired count. Releasing is idempotent and also happens on destruction.
    // A lease must not outlive the registry that issued it.
    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        void release() noexcept;
        bool active() const noexcept { return owner_ != nullptr; }
        const std::string& key() const noexcept { return key_; }

    private:
        friend class ActivityRegistry;
        Lease(ActivityRegistry* owner, std::string key) : owner_(owner), key_(std::move(key)) {}

        ActivityRegistry* owner_ = nullptr;
        std::string key_;
    };

    struct Snapshot {
        size_t activeLeaseCount = 0;
        std::map<std::string, size_t> byKey;
    };

    ActivityRegistry() = default;
    ActivityRegistry(const ActivityRegistry&) = delete;
    ActivityRegistry& operator=(const ActivityRegistry&) = delete;

    [[nodiscard]] Lease acquire(std::string key);

    Snapshot snapshot() const;
    size_t total() const;
    size_t count(std::string_view key) const;

    // Invoked (outside the lock) whenever a lease is acquired or released
    void setActivityListener(std::function<void()> listener);

private:
    void releaseKey(const std::string& key) noexcept;
    void notify() const;

    mutable std::mutex mutex_;
    std::map<std::string, size_t, std::less<>> counts_;
    size_t total_ = 0;
    std::function<void()> listener_;
};

} // namespace toolhub::daemon
