#include <toolhub/daemon/components/ActivityRegistry.h>

#include <spdlog/spdlog.h>

namespace toolhub::daemon {

ActivityRegistry::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)) {
    other.owner_ = nullptr;
}

ActivityRegistry::Lease& ActivityRegistry::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        key_ = std::move(other.key_);
        other.owner_ = nullptr;
    }
    return *this;
}

void ActivityRegistry::Lease::release() noexcept {
    if (owner_ == nullptr) {
        return;
    }
    auto* owner = owner_;
    owner_ = nullptr;
    owner->releaseKey(key_);
}

ActivityRegistry::Lease ActivityRegistry::acquire(std::string key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[key];
        ++total_;
    }
    spdlog::debug("ActivityRegistry: acquired '{}'", key);
    notify();
    return Lease(this, std::move(key));
}

void ActivityRegistry::releaseKey(const std::string& key) noexcept {
    bool released = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(key);
        if (it != counts_.end()) {
            if (--it->second == 0) {
                counts_.erase(it);
            }
            --total_;
            released = true;
        }
    }
    if (!released) {
        return;
    }
    try {
        spdlog::debug("ActivityRegistry: released '{}'", key);
        notify();
    } catch (const std::exception& e) {
        spdlog::warn("ActivityRegistry: activity listener failed: {}", e.what());
    }
}

ActivityRegistry::Snapshot ActivityRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot snap;
    snap.activeLeaseCount = total_;
    for (const auto& [key, count] : counts_) {
        snap.byKey.emplace(key, count);
    }
    return snap;
}

size_t ActivityRegistry::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

size_t ActivityRegistry::count(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(key);
    return it == counts_.end() ? 0 : it->second;
}

void ActivityRegistry::setActivityListener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void ActivityRegistry::notify() const {
    std::function<void()> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener();
    }
}

} // namespace toolhub::daemon
