#include "batch/path_lock_registry.hpp"
#include "core/utils.hpp"

namespace ddlbridge {

std::string PathLockRegistry::key_for(const std::filesystem::path& path) {
    // Output names are matched case-insensitively, so two spellings of one
    // table must share a lock
    return utils::to_lower(path.lexically_normal().generic_string());
}

PathLockRegistry::Guard PathLockRegistry::acquire(const std::filesystem::path& path) {
    const std::string key = key_for(path);

    std::shared_ptr<std::mutex> mutex;

    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(locks_mutex_);
        if (const auto it = locks_.find(key); it != locks_.end()) {
            mutex = it->second;
        }
    }

    // Slow path: unique lock + try_emplace
    if (!mutex) {
        std::unique_lock lock(locks_mutex_);
        auto [it, inserted] = locks_.try_emplace(key, nullptr);
        if (inserted) {
            it->second = std::make_shared<std::mutex>();
        }
        mutex = it->second;
    }
    // Block on the path mutex outside the registry lock
    return Guard(std::move(mutex));
}

size_t PathLockRegistry::size() const {
    std::shared_lock lock(locks_mutex_);
    return locks_.size();
}

} // namespace ddlbridge
