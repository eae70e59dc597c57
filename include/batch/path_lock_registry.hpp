#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ddlbridge {

/**
 * @brief Registry of per-output-path mutexes.
 *
 * Lazily creates one mutex per normalized path using double-checked
 * locking (shared_lock for existing entries, unique_lock + try_emplace
 * for creation). Entries are never removed during a batch.
 *
 * Usage:
 *   auto guard = registry.acquire(path);   // exclusive until guard dies
 */
class PathLockRegistry {
public:
    /**
     * @brief Scoped exclusive ownership of one output path
     */
    class Guard {
    public:
        explicit Guard(std::shared_ptr<std::mutex> mutex)
            : mutex_(std::move(mutex)), lock_(*mutex_) {}

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&&) noexcept = default;
        Guard& operator=(Guard&&) = delete;

    private:
        std::shared_ptr<std::mutex> mutex_;     // Keeps the mutex alive for the lock
        std::unique_lock<std::mutex> lock_;
    };

    [[nodiscard]] Guard acquire(const std::filesystem::path& path);

    [[nodiscard]] size_t size() const;

private:
    static std::string key_for(const std::filesystem::path& path);

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
    mutable std::shared_mutex locks_mutex_;
};

} // namespace ddlbridge
