#pragma once

/**
 * @file lock.hpp
 * @brief Advisory locks for licenseguard SDK
 *
 * Two distinct primitives:
 * - LockStoreInterface: short-TTL keyed locks backing the activate
 *   idempotency guard. Callers fail open when the store errors.
 * - ProcessLock: a named cross-process mutex (flock) for the scheduled
 *   revalidation job.
 */

#include "licenseguard/licenseguard.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace licenseguard {

/// Clock used by TTL-based components (injectable for tests)
using Clock = std::function<Timestamp()>;

/// Default clock: system wall clock
[[nodiscard]] inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

/**
 * @brief Keyed short-lived lock store
 */
class LockStoreInterface {
  public:
    virtual ~LockStoreInterface() = default;

    /**
     * @brief Try to take `key` for `ttl`
     *
     * @return ok(true) when acquired, ok(false) when already held,
     *         an error when the store itself is unavailable
     */
    [[nodiscard]] virtual Result<bool> try_acquire(const std::string& key,
                                                   std::chrono::seconds ttl) = 0;
};

/**
 * @brief In-process lock store
 */
class MemoryLockStore : public LockStoreInterface {
  public:
    explicit MemoryLockStore(Clock clock = system_clock());

    [[nodiscard]] Result<bool> try_acquire(const std::string& key,
                                           std::chrono::seconds ttl) override;

    /// Number of keys currently tracked, expired ones included until the next acquire
    [[nodiscard]] std::size_t size() const;

  private:
    Clock clock_;
    std::unordered_map<std::string, Timestamp> expiries_;
    mutable std::mutex mutex_;
};

/**
 * @brief Lock store backed by one file per key
 *
 * Visible to every process sharing the directory. Each file holds the
 * lock expiry as epoch seconds; expired files are taken over.
 */
class FileLockStore : public LockStoreInterface {
  public:
    explicit FileLockStore(const std::string& directory, Clock clock = system_clock());

    [[nodiscard]] Result<bool> try_acquire(const std::string& key,
                                           std::chrono::seconds ttl) override;

    /// Path of the lock file used for `key`
    [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;

  private:
    /// 1 = created, 0 = exists, -1 = I/O error
    int create_exclusive(const std::filesystem::path& path, Timestamp expiry);

    std::filesystem::path directory_;
    Clock clock_;
    std::mutex mutex_;
};

/**
 * @brief Named cross-process advisory lock (flock on a lock file)
 *
 * Released on unlock() or destruction. Two ProcessLock objects on the
 * same path exclude each other even inside one process.
 */
class ProcessLock {
  public:
    explicit ProcessLock(std::string path);
    ~ProcessLock();

    ProcessLock(const ProcessLock&) = delete;
    ProcessLock& operator=(const ProcessLock&) = delete;

    /// Try to take the lock, polling until `timeout` elapses
    [[nodiscard]] bool try_lock_for(std::chrono::milliseconds timeout);

    /// Release the lock if held
    void unlock();

    [[nodiscard]] bool owns_lock() const noexcept { return fd_ >= 0; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

}  // namespace licenseguard
