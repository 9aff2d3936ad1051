#include "licenseguard/lock.hpp"
#include "licenseguard/crypto.hpp"
#include "licenseguard/logging.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>

namespace licenseguard {

namespace {

int64_t to_epoch_seconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

}  // namespace

// ==================== MemoryLockStore Implementation ====================

MemoryLockStore::MemoryLockStore(Clock clock) : clock_(std::move(clock)) {}

Result<bool> MemoryLockStore::try_acquire(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = clock_();
    for (auto it = expiries_.begin(); it != expiries_.end();) {
        if (it->second <= now) {
            it = expiries_.erase(it);
        } else {
            ++it;
        }
    }

    if (expiries_.count(key) != 0) {
        return Result<bool>::ok(false);
    }

    expiries_[key] = now + ttl;
    return Result<bool>::ok(true);
}

std::size_t MemoryLockStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expiries_.size();
}

// ==================== FileLockStore Implementation ====================

FileLockStore::FileLockStore(const std::string& directory, Clock clock)
    : directory_(directory), clock_(std::move(clock)) {}

std::filesystem::path FileLockStore::path_for(const std::string& key) const {
    auto digest = crypto::sha256_hex(key);
    return directory_ / ("activate_" + digest.substr(0, 32) + ".lock");
}

int FileLockStore::create_exclusive(const std::filesystem::path& path, Timestamp expiry) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        return errno == EEXIST ? 0 : -1;
    }

    auto content = std::to_string(to_epoch_seconds(expiry));
    auto written = ::write(fd, content.data(), content.size());
    ::close(fd);
    return written == static_cast<ssize_t>(content.size()) ? 1 : -1;
}

Result<bool> FileLockStore::try_acquire(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Result<bool>::error(ErrorCode::StorageError,
                                   "Cannot create lock directory: " + ec.message());
    }

    auto path = path_for(key);
    auto now = clock_();

    // Second pass only runs after an expired file was removed
    for (int pass = 0; pass < 2; ++pass) {
        int created = create_exclusive(path, now + ttl);
        if (created == 1) {
            return Result<bool>::ok(true);
        }
        if (created < 0) {
            return Result<bool>::error(ErrorCode::StorageError,
                                       "Cannot write lock file " + path.string() + ": " +
                                           std::strerror(errno));
        }

        int64_t expiry = 0;
        {
            std::ifstream file(path);
            if (!(file >> expiry)) {
                expiry = 0;  // Unreadable or half-written: treat as stale
            }
        }

        if (to_epoch_seconds(now) < expiry) {
            return Result<bool>::ok(false);
        }

        std::filesystem::remove(path, ec);
        if (ec) {
            return Result<bool>::error(ErrorCode::StorageError,
                                       "Cannot remove stale lock file: " + ec.message());
        }
    }

    // Another process re-created the file between our remove and create
    return Result<bool>::ok(false);
}

// ==================== ProcessLock Implementation ====================

ProcessLock::ProcessLock(std::string path) : path_(std::move(path)) {}

ProcessLock::~ProcessLock() { unlock(); }

bool ProcessLock::try_lock_for(std::chrono::milliseconds timeout) {
    if (fd_ >= 0) {
        return true;
    }

    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd < 0) {
        LICENSEGUARD_LOG_ERROR("process_lock: cannot open {}: {}", path_, std::strerror(errno));
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            fd_ = fd;
            return true;
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            LICENSEGUARD_LOG_ERROR("process_lock: flock {} failed: {}", path_, std::strerror(errno));
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ::close(fd);
    return false;
}

void ProcessLock::unlock() {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}  // namespace licenseguard
