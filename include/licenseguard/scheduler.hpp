#pragma once

/**
 * @file scheduler.hpp
 * @brief Scheduled license revalidation for licenseguard SDK
 *
 * One run validates the stored license key under a cross-process lock.
 * When the lock cannot be taken within the timeout another run is assumed
 * to be in progress and this one is skipped, never queued.
 */

#include "licenseguard/controller.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace licenseguard {

/// Result of one scheduled run
enum class RevalidationOutcome { Validated, ValidationFailed, NoLicenseKey, Skipped };

[[nodiscard]] constexpr const char* revalidation_outcome_to_string(RevalidationOutcome outcome) noexcept {
    switch (outcome) {
        case RevalidationOutcome::Validated:
            return "validated";
        case RevalidationOutcome::ValidationFailed:
            return "validation_failed";
        case RevalidationOutcome::NoLicenseKey:
            return "no_license_key";
        case RevalidationOutcome::Skipped:
            return "skipped";
    }
    return "skipped";
}

struct RevalidationOptions {
    std::string lock_path = "licenseguard_auto_validate.lock";
    std::chrono::milliseconds lock_timeout{2000};
    std::chrono::milliseconds interval{std::chrono::hours(6)};
};

/**
 * @brief Periodic revalidation driver
 *
 * run_once() can be triggered externally (cron, CLI); start() runs it on
 * a background thread every `interval`.
 */
class RevalidationJob {
  public:
    RevalidationJob(std::shared_ptr<LicenseController> controller, RevalidationOptions options);
    ~RevalidationJob();

    RevalidationJob(const RevalidationJob&) = delete;
    RevalidationJob& operator=(const RevalidationJob&) = delete;

    /// Validate once under the process lock; never throws
    RevalidationOutcome run_once();

    /// Start the background loop (restarts it if already running)
    void start();

    /// Stop the background loop and join the thread
    void stop();

    [[nodiscard]] bool is_running() const { return running_; }

  private:
    std::shared_ptr<LicenseController> controller_;
    RevalidationOptions options_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

/// Options derived from the SDK configuration
[[nodiscard]] RevalidationOptions revalidation_options_from(const Config& config);

}  // namespace licenseguard
