#include "licenseguard/scheduler.hpp"
#include "licenseguard/lock.hpp"
#include "licenseguard/logging.hpp"

namespace licenseguard {

RevalidationJob::RevalidationJob(std::shared_ptr<LicenseController> controller,
                                 RevalidationOptions options)
    : controller_(std::move(controller)), options_(std::move(options)) {}

RevalidationJob::~RevalidationJob() { stop(); }

RevalidationOutcome RevalidationJob::run_once() {
    LICENSEGUARD_LOG_INFO("scheduled_auto_validate: start");
    try {
        ProcessLock lock(options_.lock_path);
        if (!lock.try_lock_for(options_.lock_timeout)) {
            LICENSEGUARD_LOG_INFO("scheduled_auto_validate: skipped (another run is in progress)");
            controller_->notify(events::AUTOVALIDATION_SKIPPED);
            return RevalidationOutcome::Skipped;
        }

        auto key = controller_->state().license_key;
        if (key.empty()) {
            LICENSEGUARD_LOG_WARN("scheduled_auto_validate: no license_key set; skipping");
            return RevalidationOutcome::NoLicenseKey;
        }

        auto result = controller_->validate(key);
        if (result.is_error()) {
            LICENSEGUARD_LOG_ERROR("scheduled_auto_validate: failed: {}", result.error_message());
            controller_->notify(events::AUTOVALIDATION_CYCLE, result.error_message());
            return RevalidationOutcome::ValidationFailed;
        }

        LICENSEGUARD_LOG_INFO("scheduled_auto_validate: OK resp={}",
                              log::compact(result.value().data));
        controller_->notify(events::AUTOVALIDATION_CYCLE);
        return RevalidationOutcome::Validated;
    } catch (const std::exception& e) {
        LICENSEGUARD_LOG_ERROR("scheduled_auto_validate: failed: {}", e.what());
        return RevalidationOutcome::ValidationFailed;
    } catch (...) {
        LICENSEGUARD_LOG_ERROR("scheduled_auto_validate: failed with a non-standard exception");
        return RevalidationOutcome::ValidationFailed;
    }
}

void RevalidationJob::start() {
    stop();

    if (options_.interval <= std::chrono::milliseconds::zero()) {
        return;
    }

    running_ = true;
    thread_ = std::thread([this]() {
        while (running_) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, options_.interval, [this]() { return !running_; });
            }
            if (!running_) {
                break;
            }

            auto outcome = run_once();
            LICENSEGUARD_LOG_DEBUG("revalidation cycle finished: {}",
                                   revalidation_outcome_to_string(outcome));
        }
    });
}

void RevalidationJob::stop() {
    if (!running_ && !thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

RevalidationOptions revalidation_options_from(const Config& config) {
    RevalidationOptions options;
    options.lock_path = config.scheduler_lock_path;
    options.lock_timeout = std::chrono::milliseconds(config.scheduler_lock_timeout_ms);
    options.interval = std::chrono::milliseconds(
        static_cast<int64_t>(config.revalidate_interval_hours * 3600.0 * 1000.0));
    return options;
}

}  // namespace licenseguard
