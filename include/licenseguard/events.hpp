#pragma once

/**
 * @file events.hpp
 * @brief Lifecycle event bus for licenseguard SDK
 *
 * The controller publishes one event per lifecycle outcome so a host
 * application can react (notify the user, gate features, ...) without
 * polling the state document.
 */

#include "licenseguard/licenseguard.hpp"
#include "licenseguard/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace licenseguard {

/// Payload delivered to event handlers
struct EventData {
    LicenseState state;       // State snapshot after the operation
    std::string message;      // Error message for *:error events, else empty
    ErrorCode error = ErrorCode::Success;
};

/// Event handler callback type
using EventHandler = std::function<void(const EventData&)>;

/// Handle returned by EventBus::on
class Subscription {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

    /// Cancel this subscription
    void cancel() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    [[nodiscard]] bool is_active() const { return unsubscribe_ != nullptr; }

  private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief Named-event bus
 *
 * Handlers run on the emitting thread, outside the bus lock. A throwing
 * handler is logged and does not stop the remaining handlers.
 * Subscriptions must not outlive the bus.
 */
class EventBus {
  public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    Subscription on(const std::string& event, EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto id = next_id_++;
        handlers_[event].push_back({id, std::move(handler)});

        return Subscription([this, event, id]() { this->remove_handler(event, id); });
    }

    void emit(const std::string& event, const EventData& data) {
        std::vector<EventHandler> handlers_copy;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(event);
            if (it != handlers_.end()) {
                for (const auto& entry : it->second) {
                    handlers_copy.push_back(entry.handler);
                }
            }
        }

        for (const auto& handler : handlers_copy) {
            try {
                handler(data);
            } catch (const std::exception& e) {
                LICENSEGUARD_LOG_WARN("event handler for '{}' threw: {}", event, e.what());
            } catch (...) {
                LICENSEGUARD_LOG_WARN("event handler for '{}' threw a non-standard exception", event);
            }
        }
    }

    /// Number of live handlers for `event`
    [[nodiscard]] std::size_t handler_count(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        return it == handlers_.end() ? 0 : it->second.size();
    }

  private:
    struct HandlerEntry {
        uint64_t id;
        EventHandler handler;
    };

    void remove_handler(const std::string& event, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event);
        if (it != handlers_.end()) {
            auto& vec = it->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
        }
    }

    std::unordered_map<std::string, std::vector<HandlerEntry>> handlers_;
    std::mutex mutex_;
    uint64_t next_id_ = 0;
};

namespace events {
constexpr const char* ACTIVATION_SUCCESS = "activation:success";
constexpr const char* ACTIVATION_ERROR = "activation:error";
constexpr const char* VALIDATION_SUCCESS = "validation:success";
constexpr const char* VALIDATION_ERROR = "validation:error";
constexpr const char* DEACTIVATION_SUCCESS = "deactivation:success";
constexpr const char* DEACTIVATION_ERROR = "deactivation:error";
constexpr const char* LICENSE_EXPIRED = "license:expired";
constexpr const char* GRACE_ENGAGED = "grace:engaged";
constexpr const char* STATUS_CHANGED = "status:changed";
constexpr const char* AUTOVALIDATION_CYCLE = "autovalidation:cycle";
constexpr const char* AUTOVALIDATION_SKIPPED = "autovalidation:skipped";
}  // namespace events

}  // namespace licenseguard
