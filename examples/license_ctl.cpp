/**
 * @file license_ctl.cpp
 * @brief Command-line front end for the licenseguard SDK
 *
 * Usage:
 *   license_ctl [--config FILE] <command> [--key KEY] [--token TOKEN]
 *
 * Commands: activate, reactivate, deactivate, validate, status, auto-validate
 *
 * Without --config the configuration comes from $LICENSEGUARD_CONFIG or the
 * LICENSEGUARD_* environment variables.
 */

#include <licenseguard/config.hpp>
#include <licenseguard/controller.hpp>
#include <licenseguard/json.hpp>
#include <licenseguard/logging.hpp>
#include <licenseguard/scheduler.hpp>

#include <iostream>
#include <string>

namespace {

void print_usage() {
    std::cerr << "usage: license_ctl [--config FILE] "
                 "<activate|reactivate|deactivate|validate|status|auto-validate> "
                 "[--key KEY] [--token TOKEN]\n";
}

std::string format_optional(const std::optional<licenseguard::Timestamp>& ts) {
    return ts ? licenseguard::json::format_timestamp(*ts) : "-";
}

void print_state(const licenseguard::LicenseState& state) {
    std::cout << "License key:    " << (state.license_key.empty() ? "-" : state.license_key) << "\n";
    std::cout << "Status:         " << licenseguard::license_status_to_string(state.status) << "\n";
    std::cout << "Token:          " << licenseguard::log::mask_token(state.activation_token) << "\n";
    std::cout << "Expires at:     " << format_optional(state.expires_at) << "\n";
    std::cout << "Grace until:    " << format_optional(state.grace_until) << "\n";
    std::cout << "Last validated: " << format_optional(state.last_validated) << "\n";
    std::cout << "Reason:         " << state.reason << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string command;
    std::string license_key;
    std::string token;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << name << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--config" || arg == "--key" || arg == "--token") {
            const char* value = needs_value(arg);
            if (value == nullptr) {
                return 1;
            }
            if (arg == "--config") {
                config_path = value;
            } else if (arg == "--key") {
                license_key = value;
            } else {
                token = value;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            std::cerr << "unexpected argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    auto config = licenseguard::config::resolve(config_path);
    if (config.is_error()) {
        std::cerr << "Configuration error: " << config.error_message() << "\n";
        return 1;
    }
    licenseguard::log::init(config.value().log_level, config.value().log_file,
                            config.value().log_max_bytes, config.value().log_file_count);

    auto controller = licenseguard::make_controller(config.value());

    auto sub = controller->on(licenseguard::events::STATUS_CHANGED,
                              [](const licenseguard::EventData& data) {
                                  std::cout << "[status] "
                                            << licenseguard::license_status_to_string(data.state.status)
                                            << "\n";
                              });

    if (command == "status") {
        auto health = controller->health();
        print_state(controller->state());
        std::cout << "Healthy:        " << (health.ok ? "yes" : "no") << "\n";
        return health.ok ? 0 : 1;
    }

    if (command == "auto-validate") {
        licenseguard::RevalidationJob job(controller,
                                          licenseguard::revalidation_options_from(config.value()));
        auto outcome = job.run_once();
        std::cout << "Auto-validate: " << licenseguard::revalidation_outcome_to_string(outcome)
                  << "\n";
        return outcome == licenseguard::RevalidationOutcome::ValidationFailed ||
                       outcome == licenseguard::RevalidationOutcome::NoLicenseKey
                   ? 1
                   : 0;
    }

    licenseguard::Result<licenseguard::ResponseData> result =
        licenseguard::Result<licenseguard::ResponseData>::error(licenseguard::ErrorCode::Unknown);
    if (command == "activate") {
        result = controller->activate(license_key, token);
    } else if (command == "reactivate") {
        result = controller->reactivate(token, license_key);
    } else if (command == "deactivate") {
        result = controller->deactivate(token, license_key);
    } else if (command == "validate") {
        result = controller->validate(license_key);
    } else {
        std::cerr << "unknown command: " << command << "\n";
        print_usage();
        return 1;
    }

    if (result.is_error()) {
        std::cerr << "Error (" << licenseguard::error_code_to_string(result.error_code())
                  << "): " << result.error_message() << "\n";
        print_state(controller->state());
        return 1;
    }

    print_state(controller->state());
    return 0;
}
