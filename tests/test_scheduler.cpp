#include <gtest/gtest.h>
#include <licenseguard/scheduler.hpp>

#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace licenseguard {
namespace {

using namespace testing_support;
using std::chrono::milliseconds;

class RevalidationJobTest : public ::testing::Test {
  protected:
    void SetUp() override {
        LicenseState seeded;
        seeded.license_key = "LIC-9";
        seeded.status = LicenseStatus::Validated;
        seeded.last_validated = clock.now();
        store = std::make_shared<MemoryStateStore>(seeded);

        ControllerOptions controller_options;
        controller_options.clock = clock.clock();
        controller = std::make_shared<LicenseController>(api, store, controller_options);

        options.lock_path = (dir.path() / "auto_validate.lock").string();
        options.lock_timeout = milliseconds(100);
    }

    TempDirectory dir;
    ManualClock clock{at("2025-06-01 12:00:00")};
    std::shared_ptr<FakeLicenseApi> api = std::make_shared<FakeLicenseApi>();
    std::shared_ptr<MemoryStateStore> store;
    std::shared_ptr<LicenseController> controller;
    RevalidationOptions options;
};

TEST_F(RevalidationJobTest, ValidatesStoredKey) {
    std::vector<std::string> cycles;
    auto sub = controller->on(events::AUTOVALIDATION_CYCLE,
                              [&](const EventData& data) { cycles.push_back(data.message); });
    api->validate_results.push_back(ok_response(R"({"data":{"timesActivated":1}})"));
    RevalidationJob job(controller, options);

    auto outcome = job.run_once();

    EXPECT_EQ(outcome, RevalidationOutcome::Validated);
    EXPECT_EQ(api->validate_keys, (std::vector<std::string>{"LIC-9"}));
    EXPECT_EQ(cycles, (std::vector<std::string>{""}));
}

TEST_F(RevalidationJobTest, FailureEngagesGraceAndReportsMessage) {
    std::vector<std::string> cycles;
    auto sub = controller->on(events::AUTOVALIDATION_CYCLE,
                              [&](const EventData& data) { cycles.push_back(data.message); });
    api->validate_results.push_back(request_error("Network error: timeout"));
    RevalidationJob job(controller, options);

    auto outcome = job.run_once();

    EXPECT_EQ(outcome, RevalidationOutcome::ValidationFailed);
    EXPECT_EQ(controller->state().status, LicenseStatus::GraceSoft);
    EXPECT_EQ(cycles, (std::vector<std::string>{"Operation failed. See error log for details."}));
}

TEST_F(RevalidationJobTest, NoKeyMeansNoCall) {
    store = std::make_shared<MemoryStateStore>();
    ControllerOptions controller_options;
    controller_options.clock = clock.clock();
    controller = std::make_shared<LicenseController>(api, store, controller_options);
    RevalidationJob job(controller, options);

    EXPECT_EQ(job.run_once(), RevalidationOutcome::NoLicenseKey);
    EXPECT_EQ(api->validate_calls(), 0);
}

TEST_F(RevalidationJobTest, SkipsWhileAnotherRunHoldsLock) {
    int skipped = 0;
    auto sub = controller->on(events::AUTOVALIDATION_SKIPPED,
                              [&](const EventData& /*data*/) { ++skipped; });
    ProcessLock other(options.lock_path);
    ASSERT_TRUE(other.try_lock_for(milliseconds(0)));
    RevalidationJob job(controller, options);

    auto outcome = job.run_once();

    EXPECT_EQ(outcome, RevalidationOutcome::Skipped);
    EXPECT_EQ(api->validate_calls(), 0);
    EXPECT_EQ(skipped, 1);
}

TEST_F(RevalidationJobTest, LockReleasedAfterRun) {
    api->validate_results.push_back(ok_response(R"({"data":{"timesActivated":1}})"));
    RevalidationJob job(controller, options);

    ASSERT_EQ(job.run_once(), RevalidationOutcome::Validated);

    ProcessLock after(options.lock_path);
    EXPECT_TRUE(after.try_lock_for(milliseconds(0)));
}

TEST_F(RevalidationJobTest, ControllerExceptionCountsAsFailure) {
    api->throw_on_validate = true;
    RevalidationJob job(controller, options);

    EXPECT_EQ(job.run_once(), RevalidationOutcome::ValidationFailed);
}

TEST_F(RevalidationJobTest, ThrowingCycleHandlerKeepsOutcome) {
    auto sub = controller->on(events::AUTOVALIDATION_CYCLE,
                              [](const EventData& /*data*/) { throw 42; });
    api->validate_results.push_back(ok_response(R"({"data":{"timesActivated":1}})"));
    RevalidationJob job(controller, options);

    EXPECT_EQ(job.run_once(), RevalidationOutcome::Validated);
}

TEST_F(RevalidationJobTest, StopInterruptsLongInterval) {
    options.interval = std::chrono::hours(6);
    RevalidationJob job(controller, options);

    job.start();
    EXPECT_TRUE(job.is_running());

    auto begin = std::chrono::steady_clock::now();
    job.stop();

    EXPECT_FALSE(job.is_running());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
    EXPECT_EQ(api->validate_calls(), 0);
}

TEST_F(RevalidationJobTest, BackgroundLoopRuns) {
    std::atomic<int> cycles{0};
    auto sub = controller->on(events::AUTOVALIDATION_CYCLE,
                              [&](const EventData& /*data*/) { ++cycles; });
    for (int i = 0; i < 500; ++i) {
        api->validate_results.push_back(ok_response(R"({"data":{"timesActivated":1}})"));
    }
    options.interval = milliseconds(10);
    RevalidationJob job(controller, options);

    job.start();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (cycles == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    job.stop();

    EXPECT_GE(cycles.load(), 1);
    EXPECT_EQ(api->validate_calls(), cycles.load());
}

TEST(RevalidationOptionsTest, DerivedFromConfig) {
    Config config;
    config.scheduler_lock_path = "/run/app/auto_validate.lock";
    config.scheduler_lock_timeout_ms = 2000;
    config.revalidate_interval_hours = 0.5;

    auto options = revalidation_options_from(config);

    EXPECT_EQ(options.lock_path, "/run/app/auto_validate.lock");
    EXPECT_EQ(options.lock_timeout, milliseconds(2000));
    EXPECT_EQ(options.interval, milliseconds(30 * 60 * 1000));
}

TEST(RevalidationOutcomeTest, Names) {
    EXPECT_STREQ(revalidation_outcome_to_string(RevalidationOutcome::Skipped), "skipped");
    EXPECT_STREQ(revalidation_outcome_to_string(RevalidationOutcome::NoLicenseKey),
                 "no_license_key");
}

}  // namespace
}  // namespace licenseguard
