#include <gtest/gtest.h>
#include <licenseguard/json.hpp>

#include <chrono>
#include <string>

namespace licenseguard {
namespace json {
namespace {

Timestamp utc(int64_t epoch_seconds) {
    return Timestamp(std::chrono::seconds(epoch_seconds));
}

// ==================== Timestamp Tests ====================

TEST(TimestampTest, ParsesServerFormatAsUtc) {
    EXPECT_EQ(parse_timestamp("2025-01-01 00:00:00"), utc(1735689600));
    EXPECT_EQ(parse_timestamp("2025-01-01 00:00:01"), utc(1735689601));
}

TEST(TimestampTest, ParsesIsoVariants) {
    EXPECT_EQ(parse_timestamp("2025-01-01T00:00:00Z"), utc(1735689600));
    EXPECT_EQ(parse_timestamp("2025-01-01T00:00:00.250Z"), utc(1735689600));
    EXPECT_EQ(parse_timestamp("2025-01-01"), utc(1735689600));
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("never").has_value());
}

TEST(TimestampTest, FormatsIso) {
    EXPECT_EQ(format_timestamp(utc(1735689600)), "2025-01-01T00:00:00Z");
}

// ==================== Response Parsing Tests ====================

TEST(ResponseDataTest, SingleActivationObject) {
    auto data = parse_response_data(json::parse(R"({
        "success": true,
        "data": {
            "licenseKey": "ABCD-1234-EFGH",
            "expiresAt": "2025-12-31 00:00:00",
            "timesActivated": 1,
            "activationData": {"token": "a1b2c3", "created_at": "2025-05-01 10:00:00"}
        }
    })"));

    EXPECT_EQ(data.expires_at, "2025-12-31 00:00:00");
    EXPECT_EQ(data.times_activated, 1);
    ASSERT_EQ(data.activation_shape, ActivationShape::Single);
    ASSERT_EQ(data.activations.size(), 1u);
    EXPECT_EQ(data.activations[0].token, "a1b2c3");
    EXPECT_EQ(data.activations[0].created_at, parse_timestamp("2025-05-01 10:00:00"));
    EXPECT_TRUE(data.activations[0].is_active());
    EXPECT_NE(data.data.find("ABCD-1234-EFGH"), std::string::npos);
    EXPECT_NE(data.body.find("\"success\""), std::string::npos);
}

TEST(ResponseDataTest, ActivationList) {
    auto data = parse_response_data(json::parse(R"({"data": {"activationData": [
        {"token": "t1", "deactivated_at": "2025-05-01 00:00:00"},
        {"token": "t2", "deactivated_at": null},
        "not-an-object"
    ]}})"));

    ASSERT_EQ(data.activation_shape, ActivationShape::List);
    ASSERT_EQ(data.activations.size(), 2u);
    EXPECT_FALSE(data.activations[0].is_active());
    EXPECT_TRUE(data.activations[1].is_active());
}

TEST(ResponseDataTest, DeactivatedAtTruthiness) {
    auto data = parse_response_data(json::parse(R"({"data": {"activationData": [
        {"token": "a", "deactivated_at": false},
        {"token": "b", "deactivated_at": 0},
        {"token": "c", "deactivated_at": ""},
        {"token": "d", "deactivated_at": true},
        {"token": "e", "deactivated_at": 1700000000}
    ]}})"));

    ASSERT_EQ(data.activations.size(), 5u);
    EXPECT_TRUE(data.activations[0].is_active());
    EXPECT_TRUE(data.activations[1].is_active());
    EXPECT_TRUE(data.activations[2].is_active());
    EXPECT_FALSE(data.activations[3].is_active());
    EXPECT_FALSE(data.activations[4].is_active());
}

TEST(ResponseDataTest, TimesActivatedAsString) {
    auto data = parse_response_data(json::parse(R"({"data": {"timesActivated": "4"}})"));
    EXPECT_EQ(data.times_activated, 4);

    auto junk = parse_response_data(json::parse(R"({"data": {"timesActivated": "many"}})"));
    EXPECT_FALSE(junk.times_activated.has_value());
}

TEST(ResponseDataTest, BodyWithoutDataKeyIsItsOwnData) {
    auto data = parse_response_data(json::parse(R"({"expiresAt": "2026-01-01 00:00:00"})"));

    EXPECT_EQ(data.expires_at, "2026-01-01 00:00:00");
    EXPECT_EQ(data.activation_shape, ActivationShape::None);
}

TEST(ResponseDataTest, EmptyExpiryIsAbsent) {
    auto data = parse_response_data(json::parse(R"({"data": {"expiresAt": ""}})"));

    EXPECT_FALSE(data.expires_at.has_value());
}

// ==================== Error Parsing Tests ====================

TEST(ErrorParsingTest, MessageFieldWins) {
    auto message = extract_http_error_message(
        json::parse(R"({"code": "x", "message": "License not found", "errors": ["other"]})"));

    EXPECT_EQ(message, "License not found");
}

TEST(ErrorParsingTest, NoMessageAvailable) {
    EXPECT_FALSE(extract_http_error_message(json::parse(R"({"code": "x"})")).has_value());
    EXPECT_FALSE(extract_http_error_message(json::parse(R"(["a"])")).has_value());
}

TEST(ErrorParsingTest, EmbeddedErrorKeepsServerOrder) {
    auto errors = json::parse(R"({
        "lmfwc_rest_license_expired": ["The license expired on 2025-01-01 00:00:00 (UTC)."],
        "another_code": ["second"]
    })");
    auto error_data = json::parse(R"({"lmfwc_rest_license_expired": {"status": "410"}})");

    auto embedded = extract_embedded_error(errors, error_data);

    EXPECT_EQ(embedded.code, "lmfwc_rest_license_expired");
    EXPECT_EQ(embedded.message, "The license expired on 2025-01-01 00:00:00 (UTC).");
    EXPECT_EQ(embedded.status, 410);
}

TEST(ErrorParsingTest, EmbeddedErrorDefaults) {
    auto embedded = extract_embedded_error(json::object(), json::object());

    EXPECT_EQ(embedded.code, "lmfwc_error");
    EXPECT_FALSE(embedded.message.has_value());
    EXPECT_FALSE(embedded.status.has_value());
}

// ==================== State Document Tests ====================

TEST(StateJsonTest, LoadsStoredDocument) {
    auto state = state_from_json(json::parse(R"({
        "license_key": "ABCD-1234-EFGH",
        "status": "GRACE_SOFT",
        "activation_token": "a1b2c3",
        "expires_at": "2025-12-31T00:00:00Z",
        "grace_until": "2025-06-01 12:00:00",
        "reason": "Grace policy engaged: timeout",
        "last_validated": null
    })"));

    EXPECT_EQ(state.license_key, "ABCD-1234-EFGH");
    EXPECT_EQ(state.status, LicenseStatus::GraceSoft);
    EXPECT_EQ(state.activation_token, "a1b2c3");
    EXPECT_EQ(state.expires_at, parse_timestamp("2025-12-31 00:00:00"));
    EXPECT_EQ(state.grace_until, parse_timestamp("2025-06-01 12:00:00"));
    EXPECT_FALSE(state.last_validated.has_value());
    EXPECT_TRUE(state.last_error_raw.empty());
}

TEST(StateJsonTest, UnsetTimestampsSerializeAsNull) {
    LicenseState state;
    state.status = LicenseStatus::LockHard;

    auto j = state_to_json(state);

    EXPECT_EQ(j["status"], "LOCK_HARD");
    EXPECT_TRUE(j["expires_at"].is_null());
    EXPECT_TRUE(j["grace_until"].is_null());
    EXPECT_TRUE(j["last_validated"].is_null());
}

TEST(StateJsonTest, NonObjectGivesDefaults) {
    auto state = state_from_json(json::parse("[]"));

    EXPECT_EQ(state.status, LicenseStatus::Unconfigured);
    EXPECT_TRUE(state.license_key.empty());
}

}  // namespace
}  // namespace json
}  // namespace licenseguard
