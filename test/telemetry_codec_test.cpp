#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <mjson.h>
#include <main/protocol/telemetry_codec.hpp>

namespace {
    TelemetrySnapshot sampleSnapshot() {
        TelemetrySnapshot s{};
        s.has_soil = true;
        s.soil_raw = 2100;
        s.soil_smoothed = 2100.4f;
        s.soil_percent = 58;
        s.has_tank_distance = true;
        s.tank_distance_cm = 4.75f;
        s.tank_valid_samples = 5;
        s.tank_level_percent = 50;
        s.tank_volume_cm3 = 351;
        s.tank_capacity_cm3 = 702;
        s.lockout = false;
        s.pump_on = true;
        s.mode = ControllerMode::AUTO;
        s.pump_state_ms = 12500;
        s.last_decision = PumpDecision::TURN_ON;
        s.transitions = 3;
        s.legacy_threshold_raw = 2000;
        s.uptime_ms = 61500;
        return s;
    }

    double number(const char* json, const char* path) {
        double v = -1.0;
        EXPECT_EQ(mjson_get_number(json, static_cast<int>(std::strlen(json)), path, &v), 1) << path;
        return v;
    }

    int tokenType(const char* json, const char* path) {
        const char* tok = nullptr;
        int len = 0;
        return mjson_find(json, static_cast<int>(std::strlen(json)), path, &tok, &len);
    }

    std::string text(const char* json, const char* path) {
        char buf[64] = {};
        if (mjson_get_string(json, static_cast<int>(std::strlen(json)), path, buf, sizeof(buf)) < 0) {
            return "<missing>";
        }
        return buf;
    }
}

TEST(TelemetryCodec, FullSnapshot) {
    char out[512];
    const TelemetrySnapshot s = sampleSnapshot();
    const int n = TelemetryCodec::formatTelemetry(s, nullptr, out, sizeof(out));
    ASSERT_GT(n, 0);
    EXPECT_EQ(static_cast<size_t>(n), std::strlen(out));
    EXPECT_EQ(tokenType(out, "$"), MJSON_TOK_OBJECT);

    EXPECT_EQ(number(out, "$.soil_raw"), 2100);
    EXPECT_EQ(number(out, "$.soil_pct"), 58);
    EXPECT_NEAR(number(out, "$.ultrasonic_cm"), 4.75, 0.001);
    EXPECT_EQ(number(out, "$.tank_pct"), 50);
    EXPECT_EQ(number(out, "$.tank_capacity_cm3"), 702);
    EXPECT_EQ(tokenType(out, "$.pump_on"), MJSON_TOK_TRUE);
    EXPECT_EQ(tokenType(out, "$.auto_mode"), MJSON_TOK_TRUE);
    EXPECT_EQ(tokenType(out, "$.tank_empty"), MJSON_TOK_FALSE);
    EXPECT_EQ(text(out, "$.mode"), "auto");
    EXPECT_EQ(text(out, "$.last_reason"), "dry");
    EXPECT_EQ(number(out, "$.pump_state_s"), 12);
    EXPECT_EQ(number(out, "$.soil_threshold_raw"), 2000);
    EXPECT_EQ(number(out, "$.uptime_s"), 61);
    EXPECT_EQ(tokenType(out, "$.ip"), MJSON_TOK_INVALID);
}

TEST(TelemetryCodec, AbsentReadingsAreNull) {
    char out[512];
    TelemetrySnapshot s = sampleSnapshot();
    s.has_soil = false;
    s.has_tank_distance = false;
    s.mode = ControllerMode::MANUAL;
    ASSERT_GT(TelemetryCodec::formatTelemetry(s, nullptr, out, sizeof(out)), 0);

    EXPECT_EQ(tokenType(out, "$.soil_raw"), MJSON_TOK_NULL);
    EXPECT_EQ(tokenType(out, "$.soil_pct"), MJSON_TOK_NULL);
    EXPECT_EQ(tokenType(out, "$.ultrasonic_cm"), MJSON_TOK_NULL);
    EXPECT_EQ(tokenType(out, "$.tank_pct"), MJSON_TOK_NULL);
    EXPECT_EQ(tokenType(out, "$.auto_mode"), MJSON_TOK_FALSE);
    EXPECT_EQ(text(out, "$.mode"), "manual");
}

TEST(TelemetryCodec, NetworkInfoIsAppended) {
    char out[512];
    TelemetryCodec::NetworkInfo net{"192.168.1.40", "garden"};
    ASSERT_GT(TelemetryCodec::formatTelemetry(sampleSnapshot(), &net, out, sizeof(out)), 0);
    EXPECT_EQ(text(out, "$.ip"), "192.168.1.40");
    EXPECT_EQ(text(out, "$.wifi_ssid"), "garden");
}

TEST(TelemetryCodec, OverflowReportsFailure) {
    char out[32];
    EXPECT_EQ(TelemetryCodec::formatTelemetry(sampleSnapshot(), nullptr, out, sizeof(out)), -1);
    EXPECT_EQ(TelemetryCodec::formatStatus(5, nullptr, out, 8), -1);
    EXPECT_EQ(TelemetryCodec::formatTelemetry(sampleSnapshot(), nullptr, nullptr, 0), -1);
}

TEST(TelemetryCodec, AckOk) {
    char out[256];
    TelemetrySnapshot s = sampleSnapshot();
    s.mode = ControllerMode::MANUAL;
    ASSERT_GT(TelemetryCodec::formatAck("set_pump", "req-1", nullptr, s, out, sizeof(out)), 0);
    EXPECT_EQ(text(out, "$.command"), "set_pump");
    EXPECT_EQ(text(out, "$.id"), "req-1");
    EXPECT_EQ(text(out, "$.status"), "ok");
    EXPECT_EQ(text(out, "$.error"), "");
    EXPECT_EQ(text(out, "$.mode"), "manual");
    EXPECT_EQ(tokenType(out, "$.pump_on"), MJSON_TOK_TRUE);
    EXPECT_EQ(tokenType(out, "$.lockout"), MJSON_TOK_FALSE);
}

TEST(TelemetryCodec, AckWithError) {
    char out[256];
    ASSERT_GT(TelemetryCodec::formatAck("set_threshold", nullptr, "not persisted",
                                        sampleSnapshot(), out, sizeof(out)), 0);
    EXPECT_EQ(text(out, "$.status"), "error");
    EXPECT_EQ(text(out, "$.error"), "not persisted");
    EXPECT_EQ(text(out, "$.id"), "");
}

TEST(TelemetryCodec, Reject) {
    char out[256];
    ASSERT_GT(TelemetryCodec::formatReject("set_mode", "r9", "invalid parameter", out, sizeof(out)), 0);
    EXPECT_EQ(text(out, "$.command"), "set_mode");
    EXPECT_EQ(text(out, "$.id"), "r9");
    EXPECT_EQ(text(out, "$.status"), "error");
    EXPECT_EQ(text(out, "$.error"), "invalid parameter");
    EXPECT_EQ(tokenType(out, "$.pump_on"), MJSON_TOK_INVALID);
}

TEST(TelemetryCodec, Status) {
    char out[192];
    ASSERT_GT(TelemetryCodec::formatStatus(42, nullptr, out, sizeof(out)), 0);
    EXPECT_EQ(text(out, "$.status"), "online");
    EXPECT_EQ(number(out, "$.uptime_s"), 42);

    ASSERT_GT(TelemetryCodec::formatStatus(7, "on_percent must be below off_percent", out, sizeof(out)), 0);
    EXPECT_EQ(text(out, "$.status"), "config_error");
    EXPECT_EQ(text(out, "$.error"), "on_percent must be below off_percent");
}
