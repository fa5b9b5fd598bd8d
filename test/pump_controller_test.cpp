#include <gtest/gtest.h>
#include <vector>
#include <main/control/pump_controller.hpp>

namespace {
    class FakePump : public PumpOutput {
    public:
        void drive(bool on) override { calls.push_back(on); }
        std::vector<bool> calls;
    };

    TickInputs inputs(uint8_t percent, float tank_cm = 3.0f) {
        TickInputs in{};
        in.has_soil = true;
        in.soil.raw = 2000;
        in.soil.smoothed = 2000.0f;
        in.soil.percent = percent;
        in.tank.has_distance = true;
        in.tank.distance_cm = tank_cm;
        in.tank.valid_samples = 5;
        return in;
    }

    TickInputs noSoil(float tank_cm = 3.0f) {
        TickInputs in = inputs(0, tank_cm);
        in.has_soil = false;
        return in;
    }

    TickInputs noTank(uint8_t percent) {
        TickInputs in = inputs(percent);
        in.tank.has_distance = false;
        in.tank.valid_samples = 0;
        return in;
    }

    class PumpControllerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            controller.begin(0, 2000);
            pump.calls.clear();
        }

        // Holds dry until the controller turns the pump on
        void runUntilOn(uint32_t& now) {
            (void)controller.tick(now, inputs(10));
            now += 5000;
            ASSERT_EQ(controller.tick(now, inputs(10)).decision, PumpDecision::TURN_ON);
        }

        FakePump pump;
        ControlThresholds t = ThresholdConfig::fromBuildConfig();
        PumpController controller{t, &pump};
    };
}

TEST_F(PumpControllerTest, BeginDrivesPumpOffInAuto) {
    FakePump fresh;
    PumpController c(t, &fresh);
    c.begin(100, 1234);
    ASSERT_EQ(fresh.calls.size(), 1u);
    EXPECT_FALSE(fresh.calls[0]);
    EXPECT_EQ(c.mode(), ControllerMode::AUTO);
    EXPECT_FALSE(c.pumpOn());
    EXPECT_EQ(c.state().legacy_threshold_raw, 1234);
}

TEST_F(PumpControllerTest, AutoCycle) {
    uint32_t now = 1000;
    runUntilOn(now);
    EXPECT_TRUE(controller.pumpOn());
    ASSERT_EQ(pump.calls.size(), 1u);
    EXPECT_TRUE(pump.calls[0]);
    EXPECT_EQ(controller.state().pump.on_since_ms, now);
    EXPECT_FALSE(controller.state().pump.has_off_since);

    now += 15000;
    EXPECT_EQ(controller.tick(now, inputs(50)).decision, PumpDecision::TURN_OFF_WET);
    EXPECT_FALSE(controller.pumpOn());
    EXPECT_EQ(controller.state().pump.off_since_ms, now);
    EXPECT_FALSE(controller.state().pump.has_on_since);
    EXPECT_EQ(controller.state().transitions, 2u);
    EXPECT_EQ(controller.state().last_decision, PumpDecision::TURN_OFF_WET);
}

TEST_F(PumpControllerTest, TankEmptyStopsPumpBeforeMinimumRun) {
    uint32_t now = 0;
    runUntilOn(now);
    const TickResult r = controller.tick(now + 1000, inputs(10, 9.0f));
    EXPECT_EQ(r.decision, PumpDecision::TURN_OFF_LOCKOUT);
    EXPECT_TRUE(r.lockout_changed);
    EXPECT_TRUE(controller.state().lockout);
    EXPECT_FALSE(controller.pumpOn());
}

TEST_F(PumpControllerTest, ManualOffOverridesAuto) {
    uint32_t now = 0;
    runUntilOn(now);

    now += 1000;
    EXPECT_EQ(controller.setManual(false, now), PumpDecision::MANUAL_OFF);
    EXPECT_EQ(controller.mode(), ControllerMode::MANUAL);
    EXPECT_FALSE(controller.pumpOn());
    const size_t drives = pump.calls.size();

    // Bone dry for minutes: MANUAL leaves the pump alone
    for (int i = 0; i < 120; ++i) {
        now += 1000;
        const TickResult r = controller.tick(now, inputs(0));
        EXPECT_FALSE(r.evaluated);
        EXPECT_EQ(r.decision, PumpDecision::NONE);
    }
    EXPECT_FALSE(controller.pumpOn());
    EXPECT_EQ(pump.calls.size(), drives);

    // Back to AUTO: a fresh dry window is needed
    EXPECT_TRUE(controller.setMode(ControllerMode::AUTO));
    now += 1000;
    EXPECT_EQ(controller.tick(now, inputs(0)).decision, PumpDecision::NONE);
    now += 5000;
    EXPECT_EQ(controller.tick(now, inputs(0)).decision, PumpDecision::TURN_ON);
}

TEST_F(PumpControllerTest, SetModeDoesNotEvaluate) {
    (void)controller.setManual(false, 0);
    (void)controller.tick(40000, inputs(0));
    pump.calls.clear();

    EXPECT_TRUE(controller.setMode(ControllerMode::AUTO));
    EXPECT_TRUE(pump.calls.empty());
    EXPECT_FALSE(controller.pumpOn());
    EXPECT_EQ(controller.state().transitions, 0u);
}

TEST_F(PumpControllerTest, SetModeIsIdempotent) {
    EXPECT_FALSE(controller.setMode(ControllerMode::AUTO));
    EXPECT_TRUE(controller.setMode(ControllerMode::MANUAL));
    EXPECT_FALSE(controller.setMode(ControllerMode::MANUAL));
    EXPECT_TRUE(pump.calls.empty());
}

TEST_F(PumpControllerTest, RepeatedManualOnKeepsOriginalTimestamp) {
    EXPECT_EQ(controller.setManual(true, 1000), PumpDecision::MANUAL_ON);
    EXPECT_EQ(controller.setManual(true, 5000), PumpDecision::NONE);
    EXPECT_EQ(controller.state().pump.on_since_ms, 1000u);
    EXPECT_EQ(controller.state().transitions, 1u);
    EXPECT_EQ(pump.calls.size(), 1u);
}

TEST_F(PumpControllerTest, ManualOnIgnoresLockout) {
    (void)controller.tick(0, inputs(50, 9.0f));
    ASSERT_TRUE(controller.state().lockout);

    EXPECT_EQ(controller.setManual(true, 1000), PumpDecision::MANUAL_ON);
    EXPECT_TRUE(controller.pumpOn());

    // Lockout is still tracked in MANUAL but does not act
    const TickResult r = controller.tick(2000, inputs(50, 9.0f));
    EXPECT_FALSE(r.evaluated);
    EXPECT_TRUE(controller.pumpOn());
    EXPECT_TRUE(controller.state().lockout);
}

TEST_F(PumpControllerTest, MissingSoilStillHonoursLockout) {
    (void)controller.setManual(true, 0);
    (void)controller.setMode(ControllerMode::AUTO);

    EXPECT_EQ(controller.tick(1000, noSoil()).decision, PumpDecision::NONE);
    EXPECT_TRUE(controller.pumpOn());
    EXPECT_EQ(controller.tick(2000, noSoil(9.0f)).decision, PumpDecision::TURN_OFF_LOCKOUT);
    EXPECT_FALSE(controller.pumpOn());
}

TEST_F(PumpControllerTest, MissingSoilBreaksDryWindow) {
    (void)controller.tick(0, inputs(10));
    (void)controller.tick(3000, noSoil());
    EXPECT_FALSE(controller.state().debounce.dry_active);
    EXPECT_EQ(controller.tick(5000, inputs(10)).decision, PumpDecision::NONE);
    EXPECT_EQ(controller.tick(10000, inputs(10)).decision, PumpDecision::TURN_ON);
}

TEST_F(PumpControllerTest, SensorLossHoldsLockoutByDefault) {
    (void)controller.tick(0, inputs(50, 9.0f));
    ASSERT_TRUE(controller.state().lockout);
    const TickResult r = controller.tick(1000, noTank(10));
    EXPECT_FALSE(r.lockout_changed);
    EXPECT_TRUE(controller.state().lockout);

    // Still dry, still no echo: pump must not start
    EXPECT_EQ(controller.tick(60000, noTank(10)).decision, PumpDecision::NONE);
    EXPECT_FALSE(controller.pumpOn());
}

TEST(PumpControllerPolicy, SensorLossClearsLockoutWhenConfigured) {
    ControlThresholds t = ThresholdConfig::fromBuildConfig();
    t.sensor_loss_policy = SensorLossPolicy::CLEAR_LOCKOUT;
    PumpController c(t, nullptr);
    c.begin(0, 0);

    (void)c.tick(0, inputs(50, 9.0f));
    ASSERT_TRUE(c.state().lockout);
    EXPECT_TRUE(c.tick(1000, noTank(50)).lockout_changed);
    EXPECT_FALSE(c.state().lockout);
}

TEST_F(PumpControllerTest, LegacyThresholdDoesNotAffectAuto) {
    controller.setLegacyThreshold(4095);
    uint32_t now = 0;
    runUntilOn(now);
    controller.setLegacyThreshold(0);
    EXPECT_EQ(controller.tick(now + 1000, inputs(10)).decision, PumpDecision::NONE);
    EXPECT_EQ(controller.snapshot(now).legacy_threshold_raw, 0);
}

TEST_F(PumpControllerTest, SnapshotIsReadOnly) {
    (void)controller.tick(1000, inputs(25, 4.75f));
    const ControllerState before = controller.state();

    const TelemetrySnapshot a = controller.snapshot(4000);
    const TelemetrySnapshot b = controller.snapshot(4000);
    EXPECT_EQ(a.transitions, b.transitions);
    EXPECT_EQ(a.pump_state_ms, b.pump_state_ms);

    const ControllerState& after = controller.state();
    EXPECT_EQ(after.debounce.dry_active, before.debounce.dry_active);
    EXPECT_EQ(after.debounce.dry_since_ms, before.debounce.dry_since_ms);
    EXPECT_EQ(after.pump.is_on, before.pump.is_on);
    EXPECT_EQ(after.transitions, before.transitions);
    EXPECT_EQ(after.lockout, before.lockout);
}

TEST_F(PumpControllerTest, SnapshotContents) {
    (void)controller.tick(1000, inputs(25, 4.75f));
    const TelemetrySnapshot s = controller.snapshot(61000);
    EXPECT_TRUE(s.has_soil);
    EXPECT_EQ(s.soil_percent, 25);
    EXPECT_EQ(s.soil_raw, 2000);
    EXPECT_TRUE(s.has_tank_distance);
    EXPECT_FLOAT_EQ(s.tank_distance_cm, 4.75f);
    EXPECT_EQ(s.tank_level_percent, 50);
    EXPECT_EQ(s.tank_capacity_cm3, 702u);
    EXPECT_FALSE(s.lockout);
    EXPECT_FALSE(s.pump_on);
    EXPECT_EQ(s.mode, ControllerMode::AUTO);
    EXPECT_EQ(s.pump_state_ms, 61000u);
    EXPECT_EQ(s.uptime_ms, 61000u);
    EXPECT_EQ(s.legacy_threshold_raw, 2000);
}

TEST_F(PumpControllerTest, SnapshotBeforeFirstTick) {
    const TelemetrySnapshot s = controller.snapshot(10);
    EXPECT_FALSE(s.has_soil);
    EXPECT_FALSE(s.has_tank_distance);
    EXPECT_EQ(s.tank_valid_samples, 0);
}

TEST(PumpControllerNames, DecisionAndModeNames) {
    EXPECT_STREQ(modeName(ControllerMode::AUTO), "auto");
    EXPECT_STREQ(modeName(ControllerMode::MANUAL), "manual");
    EXPECT_STREQ(decisionName(PumpDecision::TURN_ON), "dry");
    EXPECT_STREQ(decisionName(PumpDecision::TURN_OFF_LOCKOUT), "tank_empty");
}
