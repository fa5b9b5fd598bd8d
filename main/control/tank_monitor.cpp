#include <main/control/tank_monitor.hpp>
#include <cmath>

namespace {
    static constexpr float kSoundCmPerUs = 0.0343f;
    static constexpr float kPi = 3.14159265f;
}

namespace TankMonitor {
    float echoToDistanceCm(uint32_t echo_us) {
        return static_cast<float>(echo_us) * kSoundCmPerUs / 2.0f;
    }

    TankReading aggregate(const EchoSample* samples, std::size_t count,
                          float empty_distance_cm, uint32_t now_ms) {
        TankReading out{};
        out.ts_ms = now_ms;

        float sum = 0.0f;
        uint8_t valid = 0;
        for (std::size_t i = 0; samples != nullptr && i < count; ++i) {
            if (!samples[i].valid) {
                continue;
            }
            sum += samples[i].distance_cm;
            ++valid;
        }

        out.valid_samples = valid;
        if (valid == 0) {
            out.has_distance = false;
            out.distance_cm = 0.0f;
            out.empty = false;
            return out;
        }
        out.has_distance = true;
        out.distance_cm = sum / static_cast<float>(valid);
        out.empty = out.distance_cm >= empty_distance_cm;
        return out;
    }

    bool deriveLockout(const TankReading& reading, bool previous_lockout,
                       const ControlThresholds& t) {
        if (!t.tank_protection_enabled) {
            return false;
        }
        if (reading.has_distance) {
            return reading.distance_cm >= t.tank_empty_distance_cm;
        }
        return (t.sensor_loss_policy == SensorLossPolicy::HOLD_LOCKOUT) ? previous_lockout : false;
    }

    TankLevel level(const TankReading& reading, float height_cm, float radius_cm) {
        TankLevel out{};
        const float base_area = kPi * radius_cm * radius_cm;
        out.capacity_cm3 = static_cast<uint32_t>(std::lround(base_area * height_cm));
        if (!reading.has_distance || !(height_cm > 0.0f)) {
            out.valid = false;
            return out;
        }
        float h = height_cm - reading.distance_cm;
        if (h < 0.0f) h = 0.0f;
        if (h > height_cm) h = height_cm;

        out.valid = true;
        out.water_height_cm = h;
        out.volume_cm3 = static_cast<uint32_t>(std::lround(base_area * h));
        out.percent = static_cast<uint8_t>(std::lround(100.0f * h / height_cm));
        return out;
    }
}
