#include <main/control/moisture_filter.hpp>
#include <cmath>

MoistureFilter::MoistureFilter(float alpha_in, uint16_t dry, uint16_t wet)
    : alpha(alpha_in), raw_dry(dry), raw_wet(wet), seeded(false), ema(0.0f) {}

SoilSample MoistureFilter::update(uint16_t raw, uint32_t now_ms) {
    const float x = static_cast<float>(raw);
    if (!seeded) {
        ema = x;
        seeded = true;
    } else {
        ema = alpha * x + (1.0f - alpha) * ema;
    }

    SoilSample out{};
    out.raw = raw;
    out.smoothed = ema;
    out.percent = toPercent(ema, raw_dry, raw_wet);
    out.ts_ms = now_ms;
    return out;
}

void MoistureFilter::reset() {
    seeded = false;
    ema = 0.0f;
}

uint8_t MoistureFilter::toPercent(float raw, uint16_t dry_raw, uint16_t wet_raw) {
    const float dry = static_cast<float>(dry_raw);
    const float wet = static_cast<float>(wet_raw);
    if (dry_raw == wet_raw) {
        return 0;
    }
    float percent = 100.0f * (raw - dry) / (wet - dry);
    if (percent < 0.0f) percent = 0.0f;
    if (percent > 100.0f) percent = 100.0f;
    return static_cast<uint8_t>(std::lround(percent));
}

uint16_t MoistureFilter::average(const uint16_t* samples, std::size_t count) {
    if (samples == nullptr || count == 0) {
        return 0;
    }
    uint32_t sum = 0;
    for (std::size_t i = 0; i < count; ++i) {
        sum += samples[i];
    }
    return static_cast<uint16_t>(sum / count);
}
