#ifndef TELEMETRY_CODEC_HPP
#define TELEMETRY_CODEC_HPP

#include <cstddef>
#include <main/models/telemetry_snapshot.hpp>

// JSON payloads published by the controller. All functions write into a
// caller buffer, return the payload length, or -1 if it did not fit.
namespace TelemetryCodec {
    struct NetworkInfo {
        const char* ip;        // may be null
        const char* wifi_ssid; // may be null
    };

    // Dashboard snapshot. Field names follow the legacy /data endpoint
    // (soil_raw, soil_pct, ultrasonic_cm, pump_on, auto_mode,
    // soil_threshold_raw); absent readings are encoded as null.
    int formatTelemetry(const TelemetrySnapshot& s, const NetworkInfo* net, char* out, std::size_t out_size);

    // {"command":..,"id":..,"status":"ok"|"error",["error":..,]"mode":..,"pump_on":..}
    int formatAck(const char* command, const char* request_id, const char* error,
                  const TelemetrySnapshot& s, char* out, std::size_t out_size);

    // Rejection before the command reached the controller (nothing to report)
    int formatReject(const char* command, const char* request_id, const char* error,
                     char* out, std::size_t out_size);

    // Retained device status; config_error is null when configuration is valid
    int formatStatus(unsigned long uptime_s, const char* config_error, char* out, std::size_t out_size);
}

#endif // TELEMETRY_CODEC_HPP
