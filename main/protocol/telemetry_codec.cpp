#include <main/protocol/telemetry_codec.hpp>
#include <main/control/pump_controller.hpp>
#include <mjson.h>
#include <cstdarg>
#include <cstdio>

namespace {
    // Bounded appender over a caller buffer; remembers overflow
    struct JsonWriter {
        char* buf;
        std::size_t size;
        std::size_t off;
        bool overflow;

        __attribute__((format(printf, 2, 3)))
        void append(const char* fmt, ...) {
            if (overflow) {
                return;
            }
            va_list args;
            va_start(args, fmt);
            int n = std::vsnprintf(buf + off, size - off, fmt, args);
            va_end(args);
            if (n < 0 || static_cast<std::size_t>(n) >= size - off) {
                overflow = true;
                return;
            }
            off += static_cast<std::size_t>(n);
        }
    };

    static const char* boolStr(bool v) {
        return v ? "true" : "false";
    }

    // mjson_snprintf truncates silently; a full buffer is treated as overflow
    static int checked(int n, std::size_t out_size) {
        if (n < 0 || static_cast<std::size_t>(n) + 1 >= out_size) {
            return -1;
        }
        return n;
    }
}

namespace TelemetryCodec {
    int formatTelemetry(const TelemetrySnapshot& s, const NetworkInfo* net, char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        JsonWriter w{out, out_size, 0, false};
        out[0] = '\0';

        if (s.has_soil) {
            w.append("{\"soil_raw\":%u,\"soil_smoothed\":%.1f,\"soil_pct\":%u",
                     static_cast<unsigned>(s.soil_raw),
                     static_cast<double>(s.soil_smoothed),
                     static_cast<unsigned>(s.soil_percent));
        } else {
            w.append("{\"soil_raw\":null,\"soil_smoothed\":null,\"soil_pct\":null");
        }

        if (s.has_tank_distance) {
            w.append(",\"ultrasonic_cm\":%.2f,\"tank_pct\":%u,\"tank_volume_cm3\":%lu",
                     static_cast<double>(s.tank_distance_cm),
                     static_cast<unsigned>(s.tank_level_percent),
                     static_cast<unsigned long>(s.tank_volume_cm3));
        } else {
            w.append(",\"ultrasonic_cm\":null,\"tank_pct\":null,\"tank_volume_cm3\":null");
        }
        w.append(",\"tank_capacity_cm3\":%lu,\"tank_echoes\":%u,\"tank_empty\":%s",
                 static_cast<unsigned long>(s.tank_capacity_cm3),
                 static_cast<unsigned>(s.tank_valid_samples),
                 boolStr(s.lockout));

        w.append(",\"pump_on\":%s,\"auto_mode\":%s,\"mode\":\"%s\"",
                 boolStr(s.pump_on),
                 boolStr(s.mode == ControllerMode::AUTO),
                 modeName(s.mode));
        w.append(",\"pump_state_s\":%lu,\"last_reason\":\"%s\",\"transitions\":%lu",
                 static_cast<unsigned long>(s.pump_state_ms / 1000U),
                 decisionName(s.last_decision),
                 static_cast<unsigned long>(s.transitions));
        w.append(",\"soil_threshold_raw\":%u,\"uptime_s\":%lu",
                 static_cast<unsigned>(s.legacy_threshold_raw),
                 static_cast<unsigned long>(s.uptime_ms / 1000U));

        if (net != nullptr && net->ip != nullptr) {
            w.append(",\"ip\":\"%s\"", net->ip);
        }
        if (net != nullptr && net->wifi_ssid != nullptr) {
            w.append(",\"wifi_ssid\":\"%s\"", net->wifi_ssid);
        }
        w.append("}");

        if (w.overflow) {
            return -1;
        }
        return static_cast<int>(w.off);
    }

    int formatAck(const char* command, const char* request_id, const char* error,
                  const TelemetrySnapshot& s, char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        const bool ok = (error == nullptr);
        int n = mjson_snprintf(out, out_size,
                               "{%Q:%Q,%Q:%Q,%Q:%Q,%Q:%Q,%Q:%Q,%Q:%B,%Q:%B}",
                               "command", command != nullptr ? command : "",
                               "id", request_id != nullptr ? request_id : "",
                               "status", ok ? "ok" : "error",
                               "error", ok ? "" : error,
                               "mode", modeName(s.mode),
                               "pump_on", s.pump_on ? 1 : 0,
                               "lockout", s.lockout ? 1 : 0);
        return checked(n, out_size);
    }

    int formatReject(const char* command, const char* request_id, const char* error,
                     char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        int n = mjson_snprintf(out, out_size, "{%Q:%Q,%Q:%Q,%Q:%Q,%Q:%Q}",
                               "command", command != nullptr ? command : "",
                               "id", request_id != nullptr ? request_id : "",
                               "status", "error",
                               "error", error != nullptr ? error : "rejected");
        return checked(n, out_size);
    }

    int formatStatus(unsigned long uptime_s, const char* config_error, char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return -1;
        }
        int n;
        if (config_error == nullptr) {
            n = std::snprintf(out, out_size, "{\"status\":\"online\",\"uptime_s\":%lu}", uptime_s);
        } else {
            n = mjson_snprintf(out, out_size, "{%Q:%Q,%Q:%Q,%Q:%d}",
                               "status", "config_error",
                               "error", config_error,
                               "uptime_s", static_cast<int>(uptime_s));
        }
        return checked(n, out_size);
    }
}
