#include <main/protocol/command_parser.hpp>
#include <main/models/pump_state.hpp>
#include <main/config/control_config.hpp>
#include <mjson.h>
#include <cmath>
#include <cstring>

namespace {
    static bool parseSwitch(const char* json, int len, bool& on) {
        const char* tok = nullptr;
        int tok_len = 0;
        int type = mjson_find(json, len, "$.state", &tok, &tok_len);
        if (type == MJSON_TOK_TRUE) { on = true; return true; }
        if (type == MJSON_TOK_FALSE) { on = false; return true; }
        if (type != MJSON_TOK_STRING) {
            return false;
        }
        char value[8];
        if (mjson_get_string(json, len, "$.state", value, sizeof(value)) <= 0) {
            return false;
        }
        if (std::strcmp(value, "on") == 0) { on = true; return true; }
        if (std::strcmp(value, "off") == 0) { on = false; return true; }
        return false;
    }

    static bool hasField(const char* json, int len, const char* path) {
        const char* tok = nullptr;
        int tok_len = 0;
        return mjson_find(json, len, path, &tok, &tok_len) != MJSON_TOK_INVALID;
    }

    static CommandError parsePump(const char* json, int len, Command& cmd) {
        if (!hasField(json, len, "$.state")) {
            return CommandError::MISSING_VALUE;
        }
        bool on = false;
        if (!parseSwitch(json, len, on)) {
            return CommandError::INVALID_VALUE;
        }
        cmd.type = CommandType::SET_PUMP;
        cmd.value = on ? 1 : 0;
        return CommandError::NONE;
    }

    static CommandError parseMode(const char* json, int len, Command& cmd) {
        if (!hasField(json, len, "$.mode")) {
            return CommandError::MISSING_VALUE;
        }
        char mode[12];
        if (mjson_get_string(json, len, "$.mode", mode, sizeof(mode)) <= 0) {
            return CommandError::INVALID_VALUE;
        }
        if (std::strcmp(mode, "auto") == 0) {
            cmd.value = static_cast<int32_t>(ControllerMode::AUTO);
        } else if (std::strcmp(mode, "manual") == 0) {
            cmd.value = static_cast<int32_t>(ControllerMode::MANUAL);
        } else {
            return CommandError::INVALID_VALUE;
        }
        cmd.type = CommandType::SET_MODE;
        return CommandError::NONE;
    }

    static CommandError parseThreshold(const char* json, int len, Command& cmd) {
        if (!hasField(json, len, "$.value")) {
            return CommandError::MISSING_VALUE;
        }
        double v = 0.0;
        if (mjson_get_number(json, len, "$.value", &v) != 1) {
            return CommandError::INVALID_VALUE;
        }
        if (v < 0.0 || v > static_cast<double>(Config::Calibration::adc_max) || std::floor(v) != v) {
            return CommandError::INVALID_VALUE;
        }
        cmd.type = CommandType::SET_LEGACY_THRESHOLD;
        cmd.value = static_cast<int32_t>(v);
        return CommandError::NONE;
    }
}

namespace CommandParser {
    ParsedCommand parse(const char* json, int length, uint32_t now_ms) {
        ParsedCommand out{};
        out.error = CommandError::MALFORMED;
        out.command.type = CommandType::NONE;
        out.command.timestamp_ms = now_ms;

        if (json == nullptr || length <= 0 || length > max_payload_len) {
            return out;
        }
        const char* tok = nullptr;
        int tok_len = 0;
        if (mjson_find(json, length, "$", &tok, &tok_len) != MJSON_TOK_OBJECT) {
            return out;
        }

        // Optional correlation id; oversized ids are dropped, not rejected
        if (mjson_get_string(json, length, "$.id", out.command.request_id,
                             sizeof(out.command.request_id)) < 0) {
            out.command.request_id[0] = '\0';
        }

        if (mjson_get_string(json, length, "$.command", out.name, sizeof(out.name)) <= 0) {
            out.name[0] = '\0';
            out.error = CommandError::MISSING_COMMAND;
            return out;
        }

        if (std::strcmp(out.name, "set_pump") == 0) {
            out.error = parsePump(json, length, out.command);
        } else if (std::strcmp(out.name, "set_mode") == 0) {
            out.error = parseMode(json, length, out.command);
        } else if (std::strcmp(out.name, "set_threshold") == 0) {
            out.error = parseThreshold(json, length, out.command);
        } else {
            out.error = CommandError::UNKNOWN_COMMAND;
        }
        if (out.error != CommandError::NONE) {
            out.command.type = CommandType::NONE;
            out.command.value = 0;
        }
        return out;
    }

    const char* describe(CommandError err) {
        switch (err) {
            case CommandError::NONE:            return "ok";
            case CommandError::MALFORMED:       return "malformed payload";
            case CommandError::MISSING_COMMAND: return "missing command";
            case CommandError::UNKNOWN_COMMAND: return "unknown command";
            case CommandError::MISSING_VALUE:   return "missing parameter";
            case CommandError::INVALID_VALUE:   return "invalid parameter";
        }
        return "unknown";
    }

    const char* commandName(CommandType type) {
        switch (type) {
            case CommandType::SET_PUMP:             return "set_pump";
            case CommandType::SET_MODE:             return "set_mode";
            case CommandType::SET_LEGACY_THRESHOLD: return "set_threshold";
            case CommandType::NONE:                 break;
        }
        return "none";
    }
}
