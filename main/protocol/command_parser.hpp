#ifndef COMMAND_PARSER_HPP
#define COMMAND_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/command.hpp>

enum class CommandError : uint8_t {
    NONE = 0,
    MALFORMED,        // empty, oversized or not a JSON object
    MISSING_COMMAND,  // no "command" string
    UNKNOWN_COMMAND,
    MISSING_VALUE,    // command without its parameter
    INVALID_VALUE     // parameter present but not acceptable
};

struct ParsedCommand {
    CommandError error;
    Command      command;  // valid only when error == NONE
    char         name[24]; // "command" field as received, may be empty
};

// Incoming MQTT command payloads:
//   {"command":"set_pump","state":"on"|"off"|true|false}
//   {"command":"set_mode","mode":"auto"|"manual"}
//   {"command":"set_threshold","value":0..4095}
// Any of them may carry "id":"<string>", echoed in the acknowledgement.
namespace CommandParser {
    static constexpr int max_payload_len = 256;

    ParsedCommand parse(const char* json, int length, uint32_t now_ms);

    const char* describe(CommandError err);
    const char* commandName(CommandType type);
}

#endif // COMMAND_PARSER_HPP
