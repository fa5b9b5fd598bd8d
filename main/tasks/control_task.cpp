#include <main/tasks/control_task.hpp>
#include <freertos/task.h>
#include <esp_timer.h>
#include <main/config/config.hpp>
#include <main/control/pump_controller.hpp>
#include <main/hardware/pump_relay.hpp>
#include <main/hardware/soil_moisture_sensor.hpp>
#include <main/hardware/ultrasonic_sensor.hpp>
#include <main/models/command.hpp>
#include <main/models/cloud_publish_request.hpp>
#include <main/models/telemetry_snapshot.hpp>
#include <main/protocol/command_parser.hpp>
#include <main/protocol/telemetry_codec.hpp>
#include <main/state/settings_store.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>
#include <cstdio>

namespace {
    static const char* TAG = "CONTROL";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[6144 / sizeof(StackType_t)];

    static QueueHandle_t s_command_queue = nullptr;
    static QueueHandle_t s_telemetry_queue = nullptr;
    static QueueHandle_t s_ack_queue = nullptr;
    static ControlThresholds s_thresholds{};

    static uint32_t nowMs() {
        return static_cast<uint32_t>(esp_timer_get_time() / 1000ULL);
    }

    static void publishSnapshot(const PumpController& controller) {
        TelemetrySnapshot snap = controller.snapshot(nowMs());
        (void)xQueueOverwrite(s_telemetry_queue, &snap);
    }

    static void enqueueAck(const Command& cmd, const char* error, const PumpController& controller) {
        if (s_ack_queue == nullptr) {
            return;
        }
        CloudPublishRequest req{};
        std::snprintf(req.topic, sizeof(req.topic), Config::Mqtt::Topics::CMD_ACK, Config::Device::id);
        const TelemetrySnapshot snap = controller.snapshot(nowMs());
        const char* id = (cmd.request_id[0] != '\0') ? cmd.request_id : nullptr;
        if (TelemetryCodec::formatAck(CommandParser::commandName(cmd.type), id, error,
                                      snap, req.payload, sizeof(req.payload)) < 0) {
            LOG_WARN(TAG, "%s", "Ack payload did not fit, dropped");
            return;
        }
        if (xQueueSend(s_ack_queue, &req, 0) != pdTRUE) {
            LOG_WARN(TAG, "%s", "ack_queue full, dropped acknowledgement");
        }
    }

    static void handleCommand(PumpController& controller, const Command& cmd) {
        const char* error = nullptr;
        switch (cmd.type) {
            case CommandType::SET_PUMP: {
                const bool on = (cmd.value != 0);
                PumpDecision d = controller.setManual(on, nowMs());
                if (d == PumpDecision::NONE) {
                    LOG_INFO(TAG, "Manual pump %s (already there)", on ? "ON" : "OFF");
                } else {
                    LOG_INFO(TAG, "Pump %s (%s)", on ? "ON" : "OFF", decisionName(d));
                }
                break;
            }
            case CommandType::SET_MODE: {
                const ControllerMode mode = (cmd.value == static_cast<int32_t>(ControllerMode::MANUAL))
                                                ? ControllerMode::MANUAL
                                                : ControllerMode::AUTO;
                if (controller.setMode(mode)) {
                    LOG_INFO(TAG, "Mode -> %s", modeName(mode));
                }
                break;
            }
            case CommandType::SET_LEGACY_THRESHOLD: {
                const uint16_t raw = static_cast<uint16_t>(cmd.value);
                controller.setLegacyThreshold(raw);
                if (!SettingsStore::saveLegacyThreshold(raw)) {
                    error = "not persisted";
                }
                LOG_INFO(TAG, "Legacy threshold -> %u", static_cast<unsigned>(raw));
                break;
            }
            case CommandType::NONE:
                LOG_WARN(TAG, "%s", "Ignoring empty command");
                return;
        }
        enqueueAck(cmd, error, controller);
        publishSnapshot(controller);
    }

    static void runTick(PumpController& controller, SoilMoistureSensor& soil,
                        bool soil_ready, UltrasonicSensor& tank) {
        TickInputs in{};
        in.has_soil = soil_ready && soil.read(nowMs(), in.soil);
        if (soil_ready && !in.has_soil) {
            LOG_WARN(TAG, "%s", "Soil read failed");
        }
        tank.read(nowMs(), in.tank);

        const uint32_t now = nowMs();
        const TickResult r = controller.tick(now, in);

        if (r.lockout_changed) {
            if (controller.state().lockout) {
                LOG_WARN(TAG, "Tank empty (%.1f cm), pump locked out",
                         static_cast<double>(in.tank.distance_cm));
            } else {
                LOG_INFO(TAG, "%s", "Tank lockout cleared");
            }
        }
        if (r.decision != PumpDecision::NONE) {
            LOG_INFO(TAG, "Pump %s (%s) soil=%u%%",
                     controller.pumpOn() ? "ON" : "OFF",
                     decisionName(r.decision),
                     in.has_soil ? static_cast<unsigned>(in.soil.percent) : 0U);
        }
        LOG_DEBUG(TAG, "raw=%u pct=%u tank=%s%.1f cm echoes=%u pump=%d mode=%s",
                  static_cast<unsigned>(in.soil.raw),
                  static_cast<unsigned>(in.soil.percent),
                  in.tank.has_distance ? "" : "~",
                  static_cast<double>(in.tank.distance_cm),
                  static_cast<unsigned>(in.tank.valid_samples),
                  controller.pumpOn() ? 1 : 0,
                  modeName(controller.mode()));

        publishSnapshot(controller);
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Control Task started");

        static PumpRelay relay(Config::Hardware::Pins::pump_gpio, Config::Hardware::Pins::pump_active_high);
        static SoilMoistureSensor soil{ SoilMoistureSensor::Config{
            Config::Hardware::Moisture::unit,
            Config::Hardware::Moisture::channel,
            Config::Hardware::Moisture::attenuation,
            Config::Hardware::Moisture::sample_count,
            Config::Hardware::Moisture::sample_delay_ms,
            s_thresholds.raw_dry,
            s_thresholds.raw_wet,
            s_thresholds.ema_alpha
        }};
        static UltrasonicSensor tank{ UltrasonicSensor::Config{
            Config::Hardware::Pins::ultrasonic_trig_gpio,
            Config::Hardware::Pins::ultrasonic_echo_gpio,
            Config::Hardware::Tank::pulse_count,
            Config::Hardware::Tank::echo_timeout_us,
            Config::Hardware::Tank::pulse_gap_ms,
            s_thresholds.tank_empty_distance_cm
        }};
        static PumpController controller(s_thresholds, &relay);

        // Nothing runs until the pump is known to be OFF
        while (!relay.init()) {
            LOG_ERROR(TAG, "%s", "Pump relay GPIO init failed; retrying");
            vTaskDelay(pdMS_TO_TICKS(2000));
        }
        bool soil_ready = soil.init();
        if (!soil_ready) {
            LOG_WARN(TAG, "%s", "ADC init failed; will retry");
        }
        if (!tank.init()) {
            LOG_WARN(TAG, "%s", "Ultrasonic GPIO init failed; readings will be invalid");
        }

        controller.begin(nowMs(), SettingsStore::loadLegacyThreshold(Config::Control::legacy_threshold_raw));
        publishSnapshot(controller);

        (void)Watchdog::subscribe();

        const TickType_t period = pdMS_TO_TICKS(Config::Tasks::Control::period_ms);
        TickType_t last_wake = xTaskGetTickCount();

        for (;;) {
            Watchdog::feed();

            if (!soil_ready) {
                soil_ready = soil.init();
                if (soil_ready) {
                    LOG_INFO(TAG, "%s", "ADC init successful");
                }
            }
            runTick(controller, soil, soil_ready, tank);

            // Serve commands until the next tick is due
            for (;;) {
                const TickType_t elapsed = xTaskGetTickCount() - last_wake;
                if (elapsed >= period) {
                    break;
                }
                Command cmd;
                if (xQueueReceive(s_command_queue, &cmd, period - elapsed) == pdTRUE) {
                    handleCommand(controller, cmd);
                }
            }
            last_wake += period;
            // A tick that overran a whole period restarts the schedule
            if (xTaskGetTickCount() - last_wake >= period) {
                LOG_WARN(TAG, "%s", "Control tick overran its period");
                last_wake = xTaskGetTickCount();
            }
        }
    }
}

namespace ControlTask {
    void create(QueueHandle_t command_queue,
                QueueHandle_t telemetry_queue,
                QueueHandle_t ack_queue,
                const ControlThresholds& thresholds) {
        s_command_queue = command_queue;
        s_telemetry_queue = telemetry_queue;
        s_ack_queue = ack_queue;
        s_thresholds = thresholds;
        xTaskCreateStatic(taskFunction,
                          "control",
                          sizeof(s_task_stack) / sizeof(StackType_t),
                          nullptr,
                          Config::TaskPriorities::HIGH,
                          s_task_stack,
                          &s_task_tcb);
    }
}
