#ifndef CONTROL_TASK_HPP
#define CONTROL_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <main/control/control_thresholds.hpp>

// Owns the pump, the sensors and the PumpController. Ticks every
// Config::Tasks::Control::period_ms and applies queued commands in between.
namespace ControlTask {
    // command_queue:   Command, from the cloud task
    // telemetry_queue: TelemetrySnapshot, length 1, overwritten every tick
    // ack_queue:       CloudPublishRequest, command acknowledgements
    void create(QueueHandle_t command_queue,
                QueueHandle_t telemetry_queue,
                QueueHandle_t ack_queue,
                const ControlThresholds& thresholds);
}

#endif // CONTROL_TASK_HPP
