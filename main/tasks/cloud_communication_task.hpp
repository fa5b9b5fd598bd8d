#ifndef CLOUD_COMMUNICATION_TASK_HPP
#define CLOUD_COMMUNICATION_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace CloudCommunicationTask {
    // command_queue may be null when the control task is not running; incoming
    // commands are then rejected. config_error is null for a valid
    // configuration and otherwise reported in the retained status message.
    void create(QueueHandle_t command_queue,
                QueueHandle_t telemetry_queue,
                QueueHandle_t ack_queue,
                const char* config_error);
}

#endif // CLOUD_COMMUNICATION_TASK_HPP
