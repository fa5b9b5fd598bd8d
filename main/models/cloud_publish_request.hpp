// Fixed-size MQTT publish request handed from the control task (command
// acknowledgements) and the MQTT callback (rejections) to the cloud task.
#ifndef CLOUD_PUBLISH_REQUEST_HPP
#define CLOUD_PUBLISH_REQUEST_HPP

#include <cstdint>

struct CloudPublishRequest {
    char topic[96];
    char payload[256];
};

#endif // CLOUD_PUBLISH_REQUEST_HPP
