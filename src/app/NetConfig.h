#pragma once

#ifndef WIFI_SSID
#define WIFI_SSID ""
#endif

#ifndef WIFI_PASSWORD
#define WIFI_PASSWORD ""
#endif

#ifndef MQTT_BROKER
#define MQTT_BROKER "192.168.1.10"
#endif

#ifndef MQTT_PORT
#define MQTT_PORT 1883
#endif

#ifndef MQTT_USERNAME
#define MQTT_USERNAME ""
#endif

#ifndef MQTT_PASSWORD
#define MQTT_PASSWORD ""
#endif

#ifndef MQTT_CLIENT_ID
#define MQTT_CLIENT_ID "stoker-bridge-esp32"
#endif

#ifndef MQTT_KEEPALIVE_S
#define MQTT_KEEPALIVE_S 30
#endif

#ifndef MQTT_SOCKET_TIMEOUT_S
#define MQTT_SOCKET_TIMEOUT_S 2
#endif

#ifndef WIFI_RECONNECT_MS
#define WIFI_RECONNECT_MS 5000
#endif

#ifndef MQTT_RECONNECT_MS
#define MQTT_RECONNECT_MS 3000
#endif

#ifndef MQTT_TOPIC_BASE
#define MQTT_TOPIC_BASE "stoker"
#endif

#ifndef MQTT_DISCOVERY_PREFIX
#define MQTT_DISCOVERY_PREFIX "homeassistant"
#endif

// Room for the event-log attributes plus topic and MQTT header.
#ifndef MQTT_EXTRA_BUFFER
#define MQTT_EXTRA_BUFFER 1024
#endif

#ifndef STATUS_HEARTBEAT_MS
#define STATUS_HEARTBEAT_MS 60000
#endif

#ifndef SETUP_RETRY_MS
#define SETUP_RETRY_MS 60000
#endif

#ifndef NVS_NAMESPACE
#define NVS_NAMESPACE "stoker"
#endif
