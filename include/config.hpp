#pragma once

#include <cstdint>

// Wi-Fi credentials
extern const char* WIFI_SSID;
extern const char* WIFI_PASSWORD;

// Web authentication (Basic Auth, empty username disables it)
extern const char* WEB_AUTH_USERNAME;
extern const char* WEB_AUTH_PASSWORD;

// HTTP API
extern const uint16_t HTTP_PORT;

// BLE radio
extern const char* BLE_DEVICE_NAME;
extern const uint8_t BLE_MAX_CONNECTIONS;     // simultaneous device links (max 4)
extern const uint32_t BLE_SETTLE_DELAY_MS;    // wait before reading a reply back

// Device session policy
extern const uint8_t CONNECT_ATTEMPTS;
extern const uint32_t CONNECT_BACKOFF_BASE_MS;
extern const uint32_t CONNECT_BACKOFF_MAX_MS;
extern const uint32_t CONNECT_TIMEOUT_MS;
extern const uint8_t COMMAND_RETRIES;
extern const uint32_t RESPONSE_TIMEOUT_MS;
extern const uint32_t REQUEST_TIMEOUT_MS;     // how long an API caller may wait
extern const uint32_t STATE_STALENESS_MS;     // cached state younger than this is served as is

// Session lifecycle
extern const uint32_t SESSION_IDLE_TIMEOUT_MS;
extern const uint8_t SESSION_MAX_FAILURES;    // 0 = never evict for failures

// Discovery
extern const uint32_t DISCOVERY_INTERVAL_MS;  // 0 = only on request
extern const uint32_t DISCOVERY_SCAN_SECONDS;

// Background maintenance (idle eviction, periodic discovery)
extern const uint32_t MAINTENANCE_PERIOD_MS;

// Worker tasks that run device requests off the web server task
extern const uint8_t DEVICE_WORKER_TASKS;
extern const uint8_t DEVICE_JOB_QUEUE_LENGTH;   // pending requests before 503
