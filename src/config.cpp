#include "config.hpp"

// Default values can be overridden at build time using PlatformIO build flags, e.g.:
// build_flags =
//   -DWIFI_SSID_VALUE=\"your-ssid\"
//   -DWIFI_PASSWORD_VALUE=\"your-password\"
//   -DWEB_AUTH_USERNAME_VALUE=\"admin\"
//   -DWEB_AUTH_PASSWORD_VALUE=\"secret\"
//   -DBLE_MAX_CONNECTIONS_VALUE=2
//   -DSESSION_IDLE_TIMEOUT_MS_VALUE=300000

#ifndef WIFI_SSID_VALUE
#define WIFI_SSID_VALUE "xxx"
#endif

#ifndef WIFI_PASSWORD_VALUE
#define WIFI_PASSWORD_VALUE "xxx"
#endif

#ifndef WEB_AUTH_USERNAME_VALUE
#define WEB_AUTH_USERNAME_VALUE ""
#endif

#ifndef WEB_AUTH_PASSWORD_VALUE
#define WEB_AUTH_PASSWORD_VALUE ""
#endif

#ifndef HTTP_PORT_VALUE
#define HTTP_PORT_VALUE 80
#endif

#ifndef BLE_DEVICE_NAME_VALUE
#define BLE_DEVICE_NAME_VALUE "Prana-Bridge"
#endif

#ifndef BLE_MAX_CONNECTIONS_VALUE
#define BLE_MAX_CONNECTIONS_VALUE 4
#endif

#ifndef BLE_SETTLE_DELAY_MS_VALUE
#define BLE_SETTLE_DELAY_MS_VALUE 600
#endif

#ifndef CONNECT_ATTEMPTS_VALUE
#define CONNECT_ATTEMPTS_VALUE 3
#endif

#ifndef CONNECT_BACKOFF_BASE_MS_VALUE
#define CONNECT_BACKOFF_BASE_MS_VALUE 250
#endif

#ifndef CONNECT_BACKOFF_MAX_MS_VALUE
#define CONNECT_BACKOFF_MAX_MS_VALUE 2000
#endif

#ifndef CONNECT_TIMEOUT_MS_VALUE
#define CONNECT_TIMEOUT_MS_VALUE 5000
#endif

#ifndef COMMAND_RETRIES_VALUE
#define COMMAND_RETRIES_VALUE 2
#endif

#ifndef RESPONSE_TIMEOUT_MS_VALUE
#define RESPONSE_TIMEOUT_MS_VALUE 2000
#endif

#ifndef REQUEST_TIMEOUT_MS_VALUE
#define REQUEST_TIMEOUT_MS_VALUE 10000
#endif

#ifndef STATE_STALENESS_MS_VALUE
#define STATE_STALENESS_MS_VALUE 5000
#endif

#ifndef SESSION_IDLE_TIMEOUT_MS_VALUE
#define SESSION_IDLE_TIMEOUT_MS_VALUE 120000
#endif

#ifndef SESSION_MAX_FAILURES_VALUE
#define SESSION_MAX_FAILURES_VALUE 5
#endif

#ifndef DISCOVERY_INTERVAL_MS_VALUE
#define DISCOVERY_INTERVAL_MS_VALUE 300000
#endif

#ifndef DISCOVERY_SCAN_SECONDS_VALUE
#define DISCOVERY_SCAN_SECONDS_VALUE 5
#endif

#ifndef MAINTENANCE_PERIOD_MS_VALUE
#define MAINTENANCE_PERIOD_MS_VALUE 10000
#endif

#ifndef DEVICE_WORKER_TASKS_VALUE
#define DEVICE_WORKER_TASKS_VALUE 4
#endif

#ifndef DEVICE_JOB_QUEUE_LENGTH_VALUE
#define DEVICE_JOB_QUEUE_LENGTH_VALUE 16
#endif

const char* WIFI_SSID = WIFI_SSID_VALUE;
const char* WIFI_PASSWORD = WIFI_PASSWORD_VALUE;

const char* WEB_AUTH_USERNAME = WEB_AUTH_USERNAME_VALUE;
const char* WEB_AUTH_PASSWORD = WEB_AUTH_PASSWORD_VALUE;

const uint16_t HTTP_PORT = HTTP_PORT_VALUE;

const char* BLE_DEVICE_NAME = BLE_DEVICE_NAME_VALUE;
const uint8_t BLE_MAX_CONNECTIONS = BLE_MAX_CONNECTIONS_VALUE;
const uint32_t BLE_SETTLE_DELAY_MS = BLE_SETTLE_DELAY_MS_VALUE;

const uint8_t CONNECT_ATTEMPTS = CONNECT_ATTEMPTS_VALUE;
const uint32_t CONNECT_BACKOFF_BASE_MS = CONNECT_BACKOFF_BASE_MS_VALUE;
const uint32_t CONNECT_BACKOFF_MAX_MS = CONNECT_BACKOFF_MAX_MS_VALUE;
const uint32_t CONNECT_TIMEOUT_MS = CONNECT_TIMEOUT_MS_VALUE;
const uint8_t COMMAND_RETRIES = COMMAND_RETRIES_VALUE;
const uint32_t RESPONSE_TIMEOUT_MS = RESPONSE_TIMEOUT_MS_VALUE;
const uint32_t REQUEST_TIMEOUT_MS = REQUEST_TIMEOUT_MS_VALUE;
const uint32_t STATE_STALENESS_MS = STATE_STALENESS_MS_VALUE;

const uint32_t SESSION_IDLE_TIMEOUT_MS = SESSION_IDLE_TIMEOUT_MS_VALUE;
const uint8_t SESSION_MAX_FAILURES = SESSION_MAX_FAILURES_VALUE;

const uint32_t DISCOVERY_INTERVAL_MS = DISCOVERY_INTERVAL_MS_VALUE;
const uint32_t DISCOVERY_SCAN_SECONDS = DISCOVERY_SCAN_SECONDS_VALUE;

const uint32_t MAINTENANCE_PERIOD_MS = MAINTENANCE_PERIOD_MS_VALUE;

const uint8_t DEVICE_WORKER_TASKS = DEVICE_WORKER_TASKS_VALUE;
const uint8_t DEVICE_JOB_QUEUE_LENGTH = DEVICE_JOB_QUEUE_LENGTH_VALUE;
