#include <Arduino.h>
#include <WiFi.h>
#include <ESPAsyncWebServer.h>
#include <ArduinoJson.h>
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>
#include <memory>
#include <vector>

// Prana device session stack
#include "PranaCore.hpp"

#include "config.hpp"

// Web server
AsyncWebServer server(HTTP_PORT);

// Device stack, created in setup() and kept for the lifetime of the firmware
BLECentralTransport* bleTransport = nullptr;
SessionRegistry* sessionRegistry = nullptr;
DiscoveryScanner* discoveryScanner = nullptr;
bool bleReady = false;

// WiFi reconnect interval when the link drops
const unsigned long WIFI_RETRY_INTERVAL = 30000;
unsigned long lastWiFiRetry = 0;

const char* DEVICES_PATH = "/api/devices/";

// Fields of a PUT /api/devices/{addr}/state body, validated before queueing
struct DesiredState {
  bool hasPower = false;
  bool power = false;
  bool hasSpeed = false;
  uint8_t speed = 0;
  bool hasHeating = false;
  bool heating = false;
  bool hasWinter = false;
  bool winter = false;
  bool hasFlowsLocked = false;
  bool flowsLocked = false;
  String mode;
};

// Device request handed from an HTTP handler to a worker task.
// The worker answers the request unless the client went away first.
struct DeviceJob {
  enum class Kind {
    ReadState,
    Command,
    SetState,
    Remove,
    Discover
  };

  Kind kind = Kind::ReadState;
  String address;
  std::shared_ptr<DeviceSession> session;
  bool fresh = false;
  PranaCommand command = PranaCommand::ReadState;
  DesiredState desired;
  uint32_t scanSeconds = 0;

  AsyncWebServerRequest* request = nullptr;  // guarded by jobLock, cleared on disconnect
  int status = 500;
  String response;
};

// Device worker tasks block on BLE so the async_tcp task never does
QueueHandle_t deviceJobs = nullptr;
SemaphoreHandle_t jobLock = nullptr;
const uint32_t DEVICE_WORKER_STACK_SIZE = 8192;

// prototype declarations
void initWiFi();
void initDeviceStack();
void initDeviceWorkers();
void initWebServer();
bool ensureAuthenticated(AsyncWebServerRequest* request);
uint64_t firmwareMillis();
void firmwareDelay(uint32_t ms);
int httpStatusFor(PranaError error);
String errorBody(const char* message);
String stateBody(const String& address, const DeviceState& state);
String discoveryBody(const std::vector<DeviceInfo>& found);
void sendJsonError(AsyncWebServerRequest* request, int status, const char* message);
void writeState(JsonObject obj, const DeviceState& state);
void writeDeviceSummary(JsonObject obj, const DeviceSummary& summary);
bool parseDevicePath(const String& url, String& address, String& action);
std::shared_ptr<DeviceSession> sessionForRequest(AsyncWebServerRequest* request, const char* expectedAction,
                                                 bool create);
bool parseDesiredState(JsonDocument& doc, DesiredState& desired, const char*& problem);
PranaError applyDesiredState(DeviceSession& session, const DesiredState& desired, DeviceState& state);
void queueDeviceJob(AsyncWebServerRequest* request, const std::shared_ptr<DeviceJob>& job);
void runDeviceJob(DeviceJob& job);
void deviceWorkerTask(void* parameter);

void setup() {
  Serial.begin(115200);
  delay(1000);

  Serial.println("\n\n========================================");
  Serial.println("   Prana BLE Bridge Starting...");
  Serial.println("========================================");

  // Initialize WiFi
  initWiFi();

  // Initialize BLE transport, session registry and discovery
  initDeviceStack();
  initDeviceWorkers();

  // Initialize web server
  initWebServer();

  Serial.println("System ready!");
  Serial.print("Access API at: http://");
  Serial.println(WiFi.localIP());
}

void loop() {
  static unsigned long lastMaintenance = 0;
  unsigned long currentTime = millis();

  if (WiFi.status() != WL_CONNECTED && currentTime - lastWiFiRetry >= WIFI_RETRY_INTERVAL) {
    lastWiFiRetry = currentTime;
    Serial.println("WiFi disconnected, reconnecting...");
    WiFi.reconnect();
  }

  // Idle eviction and periodic discovery run here, away from the async web server task
  if (bleReady && currentTime - lastMaintenance >= MAINTENANCE_PERIOD_MS) {
    lastMaintenance = currentTime;

    size_t evicted = sessionRegistry->evictIdle(SESSION_IDLE_TIMEOUT_MS);
    if (evicted > 0) {
      Serial.printf("Maintenance: evicted %u session(s), %u remaining\n",
                    (unsigned int)evicted, (unsigned int)sessionRegistry->size());
    }

    if (DISCOVERY_INTERVAL_MS > 0) {
      discoveryScanner->maintain();
    }
  }

  delay(10);
}

void initWiFi() {
  Serial.println("Connecting to WiFi...");
  WiFi.mode(WIFI_STA);
  WiFi.begin(WIFI_SSID, WIFI_PASSWORD);

  int attempts = 0;
  while (WiFi.status() != WL_CONNECTED && attempts < 30) {
    delay(1000);
    Serial.print(".");
    attempts++;
  }

  if (WiFi.status() == WL_CONNECTED) {
    Serial.println("\nWiFi connected!");
    Serial.print("IP address: ");
    Serial.println(WiFi.localIP());
  } else {
    Serial.println("\nFailed to connect to WiFi!");
  }
}

uint64_t firmwareMillis() {
  // millis() wraps after ~49 days; the session policies need a monotonic 64-bit clock
  return static_cast<uint64_t>(esp_timer_get_time() / 1000);
}

void firmwareDelay(uint32_t ms) {
  delay(ms);
}

void initDeviceStack() {
  Serial.println("Initializing Prana device stack...");
  Serial.printf("Free heap before init: %d bytes\n", ESP.getFreeHeap());

  BLECentralTransport::Config transportConfig;
  transportConfig.deviceName = BLE_DEVICE_NAME;
  transportConfig.maxConnections = BLE_MAX_CONNECTIONS;
  transportConfig.settleDelayMs = BLE_SETTLE_DELAY_MS;

  bleTransport = new BLECentralTransport(transportConfig);
  if (!bleTransport->init()) {
    Serial.println("ERROR: BLE initialization failed, device API disabled");
    return;
  }

  SessionRegistry::Config registryConfig;
  registryConfig.session.connectAttempts = CONNECT_ATTEMPTS;
  registryConfig.session.backoffBaseMs = CONNECT_BACKOFF_BASE_MS;
  registryConfig.session.backoffMaxMs = CONNECT_BACKOFF_MAX_MS;
  registryConfig.session.connectTimeoutMs = CONNECT_TIMEOUT_MS;
  registryConfig.session.commandRetries = COMMAND_RETRIES;
  registryConfig.session.responseTimeoutMs = RESPONSE_TIMEOUT_MS;
  registryConfig.session.waitTimeoutMs = REQUEST_TIMEOUT_MS;
  registryConfig.session.stalenessMs = STATE_STALENESS_MS;
  registryConfig.session.millis = firmwareMillis;
  registryConfig.session.delay = firmwareDelay;
  registryConfig.idleTimeoutMs = SESSION_IDLE_TIMEOUT_MS;
  registryConfig.maxConsecutiveFailures = SESSION_MAX_FAILURES;

  sessionRegistry = new SessionRegistry(*bleTransport, registryConfig);

  DiscoveryScanner::Config scannerConfig;
  scannerConfig.scanSeconds = DISCOVERY_SCAN_SECONDS;
  scannerConfig.intervalMs = DISCOVERY_INTERVAL_MS;
  scannerConfig.millis = firmwareMillis;

  discoveryScanner = new DiscoveryScanner(*bleTransport, *sessionRegistry, scannerConfig);
  bleReady = true;

  Serial.printf("Device stack ready (max %d links)\n", BLE_MAX_CONNECTIONS);
  Serial.printf("Free heap after init: %d bytes\n", ESP.getFreeHeap());
}


void initDeviceWorkers() {
  if (!bleReady) {
    return;
  }

  jobLock = xSemaphoreCreateRecursiveMutex();
  deviceJobs = xQueueCreate(DEVICE_JOB_QUEUE_LENGTH, sizeof(std::shared_ptr<DeviceJob>*));
  if (jobLock == nullptr || deviceJobs == nullptr) {
    Serial.println("ERROR: could not create device job queue, device API disabled");
    bleReady = false;
    return;
  }

  int started = 0;
  for (uint8_t i = 0; i < DEVICE_WORKER_TASKS; i++) {
    char name[16];
    snprintf(name, sizeof(name), "DeviceWorker%u", (unsigned int)i);
    if (xTaskCreate(deviceWorkerTask, name, DEVICE_WORKER_STACK_SIZE, nullptr, 1, nullptr) == pdPASS) {
      started++;
    } else {
      Serial.printf("WARNING: could not start %s\n", name);
    }
  }

  if (started == 0) {
    Serial.println("ERROR: no device worker task running, device API disabled");
    bleReady = false;
    return;
  }
  Serial.printf("Started %d device worker task(s)\n", started);
}

bool ensureAuthenticated(AsyncWebServerRequest* request) {
  if (strlen(WEB_AUTH_USERNAME) == 0 || strlen(WEB_AUTH_PASSWORD) == 0) {
    return true;
  }

  if (request->authenticate(WEB_AUTH_USERNAME, WEB_AUTH_PASSWORD)) {
    return true;
  }

  request->requestAuthentication();
  return false;
}

int httpStatusFor(PranaError error) {
  switch (error) {
    case PranaError::None: return 200;
    case PranaError::InvalidArgument: return 400;
    case PranaError::SessionClosed: return 410;
    case PranaError::ProtocolError:
    case PranaError::MalformedFrame:
    case PranaError::UnexpectedCommand: return 502;
    case PranaError::Timeout:
    case PranaError::TransportTimeout: return 504;
    case PranaError::DeviceUnreachable:
    case PranaError::ConnectionError:
    case PranaError::TransportError:
    case PranaError::DiscoveryError: return 503;
    default: return 500;
  }
}

String errorBody(const char* message) {
  JsonDocument doc;
  doc["error"] = message;

  String response;
  serializeJson(doc, response);
  return response;
}

void sendJsonError(AsyncWebServerRequest* request, int status, const char* message) {
  request->send(status, "application/json", errorBody(message));
}

void writeState(JsonObject obj, const DeviceState& state) {
  obj["valid"] = state.valid;
  obj["power"] = state.powerOn;
  obj["speed"] = state.speed;
  obj["speedIn"] = state.speedIn;
  obj["speedOut"] = state.speedOut;
  obj["mode"] = operatingModeToString(state.mode);
  obj["flow"] = flowDirectionToString(state.flowDirection);
  obj["flowsLocked"] = state.flowsLocked;
  obj["heating"] = state.heatingOn;
  obj["winter"] = state.winterMode;
  obj["inputFan"] = state.inputFanOn;
  obj["outputFan"] = state.outputFanOn;
  if (state.hasSensors) {
    JsonObject sensors = obj["sensors"].to<JsonObject>();
    sensors["indoorTemp"] = state.indoorTempC;
    sensors["outdoorTemp"] = state.outdoorTempC;
    sensors["humidity"] = state.humidityPercent;
  }
  obj["lastUpdatedMs"] = state.lastUpdatedMs;

  JsonObject health = obj["health"].to<JsonObject>();
  health["connected"] = state.health.connected;
  health["consecutiveFailures"] = state.health.consecutiveFailures;
  health["lastError"] = errorToString(state.health.lastError);
}

void writeDeviceSummary(JsonObject obj, const DeviceSummary& summary) {
  obj["address"] = summary.info.address;
  obj["name"] = summary.info.name;
  obj["advertisedName"] = summary.info.advertisedName;
  obj["rssi"] = summary.info.rssi;
  obj["session"] = DeviceSession::stateToString(summary.sessionState);
  writeState(obj["state"].to<JsonObject>(), summary.state);
}

String stateBody(const String& address, const DeviceState& state) {
  JsonDocument doc;
  doc["address"] = address;
  writeState(doc["state"].to<JsonObject>(), state);

  String response;
  serializeJson(doc, response);
  return response;
}

String discoveryBody(const std::vector<DeviceInfo>& found) {
  JsonDocument doc;
  JsonArray array = doc["devices"].to<JsonArray>();
  for (const DeviceInfo& info : found) {
    JsonObject obj = array.add<JsonObject>();
    obj["address"] = info.address;
    obj["name"] = info.name;
    obj["advertisedName"] = info.advertisedName;
    obj["rssi"] = info.rssi;
  }

  String response;
  serializeJson(doc, response);
  return response;
}

// Splits /api/devices/{address}[/{action}]
bool parseDevicePath(const String& url, String& address, String& action) {
  if (!url.startsWith(DEVICES_PATH)) {
    return false;
  }
  String rest = url.substring(strlen(DEVICES_PATH));
  int slash = rest.indexOf('/');
  if (slash < 0) {
    address = rest;
    action = "";
  } else {
    address = rest.substring(0, slash);
    action = rest.substring(slash + 1);
  }
  address.toUpperCase();
  return SessionRegistry::isValidAddress(address.c_str());
}

// Sends the error response itself and returns nullptr when the request can't be served.
// Only create=true (authenticated writes) may open a session for an unknown device.
std::shared_ptr<DeviceSession> sessionForRequest(AsyncWebServerRequest* request, const char* expectedAction,
                                                 bool create) {
  if (!bleReady) {
    sendJsonError(request, 503, "BLE not available");
    return nullptr;
  }

  String address;
  String action;
  if (!parseDevicePath(request->url(), address, action)) {
    sendJsonError(request, 400, "Invalid device address");
    return nullptr;
  }
  if (action != expectedAction) {
    sendJsonError(request, 404, "Not found");
    return nullptr;
  }

  std::shared_ptr<DeviceSession> session = create ? sessionRegistry->get(address.c_str())
                                                  : sessionRegistry->find(address.c_str());
  if (!session) {
    sendJsonError(request, 404, "Device not found");
  }
  return session;
}

bool parseDesiredState(JsonDocument& doc, DesiredState& desired, const char*& problem) {
  if (!doc["speed"].isNull()) {
    if (!doc["speed"].is<int>() || doc["speed"].as<int>() < 0 ||
        doc["speed"].as<int>() > DeviceState::MAX_SPEED) {
      problem = "speed must be between 0 and 10";
      return false;
    }
    desired.hasSpeed = true;
    desired.speed = static_cast<uint8_t>(doc["speed"].as<int>());
  }

  if (!doc["mode"].isNull()) {
    desired.mode = doc["mode"].as<String>();
    if (desired.mode != "manual" && desired.mode != "night" && desired.mode != "high_speed") {
      problem = "mode must be manual, night or high_speed";
      return false;
    }
  }

  if (doc["power"].is<bool>()) {
    desired.hasPower = true;
    desired.power = doc["power"].as<bool>();
  }
  if (doc["heating"].is<bool>()) {
    desired.hasHeating = true;
    desired.heating = doc["heating"].as<bool>();
  }
  if (doc["winter"].is<bool>()) {
    desired.hasWinter = true;
    desired.winter = doc["winter"].as<bool>();
  }
  if (doc["flowsLocked"].is<bool>()) {
    desired.hasFlowsLocked = true;
    desired.flowsLocked = doc["flowsLocked"].as<bool>();
  }

  if (!desired.hasPower && !desired.hasSpeed && !desired.hasHeating && !desired.hasWinter &&
      !desired.hasFlowsLocked && desired.mode.length() == 0) {
    problem = "No recognized fields";
    return false;
  }
  return true;
}

PranaError applyDesiredState(DeviceSession& session, const DesiredState& desired, DeviceState& state) {
  PranaError err = PranaError::None;

  if (err == PranaError::None && desired.hasPower) {
    err = session.setPower(desired.power, state);
  }
  if (err == PranaError::None && desired.hasSpeed) {
    err = session.setSpeed(desired.speed, state);
  }
  if (err == PranaError::None && desired.hasHeating) {
    err = session.setHeating(desired.heating, state);
  }
  if (err == PranaError::None && desired.hasWinter) {
    err = session.setWinterMode(desired.winter, state);
  }
  if (err == PranaError::None && desired.hasFlowsLocked) {
    err = session.setFlowsLocked(desired.flowsLocked, state);
  }
  if (err == PranaError::None && desired.mode.length() > 0) {
    if (desired.mode == "high_speed") {
      err = session.setHighSpeed(state);
    } else {
      err = session.setNightMode(desired.mode == "night", state);
    }
  }
  return err;
}

// Hands the job to a worker task; answers 503 itself when the queue is full
void queueDeviceJob(AsyncWebServerRequest* request, const std::shared_ptr<DeviceJob>& job) {
  xSemaphoreTakeRecursive(jobLock, portMAX_DELAY);
  job->request = request;
  request->onDisconnect([job]() {
    xSemaphoreTakeRecursive(jobLock, portMAX_DELAY);
    job->request = nullptr;
    xSemaphoreGiveRecursive(jobLock);
  });

  std::shared_ptr<DeviceJob>* item = new std::shared_ptr<DeviceJob>(job);
  bool queued = xQueueSend(deviceJobs, &item, 0) == pdTRUE;
  if (!queued) {
    delete item;
    job->request = nullptr;
  }
  xSemaphoreGiveRecursive(jobLock);

  if (!queued) {
    Serial.println("Device job queue full, rejecting request");
    sendJsonError(request, 503, "Device queue full");
  }
}

void runDeviceJob(DeviceJob& job) {
  DeviceState state;
  PranaError err = PranaError::None;

  switch (job.kind) {
    case DeviceJob::Kind::ReadState:
      err = job.session->getState(job.fresh, state);
      break;

    case DeviceJob::Kind::Command: {
      DeviceSession::ExecuteOptions options;
      err = job.session->execute(job.command, std::vector<uint8_t>(), options, state);
      break;
    }

    case DeviceJob::Kind::SetState:
      err = applyDesiredState(*job.session, job.desired, state);
      break;

    case DeviceJob::Kind::Remove:
      if (sessionRegistry->remove(job.address.c_str())) {
        job.status = 200;
        job.response = "{\"success\":true}";
      } else {
        job.status = 404;
        job.response = errorBody("Device not found");
      }
      return;

    case DeviceJob::Kind::Discover: {
      std::vector<DeviceInfo> found;
      err = discoveryScanner->scan(job.scanSeconds, found);
      if (err == PranaError::None) {
        job.status = 200;
        job.response = discoveryBody(found);
        return;
      }
      break;
    }
  }

  if (err != PranaError::None) {
    job.status = httpStatusFor(err);
    job.response = errorBody(errorToString(err));
    return;
  }
  job.status = 200;
  job.response = stateBody(job.session->getAddress().c_str(), state);
}

void deviceWorkerTask(void* parameter) {
  (void)parameter;

  for (;;) {
    std::shared_ptr<DeviceJob>* item = nullptr;
    if (xQueueReceive(deviceJobs, &item, portMAX_DELAY) != pdTRUE || item == nullptr) {
      continue;
    }
    std::shared_ptr<DeviceJob> job = *item;
    delete item;

    runDeviceJob(*job);

    xSemaphoreTakeRecursive(jobLock, portMAX_DELAY);
    if (job->request != nullptr) {
      job->request->send(job->status, "application/json", job->response);
      job->request = nullptr;
    } else {
      Serial.printf("Device worker: client left before the %s request was answered\n",
                    job->address.c_str());
    }
    xSemaphoreGiveRecursive(jobLock);
  }
}

void initWebServer() {

  server.on("/api/status", HTTP_GET, [](AsyncWebServerRequest *request) {
    JsonDocument doc;
    doc["wifiConnected"] = WiFi.status() == WL_CONNECTED;
    doc["ip"] = WiFi.localIP().toString();
    doc["uptimeMs"] = firmwareMillis();
    doc["freeHeap"] = ESP.getFreeHeap();
    doc["bleReady"] = bleReady;
    doc["deviceName"] = BLE_DEVICE_NAME;
    if (bleReady) {
      doc["sessions"] = sessionRegistry->size();
      doc["bleLinks"] = bleTransport->getConnectionCount();
      doc["pendingRequests"] = uxQueueMessagesWaiting(deviceJobs);
      doc["lastScanMs"] = discoveryScanner->getLastScanMs();
      doc["lastScanError"] = errorToString(discoveryScanner->getLastError());
    }
    doc["discoveryIntervalMs"] = DISCOVERY_INTERVAL_MS;
    doc["idleTimeoutMs"] = SESSION_IDLE_TIMEOUT_MS;

    String response;
    serializeJson(doc, response);
    request->send(200, "application/json", response);
  });

  server.on("/api/discover", HTTP_POST, [](AsyncWebServerRequest *request) {
    if (!ensureAuthenticated(request)) {
      return;
    }
    if (!bleReady) {
      sendJsonError(request, 503, "BLE not available");
      return;
    }

    uint32_t seconds = 0;
    if (request->hasParam("seconds")) {
      long requested = request->getParam("seconds")->value().toInt();
      if (requested <= 0 || requested > 30) {
        sendJsonError(request, 400, "seconds must be between 1 and 30");
        return;
      }
      seconds = static_cast<uint32_t>(requested);
    }

    std::shared_ptr<DeviceJob> job = std::make_shared<DeviceJob>();
    job->kind = DeviceJob::Kind::Discover;
    job->address = "discover";
    job->scanSeconds = seconds;
    queueDeviceJob(request, job);
  });

  // read state (?fresh=1 bypasses the cache); a fresh cache is answered here without queueing
  server.on("/api/devices/*", HTTP_GET, [](AsyncWebServerRequest *request) {
    std::shared_ptr<DeviceSession> session = sessionForRequest(request, "state", false);
    if (!session) {
      return;
    }

    bool fresh = request->hasParam("fresh") && request->getParam("fresh")->value() == "1";
    DeviceState state;
    if (!fresh && session->peekState(state)) {
      request->send(200, "application/json", stateBody(session->getAddress().c_str(), state));
      return;
    }

    std::shared_ptr<DeviceJob> job = std::make_shared<DeviceJob>();
    job->kind = DeviceJob::Kind::ReadState;
    job->address = session->getAddress().c_str();
    job->session = session;
    job->fresh = fresh;
    queueDeviceJob(request, job);
  });

  // raw command, e.g. {"command":"speed_up"}
  server.on("/api/devices/*", HTTP_POST, [](AsyncWebServerRequest *request) {}, NULL,
    [](AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
      if (!ensureAuthenticated(request)) {
        return;
      }

      JsonDocument doc;
      if (deserializeJson(doc, data, len) != DeserializationError::Ok) {
        sendJsonError(request, 400, "Invalid JSON");
        return;
      }

      PranaCommand command;
      if (!doc["command"].is<const char*>() ||
          !FrameCodec::parseCommandName(doc["command"].as<const char*>(), command)) {
        sendJsonError(request, 400, "Unknown command");
        return;
      }

      std::shared_ptr<DeviceSession> session = sessionForRequest(request, "command", true);
      if (!session) {
        return;
      }

      std::shared_ptr<DeviceJob> job = std::make_shared<DeviceJob>();
      job->kind = DeviceJob::Kind::Command;
      job->address = session->getAddress().c_str();
      job->session = session;
      job->command = command;
      queueDeviceJob(request, job);
    }
  );

  // desired state, e.g. {"power":true,"speed":4,"mode":"night"}
  server.on("/api/devices/*", HTTP_PUT, [](AsyncWebServerRequest *request) {}, NULL,
    [](AsyncWebServerRequest *request, uint8_t *data, size_t len, size_t index, size_t total) {
      if (!ensureAuthenticated(request)) {
        return;
      }

      JsonDocument doc;
      if (deserializeJson(doc, data, len) != DeserializationError::Ok) {
        sendJsonError(request, 400, "Invalid JSON");
        return;
      }

      // Validate everything before touching the device
      DesiredState desired;
      const char* problem = "";
      if (!parseDesiredState(doc, desired, problem)) {
        sendJsonError(request, 400, problem);
        return;
      }

      std::shared_ptr<DeviceSession> session = sessionForRequest(request, "state", true);
      if (!session) {
        return;
      }

      std::shared_ptr<DeviceJob> job = std::make_shared<DeviceJob>();
      job->kind = DeviceJob::Kind::SetState;
      job->address = session->getAddress().c_str();
      job->session = session;
      job->desired = desired;
      queueDeviceJob(request, job);
    }
  );

  // drop a session and its link
  server.on("/api/devices/*", HTTP_DELETE, [](AsyncWebServerRequest *request) {
    if (!ensureAuthenticated(request)) {
      return;
    }
    if (!bleReady) {
      sendJsonError(request, 503, "BLE not available");
      return;
    }

    String address;
    String action;
    if (!parseDevicePath(request->url(), address, action) || action.length() > 0) {
      sendJsonError(request, 400, "Invalid device address");
      return;
    }
    if (!sessionRegistry->find(address.c_str())) {
      sendJsonError(request, 404, "Device not found");
      return;
    }

    // close() waits for a command in flight, so it runs on a worker
    std::shared_ptr<DeviceJob> job = std::make_shared<DeviceJob>();
    job->kind = DeviceJob::Kind::Remove;
    job->address = address;
    queueDeviceJob(request, job);
  });

  // list known devices (registered after the wildcard routes, which it would otherwise shadow)
  server.on("/api/devices", HTTP_GET, [](AsyncWebServerRequest *request) {
    if (!bleReady) {
      sendJsonError(request, 503, "BLE not available");
      return;
    }

    JsonDocument doc;
    JsonArray array = doc["devices"].to<JsonArray>();
    for (const DeviceSummary& summary : sessionRegistry->list()) {
      writeDeviceSummary(array.add<JsonObject>(), summary);
    }

    String response;
    serializeJson(doc, response);
    request->send(200, "application/json", response);
  });

  server.onNotFound([](AsyncWebServerRequest *request) {
    sendJsonError(request, 404, "Not found");
  });

  server.begin();
  Serial.printf("HTTP server started on port %d\n", HTTP_PORT);
}
