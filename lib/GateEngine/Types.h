/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/Types.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Shared enums, configuration structs and value types for the Gate Engine.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

// --- Enums ---
enum GateState : uint8_t { GATE_CLOSED, GATE_OPENING, GATE_OPEN, GATE_CLOSING, GATE_UNKNOWN };
enum ActivityType : uint8_t {
  ACT_GATE_OPENED,
  ACT_GATE_CLOSED,
  ACT_TOKEN_DETECTED,
  ACT_TOKEN_REGISTERED,
  ACT_TOKEN_UNREGISTERED,
  ACT_TOKEN_UPDATED,
  ACT_ERROR,
  ACT_INFO,
  ACT_CONFIG_UPDATED
};
enum ActivityMode : uint8_t { ACTIVITY_SUPPRESS, ACTIVITY_EXTENDED };
enum GateEventType : uint8_t {
  EVT_TOKEN_DETECTED,
  EVT_GATE_OPENED,
  EVT_GATE_CLOSED,
  EVT_ACTUATOR_ERROR,
  EVT_TOKEN_REGISTERED,
  EVT_TOKEN_UPDATED,
  EVT_TOKEN_UNREGISTERED,
  EVT_CONFIG_UPDATED,
  EVT_INFO
};
enum DeviceKind : uint8_t { DEVICE_BEACON, DEVICE_GENERIC };

// --- Constants ---

// Logging
#define SERIAL_QUEUE_SIZE 50
#define LOG_BUFFER_SIZE 150
#define MAX_LOG_LENGTH 150

// Activity
#define ACTIVITY_DEFAULT_MAX_ENTRIES 1000

// Distance estimation
#define BEACON_DEFAULT_TX_POWER -59
#define BEACON_PATH_LOSS_EXPONENT 2.0f
#define DISTANCE_UNKNOWN -1.0f

// Token identifiers
#define MAX_TOKEN_ID_LENGTH 64
#define MAX_TOKEN_NAME_LENGTH 48

// --- Configuration Structs ---

// All durations in seconds.
struct GateConfig {
  uint32_t autoCloseTimeout = 300;
  uint32_t sessionTimeout = 60;
  uint32_t statusCheckInterval = 30;
  uint32_t bleScanInterval = 5;
  uint32_t tokenIdleTimeout = 30;
  uint32_t autoCloseCheckInterval = 10;
  uint32_t nearbyScanDuration = 10;
};

struct ActuatorConfig {
  std::string host;
  std::string username;
  std::string password;
  uint32_t gateDeviceId = 348;
  uint32_t openScenario = 21;
  uint32_t closeScenario = 22;
  uint32_t notificationAgentId = 7;
};

struct ActivityConfig {
  ActivityMode mode = ACTIVITY_SUPPRESS;
  uint32_t maxEntries = ACTIVITY_DEFAULT_MAX_ENTRIES;
};

// --- Domain Structs ---

struct Token {
  std::string id; // Normalized (lowercase, separators stripped)
  std::string displayName;
  bool enabled = true;
};

// One detection of a registered token, produced by the scan pipeline.
struct Observation {
  std::string tokenId;
  bool hasRssi = false;
  int rssi = 0;
  float distance = DISTANCE_UNKNOWN;
};

// Controller-side report for the gate device.
struct ActuatorStatus {
  bool online = false;
  std::string name;
  std::string detail;
};

struct GateStatus {
  GateState state = GATE_UNKNOWN;
  bool hasLastOpenTime = false;
  uint32_t secondsSinceOpen = 0;
  uint32_t lastOpenEpoch = 0;
  bool sessionActive = false;
  uint32_t secondsSinceSession = 0;
  int actuatorCode = 0;
  ActuatorStatus actuator;
};

struct GateEvent {
  GateEventType type = EVT_INFO;
  Token token;
  bool hasRssi = false;
  int rssi = 0;
  float distance = DISTANCE_UNKNOWN;
  std::string reason;
};

// Parsed Apple iBeacon frame.
struct BeaconFrame {
  std::string uuid; // Uppercase 8-4-4-4-12
  uint16_t major = 0;
  uint16_t minor = 0;
  int8_t txPower = BEACON_DEFAULT_TX_POWER;
};

// Raw advertisement as collected by the radio, before matching.
struct RawSighting {
  std::string address;
  std::string name;
  int rssi = 0;
  bool hasTxPower = false;
  int8_t txPower = 0;
  uint16_t companyId = 0;
  std::string manufacturerData; // Payload after the 16-bit company id
};

// Entry of a full-area scan (registration tooling).
struct NearbyDevice {
  DeviceKind kind = DEVICE_GENERIC;
  std::string address;
  std::string name;
  int rssi = 0;
  float distance = DISTANCE_UNKNOWN;
  BeaconFrame beacon;
};

extern const char *gateStateToString(GateState s);
extern const char *activityTypeToString(ActivityType t);
extern bool activityTypeFromString(const char *str, ActivityType &out);
extern const char *activityModeToString(ActivityMode m);
extern const char *deviceKindToString(DeviceKind k);
