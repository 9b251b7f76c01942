/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines pin mappings, system constants, task
 * sizing, controller endpoints and compile-time defaults.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Device Name String ---
#define DEVICE_NAME "BeaconGate"
#define DEVICE_VERSION "1.0.0"

// =================================================================================
// SECTION: HARDWARE & SYSTEM OBJECTS
// =================================================================================

#define SERIAL_BAUD_RATE 115200
#define DEFAULT_WDT_TIMEOUT 30 // Covers the longest blocking HTTPS call in loop()
#define MIN_FREE_HEAP 12000    // Restart below this (BLE + TLS fragment the heap)

// --- Pin Definitions ---
#define PCB_BUTTON_PIN 0 // Standard ESP32 Boot Button

#ifdef DEBUG_MODE
#define STATUS_LED_PIN 23
#else
#define STATUS_LED_PIN 2
#endif

#define LONG_PRESS_MS 3000

// =================================================================================
// SECTION: GATE ENGINE (Device Limits)
// =================================================================================

// RAM-only activity history. The core default is too large for the heap.
#define DEVICE_ACTIVITY_MAX_ENTRIES 200

// =================================================================================
// SECTION: TASKS
// =================================================================================

#define SCAN_TASK_STACK 6144
#define STATUS_TASK_STACK 8192
#define AUTOCLOSE_TASK_STACK 8192
#define COMMAND_TASK_STACK 8192
#define TASK_PRIORITY 1
#define COMMAND_QUEUE_LENGTH 8
#define TASK_SLEEP_SLICE_MS 1000
#define TASK_JOIN_TIMEOUT_MS 30000

// =================================================================================
// SECTION: NETWORK
// =================================================================================

#define WIFI_MAX_RETRIES 5
#define WEB_SERVER_PORT 80
#define NTP_SERVER_1 "pool.ntp.org"
#define NTP_SERVER_2 "time.nist.gov"

// =================================================================================
// SECTION: CONTROL4 CLOUD
// =================================================================================

#define C4_AUTH_URL "https://apis.control4.com/authentication/v1/rest"
#define C4_CONTROLLER_AUTH_URL "https://apis.control4.com/authentication/v1/rest/authorization"
#define C4_ACCOUNTS_URL "https://apis.control4.com/account/v3/rest/accounts"
#define C4_APPLICATION_KEY "78f6791373d61bea49fdb9fb8897f1f3af193f11"
#define C4_HTTP_TIMEOUT_MS 10000
#define C4_MAX_ATTEMPTS 3
#define C4_BACKOFF_BASE_MS 1000
