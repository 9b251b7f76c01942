/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/ActuatorGateway.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Interface to the remote controller that physically drives the gate.
 * Implementations own authentication, session caching and retry. The engine
 * performs exactly one call per decision and only looks at the result.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class IActuatorGateway {
public:
    virtual ~IActuatorGateway() {}

    // Establishes the controller session. Returns false if unreachable.
    virtual bool connect() = 0;
    virtual void disconnect() = 0;

    // Returns true once the controller accepted the command.
    virtual bool open() = 0;
    virtual bool close() = 0;

    // Returns 200 and fills 'out', or 503 if the controller is unavailable.
    virtual int queryState(ActuatorStatus& out) = 0;

    // Best-effort push notification. Priority: low, normal, high, critical.
    virtual bool sendNotification(const char* title, const char* message, const char* priority) = 0;
};
