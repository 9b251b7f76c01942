/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      include/Control4Gateway.h
 * Description: IActuatorGateway over the Control4 cloud + director REST API.
 *
 * Authentication chain (connect):
 *   1. Account bearer token  (apis.control4.com/authentication)
 *   2. Controller common name (apis.control4.com/account)
 *   3. Director bearer token  (apis.control4.com/authentication/authorization)
 * Commands then go directly to the local director at https://<host>.
 * =================================================================================
 */
#pragma once
#include <Arduino.h>
#include <ArduinoJson.h>
#include <string>

#include "ActuatorGateway.h"
#include "Types.h"

class Control4Gateway : public IActuatorGateway {
public:
    explicit Control4Gateway(const ActuatorConfig& config);

    // --- IActuatorGateway ---
    bool connect() override;
    void disconnect() override;
    bool open() override;
    bool close() override;
    int queryState(ActuatorStatus& out) override;
    bool sendNotification(const char* title, const char* message, const char* priority) override;

    bool isConnected() const { return !_directorToken.empty(); }
    const std::string& getControllerName() const { return _controllerName; }

    void printStartupDiagnostics();

private:
    ActuatorConfig _config;
    // Guards the token cache and the auth chain, never a director command
    SemaphoreHandle_t _authMutex;

    std::string _accountToken;
    std::string _directorToken;
    std::string _controllerName;

    // --- Authentication ---
    bool connectLocked();
    bool requestAccountToken();
    bool requestControllerName();
    bool requestDirectorToken();
    bool acquireDirectorToken(std::string& out);
    void invalidateDirectorToken(const std::string& rejected);

    // --- Transport ---
    // Returns the HTTP status code, or a negative HTTPClient error.
    int httpRequest(const char* method, const std::string& url, const std::string& bearer,
                    const std::string* body, std::string* response);

    // Director call with retry/backoff and a single re-auth on 401.
    int directorRequest(const char* method, const std::string& path, const std::string* body,
                        std::string* response);

    bool runScenario(uint32_t scenario, const char* label);
    std::string directorUrl(const std::string& path) const;

    void log(const char* value);
};
