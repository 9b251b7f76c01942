/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/TokenRegistry.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * In-memory registry of authorized tokens, persisted through the HAL after
 * every successful mutation. Lookups ignore case and separator characters so
 * "AA:BB:CC" and "aabbcc" address the same token.
 * =================================================================================
 */
#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "GateContext.h"
#include "Types.h"

class TokenRegistry {
public:
    explicit TokenRegistry(IGateHAL& hal);

    // --- Mutations (persisted) ---
    // 200 OK, 400 empty id/name, 409 already registered
    int registerToken(const std::string& id, const std::string& name, bool enabled = true);
    // 200 OK, 404 not found. Null pointers leave the field unchanged.
    int updateToken(const std::string& id, const std::string* name, const bool* enabled);
    // 200 OK, 404 not found
    int unregisterToken(const std::string& id);

    // --- Queries ---
    bool getToken(const std::string& id, Token& out) const;
    std::vector<Token> list() const;
    size_t count() const;

    // Replaces the content from storage without persisting it again.
    void loadTokens(const std::vector<Token>& tokens);

    static std::string normalizeId(const std::string& id);

private:
    IGateHAL& _hal;
    mutable std::mutex _mutex;
    std::vector<Token> _tokens; // Insertion order

    int findIndex(const std::string& normalizedId) const;
    void persist();
    void logKeyValue(const char* key, const char* value);
};
