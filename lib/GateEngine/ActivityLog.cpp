/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/ActivityLog.cpp
 *
 * Description:
 * Activity history with suppress/extended detection modes.
 * =================================================================================
 */
#include <stdio.h>

#include "ActivityLog.h"
#include "BeaconParser.h"

ActivityLog::ActivityLog(IGateHAL& hal, const ActivityConfig& config)
    : _hal(hal),
      _mode(config.mode),
      _maxEntries(config.maxEntries > 0 ? config.maxEntries : 1),
      _nextSeq(1)
{
}

// =================================================================================
// SECTION: INTERNAL HELPERS
// =================================================================================

void ActivityLog::appendLocked(ActivityEntry& entry) {
    entry.seq = _nextSeq++;
    _entries.push_back(entry);

    // Oldest entries are dropped first
    while (_entries.size() > _maxEntries) {
        _entries.pop_front();
    }
}

ActivityEntry* ActivityLog::findBySeqLocked(uint32_t seq) {
    if (_entries.empty()) return nullptr;
    uint32_t frontSeq = _entries.front().seq;
    if (seq < frontSeq) return nullptr; // Trimmed
    size_t pos = seq - frontSeq;
    if (pos >= _entries.size()) return nullptr;
    return &_entries[pos];
}

// =================================================================================
// SECTION: RECORDING
// =================================================================================

void ActivityLog::record(ActivityType type, const std::string& message, const Token* token) {
    ActivityEntry entry;
    entry.timestamp = _hal.getEpochSeconds();
    entry.type = type;
    entry.message = message;
    if (token != nullptr) {
        entry.tokenId = token->id;
        entry.tokenName = token->displayName;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    appendLocked(entry);
}

void ActivityLog::recordDetection(const Token& token, bool hasRssi, int rssi, float distance) {
    // Build message: "Token detected: <name> | RSSI: <rssi> dBm (<quality>) | Distance: ~<d>m"
    char msgBuf[160];
    int offset = snprintf(msgBuf, sizeof(msgBuf), "Token detected: %s", token.displayName.c_str());

    if (hasRssi && offset > 0 && (size_t)offset < sizeof(msgBuf)) {
        offset += snprintf(msgBuf + offset, sizeof(msgBuf) - offset, " | RSSI: %d dBm (%s)", rssi,
                           BeaconParser::signalQuality(rssi));
    }
    if (distance > 0 && offset > 0 && (size_t)offset < sizeof(msgBuf)) {
        snprintf(msgBuf + offset, sizeof(msgBuf) - offset, " | Distance: ~%.1fm", distance);
    }

    uint32_t now = _hal.getEpochSeconds();

    std::lock_guard<std::mutex> lock(_mutex);

    if (_mode == ACTIVITY_SUPPRESS) {
        std::map<std::string, uint32_t>::iterator it = _lastDetectionSeq.find(token.id);
        if (it != _lastDetectionSeq.end()) {
            ActivityEntry* existing = findBySeqLocked(it->second);
            if (existing != nullptr && existing->type == ACT_TOKEN_DETECTED) {
                existing->timestamp = now;
                existing->message = msgBuf;
                existing->tokenName = token.displayName;
                existing->hasRssi = hasRssi;
                existing->rssi = rssi;
                existing->distance = distance;
                existing->updateCount++;
                return;
            }
        }
    }

    ActivityEntry entry;
    entry.timestamp = now;
    entry.type = ACT_TOKEN_DETECTED;
    entry.message = msgBuf;
    entry.tokenId = token.id;
    entry.tokenName = token.displayName;
    entry.hasRssi = hasRssi;
    entry.rssi = rssi;
    entry.distance = distance;
    appendLocked(entry);

    _lastDetectionSeq[token.id] = entry.seq;
}

// =================================================================================
// SECTION: QUERIES
// =================================================================================

size_t ActivityLog::getEntries(size_t limit, const ActivityType* typeFilter, std::vector<ActivityEntry>& out) const {
    out.clear();
    std::lock_guard<std::mutex> lock(_mutex);

    for (std::deque<ActivityEntry>::const_reverse_iterator it = _entries.rbegin(); it != _entries.rend(); ++it) {
        if (typeFilter != nullptr && it->type != *typeFilter) continue;
        out.push_back(*it);
        if (limit > 0 && out.size() >= limit) break;
    }
    return out.size();
}

size_t ActivityLog::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
}

void ActivityLog::clear() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
        _lastDetectionSeq.clear();
    }
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", "Activity", "Activity log cleared.");
    _hal.log(tempBuf);
}

void ActivityLog::setMode(ActivityMode mode) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_mode == mode) return;
        _mode = mode;
        // Entries recorded before the switch are never merged into
        _lastDetectionSeq.clear();
    }
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : Detection mode: %s", "Activity", activityModeToString(mode));
    _hal.log(tempBuf);
}

ActivityMode ActivityLog::getMode() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _mode;
}

// =================================================================================
// SECTION: EVENT MAPPING
// =================================================================================

void ActivityLog::onGateEvent(const GateEvent& event) {
    const Token* token = event.token.id.empty() ? nullptr : &event.token;

    switch (event.type) {
    case EVT_TOKEN_DETECTED:
        recordDetection(event.token, event.hasRssi, event.rssi, event.distance);
        break;
    case EVT_GATE_OPENED:
        record(ACT_GATE_OPENED, "Gate opened: " + event.reason, token);
        break;
    case EVT_GATE_CLOSED:
        record(ACT_GATE_CLOSED, "Gate closed: " + event.reason, token);
        break;
    case EVT_ACTUATOR_ERROR:
        record(ACT_ERROR, event.reason, token);
        break;
    case EVT_TOKEN_REGISTERED:
        record(ACT_TOKEN_REGISTERED, "Token registered: " + event.token.displayName, token);
        break;
    case EVT_TOKEN_UPDATED:
        record(ACT_TOKEN_UPDATED,
               "Token updated: " + event.token.displayName + (event.token.enabled ? " (enabled)" : " (paused)"), token);
        break;
    case EVT_TOKEN_UNREGISTERED:
        record(ACT_TOKEN_UNREGISTERED, "Token unregistered: " + event.token.displayName, token);
        break;
    case EVT_CONFIG_UPDATED:
        record(ACT_CONFIG_UPDATED, event.reason.empty() ? std::string("Configuration updated") : event.reason);
        break;
    default:
        record(ACT_INFO, event.reason, token);
        break;
    }
}
