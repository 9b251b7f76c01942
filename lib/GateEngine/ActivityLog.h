/*
 * =================================================================================
 * Project:   BeaconGate - BLE Gate Automation Controller
 * File:      lib/GateEngine/ActivityLog.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Bounded, user-facing history of gate activity (what the dashboard shows).
 * Distinct from the HAL diagnostic log.
 *
 * Entries live in an indexed sequence: every entry gets a monotonically
 * increasing sequence number, so position = seq - front().seq. In SUPPRESS
 * mode the latest detection entry of a token is refreshed in place through
 * that index instead of appending a new line per scan.
 * =================================================================================
 */
#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "GateContext.h"
#include "Types.h"

struct ActivityEntry {
  uint32_t seq = 0;
  uint32_t timestamp = 0; // Epoch seconds (0 if clock not synchronized)
  ActivityType type = ACT_INFO;
  std::string message;

  // --- Details ---
  std::string tokenId;
  std::string tokenName;
  bool hasRssi = false;
  int rssi = 0;
  float distance = DISTANCE_UNKNOWN;

  uint32_t updateCount = 0;
};

class ActivityLog : public IGateEventListener {
public:
    ActivityLog(IGateHAL& hal, const ActivityConfig& config);

    // --- Recording ---
    void record(ActivityType type, const std::string& message, const Token* token = nullptr);
    void recordDetection(const Token& token, bool hasRssi, int rssi, float distance);

    // --- Queries ---
    // Newest first. limit 0 = all. typeFilter nullptr = all types.
    // Returns the number of entries written to 'out'.
    size_t getEntries(size_t limit, const ActivityType* typeFilter, std::vector<ActivityEntry>& out) const;
    size_t size() const;
    void clear();

    // --- Mode ---
    void setMode(ActivityMode mode);
    ActivityMode getMode() const;

    // --- IGateEventListener ---
    void onGateEvent(const GateEvent& event) override;

private:
    IGateHAL& _hal;
    mutable std::mutex _mutex;

    ActivityMode _mode;
    size_t _maxEntries;

    std::deque<ActivityEntry> _entries;
    uint32_t _nextSeq;
    std::map<std::string, uint32_t> _lastDetectionSeq; // tokenId -> seq

    void appendLocked(ActivityEntry& entry);
    ActivityEntry* findBySeqLocked(uint32_t seq);
};
