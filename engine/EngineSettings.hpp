// Engine tunables persisted in QSettings("Ferry", "Ferry").
#pragma once
#include "ferry/Types.hpp"

class QSettings;

struct EngineSettings {
    int maxConcurrent = 1;       // Transfers/maxConcurrent
    int cancelLatencyMs = 750;   // Transfers/cancelLatencyMs
    ferry::TransportOptions transport; // Network/*, Native/*, progress thresholds

    static EngineSettings load();
    static EngineSettings load(QSettings& s);
    void save(QSettings& s) const;
};
