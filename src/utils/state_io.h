#ifndef STATE_IO_H
#define STATE_IO_H

#include <string>
#include "detectors/drift_detector.h"

// Checkpoint helpers for DriftState. Round trips are exact.
std::string driftStateToJson(const DriftState& state);
bool parseDriftState(const std::string& json, DriftState& state, std::string& error);

bool saveDriftState(const std::string& path, const DriftState& state);
bool loadDriftState(const std::string& path, DriftState& state);

#endif  // STATE_IO_H
