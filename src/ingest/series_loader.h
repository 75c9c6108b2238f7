#ifndef SERIES_LOADER_H
#define SERIES_LOADER_H

#include <string>
#include <vector>
#include "ingest/waveform_reducer.h"

// One monitored series listed in a batch manifest
struct SeriesEntry {
    std::string id;
    std::string path;
};

// One patient listed in a session manifest
struct PatientSessions {
    std::string id;
    bool has_baseline = false;
    std::vector<double> baseline;
    std::vector<std::string> session_paths;
};

// Series: JSON array, {"values": [...]}, or text with one value per line
// ('#' comments and blank lines skipped). Missing or non-finite entries throw
// InvalidInputError; unreadable or malformed files return false.
bool parseSeries(const std::string& content, std::vector<double>& values, std::string& error);
bool loadSeriesFile(const std::string& path, std::vector<double>& values);

// Waveform: JSON array of [pressure, time] pairs, or {"waveform": [...]}
bool parseWaveform(const std::string& content, std::vector<PressureSample>& samples,
                   std::string& error);
bool loadWaveformFile(const std::string& path, std::vector<PressureSample>& samples);

// Manifest paths are resolved relative to the manifest's directory
bool loadSeriesManifest(const std::string& path, std::vector<SeriesEntry>& entries);
bool loadSessionManifest(const std::string& path, std::vector<PatientSessions>& patients);

#endif // SERIES_LOADER_H
