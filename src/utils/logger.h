#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <cstdint>
#include "detectors/drift_detector.h"
#include "detectors/outlier_screen.h"
#include "ingest/waveform_reducer.h"

class Logger {
public:
    Logger();
    ~Logger();

    // Initialize logger with output directory
    bool initialize(const std::string& log_dir = "logs");

    // Log a drift alarm
    void logDriftAlarm(uint64_t timestamp_ms, const std::string& series_id,
                       const DriftStep& step);

    // Log an outlier-screen decision for one candidate value
    void logScreenDecision(uint64_t timestamp_ms, const std::string& series_id,
                           double candidate, const ScreenResult& result,
                           bool accepted);

    // Log a reduced session
    void logSession(uint64_t timestamp_ms, const std::string& series_id,
                    uint64_t session_index, const WaveformSummary& summary);

    // Log kernel execution time
    void logKernelTime(uint64_t timestamp_ms, const std::string& kernel_name,
                      double execution_time_ms);

    // Close log files
    void close();

    bool isInitialized() const { return initialized_; }

    // Wall-clock milliseconds since epoch
    static uint64_t nowMs();

private:
    std::string log_dir_;
    std::ofstream alarms_file_;
    std::ofstream screen_file_;
    std::ofstream sessions_file_;
    std::ofstream kernel_times_file_;
    std::mutex mutex_;
    bool initialized_;
};

#endif // LOGGER_H
