#ifndef PATIENT_MONITOR_H
#define PATIENT_MONITOR_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "detectors/drift_detector.h"
#include "detectors/outlier_screen.h"
#include "ingest/waveform_reducer.h"
#include "utils/config_loader.h"

class Logger;

// What happened to one session on its way through the pipeline.
struct SessionOutcome {
    bool has_value;          // reducer produced a representative value
    double value;
    bool screened;           // false while the baseline is still bootstrapping
    ScreenResult screen;
    bool accepted;           // appended to the monitored series
    bool drift_evaluated;
    DriftStep drift;
    WaveformSummary summary; // empty for ingestValue()

    SessionOutcome() : has_value(false), value(0.0), screened(false),
                       accepted(false), drift_evaluated(false) {}
};

// Waveform -> scalar -> screen -> monitored series -> drift, for one patient.
class PatientMonitor {
public:
    PatientMonitor(const std::string& id, const MonitorConfig& config);
    ~PatientMonitor();

    // Screen against a fixed reference sample instead of the growing series.
    // Throws InsufficientDataError for fewer than 2 points.
    void setReferenceBaseline(const std::vector<double>& baseline);
    void clearReferenceBaseline();
    bool hasReferenceBaseline() const { return has_reference_; }

    // Reduce a session waveform and feed its value (if any) through the pipeline
    SessionOutcome ingestWaveform(const std::vector<PressureSample>& samples);

    // Screen one value, append it when accepted, step the drift detector
    SessionOutcome ingestValue(double value);

    // Batch drift run over the accepted series
    DriftResult reanalyze() const;

    // Optional sink for screen decisions, sessions and alarms (not owned)
    void setLogger(Logger* logger) { logger_ = logger; }

    const std::string& getId() const { return id_; }
    const std::vector<double>& series() const { return series_; }
    const DriftMonitor& drift() const { return drift_; }
    uint64_t sessionCount() const { return session_count_; }
    uint64_t rejectedCount() const { return rejected_count_; }

private:
    std::string id_;
    MonitorConfig config_;
    WaveformReducer reducer_;
    BaselineOutlierScreen screen_;
    DriftMonitor drift_;

    std::vector<double> series_;
    std::vector<double> reference_;
    bool has_reference_;
    uint64_t session_count_;
    uint64_t rejected_count_;
    Logger* logger_;
};

// One PatientMonitor per patient id; monitors share nothing.
class MonitorRegistry {
public:
    explicit MonitorRegistry(const MonitorConfig& config);
    ~MonitorRegistry();

    PatientMonitor& getOrCreate(const std::string& id);
    PatientMonitor* find(const std::string& id);
    bool remove(const std::string& id);
    size_t size() const { return monitors_.size(); }
    std::vector<std::string> ids() const;

    void setLogger(Logger* logger);

private:
    MonitorConfig config_;
    Logger* logger_;
    std::map<std::string, std::unique_ptr<PatientMonitor>> monitors_;
};

#endif // PATIENT_MONITOR_H
