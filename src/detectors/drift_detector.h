#ifndef DRIFT_DETECTOR_H
#define DRIFT_DETECTOR_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

// What happens to the EWMA baseline when an alarm fires.
enum class RecenterPolicy {
    None,           // mu and variance keep evolving untouched
    ResetBaseline   // mu jumps to the sample that raised the alarm
};

enum class DriftDirection : uint8_t {
    None = 0,
    Up = 1,
    Down = 2,
    Both = 3
};

std::string toString(RecenterPolicy policy);
std::string toString(DriftDirection direction);
RecenterPolicy parseRecenterPolicy(const std::string& name);

struct DriftConfig {
    double alpha_baseline = 0.01;       // slow EWMA baseline
    double alpha_var = 0.05;            // EWMA variance for standardization
    double delta = 0.25;                // target shift in sigma units
    double h = 5.0;                     // decision threshold on S+/S-
    size_t warmup = 100;                // alarms suppressed below this index
    std::optional<double> clip_z = 6.0; // winsorization bound, unset = no clipping
    double variance_floor = 1e-12;
    double initial_variance = 1e-6;
    RecenterPolicy recenter_policy = RecenterPolicy::None;

    // CUSUM reference value k
    double referenceValue() const { return delta / 2.0; }

    // Throws InvalidConfigurationError on out-of-range parameters
    void validate() const;
};

// Running state of one monitored series. Plain value: copy it to checkpoint.
struct DriftState {
    double mu = 0.0;
    double variance = 0.0;
    double s_plus = 0.0;
    double s_minus = 0.0;
    uint64_t index = 0;          // index of the next sample
    uint64_t alarm_count = 0;
    bool initialized = false;
};

// Values recorded for one processed sample.
struct DriftStep {
    uint64_t index = 0;
    double value = 0.0;
    double mu = 0.0;
    double sigma = 0.0;
    double z = 0.0;
    double s_plus = 0.0;
    double s_minus = 0.0;
    bool alarmed = false;
    DriftDirection direction = DriftDirection::None;
};

// Batch output: parallel trajectories plus alarm indices.
struct DriftResult {
    std::vector<size_t> alarms;
    std::vector<double> mu;
    std::vector<double> sigma;
    std::vector<double> s_plus;
    std::vector<double> s_minus;

    size_t size() const { return mu.size(); }
    bool empty() const { return mu.empty(); }
};

// EWMA baseline + two-sided CUSUM on standardized residuals.
class EWCusumDetector {
public:
    // Advance state by one sample. Throws InvalidInputError for a non-finite
    // sample, leaving state untouched. config must already have passed
    // validate(); process() and DriftMonitor check it once up front.
    static DriftStep step(DriftState& state, double x, const DriftConfig& config);

    // Run over a full series from a fresh state.
    static DriftResult process(const std::vector<double>& series, const DriftConfig& config);

    // Seed state from the first sample
    static void initialize(DriftState& state, double first_value, const DriftConfig& config);
};

// Stateful wrapper for streaming use with an optional bounded history.
class DriftMonitor {
public:
    explicit DriftMonitor(const DriftConfig& config = DriftConfig(), size_t history_capacity = 0);
    ~DriftMonitor();

    // Feed one accepted sample
    const DriftStep& update(double value);

    // Whether the most recent sample raised an alarm
    bool isAlarm() const { return last_step_.alarmed; }

    const DriftState& state() const { return state_; }
    const DriftConfig& config() const { return config_; }
    const DriftStep& lastStep() const { return last_step_; }
    const std::deque<DriftStep>& history() const { return history_; }
    size_t historyCapacity() const { return history_capacity_; }

    // Resume from a checkpointed state; history is cleared
    void restore(const DriftState& state);

    // Discard all state (new patient or configuration change)
    void reset();

private:
    DriftConfig config_;
    DriftState state_;
    DriftStep last_step_;
    size_t history_capacity_;
    std::deque<DriftStep> history_;
};

#endif // DRIFT_DETECTOR_H
