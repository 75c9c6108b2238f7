#include "drift_detector.h"
#include "utils/errors.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

// Guards the division on the degenerate first step
const double kSigmaEpsilon = 1e-12;

}  // namespace

std::string toString(RecenterPolicy policy) {
    switch (policy) {
        case RecenterPolicy::None: return "none";
        case RecenterPolicy::ResetBaseline: return "reset";
    }
    return "none";
}

std::string toString(DriftDirection direction) {
    switch (direction) {
        case DriftDirection::None: return "none";
        case DriftDirection::Up: return "up";
        case DriftDirection::Down: return "down";
        case DriftDirection::Both: return "both";
    }
    return "none";
}

RecenterPolicy parseRecenterPolicy(const std::string& name) {
    if (name == "none") return RecenterPolicy::None;
    if (name == "reset" || name == "reset_baseline") return RecenterPolicy::ResetBaseline;
    throw InvalidConfigurationError("recenter_policy must be 'none' or 'reset', got '" + name + "'");
}

void DriftConfig::validate() const {
    std::ostringstream oss;
    if (!(alpha_baseline > 0.0 && alpha_baseline <= 1.0)) {
        oss << "alpha_baseline must be in (0, 1], got " << alpha_baseline;
    } else if (!(alpha_var > 0.0 && alpha_var <= 1.0)) {
        oss << "alpha_var must be in (0, 1], got " << alpha_var;
    } else if (!(delta >= 0.0) || !std::isfinite(delta)) {
        oss << "delta must be a finite non-negative value, got " << delta;
    } else if (!(h > 0.0) || !std::isfinite(h)) {
        oss << "h must be a finite positive value, got " << h;
    } else if (clip_z && !(*clip_z > 0.0)) {
        oss << "clip_z must be positive when set, got " << *clip_z;
    } else if (!(variance_floor > 0.0) || !std::isfinite(variance_floor)) {
        oss << "variance_floor must be positive, got " << variance_floor;
    } else if (!(initial_variance > 0.0) || !std::isfinite(initial_variance)) {
        oss << "initial_variance must be positive, got " << initial_variance;
    }
    if (!oss.str().empty()) {
        throw InvalidConfigurationError(oss.str());
    }
}

void EWCusumDetector::initialize(DriftState& state, double first_value, const DriftConfig& config) {
    state = DriftState();
    state.mu = first_value;
    state.variance = std::max(config.initial_variance, config.variance_floor);
    state.initialized = true;
}

DriftStep EWCusumDetector::step(DriftState& state, double x, const DriftConfig& config) {
    if (!std::isfinite(x)) {
        std::ostringstream oss;
        oss << "Non-finite sample at index " << state.index << ": " << x;
        throw InvalidInputError(oss.str());
    }

    if (!state.initialized) {
        initialize(state, x, config);
    }

    DriftStep out;
    out.index = state.index;
    out.value = x;

    // Baseline first, residual against the updated baseline
    state.mu = (1.0 - config.alpha_baseline) * state.mu + config.alpha_baseline * x;
    double r = x - state.mu;

    state.variance = (1.0 - config.alpha_var) * state.variance + config.alpha_var * (r * r);
    state.variance = std::max(state.variance, config.variance_floor);
    double sigma = std::sqrt(state.variance);

    double z = r / (sigma + kSigmaEpsilon);
    if (config.clip_z) {
        z = std::clamp(z, -*config.clip_z, *config.clip_z);
    }

    const double k = config.referenceValue();
    state.s_plus = std::max(0.0, state.s_plus + z - k);
    state.s_minus = std::max(0.0, state.s_minus - z - k);

    bool up = state.s_plus > config.h;
    bool down = state.s_minus > config.h;
    if (state.index >= config.warmup && (up || down)) {
        out.alarmed = true;
        out.direction = (up && down) ? DriftDirection::Both
                                     : (up ? DriftDirection::Up : DriftDirection::Down);
        // Re-arm
        state.s_plus = 0.0;
        state.s_minus = 0.0;
        state.alarm_count++;
        if (config.recenter_policy == RecenterPolicy::ResetBaseline) {
            state.mu = x;
        }
    }

    out.mu = state.mu;
    out.sigma = sigma;
    out.z = z;
    out.s_plus = state.s_plus;
    out.s_minus = state.s_minus;

    state.index++;
    return out;
}

DriftResult EWCusumDetector::process(const std::vector<double>& series, const DriftConfig& config) {
    config.validate();

    DriftResult result;
    const size_t n = series.size();
    if (n == 0) {
        return result;
    }
    result.mu.reserve(n);
    result.sigma.reserve(n);
    result.s_plus.reserve(n);
    result.s_minus.reserve(n);

    DriftState state;
    for (size_t t = 0; t < n; ++t) {
        DriftStep s = step(state, series[t], config);
        result.mu.push_back(s.mu);
        result.sigma.push_back(s.sigma);
        result.s_plus.push_back(s.s_plus);
        result.s_minus.push_back(s.s_minus);
        if (s.alarmed) {
            result.alarms.push_back(t);
        }
    }
    return result;
}

DriftMonitor::DriftMonitor(const DriftConfig& config, size_t history_capacity)
    : config_(config), history_capacity_(history_capacity) {
    config_.validate();
}

DriftMonitor::~DriftMonitor() {
}

const DriftStep& DriftMonitor::update(double value) {
    last_step_ = EWCusumDetector::step(state_, value, config_);
    if (history_capacity_ > 0) {
        history_.push_back(last_step_);
        if (history_.size() > history_capacity_) {
            history_.pop_front();
        }
    }
    return last_step_;
}

void DriftMonitor::restore(const DriftState& state) {
    if (state.initialized && !std::isfinite(state.mu)) {
        throw InvalidInputError("Restored state has a non-finite baseline");
    }
    if (state.initialized && !(state.variance >= config_.variance_floor)) {
        throw InvalidInputError("Restored state violates the variance floor");
    }
    if (!(state.s_plus >= 0.0) || !(state.s_minus >= 0.0)) {
        throw InvalidInputError("Restored state has negative CUSUM accumulators");
    }
    state_ = state;
    last_step_ = DriftStep();
    history_.clear();
}

void DriftMonitor::reset() {
    state_ = DriftState();
    last_step_ = DriftStep();
    history_.clear();
}
