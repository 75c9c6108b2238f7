#include "patient_monitor.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include <cmath>
#include <sstream>

PatientMonitor::PatientMonitor(const std::string& id, const MonitorConfig& config)
    : id_(id),
      config_(config),
      reducer_(config.reducer.refractory, config.reducer.quantize_mode),
      screen_(config.screen.alpha, config.screen.method),
      drift_(config.drift, config.history_capacity),
      has_reference_(false),
      session_count_(0),
      rejected_count_(0),
      logger_(nullptr) {
    if (config_.screen.min_baseline < 2) {
        throw InvalidConfigurationError("min_baseline must be at least 2");
    }
}

PatientMonitor::~PatientMonitor() {
}

void PatientMonitor::setReferenceBaseline(const std::vector<double>& baseline) {
    if (baseline.size() < 2) {
        std::ostringstream oss;
        oss << "Reference baseline for " << id_ << " needs at least 2 points, got " << baseline.size();
        throw InsufficientDataError(oss.str());
    }
    for (size_t i = 0; i < baseline.size(); ++i) {
        if (!std::isfinite(baseline[i])) {
            std::ostringstream oss;
            oss << "Reference baseline value " << i << " for " << id_ << " is not finite";
            throw InvalidInputError(oss.str());
        }
    }
    reference_ = baseline;
    has_reference_ = true;
}

void PatientMonitor::clearReferenceBaseline() {
    reference_.clear();
    has_reference_ = false;
}

SessionOutcome PatientMonitor::ingestWaveform(const std::vector<PressureSample>& samples) {
    WaveformSummary summary = reducer_.reduce(samples);
    uint64_t session_index = session_count_++;
    if (logger_) {
        logger_->logSession(Logger::nowMs(), id_, session_index, summary);
    }

    SessionOutcome outcome;
    if (summary.representative) {
        outcome = ingestValue(*summary.representative);
    }
    outcome.summary = std::move(summary);
    return outcome;
}

SessionOutcome PatientMonitor::ingestValue(double value) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << "Non-finite value for " << id_ << ": " << value;
        throw InvalidInputError(oss.str());
    }

    SessionOutcome outcome;
    outcome.has_value = true;
    outcome.value = value;

    const std::vector<double>& reference = has_reference_ ? reference_ : series_;
    if (has_reference_ || reference.size() >= config_.screen.min_baseline) {
        outcome.screen = screen_.evaluate(reference, value);
        outcome.screened = true;
        outcome.accepted = !outcome.screen.outlier;
    } else {
        // Bootstrapping: too few points to screen against
        outcome.accepted = true;
    }

    if (logger_ && outcome.screened) {
        logger_->logScreenDecision(Logger::nowMs(), id_, value, outcome.screen, outcome.accepted);
    }

    if (!outcome.accepted) {
        rejected_count_++;
        return outcome;
    }

    series_.push_back(value);
    outcome.drift = drift_.update(value);
    outcome.drift_evaluated = true;
    if (logger_ && outcome.drift.alarmed) {
        logger_->logDriftAlarm(Logger::nowMs(), id_, outcome.drift);
    }
    return outcome;
}

DriftResult PatientMonitor::reanalyze() const {
    return EWCusumDetector::process(series_, config_.drift);
}

MonitorRegistry::MonitorRegistry(const MonitorConfig& config)
    : config_(config), logger_(nullptr) {
}

MonitorRegistry::~MonitorRegistry() {
}

PatientMonitor& MonitorRegistry::getOrCreate(const std::string& id) {
    auto it = monitors_.find(id);
    if (it != monitors_.end()) {
        return *it->second;
    }
    auto monitor = std::make_unique<PatientMonitor>(id, config_);
    monitor->setLogger(logger_);
    PatientMonitor& ref = *monitor;
    monitors_.emplace(id, std::move(monitor));
    return ref;
}

PatientMonitor* MonitorRegistry::find(const std::string& id) {
    auto it = monitors_.find(id);
    return it == monitors_.end() ? nullptr : it->second.get();
}

bool MonitorRegistry::remove(const std::string& id) {
    return monitors_.erase(id) > 0;
}

std::vector<std::string> MonitorRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(monitors_.size());
    for (const auto& entry : monitors_) {
        out.push_back(entry.first);
    }
    return out;
}

void MonitorRegistry::setLogger(Logger* logger) {
    logger_ = logger;
    for (auto& entry : monitors_) {
        entry.second->setLogger(logger);
    }
}
