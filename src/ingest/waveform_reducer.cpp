#include "waveform_reducer.h"
#include "utils/errors.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>

namespace {

// Upper bound on histogram length; pressures are physiological (mmHg)
const int64_t kMaxBins = 1 << 20;

}  // namespace

QuantizeMode parseQuantizeMode(const std::string& name) {
    if (name == "round") return QuantizeMode::Round;
    if (name == "floor") return QuantizeMode::Floor;
    throw InvalidConfigurationError("quantize_mode must be 'round' or 'floor', got '" + name + "'");
}

std::string toString(QuantizeMode mode) {
    return mode == QuantizeMode::Round ? "round" : "floor";
}

WaveformReducer::WaveformReducer(double refractory, QuantizeMode mode)
    : refractory_(refractory), mode_(mode) {
    if (!(refractory_ >= 0.0) || !std::isfinite(refractory_)) {
        std::ostringstream oss;
        oss << "Refractory interval must be finite and non-negative, got " << refractory_;
        throw InvalidConfigurationError(oss.str());
    }
}

WaveformReducer::~WaveformReducer() {
}

int64_t WaveformReducer::quantize(double pressure) const {
    // nearbyint honours the default round-half-to-even mode
    double q = (mode_ == QuantizeMode::Round) ? std::nearbyint(pressure) : std::floor(pressure);
    if (q >= static_cast<double>(kMaxBins)) {
        std::ostringstream oss;
        oss << "Pressure " << pressure << " exceeds the histogram range";
        throw InvalidInputError(oss.str());
    }
    return q < 0.0 ? -1 : static_cast<int64_t>(q);
}

std::vector<uint32_t> WaveformReducer::buildHistogram(const std::vector<PressureSample>& samples,
                                                      uint32_t* accepted_samples) const {
    if (accepted_samples) *accepted_samples = 0;
    if (samples.empty()) {
        return {};
    }

    double max_pressure = samples.front().pressure;
    for (size_t i = 0; i < samples.size(); ++i) {
        const PressureSample& s = samples[i];
        if (!std::isfinite(s.pressure) || !std::isfinite(s.time)) {
            std::ostringstream oss;
            oss << "Waveform sample " << i << " is not finite (pressure=" << s.pressure
                << ", time=" << s.time << ")";
            throw InvalidInputError(oss.str());
        }
        max_pressure = std::max(max_pressure, s.pressure);
    }

    int64_t num_bins = quantize(max_pressure) + 1;
    if (num_bins <= 0) {
        return {};
    }
    std::vector<uint32_t> bins(static_cast<size_t>(num_bins), 0);

    bool have_last = false;
    double last_time = 0.0;
    uint32_t accepted = 0;
    for (const PressureSample& s : samples) {
        if (have_last && s.time - last_time < refractory_) {
            continue;
        }
        int64_t bin = quantize(s.pressure);
        if (bin >= 0 && bin < num_bins) {
            bins[static_cast<size_t>(bin)]++;
        }
        accepted++;
        last_time = s.time;
        have_last = true;
    }

    if (accepted_samples) *accepted_samples = accepted;
    return bins;
}

std::optional<double> WaveformReducer::findRepresentativePressure(const std::vector<uint32_t>& bins) {
    // count value -> number of bins holding it
    std::map<uint32_t, uint32_t> count_frequencies;
    for (uint32_t c : bins) {
        if (c > 0) count_frequencies[c]++;
    }
    if (count_frequencies.empty()) {
        return std::nullopt;
    }

    uint32_t max_freq = 0;
    for (const auto& entry : count_frequencies) {
        max_freq = std::max(max_freq, entry.second);
    }
    // Ascending map: the last count reaching max_freq is the highest one
    uint32_t modal_count = 0;
    for (const auto& entry : count_frequencies) {
        if (entry.second == max_freq) modal_count = entry.first;
    }

    std::vector<size_t> indices;
    for (size_t i = 0; i < bins.size(); ++i) {
        if (bins[i] == modal_count) indices.push_back(i);
    }

    const size_t m = indices.size();
    if (m % 2 == 1) {
        return static_cast<double>(indices[m / 2]);
    }
    return (static_cast<double>(indices[m / 2 - 1]) + static_cast<double>(indices[m / 2])) / 2.0;
}

WaveformSummary WaveformReducer::reduce(const std::vector<PressureSample>& samples) const {
    WaveformSummary summary;
    summary.total_samples = static_cast<uint32_t>(samples.size());
    summary.histogram = buildHistogram(samples, &summary.accepted_samples);
    summary.representative = findRepresentativePressure(summary.histogram);
    return summary;
}
