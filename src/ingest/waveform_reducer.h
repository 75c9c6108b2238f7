#ifndef WAVEFORM_REDUCER_H
#define WAVEFORM_REDUCER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct PressureSample {
    double pressure;   // mmHg
    double time;       // seconds, non-decreasing
};

enum class QuantizeMode {
    Round,   // nearest integer, ties to even
    Floor
};

// Accepts "round" or "floor"; throws InvalidConfigurationError otherwise
QuantizeMode parseQuantizeMode(const std::string& name);
std::string toString(QuantizeMode mode);

struct WaveformSummary {
    std::vector<uint32_t> histogram;        // counts per integer pressure
    std::optional<double> representative;   // empty when no bin is populated
    uint32_t accepted_samples;
    uint32_t total_samples;

    WaveformSummary() : accepted_samples(0), total_samples(0) {}
};

// Reduces one session's pressure waveform to a single representative value.
class WaveformReducer {
public:
    WaveformReducer(double refractory = 0.1, QuantizeMode mode = QuantizeMode::Round);
    ~WaveformReducer();

    // Histogram of quantized pressures, skipping samples that fall inside the
    // refractory interval of the last accepted sample.
    std::vector<uint32_t> buildHistogram(const std::vector<PressureSample>& samples,
                                         uint32_t* accepted_samples = nullptr) const;

    // Median of the bin indices holding the modal non-zero count. When several
    // count values are equally frequent the highest count wins.
    static std::optional<double> findRepresentativePressure(const std::vector<uint32_t>& bins);

    WaveformSummary reduce(const std::vector<PressureSample>& samples) const;

    int64_t quantize(double pressure) const;

    double getRefractory() const { return refractory_; }
    QuantizeMode getMode() const { return mode_; }

private:
    double refractory_;
    QuantizeMode mode_;
};

#endif // WAVEFORM_REDUCER_H
