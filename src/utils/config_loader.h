#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include <string>
#include "detectors/drift_detector.h"
#include "detectors/outlier_screen.h"
#include "ingest/waveform_reducer.h"

struct ScreenConfig {
    double alpha = 0.01;
    CriticalValueMethod method = CriticalValueMethod::StudentT;
    size_t min_baseline = 2;   // points needed before screening starts
};

struct ReducerConfig {
    double refractory = 0.1;
    QuantizeMode quantize_mode = QuantizeMode::Round;
};

struct GpuConfig {
    bool enabled = false;
    std::string device;   // substring match on the OpenCL device name
    std::string kernel_path = "src/opencl/kernels/ewcusum.cl";
};

struct MonitorConfig {
    DriftConfig drift;
    size_t history_capacity = 0;
    ScreenConfig screen;
    ReducerConfig reducer;
    GpuConfig gpu;
    std::string log_dir = "logs";
};

// Missing keys keep the values already in config. I/O and syntax problems
// return false with a message on stderr; a present key with a wrong type or
// an out-of-range value throws InvalidConfigurationError.
bool loadMonitorConfig(const std::string& path, MonitorConfig& config);
bool parseMonitorConfig(const std::string& content, MonitorConfig& config, std::string& error);

#endif  // CONFIG_LOADER_H
