#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include "ingest/series_loader.h"
#include "opencl/gpu_drift_evaluator.h"
#include "pipeline/batch_evaluator.h"
#include "utils/config_loader.h"
#include "utils/errors.h"
#include "utils/logger.h"

namespace {

double elapsedMs(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

void printUsage() {
    std::cerr << "Usage: pa_monitor_gpu --manifest FILE [--config FILE] [--device NAME]\n"
              << "                      [--kernel FILE] [--use-gpu|--use-cpu] [--compare]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string manifest_path;
    std::string config_path;
    std::string device_hint;
    std::string kernel_path;
    int gpu_override = -1;  // -1 follows the config
    bool compare = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--manifest" && i + 1 < argc) {
            manifest_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            device_hint = argv[++i];
        } else if (arg == "--kernel" && i + 1 < argc) {
            kernel_path = argv[++i];
        } else if (arg == "--use-gpu") {
            gpu_override = 1;
        } else if (arg == "--use-cpu") {
            gpu_override = 0;
        } else if (arg == "--compare") {
            compare = true;
        } else {
            printUsage();
            return 1;
        }
    }
    if (manifest_path.empty()) {
        printUsage();
        return 1;
    }

    try {
        MonitorConfig config;
        if (!config_path.empty() && !loadMonitorConfig(config_path, config)) {
            return 1;
        }
        if (device_hint.empty()) device_hint = config.gpu.device;
        if (kernel_path.empty()) kernel_path = config.gpu.kernel_path;
        // Without a config file the GPU path is tried by default
        bool use_gpu = config_path.empty() ? true : config.gpu.enabled;
        if (gpu_override >= 0) use_gpu = gpu_override == 1;

        std::vector<SeriesEntry> entries;
        if (!loadSeriesManifest(manifest_path, entries)) {
            return 1;
        }
        std::vector<std::vector<double>> series(entries.size());
        size_t total_samples = 0;
        for (size_t i = 0; i < entries.size(); ++i) {
            if (!loadSeriesFile(entries[i].path, series[i])) {
                return 1;
            }
            total_samples += series[i].size();
        }

        std::cout << "=== PA Ratio Drift (batch) ===" << std::endl;
        std::cout << "Series: " << entries.size() << " (" << total_samples << " samples)" << std::endl;

        Logger logger;
        if (!logger.initialize(config.log_dir)) {
            std::cerr << "WARNING: Failed to initialize logger in " << config.log_dir << std::endl;
        }

        std::vector<DriftResult> results;
        bool gpu_done = false;
        double gpu_time = 0.0;

        if (use_gpu) {
            GPUDriftEvaluator gpu(config.drift);
            if (gpu.initialize(kernel_path, device_hint)) {
                auto start = std::chrono::high_resolution_clock::now();
                gpu_done = gpu.processBatch(series, results);
                gpu_time = elapsedMs(start);
                if (gpu_done) {
                    std::cout << "Mode: GPU (" << gpu.getDeviceName() << ")" << std::endl;
                    std::cout << "  GPU time (total): " << std::fixed << std::setprecision(3)
                              << gpu_time << " ms" << std::endl;
                    std::cout << "  GPU kernel time: " << gpu.getKernelTime() << " ms" << std::endl;
                    logger.logKernelTime(Logger::nowMs(), "ewcusum_batch", gpu.getKernelTime());
                }
            }
            if (!gpu_done) {
                std::cerr << "WARNING: GPU evaluation unavailable, falling back to CPU" << std::endl;
            }
        }

        if (!gpu_done || compare) {
            BatchDriftEvaluator cpu(config.drift);
            auto start = std::chrono::high_resolution_clock::now();
            std::vector<DriftResult> cpu_results = cpu.processBatch(series);
            double cpu_time = elapsedMs(start);
            std::cout << "  CPU time (" << cpu.getThreadCount() << " threads): " << std::fixed
                      << std::setprecision(3) << cpu_time << " ms" << std::endl;

            if (gpu_done) {
                size_t mismatched = 0;
                for (size_t s = 0; s < series.size(); ++s) {
                    if (cpu_results[s].alarms != results[s].alarms) mismatched++;
                }
                std::cout << "  Alarm mismatches: " << mismatched << "/" << series.size() << std::endl;
                if (gpu_time > 0.0) {
                    std::cout << "  Speedup: " << std::setprecision(2) << (cpu_time / gpu_time) << "x" << std::endl;
                }
            } else {
                results = std::move(cpu_results);
            }
        }

        std::cout << std::defaultfloat << std::setprecision(6);
        uint64_t now = Logger::nowMs();
        for (size_t s = 0; s < entries.size(); ++s) {
            const DriftResult& result = results[s];
            std::cout << entries[s].id << ": " << result.alarms.size() << " alarm(s)";
            for (size_t a = 0; a < result.alarms.size(); ++a) {
                size_t t = result.alarms[a];
                std::cout << (a == 0 ? " at " : ", ") << t;

                DriftStep step;
                step.index = t;
                step.value = series[s][t];
                step.mu = result.mu[t];
                step.sigma = result.sigma[t];
                step.alarmed = true;
                logger.logDriftAlarm(now, entries[s].id, step);
            }
            std::cout << std::endl;
        }
        return 0;
    } catch (const MonitorError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
