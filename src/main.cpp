#include <iostream>
#include <fstream>
#include <iomanip>
#include <filesystem>
#include <string>
#include <vector>
#include <map>
#include <cmath>
#include <cstdlib>
#include <limits>
#include "detectors/drift_detector.h"
#include "detectors/outlier_screen.h"
#include "ingest/waveform_reducer.h"
#include "ingest/series_loader.h"
#include "pipeline/patient_monitor.h"
#include "pipeline/batch_evaluator.h"
#include "utils/config_loader.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/simple_json.h"
#include "utils/state_io.h"

namespace {

const char* kDefaultConfigPath = "config/monitor_config.json";

void printUsage() {
    std::cerr << "Usage: pa_monitor <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  drift   --series FILE [--config FILE] [--output CSV] [--warmup N] [--h X]\n"
              << "          [--delta X] [--recenter none|reset] [--state-in FILE] [--state-out FILE]\n"
              << "  screen  --baseline FILE --value X [--alpha A] [--normal]\n"
              << "  reduce  --waveform FILE [--refractory T] [--quantize round|floor]\n"
              << "  monitor --sessions MANIFEST [--config FILE]\n"
              << "  batch   --manifest FILE [--config FILE] [--threads N]\n";
}

// --key value pairs and bare --flags after the command name
struct Options {
    std::map<std::string, std::string> values;
    std::map<std::string, bool> flags;

    bool has(const std::string& key) const { return values.count(key) > 0; }
    bool flag(const std::string& key) const { return flags.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = values.find(key);
        return it == values.end() ? fallback : it->second;
    }
};

Options parseOptions(int argc, char* argv[], int first) {
    Options opts;
    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.compare(0, 2, "--") != 0) {
            throw InvalidConfigurationError("Unexpected argument: " + arg);
        }
        std::string key = arg.substr(2);
        if (i + 1 < argc && std::string(argv[i + 1]).compare(0, 2, "--") != 0) {
            opts.values[key] = argv[++i];
        } else {
            opts.flags[key] = true;
        }
    }
    return opts;
}

double toDouble(const std::string& key, const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(value)) {
        throw InvalidConfigurationError("--" + key + " expects a number, got '" + text + "'");
    }
    return value;
}

size_t toCount(const std::string& key, const std::string& text) {
    uint64_t count = 0;
    if (!SimpleJson::toCount(toDouble(key, text), count) ||
        count > std::numeric_limits<size_t>::max()) {
        throw InvalidConfigurationError("--" + key + " expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<size_t>(count);
}

std::string require(const Options& opts, const std::string& key) {
    if (!opts.has(key)) {
        throw InvalidConfigurationError("Missing required option --" + key);
    }
    return opts.get(key);
}

// An explicit --config must load; the default path is optional
bool loadConfig(const Options& opts, MonitorConfig& config) {
    if (opts.has("config")) {
        if (!loadMonitorConfig(opts.get("config"), config)) {
            std::cerr << "ERROR: Unable to load config from " << opts.get("config") << std::endl;
            return false;
        }
    } else if (std::filesystem::exists(kDefaultConfigPath)) {
        if (!loadMonitorConfig(kDefaultConfigPath, config)) {
            std::cerr << "WARNING: Unable to load config from " << kDefaultConfigPath
                      << ". Using defaults." << std::endl;
            config = MonitorConfig();
        }
    }
    return true;
}

std::string seriesIdFromPath(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

void writeTrajectoryRow(std::ostream& out, const DriftStep& step) {
    out << step.index << ","
        << step.value << ","
        << step.mu << ","
        << step.sigma << ","
        << step.s_plus << ","
        << step.s_minus << ","
        << (step.alarmed ? 1 : 0) << "\n";
}

int runDrift(const Options& opts) {
    MonitorConfig config;
    if (!loadConfig(opts, config)) {
        return 1;
    }
    if (opts.has("warmup")) config.drift.warmup = toCount("warmup", opts.get("warmup"));
    if (opts.has("h")) config.drift.h = toDouble("h", opts.get("h"));
    if (opts.has("delta")) config.drift.delta = toDouble("delta", opts.get("delta"));
    if (opts.has("recenter")) config.drift.recenter_policy = parseRecenterPolicy(opts.get("recenter"));
    config.drift.validate();

    const std::string series_path = require(opts, "series");
    std::vector<double> series;
    if (!loadSeriesFile(series_path, series)) {
        return 1;
    }

    DriftMonitor monitor(config.drift);
    if (opts.has("state-in")) {
        DriftState state;
        if (!loadDriftState(opts.get("state-in"), state)) {
            return 1;
        }
        monitor.restore(state);
    }

    Logger logger;
    if (!logger.initialize(config.log_dir)) {
        std::cerr << "WARNING: Failed to initialize logger in " << config.log_dir << std::endl;
    }
    const std::string series_id = seriesIdFromPath(series_path);

    std::ofstream file;
    const bool to_file = opts.has("output");
    if (to_file) {
        file.open(opts.get("output"));
        if (!file.is_open()) {
            std::cerr << "ERROR: Cannot open output file " << opts.get("output") << std::endl;
            return 1;
        }
    }
    std::ostream& out = to_file ? static_cast<std::ostream&>(file) : std::cout;
    out << std::setprecision(12);
    out << "index,value,mu,sigma,s_plus,s_minus,alarm\n";

    std::vector<uint64_t> alarms;
    for (double value : series) {
        const DriftStep& step = monitor.update(value);
        writeTrajectoryRow(out, step);
        if (step.alarmed) {
            alarms.push_back(step.index);
            if (logger.isInitialized()) {
                logger.logDriftAlarm(Logger::nowMs(), series_id, step);
            }
        }
    }

    if (opts.has("state-out") && !saveDriftState(opts.get("state-out"), monitor.state())) {
        return 1;
    }

    std::ostream& summary = to_file ? std::cout : std::cerr;
    summary << "Series " << series_id << ": " << series.size() << " samples, "
            << alarms.size() << " alarm(s)";
    for (size_t i = 0; i < alarms.size(); ++i) {
        summary << (i == 0 ? " at " : ", ") << alarms[i];
    }
    summary << std::endl;
    return 0;
}

int runScreen(const Options& opts) {
    MonitorConfig config;
    if (!loadConfig(opts, config)) {
        return 1;
    }
    double alpha = opts.has("alpha") ? toDouble("alpha", opts.get("alpha")) : config.screen.alpha;
    CriticalValueMethod method = opts.flag("normal") ? CriticalValueMethod::NormalApprox
                                                     : config.screen.method;

    std::vector<double> baseline;
    if (!loadSeriesFile(require(opts, "baseline"), baseline)) {
        return 1;
    }
    double candidate = toDouble("value", require(opts, "value"));

    BaselineOutlierScreen screen(alpha, method);
    ScreenResult result = screen.evaluate(baseline, candidate);

    std::cout << std::setprecision(10);
    std::cout << "Baseline: n=" << result.baseline_size
              << " mean=" << result.mean
              << " sd=" << result.std_dev << std::endl;
    std::cout << "Method: " << toString(method) << " alpha=" << alpha
              << " critical=" << result.critical_value << std::endl;
    std::cout << "Interval: [" << result.lower << ", " << result.upper << "]" << std::endl;
    std::cout << "Value: " << candidate << " p=" << result.p_value
              << (result.outlier ? " OUTLIER" : " ok") << std::endl;
    return 0;
}

int runReduce(const Options& opts) {
    MonitorConfig config;
    if (!loadConfig(opts, config)) {
        return 1;
    }
    double refractory = opts.has("refractory") ? toDouble("refractory", opts.get("refractory"))
                                               : config.reducer.refractory;
    QuantizeMode mode = opts.has("quantize") ? parseQuantizeMode(opts.get("quantize"))
                                             : config.reducer.quantize_mode;

    std::vector<PressureSample> samples;
    if (!loadWaveformFile(require(opts, "waveform"), samples)) {
        return 1;
    }

    WaveformReducer reducer(refractory, mode);
    WaveformSummary summary = reducer.reduce(samples);

    std::cout << "Samples: " << summary.accepted_samples << "/" << summary.total_samples
              << " accepted (refractory " << refractory << "s, " << toString(mode) << ")" << std::endl;
    std::cout << "Histogram:";
    for (size_t i = 0; i < summary.histogram.size(); ++i) {
        if (summary.histogram[i] != 0) {
            std::cout << " " << i << ":" << summary.histogram[i];
        }
    }
    std::cout << std::endl;
    if (summary.representative) {
        std::cout << "Representative pressure: " << *summary.representative << std::endl;
    } else {
        std::cout << "Representative pressure: none" << std::endl;
    }
    return 0;
}

int runMonitor(const Options& opts) {
    MonitorConfig config;
    if (!loadConfig(opts, config)) {
        return 1;
    }

    std::vector<PatientSessions> patients;
    if (!loadSessionManifest(require(opts, "sessions"), patients)) {
        return 1;
    }

    Logger logger;
    if (!logger.initialize(config.log_dir)) {
        std::cerr << "WARNING: Failed to initialize logger in " << config.log_dir << std::endl;
    }

    MonitorRegistry registry(config);
    if (logger.isInitialized()) {
        registry.setLogger(&logger);
    }

    for (const auto& patient : patients) {
        PatientMonitor& monitor = registry.getOrCreate(patient.id);
        if (patient.has_baseline) {
            monitor.setReferenceBaseline(patient.baseline);
        }

        std::cout << "=== Patient " << patient.id << " ===" << std::endl;
        for (const auto& path : patient.session_paths) {
            std::vector<PressureSample> samples;
            if (!loadWaveformFile(path, samples)) {
                return 1;
            }
            SessionOutcome outcome = monitor.ingestWaveform(samples);

            std::cout << "  " << seriesIdFromPath(path) << ": ";
            if (!outcome.has_value) {
                std::cout << "no representative value" << std::endl;
                continue;
            }
            std::cout << "value=" << outcome.value;
            if (outcome.screened) {
                std::cout << " p=" << outcome.screen.p_value;
            }
            std::cout << (outcome.accepted ? " accepted" : " rejected");
            if (outcome.drift_evaluated) {
                std::cout << " S+=" << outcome.drift.s_plus << " S-=" << outcome.drift.s_minus;
                if (outcome.drift.alarmed) {
                    std::cout << " ALARM(" << toString(outcome.drift.direction) << ")";
                }
            }
            std::cout << std::endl;
        }
        std::cout << "  sessions=" << monitor.sessionCount()
                  << " accepted=" << monitor.series().size()
                  << " rejected=" << monitor.rejectedCount()
                  << " alarms=" << monitor.drift().state().alarm_count << std::endl;
    }
    return 0;
}

int runBatch(const Options& opts) {
    MonitorConfig config;
    if (!loadConfig(opts, config)) {
        return 1;
    }
    size_t threads = opts.has("threads") ? toCount("threads", opts.get("threads")) : 0;

    std::vector<SeriesEntry> entries;
    if (!loadSeriesManifest(require(opts, "manifest"), entries)) {
        return 1;
    }

    std::vector<std::vector<double>> series(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!loadSeriesFile(entries[i].path, series[i])) {
            return 1;
        }
    }

    Logger logger;
    if (!logger.initialize(config.log_dir)) {
        std::cerr << "WARNING: Failed to initialize logger in " << config.log_dir << std::endl;
    }

    BatchDriftEvaluator evaluator(config.drift, threads);
    std::cout << "Evaluating " << entries.size() << " series on "
              << evaluator.getThreadCount() << " thread(s)" << std::endl;
    std::vector<DriftResult> results = evaluator.processBatch(series);

    uint64_t now = Logger::nowMs();
    for (size_t i = 0; i < entries.size(); ++i) {
        const DriftResult& result = results[i];
        std::cout << entries[i].id << ": " << result.size() << " samples, "
                  << result.alarms.size() << " alarm(s)";
        for (size_t a = 0; a < result.alarms.size(); ++a) {
            size_t t = result.alarms[a];
            std::cout << (a == 0 ? " at " : ", ") << t;
            if (logger.isInitialized()) {
                DriftStep step;
                step.index = t;
                step.value = series[i][t];
                step.mu = result.mu[t];
                step.sigma = result.sigma[t];
                step.s_plus = result.s_plus[t];
                step.s_minus = result.s_minus[t];
                step.alarmed = true;
                logger.logDriftAlarm(now, entries[i].id, step);
            }
        }
        std::cout << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        printUsage();
        return 0;
    }

    try {
        Options opts = parseOptions(argc, argv, 2);
        if (command == "drift") return runDrift(opts);
        if (command == "screen") return runScreen(opts);
        if (command == "reduce") return runReduce(opts);
        if (command == "monitor") return runMonitor(opts);
        if (command == "batch") return runBatch(opts);

        std::cerr << "Unknown command: " << command << std::endl;
        printUsage();
        return 1;
    } catch (const MonitorError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
