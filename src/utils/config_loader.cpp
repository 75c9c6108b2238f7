#include "utils/config_loader.h"
#include "utils/errors.h"
#include "utils/simple_json.h"
#include <cmath>
#include <iostream>
#include <limits>

namespace {

const SimpleJson::Value* findTyped(const SimpleJson::Value& section, const std::string& key,
                                   SimpleJson::Type type, const char* type_name) {
    const auto* node = section.find(key);
    if (!node) return nullptr;
    if (node->type != type) {
        throw InvalidConfigurationError("config key '" + key + "' must be a " + type_name);
    }
    return node;
}

double getNumber(const SimpleJson::Value& section, const std::string& key, double fallback) {
    const auto* node = findTyped(section, key, SimpleJson::Type::Number, "number");
    return node ? node->number_value : fallback;
}

size_t getCount(const SimpleJson::Value& section, const std::string& key, size_t fallback) {
    const auto* node = findTyped(section, key, SimpleJson::Type::Number, "number");
    if (!node) return fallback;
    uint64_t count = 0;
    if (!SimpleJson::toCount(node->number_value, count) ||
        count > std::numeric_limits<size_t>::max()) {
        throw InvalidConfigurationError("config key '" + key + "' must be a non-negative integer");
    }
    return static_cast<size_t>(count);
}

std::string getString(const SimpleJson::Value& section, const std::string& key,
                      const std::string& fallback) {
    const auto* node = findTyped(section, key, SimpleJson::Type::String, "string");
    return node ? node->string_value : fallback;
}

bool getBool(const SimpleJson::Value& section, const std::string& key, bool fallback) {
    const auto* node = findTyped(section, key, SimpleJson::Type::Bool, "boolean");
    return node ? node->bool_value : fallback;
}

void applyDrift(const SimpleJson::Value& drift, MonitorConfig& config) {
    DriftConfig& d = config.drift;
    d.alpha_baseline = getNumber(drift, "alpha_baseline", d.alpha_baseline);
    d.alpha_var = getNumber(drift, "alpha_var", d.alpha_var);
    d.delta = getNumber(drift, "delta", d.delta);
    d.h = getNumber(drift, "h", d.h);
    d.warmup = getCount(drift, "warmup", d.warmup);
    d.variance_floor = getNumber(drift, "variance_floor", d.variance_floor);
    d.initial_variance = getNumber(drift, "initial_variance", d.initial_variance);

    // null disables winsorization
    if (const auto* clip = drift.find("clip_z")) {
        if (clip->isNull()) {
            d.clip_z.reset();
        } else if (clip->isNumber()) {
            d.clip_z = clip->number_value;
        } else {
            throw InvalidConfigurationError("config key 'clip_z' must be a number or null");
        }
    }

    if (drift.find("recenter_policy")) {
        d.recenter_policy = parseRecenterPolicy(getString(drift, "recenter_policy", ""));
    }
    config.history_capacity = getCount(drift, "history_capacity", config.history_capacity);
    d.validate();
}

void applyScreen(const SimpleJson::Value& screen, MonitorConfig& config) {
    ScreenConfig& s = config.screen;
    s.alpha = getNumber(screen, "alpha", s.alpha);
    if (!(s.alpha > 0.0 && s.alpha < 1.0)) {
        throw InvalidConfigurationError("screen alpha must be in (0, 1)");
    }
    if (screen.find("method")) {
        s.method = parseCriticalValueMethod(getString(screen, "method", ""));
    }
    s.min_baseline = getCount(screen, "min_baseline", s.min_baseline);
    if (s.min_baseline < 2) {
        throw InvalidConfigurationError("screen min_baseline must be at least 2");
    }
}

void applyReducer(const SimpleJson::Value& reducer, MonitorConfig& config) {
    ReducerConfig& r = config.reducer;
    r.refractory = getNumber(reducer, "refractory", r.refractory);
    if (!(r.refractory >= 0.0)) {
        throw InvalidConfigurationError("reducer refractory must be non-negative");
    }
    if (reducer.find("quantize_mode")) {
        r.quantize_mode = parseQuantizeMode(getString(reducer, "quantize_mode", ""));
    }
}

void applyGpu(const SimpleJson::Value& gpu, MonitorConfig& config) {
    GpuConfig& g = config.gpu;
    g.enabled = getBool(gpu, "enabled", g.enabled);
    g.device = getString(gpu, "device", g.device);
    g.kernel_path = getString(gpu, "kernel_path", g.kernel_path);
}

const SimpleJson::Value* findSection(const SimpleJson::Value& root, const std::string& key) {
    return findTyped(root, key, SimpleJson::Type::Object, "object");
}

}  // namespace

bool parseMonitorConfig(const std::string& content, MonitorConfig& config, std::string& error) {
    SimpleJson::Value root;
    if (!SimpleJson::parse(content, root, error)) {
        return false;
    }
    if (!root.isObject()) {
        error = "top-level config must be a JSON object";
        return false;
    }

    MonitorConfig parsed = config;
    if (const auto* drift = findSection(root, "drift")) applyDrift(*drift, parsed);
    if (const auto* screen = findSection(root, "screen")) applyScreen(*screen, parsed);
    if (const auto* reducer = findSection(root, "reducer")) applyReducer(*reducer, parsed);
    if (const auto* gpu = findSection(root, "gpu")) applyGpu(*gpu, parsed);
    parsed.log_dir = getString(root, "log_dir", parsed.log_dir);

    config = parsed;
    return true;
}

bool loadMonitorConfig(const std::string& path, MonitorConfig& config) {
    std::string content;
    if (!SimpleJson::readFile(path, content)) {
        std::cerr << "Failed to open config file: " << path << std::endl;
        return false;
    }
    std::string error;
    if (!parseMonitorConfig(content, config, error)) {
        std::cerr << "Failed to parse monitor config " << path << ": " << error << std::endl;
        return false;
    }
    return true;
}
