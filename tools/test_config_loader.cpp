/**
 * Unit tests for configuration and file formats:
 * - monitor config (JSON)
 * - drift state checkpoints
 * - series, waveform and manifest loaders
 */

#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <cmath>
#include <cstdint>
#include <limits>

#include "ingest/series_loader.h"
#include "utils/config_loader.h"
#include "utils/errors.h"
#include "utils/simple_json.h"
#include "utils/state_io.h"

using namespace std;
namespace fs = std::filesystem;

// Test utilities
#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_NEAR(a, b, tol) assert(abs((a) - (b)) < (tol))
#define ASSERT_THROWS(expr, type) \
    do { \
        bool thrown_ = false; \
        try { expr; } catch (const type&) { thrown_ = true; } \
        assert(thrown_); \
    } while (0)
#define TEST(name) cout << "\n[TEST] " << name << "..." << endl

namespace {

void writeFile(const fs::path& path, const string& content) {
    ofstream out(path);
    assert(out.is_open());
    out << content;
}

}  // namespace

void test_json_reader() {
    TEST("JSON reader");

    SimpleJson::Value root;
    string error;
    ASSERT_TRUE(SimpleJson::parse("{\"a\": [1, -2.5e-3, true, null], \"b\": \"x\\u0041\"}", root, error));
    const SimpleJson::Value* a = root.find("a");
    ASSERT_TRUE(a && a->isArray());
    ASSERT_EQ(a->array_values.size(), 4u);
    ASSERT_NEAR(a->array_values[1].number_value, -2.5e-3, 1e-18);
    ASSERT_TRUE(a->array_values[2].isBool() && a->array_values[2].bool_value);
    ASSERT_TRUE(a->array_values[3].isNull());
    ASSERT_EQ(root.find("b")->string_value, string("xA"));
    cout << "  ✓ Objects, arrays, literals and escapes" << endl;

    ASSERT_TRUE(!SimpleJson::parse("{\"a\": 1,}", root, error));
    ASSERT_TRUE(error.find("line 1") != string::npos);
    ASSERT_TRUE(!SimpleJson::parse("[1, 2]\n  x", root, error));
    ASSERT_TRUE(error.find("line 2") != string::npos);
    ASSERT_TRUE(!SimpleJson::parse("[1e999]", root, error));
    cout << "  ✓ Errors carry a position: " << error << endl;

    SimpleJson::Value out(SimpleJson::Type::Object);
    out.object_values["pi"] = SimpleJson::Value::number(3.141592653589793);
    SimpleJson::Value back;
    ASSERT_TRUE(SimpleJson::parse(SimpleJson::write(out), back, error));
    ASSERT_EQ(back.find("pi")->number_value, 3.141592653589793);
    cout << "  ✓ Doubles survive write/parse" << endl;

    uint64_t count = 7;
    ASSERT_TRUE(SimpleJson::toCount(0.0, count) && count == 0u);
    ASSERT_TRUE(SimpleJson::toCount(9007199254740992.0, count) && count == 9007199254740992ull);
    ASSERT_TRUE(!SimpleJson::toCount(-1.0, count));
    ASSERT_TRUE(!SimpleJson::toCount(0.5, count));
    ASSERT_TRUE(!SimpleJson::toCount(18446744073709551616.0, count));
    ASSERT_TRUE(!SimpleJson::toCount(1e30, count));
    ASSERT_TRUE(!SimpleJson::toCount(numeric_limits<double>::quiet_NaN(), count));
    ASSERT_TRUE(!SimpleJson::toCount(numeric_limits<double>::infinity(), count));
    ASSERT_EQ(count, 9007199254740992ull);
    cout << "  ✓ Integer conversion rejects out-of-range numbers" << endl;
}

void test_monitor_config() {
    TEST("Monitor config");

    MonitorConfig config;
    string error;
    const string content =
        "{\n"
        "  \"drift\": {\"alpha_baseline\": 0.02, \"h\": 4.0, \"warmup\": 50,\n"
        "            \"clip_z\": null, \"recenter_policy\": \"reset\", \"history_capacity\": 16},\n"
        "  \"screen\": {\"alpha\": 0.05, \"method\": \"normal\", \"min_baseline\": 5},\n"
        "  \"reducer\": {\"refractory\": 0.25, \"quantize_mode\": \"floor\"},\n"
        "  \"gpu\": {\"enabled\": true, \"device\": \"NVIDIA\"},\n"
        "  \"log_dir\": \"out/logs\"\n"
        "}\n";
    ASSERT_TRUE(parseMonitorConfig(content, config, error));
    ASSERT_EQ(config.drift.alpha_baseline, 0.02);
    ASSERT_EQ(config.drift.h, 4.0);
    ASSERT_EQ(config.drift.warmup, 50u);
    ASSERT_TRUE(!config.drift.clip_z.has_value());
    ASSERT_TRUE(config.drift.recenter_policy == RecenterPolicy::ResetBaseline);
    ASSERT_EQ(config.history_capacity, 16u);
    ASSERT_EQ(config.screen.alpha, 0.05);
    ASSERT_TRUE(config.screen.method == CriticalValueMethod::NormalApprox);
    ASSERT_EQ(config.screen.min_baseline, 5u);
    ASSERT_EQ(config.reducer.refractory, 0.25);
    ASSERT_TRUE(config.reducer.quantize_mode == QuantizeMode::Floor);
    ASSERT_TRUE(config.gpu.enabled);
    ASSERT_EQ(config.gpu.device, string("NVIDIA"));
    ASSERT_EQ(config.log_dir, string("out/logs"));
    cout << "  ✓ All sections applied" << endl;

    // Untouched keys keep their defaults
    ASSERT_EQ(config.drift.alpha_var, 0.05);
    ASSERT_EQ(config.drift.delta, 0.25);
    ASSERT_EQ(config.gpu.kernel_path, string("src/opencl/kernels/ewcusum.cl"));

    MonitorConfig defaults;
    ASSERT_TRUE(parseMonitorConfig("{}", defaults, error));
    ASSERT_TRUE(defaults.drift.clip_z.has_value());
    ASSERT_EQ(*defaults.drift.clip_z, 6.0);
    ASSERT_EQ(defaults.drift.warmup, 100u);
    cout << "  ✓ Missing keys keep defaults" << endl;
}

void test_monitor_config_errors() {
    TEST("Monitor config errors");

    MonitorConfig config;
    string error;
    ASSERT_TRUE(!parseMonitorConfig("{\"drift\": ", config, error));
    ASSERT_TRUE(!error.empty());
    ASSERT_TRUE(!parseMonitorConfig("[1, 2]", config, error));
    cout << "  ✓ Syntax errors return false" << endl;

    ASSERT_THROWS(parseMonitorConfig("{\"drift\": {\"h\": \"five\"}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"drift\": {\"alpha_baseline\": 2.0}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"drift\": {\"warmup\": 1.5}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"drift\": {\"warmup\": -3}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"drift\": {\"warmup\": 1e30}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"screen\": {\"min_baseline\": 18446744073709551616}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"screen\": {\"method\": \"bayes\"}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"reducer\": {\"quantize_mode\": \"ceil\"}}", config, error),
                  InvalidConfigurationError);
    ASSERT_THROWS(parseMonitorConfig("{\"screen\": {\"min_baseline\": 1}}", config, error),
                  InvalidConfigurationError);
    cout << "  ✓ Bad values throw InvalidConfigurationError" << endl;

    // A failed parse leaves the previous configuration in place
    ASSERT_EQ(config.drift.h, 5.0);
    ASSERT_TRUE(config.reducer.quantize_mode == QuantizeMode::Round);

    ASSERT_TRUE(!loadMonitorConfig("does/not/exist.json", config));
    cout << "  ✓ Missing file reported" << endl;
}

void test_drift_state_io() {
    TEST("Drift state checkpoints");

    DriftState state;
    state.mu = 12.345678901234567;
    state.variance = 0.1 / 3.0;
    state.s_plus = 1.0 / 7.0;
    state.s_minus = 0.0;
    state.index = 1234;
    state.alarm_count = 3;
    state.initialized = true;

    DriftState parsed;
    string error;
    ASSERT_TRUE(parseDriftState(driftStateToJson(state), parsed, error));
    ASSERT_EQ(parsed.mu, state.mu);
    ASSERT_EQ(parsed.variance, state.variance);
    ASSERT_EQ(parsed.s_plus, state.s_plus);
    ASSERT_EQ(parsed.s_minus, state.s_minus);
    ASSERT_EQ(parsed.index, state.index);
    ASSERT_EQ(parsed.alarm_count, state.alarm_count);
    ASSERT_TRUE(parsed.initialized);
    cout << "  ✓ Exact round trip" << endl;

    ASSERT_TRUE(!parseDriftState("{\"mu\": 1.0}", parsed, error));
    ASSERT_TRUE(error.find("variance") != string::npos);
    ASSERT_TRUE(!parseDriftState(
        "{\"mu\":1,\"variance\":1,\"s_plus\":-1,\"s_minus\":0,\"index\":0,\"alarm_count\":0,\"initialized\":true}",
        parsed, error));
    cout << "  ✓ Incomplete or invalid checkpoints rejected" << endl;

    const string counters[] = {"-5", "2.5", "1e30", "18446744073709551616"};
    for (const string& bad : counters) {
        string index_json = "{\"mu\":1,\"variance\":1,\"s_plus\":0,\"s_minus\":0,\"index\":" + bad +
                            ",\"alarm_count\":0,\"initialized\":true}";
        ASSERT_TRUE(!parseDriftState(index_json, parsed, error));
        ASSERT_TRUE(error.find("index") != string::npos);

        string alarms_json = "{\"mu\":1,\"variance\":1,\"s_plus\":0,\"s_minus\":0,\"index\":3" +
                             string(",\"alarm_count\":") + bad + ",\"initialized\":true}";
        ASSERT_TRUE(!parseDriftState(alarms_json, parsed, error));
        ASSERT_TRUE(error.find("alarm_count") != string::npos);
    }
    ASSERT_EQ(parsed.index, state.index);
    cout << "  ✓ Negative, fractional and oversized counters rejected" << endl;

    fs::path dir = fs::temp_directory_path() / "pa_monitor_state_test";
    fs::create_directories(dir);
    string path = (dir / "state.json").string();
    ASSERT_TRUE(saveDriftState(path, state));
    DriftState loaded;
    ASSERT_TRUE(loadDriftState(path, loaded));
    ASSERT_EQ(loaded.mu, state.mu);
    ASSERT_EQ(loaded.index, state.index);
    fs::remove_all(dir);
    cout << "  ✓ Saved and reloaded from disk" << endl;
}

void test_series_formats() {
    TEST("Series formats");

    vector<double> values;
    string error;
    ASSERT_TRUE(parseSeries("[1.5, 2, -3e1]", values, error));
    ASSERT_EQ(values.size(), 3u);
    ASSERT_EQ(values[2], -30.0);

    ASSERT_TRUE(parseSeries("{\"values\": [4, 5]}", values, error));
    ASSERT_EQ(values.size(), 2u);
    ASSERT_EQ(values[1], 5.0);

    ASSERT_TRUE(parseSeries("# ratio per session\n0.61\n\n0.64\n  0.59  \n", values, error));
    ASSERT_EQ(values.size(), 3u);
    ASSERT_EQ(values[2], 0.59);
    cout << "  ✓ JSON array, object and text forms" << endl;

    ASSERT_THROWS(parseSeries("[1, null, 3]", values, error), InvalidInputError);
    ASSERT_THROWS(parseSeries("1.0\nnan\n", values, error), InvalidInputError);
    ASSERT_THROWS(parseSeries("1.0\nabc\n", values, error), InvalidInputError);
    ASSERT_TRUE(!parseSeries("{\"data\": [1]}", values, error));
    cout << "  ✓ Missing and non-finite values rejected" << endl;

    vector<PressureSample> samples;
    ASSERT_TRUE(parseWaveform("[[10.2, 0.0], [20.5, 0.2]]", samples, error));
    ASSERT_EQ(samples.size(), 2u);
    ASSERT_EQ(samples[1].pressure, 20.5);
    ASSERT_EQ(samples[1].time, 0.2);
    ASSERT_TRUE(parseWaveform("{\"waveform\": [[1, 0]]}", samples, error));
    ASSERT_EQ(samples.size(), 1u);
    ASSERT_THROWS(parseWaveform("[[10.2]]", samples, error), InvalidInputError);
    cout << "  ✓ Waveform pairs" << endl;
}

void test_manifests() {
    TEST("Manifests");

    fs::path dir = fs::temp_directory_path() / "pa_monitor_manifest_test";
    fs::create_directories(dir / "data");
    writeFile(dir / "series.json",
              "{\"series\": [{\"id\": \"p1\", \"path\": \"data/p1.txt\"},"
              " {\"id\": \"p2\", \"path\": \"/abs/p2.json\"}]}");
    writeFile(dir / "sessions.json",
              "{\"patients\": [{\"id\": \"p1\", \"baseline\": [0.6, 0.62, 0.61],"
              " \"sessions\": [\"data/w1.json\", \"data/w2.json\"]},"
              " {\"id\": \"p2\", \"sessions\": []}]}");
    writeFile(dir / "data" / "p1.txt", "0.6\n0.7\n");

    vector<SeriesEntry> entries;
    ASSERT_TRUE(loadSeriesManifest((dir / "series.json").string(), entries));
    ASSERT_EQ(entries.size(), 2u);
    ASSERT_EQ(entries[0].id, string("p1"));
    ASSERT_TRUE(fs::equivalent(entries[0].path, dir / "data" / "p1.txt"));
    ASSERT_EQ(entries[1].path, string("/abs/p2.json"));

    vector<double> values;
    ASSERT_TRUE(loadSeriesFile(entries[0].path, values));
    ASSERT_EQ(values.size(), 2u);
    cout << "  ✓ Series manifest paths resolved against the manifest directory" << endl;

    vector<PatientSessions> patients;
    ASSERT_TRUE(loadSessionManifest((dir / "sessions.json").string(), patients));
    ASSERT_EQ(patients.size(), 2u);
    ASSERT_TRUE(patients[0].has_baseline);
    ASSERT_EQ(patients[0].baseline.size(), 3u);
    ASSERT_EQ(patients[0].session_paths.size(), 2u);
    ASSERT_EQ(fs::path(patients[0].session_paths[1]).filename().string(), string("w2.json"));
    ASSERT_TRUE(!patients[1].has_baseline);
    ASSERT_TRUE(patients[1].session_paths.empty());
    cout << "  ✓ Session manifest with optional baseline" << endl;

    ASSERT_TRUE(!loadSeriesManifest((dir / "missing.json").string(), entries));
    fs::remove_all(dir);
}

int main() {
    cout << "=" << string(80, '=') << endl;
    cout << "Configuration and I/O Unit Tests" << endl;
    cout << "=" << string(80, '=') << endl;

    try {
        test_json_reader();
        test_monitor_config();
        test_monitor_config_errors();
        test_drift_state_io();
        test_series_formats();
        test_manifests();

        cout << "\n" << string(80, '=') << endl;
        cout << "All Configuration and I/O Tests PASSED!" << endl;
        cout << string(80, '=') << endl;
        return 0;
    } catch (const exception& e) {
        cerr << "\n❌ TEST FAILED: " << e.what() << endl;
        return 1;
    }
}
