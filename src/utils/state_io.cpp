#include "utils/state_io.h"
#include "utils/simple_json.h"
#include <fstream>
#include <iostream>

std::string driftStateToJson(const DriftState& state) {
    SimpleJson::Value root(SimpleJson::Type::Object);
    root.object_values["mu"] = SimpleJson::Value::number(state.mu);
    root.object_values["variance"] = SimpleJson::Value::number(state.variance);
    root.object_values["s_plus"] = SimpleJson::Value::number(state.s_plus);
    root.object_values["s_minus"] = SimpleJson::Value::number(state.s_minus);
    root.object_values["index"] = SimpleJson::Value::number(static_cast<double>(state.index));
    root.object_values["alarm_count"] = SimpleJson::Value::number(static_cast<double>(state.alarm_count));
    root.object_values["initialized"] = SimpleJson::Value::boolean(state.initialized);
    return SimpleJson::write(root);
}

bool parseDriftState(const std::string& json, DriftState& state, std::string& error) {
    SimpleJson::Value root;
    if (!SimpleJson::parse(json, root, error)) {
        return false;
    }
    if (!root.isObject()) {
        error = "drift state must be a JSON object";
        return false;
    }

    const char* number_keys[] = {"mu", "variance", "s_plus", "s_minus", "index", "alarm_count"};
    for (const char* key : number_keys) {
        const SimpleJson::Value* node = root.find(key);
        if (!node || !node->isNumber()) {
            error = std::string("drift state missing numeric field '") + key + "'";
            return false;
        }
    }
    const SimpleJson::Value* initialized = root.find("initialized");
    if (!initialized || !initialized->isBool()) {
        error = "drift state missing boolean field 'initialized'";
        return false;
    }

    DriftState parsed;
    parsed.mu = root.find("mu")->number_value;
    parsed.variance = root.find("variance")->number_value;
    parsed.s_plus = root.find("s_plus")->number_value;
    parsed.s_minus = root.find("s_minus")->number_value;
    if (!SimpleJson::toCount(root.find("index")->number_value, parsed.index)) {
        error = "drift state field 'index' must be a non-negative integer";
        return false;
    }
    if (!SimpleJson::toCount(root.find("alarm_count")->number_value, parsed.alarm_count)) {
        error = "drift state field 'alarm_count' must be a non-negative integer";
        return false;
    }
    parsed.initialized = initialized->bool_value;
    if (parsed.s_plus < 0.0 || parsed.s_minus < 0.0) {
        error = "drift state has negative CUSUM accumulators";
        return false;
    }
    state = parsed;
    return true;
}

bool saveDriftState(const std::string& path, const DriftState& state) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "Failed to open state file for writing: " << path << std::endl;
        return false;
    }
    file << driftStateToJson(state) << "\n";
    return static_cast<bool>(file);
}

bool loadDriftState(const std::string& path, DriftState& state) {
    std::string content;
    if (!SimpleJson::readFile(path, content)) {
        std::cerr << "Failed to open state file: " << path << std::endl;
        return false;
    }
    std::string error;
    if (!parseDriftState(content, state, error)) {
        std::cerr << "Failed to parse state file " << path << ": " << error << std::endl;
        return false;
    }
    return true;
}
