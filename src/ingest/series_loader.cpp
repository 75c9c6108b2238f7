#include "series_loader.h"
#include "utils/errors.h"
#include "utils/simple_json.h"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool looksLikeJson(const std::string& content) {
    std::string t = trim(content);
    return !t.empty() && (t[0] == '[' || t[0] == '{');
}

double requireFinite(const SimpleJson::Value& node, const std::string& where) {
    if (!node.isNumber()) {
        throw InvalidInputError(where + " is missing or not a number");
    }
    // The JSON reader rejects inf/nan literals already
    return node.number_value;
}

std::string resolvePath(const std::string& manifest_path, const std::string& entry) {
    std::filesystem::path p(entry);
    if (p.is_absolute()) return entry;
    return (std::filesystem::path(manifest_path).parent_path() / p).string();
}

bool parseJsonFile(const std::string& path, SimpleJson::Value& root, const char* what) {
    std::string content;
    if (!SimpleJson::readFile(path, content)) {
        std::cerr << "Failed to open " << what << ": " << path << std::endl;
        return false;
    }
    std::string error;
    if (!SimpleJson::parse(content, root, error)) {
        std::cerr << "Failed to parse " << what << " " << path << ": " << error << std::endl;
        return false;
    }
    return true;
}

}  // namespace

bool parseSeries(const std::string& content, std::vector<double>& values, std::string& error) {
    values.clear();
    if (looksLikeJson(content)) {
        SimpleJson::Value root;
        if (!SimpleJson::parse(content, root, error)) {
            return false;
        }
        const SimpleJson::Value* array = &root;
        if (root.isObject()) {
            array = root.find("values");
        }
        if (!array || !array->isArray()) {
            error = "series must be a JSON array or an object with a 'values' array";
            return false;
        }
        values.reserve(array->array_values.size());
        for (size_t i = 0; i < array->array_values.size(); ++i) {
            std::ostringstream where;
            where << "series value " << i;
            values.push_back(requireFinite(array->array_values[i], where.str()));
        }
        return true;
    }

    std::istringstream in(content);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        char* end = nullptr;
        double v = std::strtod(t.c_str(), &end);
        if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) {
            std::ostringstream oss;
            oss << "series line " << line_no << " is not a finite number: '" << t << "'";
            throw InvalidInputError(oss.str());
        }
        values.push_back(v);
    }
    return true;
}

bool loadSeriesFile(const std::string& path, std::vector<double>& values) {
    std::string content;
    if (!SimpleJson::readFile(path, content)) {
        std::cerr << "Failed to open series file: " << path << std::endl;
        return false;
    }
    std::string error;
    if (!parseSeries(content, values, error)) {
        std::cerr << "Failed to parse series file " << path << ": " << error << std::endl;
        return false;
    }
    return true;
}

bool parseWaveform(const std::string& content, std::vector<PressureSample>& samples,
                   std::string& error) {
    samples.clear();
    SimpleJson::Value root;
    if (!SimpleJson::parse(content, root, error)) {
        return false;
    }
    const SimpleJson::Value* array = &root;
    if (root.isObject()) {
        array = root.find("waveform");
    }
    if (!array || !array->isArray()) {
        error = "waveform must be a JSON array of [pressure, time] pairs";
        return false;
    }
    samples.reserve(array->array_values.size());
    for (size_t i = 0; i < array->array_values.size(); ++i) {
        const SimpleJson::Value& pair = array->array_values[i];
        std::ostringstream where;
        where << "waveform sample " << i;
        if (!pair.isArray() || pair.array_values.size() != 2) {
            throw InvalidInputError(where.str() + " is not a [pressure, time] pair");
        }
        PressureSample s;
        s.pressure = requireFinite(pair.array_values[0], where.str() + " pressure");
        s.time = requireFinite(pair.array_values[1], where.str() + " time");
        samples.push_back(s);
    }
    return true;
}

bool loadWaveformFile(const std::string& path, std::vector<PressureSample>& samples) {
    std::string content;
    if (!SimpleJson::readFile(path, content)) {
        std::cerr << "Failed to open waveform file: " << path << std::endl;
        return false;
    }
    std::string error;
    if (!parseWaveform(content, samples, error)) {
        std::cerr << "Failed to parse waveform file " << path << ": " << error << std::endl;
        return false;
    }
    return true;
}

bool loadSeriesManifest(const std::string& path, std::vector<SeriesEntry>& entries) {
    SimpleJson::Value root;
    if (!parseJsonFile(path, root, "series manifest")) {
        return false;
    }
    const SimpleJson::Value* list = root.find("series");
    if (!list || !list->isArray()) {
        std::cerr << "Series manifest missing 'series' array: " << path << std::endl;
        return false;
    }
    entries.clear();
    for (const auto& item : list->array_values) {
        const SimpleJson::Value* id = item.find("id");
        const SimpleJson::Value* file = item.find("path");
        if (!id || !id->isString() || !file || !file->isString()) {
            std::cerr << "Series manifest entry needs string 'id' and 'path'" << std::endl;
            return false;
        }
        entries.push_back({id->string_value, resolvePath(path, file->string_value)});
    }
    return true;
}

bool loadSessionManifest(const std::string& path, std::vector<PatientSessions>& patients) {
    SimpleJson::Value root;
    if (!parseJsonFile(path, root, "session manifest")) {
        return false;
    }
    const SimpleJson::Value* list = root.find("patients");
    if (!list || !list->isArray()) {
        std::cerr << "Session manifest missing 'patients' array: " << path << std::endl;
        return false;
    }
    patients.clear();
    for (const auto& item : list->array_values) {
        const SimpleJson::Value* id = item.find("id");
        const SimpleJson::Value* sessions = item.find("sessions");
        if (!id || !id->isString() || !sessions || !sessions->isArray()) {
            std::cerr << "Session manifest entry needs string 'id' and 'sessions' array" << std::endl;
            return false;
        }
        PatientSessions patient;
        patient.id = id->string_value;
        for (const auto& session : sessions->array_values) {
            if (!session.isString()) {
                std::cerr << "Session paths for patient " << patient.id << " must be strings" << std::endl;
                return false;
            }
            patient.session_paths.push_back(resolvePath(path, session.string_value));
        }
        if (const SimpleJson::Value* baseline = item.find("baseline")) {
            if (!baseline->isArray()) {
                std::cerr << "Baseline for patient " << patient.id << " must be an array" << std::endl;
                return false;
            }
            patient.has_baseline = true;
            for (size_t i = 0; i < baseline->array_values.size(); ++i) {
                std::ostringstream where;
                where << "baseline value " << i << " of patient " << patient.id;
                patient.baseline.push_back(requireFinite(baseline->array_values[i], where.str()));
            }
        }
        patients.push_back(std::move(patient));
    }
    return true;
}
