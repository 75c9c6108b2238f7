#include "logger.h"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <system_error>

namespace {

bool openCsv(std::ofstream& file, const std::string& path, const char* header) {
    // ate positions at the end so tellp reports the existing size
    file.open(path, std::ios::app | std::ios::ate);
    if (!file.is_open()) {
        return false;
    }
    file << std::setprecision(std::numeric_limits<double>::max_digits10);
    // Header only when the file is new/empty
    if (file.tellp() == 0) {
        file << header << "\n";
    }
    return true;
}

}  // namespace

Logger::Logger() : initialized_(false) {
}

Logger::~Logger() {
    close();
}

uint64_t Logger::nowMs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

bool Logger::initialize(const std::string& log_dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_dir_ = log_dir;

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        std::cerr << "Failed to create log directory " << log_dir << ": " << ec.message() << std::endl;
        return false;
    }

    bool ok = openCsv(alarms_file_, log_dir + "/drift_alarms.csv",
                      "timestamp_ms,series_id,index,value,mu,sigma,s_plus,s_minus,direction");
    ok = openCsv(screen_file_, log_dir + "/screen_decisions.csv",
                 "timestamp_ms,series_id,candidate,lower,upper,p_value,outlier,accepted") && ok;
    ok = openCsv(sessions_file_, log_dir + "/sessions.csv",
                 "timestamp_ms,series_id,session_index,accepted_samples,histogram_bins,representative") && ok;
    ok = openCsv(kernel_times_file_, log_dir + "/kernel_times.csv",
                 "timestamp_ms,kernel_name,execution_time_ms") && ok;

    if (!ok) {
        std::cerr << "Failed to open log files in " << log_dir << std::endl;
        return false;
    }

    initialized_ = true;
    return true;
}

void Logger::logDriftAlarm(uint64_t timestamp_ms, const std::string& series_id,
                           const DriftStep& step) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return;

    alarms_file_ << timestamp_ms << ","
                 << series_id << ","
                 << step.index << ","
                 << step.value << ","
                 << step.mu << ","
                 << step.sigma << ","
                 << step.s_plus << ","
                 << step.s_minus << ","
                 << toString(step.direction) << "\n";
    alarms_file_.flush();
}

void Logger::logScreenDecision(uint64_t timestamp_ms, const std::string& series_id,
                               double candidate, const ScreenResult& result,
                               bool accepted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return;

    screen_file_ << timestamp_ms << ","
                 << series_id << ","
                 << candidate << ","
                 << result.lower << ","
                 << result.upper << ","
                 << result.p_value << ","
                 << (result.outlier ? 1 : 0) << ","
                 << (accepted ? 1 : 0) << "\n";
    screen_file_.flush();
}

void Logger::logSession(uint64_t timestamp_ms, const std::string& series_id,
                        uint64_t session_index, const WaveformSummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return;

    sessions_file_ << timestamp_ms << ","
                   << series_id << ","
                   << session_index << ","
                   << summary.accepted_samples << ","
                   << summary.histogram.size() << ",";
    if (summary.representative) {
        sessions_file_ << *summary.representative;
    }
    sessions_file_ << "\n";
    sessions_file_.flush();
}

void Logger::logKernelTime(uint64_t timestamp_ms, const std::string& kernel_name,
                          double execution_time_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return;

    kernel_times_file_ << timestamp_ms << ","
                       << kernel_name << ","
                       << execution_time_ms << "\n";
    kernel_times_file_.flush();
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (alarms_file_.is_open()) alarms_file_.close();
    if (screen_file_.is_open()) screen_file_.close();
    if (sessions_file_.is_open()) sessions_file_.close();
    if (kernel_times_file_.is_open()) kernel_times_file_.close();
    initialized_ = false;
}
