#include "gpu_drift_evaluator.h"
#include "utils/errors.h"
#include <cmath>
#include <cstdint>
#include <iostream>
#include <sstream>

namespace {

const char* kKernelName = "ewcusum_batch";

// Keep IEEE semantics so the device agrees with the host detector
const char* kBuildOptions = "-cl-std=CL1.2";

}  // namespace

GPUDriftEvaluator::GPUDriftEvaluator(const DriftConfig& config)
    : config_(config), initialized_(false), last_kernel_time_ms_(0.0) {
    config_.validate();
}

GPUDriftEvaluator::~GPUDriftEvaluator() {
    cleanupBuffers();
}

bool GPUDriftEvaluator::initialize(const std::string& kernel_path, const std::string& device_hint) {
    if (initialized_) return true;

    if (!host_.initialize(device_hint)) {
        return false;
    }
    if (!host_.supportsDoublePrecision()) {
        std::cerr << "Device " << host_.getDeviceName() << " lacks cl_khr_fp64" << std::endl;
        host_.cleanup();
        return false;
    }
    if (!host_.loadKernel(kernel_path, kKernelName, kBuildOptions)) {
        host_.cleanup();
        return false;
    }

    initialized_ = true;
    return true;
}

bool GPUDriftEvaluator::ensureBuffer(DeviceBuffer& buffer, cl_mem_flags flags, size_t size) {
    if (buffer.mem && buffer.size >= size) {
        return true;
    }
    host_.releaseBuffer(buffer.mem);
    buffer.mem = host_.createBuffer(flags, size);
    buffer.size = buffer.mem ? size : 0;
    return buffer.mem != nullptr;
}

void GPUDriftEvaluator::cleanupBuffers() {
    DeviceBuffer* buffers[] = {&values_, &offsets_, &params_, &mu_,
                               &sigma_, &s_plus_, &s_minus_, &alarms_};
    for (DeviceBuffer* buffer : buffers) {
        host_.releaseBuffer(buffer->mem);
        buffer->mem = nullptr;
        buffer->size = 0;
    }
}

bool GPUDriftEvaluator::processBatch(const std::vector<std::vector<double>>& series,
                                     std::vector<DriftResult>& results) {
    results.assign(series.size(), DriftResult());
    if (series.empty()) {
        return true;
    }
    if (!initialized_) {
        return false;
    }

    // Flatten series into one values array with per-series offsets
    std::vector<cl_ulong> offsets(series.size() + 1, 0);
    size_t total = 0;
    for (size_t s = 0; s < series.size(); ++s) {
        offsets[s] = total;
        for (size_t i = 0; i < series[s].size(); ++i) {
            if (!std::isfinite(series[s][i])) {
                std::ostringstream oss;
                oss << "Non-finite sample at index " << i << " of series " << s << ": " << series[s][i];
                throw InvalidInputError(oss.str());
            }
        }
        total += series[s].size();
    }
    offsets[series.size()] = total;
    if (total == 0) {
        return true;
    }

    std::vector<double> values;
    values.reserve(total);
    for (const auto& s : series) {
        values.insert(values.end(), s.begin(), s.end());
    }

    const double params[7] = {
        config_.alpha_baseline,
        config_.alpha_var,
        config_.referenceValue(),
        config_.h,
        config_.clip_z ? *config_.clip_z : 0.0,
        config_.variance_floor,
        config_.initial_variance
    };

    const size_t values_size = total * sizeof(double);
    const size_t offsets_size = offsets.size() * sizeof(cl_ulong);
    if (!ensureBuffer(values_, CL_MEM_READ_ONLY, values_size) ||
        !ensureBuffer(offsets_, CL_MEM_READ_ONLY, offsets_size) ||
        !ensureBuffer(params_, CL_MEM_READ_ONLY, sizeof(params)) ||
        !ensureBuffer(mu_, CL_MEM_WRITE_ONLY, values_size) ||
        !ensureBuffer(sigma_, CL_MEM_WRITE_ONLY, values_size) ||
        !ensureBuffer(s_plus_, CL_MEM_WRITE_ONLY, values_size) ||
        !ensureBuffer(s_minus_, CL_MEM_WRITE_ONLY, values_size) ||
        !ensureBuffer(alarms_, CL_MEM_WRITE_ONLY, total)) {
        std::cerr << "Failed to allocate device buffers for " << total << " samples" << std::endl;
        return false;
    }

    if (!host_.writeBuffer(values_.mem, values_size, values.data()) ||
        !host_.writeBuffer(offsets_.mem, offsets_size, offsets.data()) ||
        !host_.writeBuffer(params_.mem, sizeof(params), params)) {
        return false;
    }

    cl_kernel kernel = host_.getKernel(kKernelName);
    if (!kernel) {
        std::cerr << "Kernel not found: " << kKernelName << std::endl;
        return false;
    }

    cl_uint num_series = static_cast<cl_uint>(series.size());
    cl_ulong warmup = static_cast<cl_ulong>(config_.warmup);
    cl_int clip_enabled = config_.clip_z ? 1 : 0;
    cl_int recenter = config_.recenter_policy == RecenterPolicy::ResetBaseline ? 1 : 0;

    cl_int err = CL_SUCCESS;
    err |= clSetKernelArg(kernel, 0, sizeof(cl_mem), &values_.mem);
    err |= clSetKernelArg(kernel, 1, sizeof(cl_mem), &offsets_.mem);
    err |= clSetKernelArg(kernel, 2, sizeof(cl_mem), &params_.mem);
    err |= clSetKernelArg(kernel, 3, sizeof(cl_mem), &mu_.mem);
    err |= clSetKernelArg(kernel, 4, sizeof(cl_mem), &sigma_.mem);
    err |= clSetKernelArg(kernel, 5, sizeof(cl_mem), &s_plus_.mem);
    err |= clSetKernelArg(kernel, 6, sizeof(cl_mem), &s_minus_.mem);
    err |= clSetKernelArg(kernel, 7, sizeof(cl_mem), &alarms_.mem);
    err |= clSetKernelArg(kernel, 8, sizeof(cl_uint), &num_series);
    err |= clSetKernelArg(kernel, 9, sizeof(cl_ulong), &warmup);
    err |= clSetKernelArg(kernel, 10, sizeof(cl_int), &clip_enabled);
    err |= clSetKernelArg(kernel, 11, sizeof(cl_int), &recenter);
    if (err != CL_SUCCESS) {
        std::cerr << "Failed to set ewcusum_batch arguments" << std::endl;
        return false;
    }

    if (!host_.enqueueKernel(kKernelName, series.size())) {
        return false;
    }
    host_.finish();
    last_kernel_time_ms_ = host_.getKernelTime(kKernelName);

    std::vector<double> mu(total), sigma(total), s_plus(total), s_minus(total);
    std::vector<uint8_t> alarms(total);
    if (!host_.readBuffer(mu_.mem, values_size, mu.data()) ||
        !host_.readBuffer(sigma_.mem, values_size, sigma.data()) ||
        !host_.readBuffer(s_plus_.mem, values_size, s_plus.data()) ||
        !host_.readBuffer(s_minus_.mem, values_size, s_minus.data()) ||
        !host_.readBuffer(alarms_.mem, total, alarms.data())) {
        return false;
    }

    for (size_t s = 0; s < series.size(); ++s) {
        const size_t begin = static_cast<size_t>(offsets[s]);
        const size_t end = static_cast<size_t>(offsets[s + 1]);
        DriftResult& result = results[s];
        result.mu.assign(mu.begin() + begin, mu.begin() + end);
        result.sigma.assign(sigma.begin() + begin, sigma.begin() + end);
        result.s_plus.assign(s_plus.begin() + begin, s_plus.begin() + end);
        result.s_minus.assign(s_minus.begin() + begin, s_minus.begin() + end);
        for (size_t i = begin; i < end; ++i) {
            if (alarms[i] != 0) {
                result.alarms.push_back(i - begin);
            }
        }
    }
    return true;
}
