#ifndef GPU_DRIFT_EVALUATOR_H
#define GPU_DRIFT_EVALUATOR_H

#include <string>
#include <vector>
#include "detectors/drift_detector.h"
#include "opencl/host.h"

// Evaluates many independent series at once on an OpenCL device, one
// work-item per series. Results match EWCusumDetector::process per series.
class GPUDriftEvaluator {
public:
    explicit GPUDriftEvaluator(const DriftConfig& config);
    ~GPUDriftEvaluator();

    // Requires a device with cl_khr_fp64
    bool initialize(const std::string& kernel_path, const std::string& device_hint = "");

    // Returns false on any OpenCL failure so the caller can fall back to the
    // CPU path. Non-finite samples throw InvalidInputError before upload.
    bool processBatch(const std::vector<std::vector<double>>& series,
                      std::vector<DriftResult>& results);

    double getKernelTime() const { return last_kernel_time_ms_; }
    std::string getDeviceName() const { return host_.getDeviceName(); }
    bool isInitialized() const { return initialized_; }

private:
    struct DeviceBuffer {
        cl_mem mem = nullptr;
        size_t size = 0;
    };

    OpenCLHost host_;
    DriftConfig config_;
    bool initialized_;
    double last_kernel_time_ms_;

    DeviceBuffer values_;
    DeviceBuffer offsets_;
    DeviceBuffer params_;
    DeviceBuffer mu_;
    DeviceBuffer sigma_;
    DeviceBuffer s_plus_;
    DeviceBuffer s_minus_;
    DeviceBuffer alarms_;

    // Grow-only: reallocates when the batch outgrows the buffer
    bool ensureBuffer(DeviceBuffer& buffer, cl_mem_flags flags, size_t size);
    void cleanupBuffers();
};

#endif // GPU_DRIFT_EVALUATOR_H
