#ifndef OPENCL_HOST_H
#define OPENCL_HOST_H

#define CL_TARGET_OPENCL_VERSION 120
#include <CL/cl.h>
#include <string>
#include <vector>
#include <cstdint>

class OpenCLHost {
public:
    OpenCLHost();
    ~OpenCLHost();

    // Pick a platform/device (GPU preferred); device_hint matches a substring
    // of the device name, empty takes the first device found
    bool initialize(const std::string& device_hint = "");

    // Build a kernel from a source file
    bool loadKernel(const std::string& kernel_file, const std::string& kernel_name,
                    const std::string& build_options = "");

    cl_mem createBuffer(cl_mem_flags flags, size_t size, void* host_ptr = nullptr);
    bool writeBuffer(cl_mem buffer, size_t size, const void* data);
    bool readBuffer(cl_mem buffer, size_t size, void* data);
    void releaseBuffer(cl_mem buffer);

    // Kernel arguments are set by the caller through getKernel()
    cl_kernel getKernel(const std::string& kernel_name);
    bool enqueueKernel(const std::string& kernel_name, size_t global_work_size);

    void finish();

    // Profiled duration of the last launch of kernel_name, in milliseconds
    double getKernelTime(const std::string& kernel_name);

    void cleanup();

    bool isInitialized() const { return initialized_; }
    bool supportsDoublePrecision() const { return supports_fp64_; }
    std::string getDeviceName() const { return device_name_; }

private:
    struct KernelEntry {
        std::string name;
        cl_program program;
        cl_kernel kernel;
        cl_event last_event;
    };

    cl_platform_id platform_;
    cl_device_id device_;
    cl_context context_;
    cl_command_queue queue_;

    std::string device_name_;
    bool supports_fp64_;
    bool initialized_;

    std::vector<KernelEntry> kernels_;

    bool selectDevice(const std::string& device_hint);
    KernelEntry* findEntry(const std::string& kernel_name);
    static std::string deviceString(cl_device_id device, cl_device_info param);
};

#endif // OPENCL_HOST_H
